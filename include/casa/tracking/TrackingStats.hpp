#pragma once

#include <cstddef>

namespace casa {

// Running counters for one tracking run.
class TrackingStats {
public:
  void recordFrame(std::size_t detections, std::size_t activeTracks);
  void recordSkippedFrame() { ++skippedFrames; }
  void recordCreated(std::size_t count) { created += count; }
  void recordTerminated(bool emitted);
  void recordPruned(std::size_t count) { pruned += count; }
  void recordFlushed(std::size_t count) { flushed += count; }

  std::size_t framesProcessed() const { return frameCount; }
  std::size_t framesSkipped() const { return skippedFrames; }
  std::size_t totalDetections() const { return detectionCount; }
  std::size_t peakActiveTracks() const { return peakActive; }
  std::size_t tracksCreated() const { return created; }
  std::size_t tracksTerminated() const { return terminated; }
  std::size_t tracksEmitted() const { return emitted; }
  std::size_t tracksDroppedShort() const { return droppedShort; }
  std::size_t tracksPruned() const { return pruned; }
  std::size_t tracksFlushed() const { return flushed; }

  double meanDetectionsPerFrame() const;

private:
  std::size_t frameCount = 0;
  std::size_t skippedFrames = 0;
  std::size_t detectionCount = 0;
  std::size_t peakActive = 0;
  std::size_t created = 0;
  std::size_t terminated = 0;
  std::size_t emitted = 0;
  std::size_t droppedShort = 0;
  std::size_t pruned = 0;
  std::size_t flushed = 0;
};

} // namespace casa
