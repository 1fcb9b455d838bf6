#include "casa/tracking/TrackingStats.hpp"

#include <algorithm>

namespace casa {

void TrackingStats::recordFrame(std::size_t detections, std::size_t activeTracks) {
  detectionCount += detections;
  peakActive = std::max(peakActive, activeTracks);
  ++frameCount;
}

void TrackingStats::recordTerminated(bool wasEmitted) {
  ++terminated;
  if (wasEmitted) {
    ++emitted;
  } else {
    ++droppedShort;
  }
}

double TrackingStats::meanDetectionsPerFrame() const {
  if (frameCount == 0) {
    return 0.0;
  }
  return static_cast<double>(detectionCount) / static_cast<double>(frameCount);
}

} // namespace casa
