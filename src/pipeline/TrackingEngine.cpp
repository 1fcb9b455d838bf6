#include "casa/pipeline/TrackingEngine.hpp"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

#include "casa/core/Errors.hpp"
#include "casa/core/Logger.hpp"

namespace casa {

namespace {

std::vector<TrackAnchor_t> anchorsOf(const TrackTable& table) {
  std::vector<TrackAnchor_t> anchors;
  anchors.reserve(table.size());
  table.forEach([&anchors](const Track_t& track) { anchors.push_back({track.id, track.lastPosition()}); });
  return anchors;
}

} // namespace

TrackingEngine::TrackingEngine(TrackerConfig_t config)
    : TrackingEngine(config, createAssociator(config)) {}

TrackingEngine::TrackingEngine(TrackerConfig_t config, std::shared_ptr<IAssociator> associatorInput)
    : trackerConfig(std::move(config)),
      detector(trackerConfig),
      associator(std::move(associatorInput)),
      lifecycle(trackerConfig) {
  if (!associator) {
    throw ConfigError("assignment", "associator must not be null");
  }
  if (auto logger = Logger::GetClass("TrackingEngine")) {
    logger->info("TrackingEngine created area [{:.1f}, {:.1f}] maxDistance {:.1f} maxDisappeared {} cap {}",
                 trackerConfig.minArea, trackerConfig.maxArea, trackerConfig.maxDistance, trackerConfig.maxDisappeared,
                 trackerConfig.maxActiveTracks);
  }
}

TrackingResult_t TrackingEngine::track(IFrameSource& frames) const {
  TrackingContext_t context;
  TrackingResult_t result;
  auto logger = Logger::GetClass("TrackingEngine");
  if (logger) {
    logger->info("Tracking started");
  }

  FrameRecord_t frame;
  while (true) {
    if (cancellationCheck && cancellationCheck()) {
      result.cancelled = true;
      if (logger) {
        logger->warn("Tracking cancelled after {} frames", context.stats.framesProcessed());
      }
      break;
    }
    try {
      if (!frames.next(frame)) {
        break;
      }
      if (processFrame(context, frame)) {
        throttle(frame.frameIndex);
      }
    } catch (const std::exception& ex) {
      result.aborted = true;
      result.errorMessage = ex.what();
      if (logger) {
        logger->error("Frame {} failed, stopping stream: {}", frame.frameIndex, ex.what());
      }
      break;
    }
  }

  finish(context);
  result.completedTracks = std::move(context.completedTracks);
  result.stats = context.stats;
  if (logger) {
    logger->info("Tracking finished: {} frames, {} skipped, {} tracks completed, {} pruned",
                 result.stats.framesProcessed(), result.stats.framesSkipped(), result.completedTracks.size(),
                 result.stats.tracksPruned());
  }
  return result;
}

bool TrackingEngine::processFrame(TrackingContext_t& context, const FrameRecord_t& frame) const {
  if (!frame.hasMask()) {
    context.stats.recordSkippedFrame();
    if (auto logger = Logger::GetClass("TrackingEngine")) {
      logger->warn("Frame {} has no mask, skipping", frame.frameIndex);
    }
    return false;
  }
  if (context.hasFrame && frame.frameIndex <= context.frameIndex) {
    context.stats.recordSkippedFrame();
    if (auto logger = Logger::GetClass("TrackingEngine")) {
      logger->warn("Frame {} does not follow frame {}, skipping", frame.frameIndex, context.frameIndex);
    }
    return false;
  }

  const PointList detections = centroidsOf(detector.detect(frame.binaryMask));
  context.frameIndex = frame.frameIndex;
  context.hasFrame = true;

  const AssociationResult_t association = associator->associate(anchorsOf(context.activeTracks), detections);
  lifecycle.apply(context, association, detections);
  lifecycle.prune(context);
  context.stats.recordFrame(detections.size(), context.activeTracks.size());

  const std::size_t processed = context.stats.framesProcessed();
  if (trackerConfig.progressInterval > 0 && (processed % trackerConfig.progressInterval) == 0) {
    if (auto logger = Logger::GetClass("TrackingEngine")) {
      logger->info("Processed {} frames, {} active tracks, {} completed", processed, context.activeTracks.size(),
                   context.completedTracks.size());
    }
  } else if (auto logger = Logger::GetClass("TrackingEngine")) {
    logger->debug("Frame {} detections {} matched {} missed {} new {}", frame.frameIndex, detections.size(),
                  association.assignments.size(), association.missedTrackIds.size(),
                  association.unmatchedDetections.size());
  }
  return true;
}

void TrackingEngine::finish(TrackingContext_t& context) const {
  const std::size_t flushed = lifecycle.flush(context);
  if (auto logger = Logger::GetClass("TrackingEngine")) {
    logger->debug("Flushed {} active tracks at end of stream", flushed);
  }
}

void TrackingEngine::throttle(int frameIndex) const {
  if (throttleHook) {
    throttleHook(frameIndex);
  } else if (trackerConfig.frameSleepMs > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(trackerConfig.frameSleepMs));
  }
}

} // namespace casa
