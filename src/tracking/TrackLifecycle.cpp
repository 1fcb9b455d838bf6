#include "casa/tracking/TrackLifecycle.hpp"

#include <algorithm>
#include <optional>
#include <utility>
#include <vector>

#include "casa/core/Logger.hpp"

namespace casa {

TrackLifecycle::TrackLifecycle(const TrackerConfig_t& config)
    : maxDisappeared(config.maxDisappeared),
      maxActiveTracks(config.maxActiveTracks),
      minEmitLength(config.minEmitLength) {
  config.validate();
}

void TrackLifecycle::apply(TrackingContext_t& context,
                           const AssociationResult_t& association,
                           const PointList& detections) const {
  for (const auto& assignment : association.assignments) {
    Track_t* track = context.activeTracks.find(assignment.trackId);
    if (!track) {
      continue;
    }
    if (!track->append(detections[assignment.detectionIndex], context.frameIndex)) {
      if (auto logger = Logger::GetClass("TrackLifecycle")) {
        logger->warn("Track {} rejected frame {} (last frame {})", track->id, context.frameIndex, track->lastFrame());
      }
      continue;
    }
    track->disappearedCount = 0;
  }

  for (const int trackId : association.missedTrackIds) {
    Track_t* track = context.activeTracks.find(trackId);
    if (!track) {
      continue;
    }
    ++track->disappearedCount;
    if (track->disappearedCount > maxDisappeared) {
      terminate(context, trackId);
    }
  }

  for (const std::size_t detectionIndex : association.unmatchedDetections) {
    context.activeTracks.create(detections[detectionIndex], context.frameIndex);
  }
  context.stats.recordCreated(association.unmatchedDetections.size());
}

void TrackLifecycle::terminate(TrackingContext_t& context, int trackId) const {
  std::optional<Track_t> track = context.activeTracks.remove(trackId);
  if (!track) {
    return;
  }
  const bool emit = track->length() >= minEmitLength;
  if (auto logger = Logger::GetClass("TrackLifecycle")) {
    logger->trace("Track {} terminated at frame {} with {} points{}", track->id, context.frameIndex, track->length(),
                  emit ? "" : " (dropped)");
  }
  context.stats.recordTerminated(emit);
  if (emit) {
    context.completedTracks.push_back(std::move(*track));
  }
}

std::size_t TrackLifecycle::prune(TrackingContext_t& context) const {
  const std::size_t active = context.activeTracks.size();
  if (active <= maxActiveTracks) {
    return 0;
  }

  struct Candidate_t {
    std::size_t length;
    int id;
  };
  std::vector<Candidate_t> candidates;
  candidates.reserve(active);
  context.activeTracks.forEach([&candidates](const Track_t& track) {
    candidates.push_back({track.length(), track.id});
  });
  // Ids arrive ascending, so equal lengths drop the oldest track first.
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate_t& a, const Candidate_t& b) { return a.length < b.length; });

  const std::size_t excess = active - maxActiveTracks;
  for (std::size_t i = 0; i < excess; ++i) {
    context.activeTracks.remove(candidates[i].id);
  }
  context.stats.recordPruned(excess);
  if (auto logger = Logger::GetClass("TrackLifecycle")) {
    logger->debug("Pruned {} short tracks at frame {} (cap {})", excess, context.frameIndex, maxActiveTracks);
  }
  return excess;
}

std::size_t TrackLifecycle::flush(TrackingContext_t& context) const {
  const std::vector<int> ids = context.activeTracks.ids();
  for (const int id : ids) {
    std::optional<Track_t> track = context.activeTracks.remove(id);
    if (track) {
      context.completedTracks.push_back(std::move(*track));
    }
  }
  context.stats.recordFlushed(ids.size());
  return ids.size();
}

} // namespace casa
