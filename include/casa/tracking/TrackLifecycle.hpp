#pragma once

#include <cstddef>

#include "casa/core/Config.hpp"
#include "casa/tracking/Associator.hpp"
#include "casa/tracking/TrackingContext.hpp"

namespace casa {

// Applies association results to the active table and harvests tracks.
//
// Per track: Active (disappearedCount == 0), Pending-loss
// (0 < disappearedCount <= maxDisappeared) and Terminated
// (disappearedCount > maxDisappeared, removed from the table).
class TrackLifecycle {
public:
  explicit TrackLifecycle(const TrackerConfig_t& config);

  // Extends matched tracks, ages missed ones and seeds new tracks for
  // unmatched detections, all at context.frameIndex.
  void apply(TrackingContext_t& context, const AssociationResult_t& association, const PointList& detections) const;

  // Drops the shortest active tracks until the cap is met. Returns the
  // number of tracks discarded.
  std::size_t prune(TrackingContext_t& context) const;

  // Moves every remaining active track to the completed list, regardless of length.
  std::size_t flush(TrackingContext_t& context) const;

private:
  void terminate(TrackingContext_t& context, int trackId) const;

  int maxDisappeared;
  std::size_t maxActiveTracks;
  std::size_t minEmitLength;
};

} // namespace casa
