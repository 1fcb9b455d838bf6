#pragma once

#include <vector>

#include "casa/tracking/TrackTable.hpp"
#include "casa/tracking/TrackingStats.hpp"

namespace casa {

// Mutable state of a single tracking run. Each run owns its own context, so
// independent runs share nothing.
struct TrackingContext_t {
  TrackTable activeTracks;
  std::vector<Track_t> completedTracks;
  TrackingStats stats;
  int frameIndex = 0;
  bool hasFrame = false;
};

} // namespace casa
