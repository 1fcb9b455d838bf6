#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "casa/core/Config.hpp"
#include "casa/data/FrameSource.hpp"
#include "casa/detection/Detector.hpp"
#include "casa/tracking/Associator.hpp"
#include "casa/tracking/TrackLifecycle.hpp"
#include "casa/tracking/TrackingContext.hpp"

namespace casa {

// Returns true when the run should stop at the next frame boundary.
using CancellationCheck = std::function<bool()>;
// Called once per processed frame; may block to cap resource usage.
using ThrottleHook = std::function<void(int frameIndex)>;

struct TrackingResult_t {
  std::vector<Track_t> completedTracks;
  TrackingStats stats;
  bool cancelled = false;
  bool aborted = false;
  std::string errorMessage;
};

// Runs detection, association and lifecycle updates over an ordered frame
// stream. Each call to track() uses a fresh context.
class TrackingEngine {
public:
  explicit TrackingEngine(TrackerConfig_t config);
  TrackingEngine(TrackerConfig_t config, std::shared_ptr<IAssociator> associator);

  void setCancellationCheck(CancellationCheck check) { cancellationCheck = std::move(check); }
  void setThrottleHook(ThrottleHook hook) { throttleHook = std::move(hook); }

  TrackingResult_t track(IFrameSource& frames) const;

  // Single frame step; exposed for callers that drive frames themselves.
  // Returns false when the frame was skipped.
  bool processFrame(TrackingContext_t& context, const FrameRecord_t& frame) const;
  void finish(TrackingContext_t& context) const;

  const TrackerConfig_t& config() const { return trackerConfig; }

private:
  void throttle(int frameIndex) const;

  TrackerConfig_t trackerConfig;
  Detector detector;
  std::shared_ptr<IAssociator> associator;
  TrackLifecycle lifecycle;
  CancellationCheck cancellationCheck;
  ThrottleHook throttleHook;
};

} // namespace casa
