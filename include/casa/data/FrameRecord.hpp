#pragma once

#include <opencv2/core.hpp>

namespace casa {

// One preprocessed frame as emitted by the upstream segmentation stage.
struct FrameRecord_t {
  cv::Mat original;
  // Foreground where non-zero. Empty when the upstream stage produced no mask.
  cv::Mat binaryMask;
  int frameIndex = 0;

  bool hasMask() const { return !binaryMask.empty(); }
};

} // namespace casa
