#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "casa/core/Config.hpp"
#include "casa/core/Types.hpp"

namespace casa {

// Connected foreground region reduced to its centroid.
struct Detection_t {
  Point2d centroid = Point2d::Zero();
  double area = 0.0;
};

using Detections = std::vector<Detection_t>;

struct DetectorOptions_t {
  double minArea = 10.0;
  double maxArea = 200.0;
  std::size_t maxDetections = 500;
  int connectivity = 8;
};

// Extracts object centroids from a binary mask using connected components.
class Detector {
public:
  explicit Detector(DetectorOptions_t options);
  explicit Detector(const TrackerConfig_t& config);

  // Empty or all-background masks yield no detections. Throws DetectionError
  // when the mask is not a single-channel 2D image.
  Detections detect(const cv::Mat& mask) const;

private:
  DetectorOptions_t opts;
};

PointList centroidsOf(const Detections& detections);

} // namespace casa
