#include "casa/detection/Detector.hpp"

#include <algorithm>
#include <string>

#include <opencv2/imgproc.hpp>

#include "casa/core/Errors.hpp"
#include "casa/core/Logger.hpp"

namespace casa {

namespace {

DetectorOptions_t optionsFrom(const TrackerConfig_t& config) {
  DetectorOptions_t options;
  options.minArea = config.minArea;
  options.maxArea = config.maxArea;
  options.maxDetections = config.maxDetections;
  options.connectivity = config.connectivity;
  return options;
}

} // namespace

Detector::Detector(DetectorOptions_t options) : opts(options) {
  if (!(opts.minArea >= 0.0)) {
    throw ConfigError("minArea", "must not be negative");
  }
  if (!(opts.maxArea >= opts.minArea)) {
    throw ConfigError("maxArea", "must not be smaller than minArea");
  }
  if (opts.maxDetections == 0) {
    throw ConfigError("maxDetections", "must be at least 1");
  }
  if (opts.connectivity != 4 && opts.connectivity != 8) {
    throw ConfigError("connectivity", "must be 4 or 8");
  }
}

Detector::Detector(const TrackerConfig_t& config) : opts(optionsFrom(config)) {
  config.validate();
}

Detections Detector::detect(const cv::Mat& mask) const {
  Detections detections;
  if (mask.empty()) {
    return detections;
  }
  if (mask.dims != 2 || mask.channels() != 1) {
    throw DetectionError("mask must be a single-channel 2D image, got " + std::to_string(mask.dims) + " dims and " +
                         std::to_string(mask.channels()) + " channels");
  }

  const cv::Mat foreground = mask != 0;
  cv::Mat labels;
  cv::Mat stats;
  cv::Mat centroids;
  const int labelCount =
      cv::connectedComponentsWithStats(foreground, labels, stats, centroids, opts.connectivity, CV_32S);

  // Label 0 is the background.
  for (int label = 1; label < labelCount; ++label) {
    const double area = static_cast<double>(stats.at<int>(label, cv::CC_STAT_AREA));
    if (area < opts.minArea || area > opts.maxArea) {
      continue;
    }
    Detection_t detection;
    detection.centroid = Point2d(centroids.at<double>(label, 0), centroids.at<double>(label, 1));
    detection.area = area;
    detections.push_back(detection);
  }

  if (detections.size() > opts.maxDetections) {
    std::stable_sort(detections.begin(), detections.end(),
                     [](const Detection_t& a, const Detection_t& b) { return a.area > b.area; });
    if (auto logger = Logger::GetClass("Detector")) {
      logger->debug("Detector kept {} of {} regions", opts.maxDetections, detections.size());
    }
    detections.resize(opts.maxDetections);
  }
  return detections;
}

PointList centroidsOf(const Detections& detections) {
  PointList points;
  points.reserve(detections.size());
  for (const auto& detection : detections) {
    points.push_back(detection.centroid);
  }
  return points;
}

} // namespace casa
