#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace casa {

// Frame-to-frame assignment strategy.
enum class AssignmentMethod_e {
  kGreedy,
  kOptimal
};

// Unit the motility distance threshold is compared in.
enum class DistanceUnit_e {
  kPixels,
  kMicrons
};

// Detection, association and lifecycle parameters for one tracking run.
struct TrackerConfig_t {
  double minArea = 10.0;
  double maxArea = 200.0;
  double maxDistance = 50.0;
  int maxDisappeared = 10;
  std::size_t maxActiveTracks = 500;
  std::size_t maxDetections = 500;
  // Tracks terminated mid-stream shorter than this are dropped.
  std::size_t minEmitLength = 3;
  int connectivity = 8;
  AssignmentMethod_e assignment = AssignmentMethod_e::kGreedy;
  // Bounded sleep per frame; 0 disables throttling.
  int frameSleepMs = 0;
  std::size_t progressInterval = 100;

  // Throws ConfigError on the first out-of-range field.
  void validate() const;
};

// Calibration and classification parameters for the motility analysis.
struct AnalyzerConfig_t {
  std::size_t minTrackLength = 10;
  double pixelsPerMicron = 1.0;
  double fps = 30.0;
  double motileDistanceThreshold = 10.0;
  DistanceUnit_e motileDistanceUnit = DistanceUnit_e::kPixels;
  double rapidVclThreshold = 100.0;
  double mediumVclThreshold = 50.0;

  void validate() const;
};

// Missing keys keep their defaults. A key of the wrong type, a negative or
// out-of-range integer, or an unknown enum string throws ConfigError.
TrackerConfig_t trackerConfigFromJson(const nlohmann::json& node);
AnalyzerConfig_t analyzerConfigFromJson(const nlohmann::json& node);
nlohmann::json toJson(const TrackerConfig_t& config);
nlohmann::json toJson(const AnalyzerConfig_t& config);

// Reads a JSON document from disk; throws std::runtime_error when unreadable.
nlohmann::json loadConfigFile(const std::string& path);

// Both throw ConfigError on an unrecognised name.
AssignmentMethod_e parseAssignmentMethod(const std::string& value);
DistanceUnit_e parseDistanceUnit(const std::string& value);
std::string toString(AssignmentMethod_e method);
std::string toString(DistanceUnit_e unit);

} // namespace casa
