#include "casa/core/Config.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

#include "casa/core/Errors.hpp"
#include "casa/core/Logger.hpp"

namespace casa {

namespace {

// Missing or null keys keep the default. A present key must hold a value of
// the field's type, otherwise the document is rejected.
const nlohmann::json* findValue(const nlohmann::json& node, const std::string& key) {
  if (!node.is_object()) {
    return nullptr;
  }
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::string getString(const nlohmann::json& node, const std::string& key, const std::string& fallback) {
  const nlohmann::json* value = findValue(node, key);
  if (!value) {
    return fallback;
  }
  if (!value->is_string()) {
    throw ConfigError(key, "expected a string, got " + std::string(value->type_name()));
  }
  return value->get<std::string>();
}

int getInt(const nlohmann::json& node, const std::string& key, int fallback) {
  const nlohmann::json* value = findValue(node, key);
  if (!value) {
    return fallback;
  }
  if (!value->is_number_integer()) {
    throw ConfigError(key, "expected an integer, got " + std::string(value->type_name()));
  }
  if (value->is_number_unsigned()) {
    if (value->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      throw ConfigError(key, "integer out of range");
    }
    return static_cast<int>(value->get<std::uint64_t>());
  }
  const std::int64_t signedValue = value->get<std::int64_t>();
  if (signedValue < std::numeric_limits<int>::min() || signedValue > std::numeric_limits<int>::max()) {
    throw ConfigError(key, "integer out of range");
  }
  return static_cast<int>(signedValue);
}

std::size_t getSize(const nlohmann::json& node, const std::string& key, std::size_t fallback) {
  const nlohmann::json* value = findValue(node, key);
  if (!value) {
    return fallback;
  }
  if (!value->is_number_integer()) {
    throw ConfigError(key, "expected a non-negative integer, got " + std::string(value->type_name()));
  }
  if (value->is_number_unsigned()) {
    const std::uint64_t unsignedValue = value->get<std::uint64_t>();
    if (unsignedValue > std::numeric_limits<std::size_t>::max()) {
      throw ConfigError(key, "integer out of range");
    }
    return static_cast<std::size_t>(unsignedValue);
  }
  // Integers set programmatically are signed even when non-negative.
  const std::int64_t signedValue = value->get<std::int64_t>();
  if (signedValue < 0) {
    throw ConfigError(key, "must not be negative");
  }
  return static_cast<std::size_t>(signedValue);
}

double getDouble(const nlohmann::json& node, const std::string& key, double fallback) {
  const nlohmann::json* value = findValue(node, key);
  if (!value) {
    return fallback;
  }
  if (!value->is_number()) {
    throw ConfigError(key, "expected a number, got " + std::string(value->type_name()));
  }
  return value->get<double>();
}

void requireFinite(const char* field, double value) {
  if (!std::isfinite(value)) {
    throw ConfigError(field, "must be finite");
  }
}

void requirePositive(const char* field, double value) {
  requireFinite(field, value);
  if (value <= 0.0) {
    throw ConfigError(field, "must be positive");
  }
}

} // namespace

void TrackerConfig_t::validate() const {
  requireFinite("minArea", minArea);
  requireFinite("maxArea", maxArea);
  if (minArea < 0.0) {
    throw ConfigError("minArea", "must not be negative");
  }
  if (maxArea < minArea) {
    throw ConfigError("maxArea", "must not be smaller than minArea");
  }
  requirePositive("maxDistance", maxDistance);
  if (maxDisappeared < 0) {
    throw ConfigError("maxDisappeared", "must not be negative");
  }
  if (maxActiveTracks == 0) {
    throw ConfigError("maxActiveTracks", "must be at least 1");
  }
  if (maxDetections == 0) {
    throw ConfigError("maxDetections", "must be at least 1");
  }
  if (connectivity != 4 && connectivity != 8) {
    throw ConfigError("connectivity", "must be 4 or 8");
  }
  if (frameSleepMs < 0) {
    throw ConfigError("frameSleepMs", "must not be negative");
  }
}

void AnalyzerConfig_t::validate() const {
  if (minTrackLength < 1) {
    throw ConfigError("minTrackLength", "must be at least 1");
  }
  requirePositive("pixelsPerMicron", pixelsPerMicron);
  requirePositive("fps", fps);
  requireFinite("motileDistanceThreshold", motileDistanceThreshold);
  if (motileDistanceThreshold < 0.0) {
    throw ConfigError("motileDistanceThreshold", "must not be negative");
  }
  requireFinite("rapidVclThreshold", rapidVclThreshold);
  requireFinite("mediumVclThreshold", mediumVclThreshold);
  if (mediumVclThreshold < 0.0) {
    throw ConfigError("mediumVclThreshold", "must not be negative");
  }
  if (rapidVclThreshold < mediumVclThreshold) {
    throw ConfigError("rapidVclThreshold", "must not be smaller than mediumVclThreshold");
  }
}

AssignmentMethod_e parseAssignmentMethod(const std::string& value) {
  if (value == "greedy") {
    return AssignmentMethod_e::kGreedy;
  }
  if (value == "optimal" || value == "hungarian") {
    return AssignmentMethod_e::kOptimal;
  }
  throw ConfigError("assignment", "unknown method '" + value + "', expected greedy or optimal");
}

DistanceUnit_e parseDistanceUnit(const std::string& value) {
  if (value == "pixels" || value == "px") {
    return DistanceUnit_e::kPixels;
  }
  if (value == "microns" || value == "um") {
    return DistanceUnit_e::kMicrons;
  }
  throw ConfigError("motileDistanceUnit", "unknown unit '" + value + "', expected pixels or microns");
}

std::string toString(AssignmentMethod_e method) {
  return method == AssignmentMethod_e::kOptimal ? "optimal" : "greedy";
}

std::string toString(DistanceUnit_e unit) {
  return unit == DistanceUnit_e::kMicrons ? "microns" : "pixels";
}

TrackerConfig_t trackerConfigFromJson(const nlohmann::json& node) {
  TrackerConfig_t config;
  if (!node.is_object()) {
    return config;
  }
  config.minArea = getDouble(node, "minArea", config.minArea);
  config.maxArea = getDouble(node, "maxArea", config.maxArea);
  config.maxDistance = getDouble(node, "maxDistance", config.maxDistance);
  config.maxDisappeared = getInt(node, "maxDisappeared", config.maxDisappeared);
  config.maxActiveTracks = getSize(node, "maxActiveTracks", config.maxActiveTracks);
  config.maxDetections = getSize(node, "maxDetections", config.maxDetections);
  config.minEmitLength = getSize(node, "minEmitLength", config.minEmitLength);
  config.connectivity = getInt(node, "connectivity", config.connectivity);
  config.assignment = parseAssignmentMethod(getString(node, "assignment", toString(config.assignment)));
  config.frameSleepMs = getInt(node, "frameSleepMs", config.frameSleepMs);
  config.progressInterval = getSize(node, "progressInterval", config.progressInterval);
  return config;
}

AnalyzerConfig_t analyzerConfigFromJson(const nlohmann::json& node) {
  AnalyzerConfig_t config;
  if (!node.is_object()) {
    return config;
  }
  config.minTrackLength = getSize(node, "minTrackLength", config.minTrackLength);
  config.pixelsPerMicron = getDouble(node, "pixelsPerMicron", config.pixelsPerMicron);
  config.fps = getDouble(node, "fps", config.fps);
  config.motileDistanceThreshold = getDouble(node, "motileDistanceThreshold", config.motileDistanceThreshold);
  config.motileDistanceUnit =
      parseDistanceUnit(getString(node, "motileDistanceUnit", toString(config.motileDistanceUnit)));
  config.rapidVclThreshold = getDouble(node, "rapidVclThreshold", config.rapidVclThreshold);
  config.mediumVclThreshold = getDouble(node, "mediumVclThreshold", config.mediumVclThreshold);
  return config;
}

nlohmann::json toJson(const TrackerConfig_t& config) {
  nlohmann::json node;
  node["minArea"] = config.minArea;
  node["maxArea"] = config.maxArea;
  node["maxDistance"] = config.maxDistance;
  node["maxDisappeared"] = config.maxDisappeared;
  node["maxActiveTracks"] = config.maxActiveTracks;
  node["maxDetections"] = config.maxDetections;
  node["minEmitLength"] = config.minEmitLength;
  node["connectivity"] = config.connectivity;
  node["assignment"] = toString(config.assignment);
  node["frameSleepMs"] = config.frameSleepMs;
  node["progressInterval"] = config.progressInterval;
  return node;
}

nlohmann::json toJson(const AnalyzerConfig_t& config) {
  nlohmann::json node;
  node["minTrackLength"] = config.minTrackLength;
  node["pixelsPerMicron"] = config.pixelsPerMicron;
  node["fps"] = config.fps;
  node["motileDistanceThreshold"] = config.motileDistanceThreshold;
  node["motileDistanceUnit"] = toString(config.motileDistanceUnit);
  node["rapidVclThreshold"] = config.rapidVclThreshold;
  node["mediumVclThreshold"] = config.mediumVclThreshold;
  return node;
}

nlohmann::json loadConfigFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file: " + path);
  }
  nlohmann::json config;
  try {
    file >> config;
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::runtime_error("Failed to parse config file " + path + ": " + ex.what());
  }
  if (auto logger = Logger::GetClass("Config")) {
    logger->debug("Loaded config {}", path);
  }
  return config;
}

} // namespace casa
