#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace casa {

enum class MotilityCategory_e {
  kRapid,
  kMedium,
  kSlow,
  kImmotile
};

std::string toString(MotilityCategory_e category);

// Kinematics of one analysed track. Distances and velocities are scaled by
// pixelsPerMicron; lin is computed on raw pixel distances.
struct TrackMetrics_t {
  int trackId = -1;
  std::size_t length = 0;
  double duration = 0.0;
  double totalDistance = 0.0;
  double straightDistance = 0.0;
  double vcl = 0.0;
  double vsl = 0.0;
  double vap = 0.0;
  double lin = 0.0;
  // Direction reversals per second; 0 for tracks with fewer than 3 points.
  double bcf = 0.0;
  bool isMotile = false;
  MotilityCategory_e category = MotilityCategory_e::kImmotile;
};

struct MotilityCategories_t {
  std::size_t rapid = 0;
  std::size_t medium = 0;
  std::size_t slow = 0;
  std::size_t immotile = 0;

  std::size_t total() const { return rapid + medium + slow + immotile; }
};

// Aggregate result of one analysis run.
struct MotilityResult_t {
  std::size_t totalCount = 0;
  std::size_t motileCount = 0;
  std::size_t immotileCount = 0;
  double motilityPercent = 0.0;
  double vcl = 0.0;
  double vsl = 0.0;
  double vap = 0.0;
  double lin = 0.0;
  // mean(vap) / mean(vcl)
  double wobble = 0.0;
  // mean(vsl) / mean(vap)
  double progression = 0.0;
  double bcf = 0.0;
  MotilityCategories_t categories;
  std::vector<TrackMetrics_t> tracks;

  nlohmann::json summary() const;
};

} // namespace casa
