#pragma once

#include <ostream>
#include <vector>

#include <nlohmann/json.hpp>

#include "casa/analysis/MotilityResult.hpp"
#include "casa/tracking/Track.hpp"

namespace casa {

// Summary, category counts and the per-track table.
nlohmann::json toJson(const MotilityResult_t& result);
nlohmann::json toJson(const TrackMetrics_t& metrics);

// Raw trajectories: id, positions and frame indices.
nlohmann::json tracksToJson(const std::vector<Track_t>& tracks);

// One header line followed by one row per analysed track.
void writeTrackCsv(std::ostream& out, const MotilityResult_t& result);

} // namespace casa
