#include "casa/analysis/ResultExport.hpp"

#include <utility>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace casa {

nlohmann::json toJson(const TrackMetrics_t& metrics) {
  nlohmann::json node;
  node["track_id"] = metrics.trackId;
  node["length"] = metrics.length;
  node["duration"] = metrics.duration;
  node["total_distance"] = metrics.totalDistance;
  node["straight_distance"] = metrics.straightDistance;
  node["vcl"] = metrics.vcl;
  node["vsl"] = metrics.vsl;
  node["vap"] = metrics.vap;
  node["lin"] = metrics.lin;
  node["bcf"] = metrics.bcf;
  node["is_motile"] = metrics.isMotile;
  node["category"] = toString(metrics.category);
  return node;
}

nlohmann::json toJson(const MotilityResult_t& result) {
  nlohmann::json node;
  node["summary"] = result.summary();
  node["categories"] = {{"rapid", result.categories.rapid},
                        {"medium", result.categories.medium},
                        {"slow", result.categories.slow},
                        {"immotile", result.categories.immotile}};
  nlohmann::json rows = nlohmann::json::array();
  for (const auto& metrics : result.tracks) {
    rows.push_back(toJson(metrics));
  }
  node["tracks"] = std::move(rows);
  return node;
}

nlohmann::json tracksToJson(const std::vector<Track_t>& tracks) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& track : tracks) {
    nlohmann::json positions = nlohmann::json::array();
    for (const auto& position : track.positions) {
      positions.push_back({position.x(), position.y()});
    }
    list.push_back({{"id", track.id}, {"positions", positions}, {"frame_indices", track.frameIndices}});
  }
  return list;
}

void writeTrackCsv(std::ostream& out, const MotilityResult_t& result) {
  fmt::print(out, "track_id,length,duration,total_distance,straight_distance,vcl,vsl,vap,lin,bcf,is_motile,category\n");
  for (const auto& m : result.tracks) {
    fmt::print(out, "{},{},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{:.6f},{},{}\n", m.trackId, m.length,
               m.duration, m.totalDistance, m.straightDistance, m.vcl, m.vsl, m.vap, m.lin, m.bcf,
               m.isMotile ? "true" : "false", toString(m.category));
  }
}

} // namespace casa
