#include "casa/analysis/MotilityResult.hpp"

namespace casa {

std::string toString(MotilityCategory_e category) {
  switch (category) {
    case MotilityCategory_e::kRapid:
      return "rapid";
    case MotilityCategory_e::kMedium:
      return "medium";
    case MotilityCategory_e::kSlow:
      return "slow";
    case MotilityCategory_e::kImmotile:
      break;
  }
  return "immotile";
}

nlohmann::json MotilityResult_t::summary() const {
  nlohmann::json node;
  node["total_count"] = totalCount;
  node["motile_count"] = motileCount;
  node["immotile_count"] = immotileCount;
  node["motility_percent"] = motilityPercent;
  node["vcl"] = vcl;
  node["vsl"] = vsl;
  node["vap"] = vap;
  node["lin"] = lin;
  node["wobble"] = wobble;
  node["progression"] = progression;
  node["bcf"] = bcf;
  return node;
}

} // namespace casa
