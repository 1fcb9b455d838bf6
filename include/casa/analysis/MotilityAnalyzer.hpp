#pragma once

#include <optional>
#include <vector>

#include "casa/analysis/MotilityResult.hpp"
#include "casa/core/Config.hpp"
#include "casa/tracking/Track.hpp"

namespace casa {

// Derives kinematic and classification metrics from completed tracks.
class MotilityAnalyzer {
public:
  explicit MotilityAnalyzer(AnalyzerConfig_t config);

  // Never throws on data: an empty or fully filtered input yields a zeroed result.
  MotilityResult_t analyze(const std::vector<Track_t>& tracks) const;

  // Counts rapid / medium / slow / immotile; tracks shorter than
  // minTrackLength are immotile.
  MotilityCategories_t classifyTracks(const std::vector<Track_t>& tracks) const;

  TrackMetrics_t measureTrack(const Track_t& track) const;
  bool isMotile(const Track_t& track) const;
  MotilityCategory_e classify(const TrackMetrics_t& metrics) const;

  // Approximation of beat-cross frequency: sign reversals of the x or y step
  // component per second. Empty when the track has fewer than 3 points or
  // spans no time.
  std::optional<double> directionChangeFrequency(const Track_t& track) const;

  const AnalyzerConfig_t& config() const { return analyzerConfig; }

private:
  AnalyzerConfig_t analyzerConfig;
};

} // namespace casa
