#include "casa/analysis/MotilityAnalyzer.hpp"

#include <utility>

#include "casa/core/Logger.hpp"

namespace casa {

namespace {

double safeRatio(double numerator, double denominator) {
  if (denominator <= 0.0) {
    return 0.0;
  }
  return numerator / denominator;
}

} // namespace

MotilityAnalyzer::MotilityAnalyzer(AnalyzerConfig_t config) : analyzerConfig(std::move(config)) {
  analyzerConfig.validate();
}

bool MotilityAnalyzer::isMotile(const Track_t& track) const {
  double distance = totalDistance(track);
  if (analyzerConfig.motileDistanceUnit == DistanceUnit_e::kMicrons) {
    distance *= analyzerConfig.pixelsPerMicron;
  }
  return distance > analyzerConfig.motileDistanceThreshold;
}

std::optional<double> MotilityAnalyzer::directionChangeFrequency(const Track_t& track) const {
  if (track.length() < 3) {
    return std::nullopt;
  }
  const int framesElapsed = track.lastFrame() - track.firstFrame();
  if (framesElapsed <= 0) {
    return std::nullopt;
  }

  int directionChanges = 0;
  Point2d previous = track.positions[1] - track.positions[0];
  for (std::size_t i = 2; i < track.positions.size(); ++i) {
    const Point2d step = track.positions[i] - track.positions[i - 1];
    if (step.x() * previous.x() < 0.0 || step.y() * previous.y() < 0.0) {
      ++directionChanges;
    }
    previous = step;
  }
  return directionChanges / (framesElapsed / analyzerConfig.fps);
}

TrackMetrics_t MotilityAnalyzer::measureTrack(const Track_t& track) const {
  const double scale = analyzerConfig.pixelsPerMicron;
  const double fps = analyzerConfig.fps;
  const double rawTotal = totalDistance(track);
  const double rawStraight = straightLineDistance(track);

  TrackMetrics_t metrics;
  metrics.trackId = track.id;
  metrics.length = track.length();
  metrics.totalDistance = rawTotal * scale;
  metrics.straightDistance = rawStraight * scale;
  if (track.length() >= 2) {
    metrics.duration = (track.lastFrame() - track.firstFrame()) / fps;
  } else {
    metrics.duration = 1.0 / fps;
  }
  metrics.vcl = safeRatio(metrics.totalDistance, metrics.duration);
  metrics.vsl = safeRatio(metrics.straightDistance, metrics.duration);
  // Mean step speed stands in for the velocity along a smoothed path.
  metrics.vap = meanStepVelocity(track) * scale * fps;
  metrics.lin = safeRatio(rawStraight, rawTotal);
  metrics.bcf = directionChangeFrequency(track).value_or(0.0);
  metrics.isMotile = isMotile(track);
  metrics.category = classify(metrics);
  return metrics;
}

MotilityCategory_e MotilityAnalyzer::classify(const TrackMetrics_t& metrics) const {
  if (metrics.length < analyzerConfig.minTrackLength || !metrics.isMotile) {
    return MotilityCategory_e::kImmotile;
  }
  if (metrics.vcl > analyzerConfig.rapidVclThreshold) {
    return MotilityCategory_e::kRapid;
  }
  if (metrics.vcl > analyzerConfig.mediumVclThreshold) {
    return MotilityCategory_e::kMedium;
  }
  return MotilityCategory_e::kSlow;
}

MotilityCategories_t MotilityAnalyzer::classifyTracks(const std::vector<Track_t>& tracks) const {
  MotilityCategories_t categories;
  for (const auto& track : tracks) {
    if (track.length() < analyzerConfig.minTrackLength) {
      ++categories.immotile;
      continue;
    }
    switch (classify(measureTrack(track))) {
      case MotilityCategory_e::kRapid:
        ++categories.rapid;
        break;
      case MotilityCategory_e::kMedium:
        ++categories.medium;
        break;
      case MotilityCategory_e::kSlow:
        ++categories.slow;
        break;
      case MotilityCategory_e::kImmotile:
        ++categories.immotile;
        break;
    }
  }
  return categories;
}

MotilityResult_t MotilityAnalyzer::analyze(const std::vector<Track_t>& tracks) const {
  auto logger = Logger::GetClass("MotilityAnalyzer");
  MotilityResult_t result;

  for (const auto& track : tracks) {
    if (track.length() >= analyzerConfig.minTrackLength) {
      result.tracks.push_back(measureTrack(track));
    }
  }
  if (result.tracks.empty()) {
    if (logger) {
      logger->warn("No valid tracks for analysis ({} submitted, minimum length {})", tracks.size(),
                   analyzerConfig.minTrackLength);
    }
    return result;
  }

  double sumVcl = 0.0;
  double sumVsl = 0.0;
  double sumVap = 0.0;
  double sumLin = 0.0;
  double sumBcf = 0.0;
  std::size_t bcfCount = 0;
  for (const auto& metrics : result.tracks) {
    if (metrics.isMotile) {
      ++result.motileCount;
    }
    sumVcl += metrics.vcl;
    sumVsl += metrics.vsl;
    sumVap += metrics.vap;
    sumLin += metrics.lin;
  }
  for (const auto& track : tracks) {
    if (track.length() < analyzerConfig.minTrackLength) {
      continue;
    }
    if (const auto frequency = directionChangeFrequency(track)) {
      sumBcf += *frequency;
      ++bcfCount;
    }
  }

  const double count = static_cast<double>(result.tracks.size());
  result.totalCount = result.tracks.size();
  result.immotileCount = result.totalCount - result.motileCount;
  result.motilityPercent = 100.0 * static_cast<double>(result.motileCount) / count;
  result.vcl = sumVcl / count;
  result.vsl = sumVsl / count;
  result.vap = sumVap / count;
  result.lin = sumLin / count;
  // Ratios of the aggregate means, not means of per-track ratios.
  result.wobble = safeRatio(result.vap, result.vcl);
  result.progression = safeRatio(result.vsl, result.vap);
  result.bcf = bcfCount > 0 ? sumBcf / static_cast<double>(bcfCount) : 0.0;
  result.categories = classifyTracks(tracks);

  if (logger) {
    logger->info("Analysis complete: {}/{} motile ({:.1f}%), VCL {:.2f} VSL {:.2f} VAP {:.2f}", result.motileCount,
                 result.totalCount, result.motilityPercent, result.vcl, result.vsl, result.vap);
  }
  return result;
}

} // namespace casa
