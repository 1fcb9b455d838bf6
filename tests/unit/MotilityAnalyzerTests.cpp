#include <cmath>
#include <vector>

#include <gtest/gtest.h>

#include "casa/analysis/MotilityAnalyzer.hpp"
#include "casa/core/Errors.hpp"

namespace {

casa::Track_t makeTrack(int id, const std::vector<casa::Point2d>& positions, const std::vector<int>& frames) {
  casa::Track_t track = casa::makeTrack(id, positions.front(), frames.front());
  for (std::size_t i = 1; i < positions.size(); ++i) {
    track.append(positions[i], frames[i]);
  }
  return track;
}

// Moves by `step` every frame for `frames` frames, starting at frame 0.
casa::Track_t makeLinearTrack(int id, const casa::Point2d& start, const casa::Point2d& step, int frames) {
  casa::Track_t track = casa::makeTrack(id, start, 0);
  for (int i = 1; i < frames; ++i) {
    track.append(start + step * static_cast<double>(i), i);
  }
  return track;
}

casa::AnalyzerConfig_t makeConfig(std::size_t minTrackLength, double fps, double pixelsPerMicron = 1.0) {
  casa::AnalyzerConfig_t config;
  config.minTrackLength = minTrackLength;
  config.fps = fps;
  config.pixelsPerMicron = pixelsPerMicron;
  return config;
}

void expectFinite(const casa::MotilityResult_t& result) {
  for (const double value : {result.motilityPercent, result.vcl, result.vsl, result.vap, result.lin, result.wobble,
                             result.progression, result.bcf}) {
    EXPECT_TRUE(std::isfinite(value));
  }
}

} // namespace

TEST(MotilityAnalyzerTests, StationaryObjectIsImmotile) {
  const casa::MotilityAnalyzer analyzer(makeConfig(10, 30.0));
  const std::vector<casa::Track_t> tracks{
      makeLinearTrack(0, casa::Point2d(40.0, 40.0), casa::Point2d(0.0, 0.0), 20)};

  const casa::MotilityResult_t result = analyzer.analyze(tracks);
  ASSERT_EQ(result.tracks.size(), 1u);
  EXPECT_NEAR(result.tracks[0].totalDistance, 0.0, 1e-12);
  EXPECT_FALSE(result.tracks[0].isMotile);
  EXPECT_EQ(result.tracks[0].category, casa::MotilityCategory_e::kImmotile);
  EXPECT_EQ(result.tracks[0].lin, 0.0);
  EXPECT_EQ(result.motileCount, 0u);
  EXPECT_EQ(result.immotileCount, 1u);
  EXPECT_EQ(result.motilityPercent, 0.0);
  EXPECT_EQ(result.categories.immotile, 1u);
  expectFinite(result);
}

TEST(MotilityAnalyzerTests, StraightMotionHasUnitLinearity) {
  const casa::MotilityAnalyzer analyzer(makeConfig(10, 10.0));
  const std::vector<casa::Track_t> tracks{
      makeLinearTrack(0, casa::Point2d(0.0, 0.0), casa::Point2d(5.0, 0.0), 20)};

  const casa::MotilityResult_t result = analyzer.analyze(tracks);
  ASSERT_EQ(result.tracks.size(), 1u);
  const casa::TrackMetrics_t& metrics = result.tracks[0];
  EXPECT_NEAR(metrics.straightDistance, metrics.totalDistance, 1e-9);
  EXPECT_NEAR(metrics.totalDistance, 95.0, 1e-9);
  EXPECT_NEAR(metrics.duration, 1.9, 1e-9);
  EXPECT_NEAR(metrics.lin, 1.0, 1e-9);
  EXPECT_NEAR(metrics.vcl, metrics.vsl, 1e-9);
  EXPECT_NEAR(metrics.vcl, 50.0, 1e-9);
  EXPECT_NEAR(metrics.vap, 50.0, 1e-9);
  EXPECT_NEAR(metrics.bcf, 0.0, 1e-12);
  EXPECT_TRUE(metrics.isMotile);
  EXPECT_EQ(metrics.category, casa::MotilityCategory_e::kSlow);
  EXPECT_NEAR(result.wobble, 1.0, 1e-9);
  EXPECT_NEAR(result.progression, 1.0, 1e-9);
  EXPECT_NEAR(result.motilityPercent, 100.0, 1e-9);
}

TEST(MotilityAnalyzerTests, EmptyInputYieldsZeroedResult) {
  const casa::MotilityAnalyzer analyzer(makeConfig(10, 30.0));
  const casa::MotilityResult_t result = analyzer.analyze({});

  EXPECT_EQ(result.totalCount, 0u);
  EXPECT_EQ(result.motileCount, 0u);
  EXPECT_EQ(result.immotileCount, 0u);
  EXPECT_EQ(result.motilityPercent, 0.0);
  EXPECT_EQ(result.vcl, 0.0);
  EXPECT_EQ(result.vsl, 0.0);
  EXPECT_EQ(result.vap, 0.0);
  EXPECT_EQ(result.lin, 0.0);
  EXPECT_EQ(result.wobble, 0.0);
  EXPECT_EQ(result.progression, 0.0);
  EXPECT_EQ(result.bcf, 0.0);
  EXPECT_EQ(result.categories.total(), 0u);
  EXPECT_TRUE(result.tracks.empty());
}

TEST(MotilityAnalyzerTests, TracksBelowMinimumLengthAreIgnored) {
  const casa::MotilityAnalyzer analyzer(makeConfig(10, 30.0));
  const std::vector<casa::Track_t> tracks{
      makeLinearTrack(0, casa::Point2d(0.0, 0.0), casa::Point2d(5.0, 0.0), 9),
      makeLinearTrack(1, casa::Point2d(0.0, 0.0), casa::Point2d(5.0, 0.0), 3)};

  const casa::MotilityResult_t result = analyzer.analyze(tracks);
  EXPECT_EQ(result.totalCount, 0u);
  EXPECT_TRUE(result.tracks.empty());
  expectFinite(result);
}

TEST(MotilityAnalyzerTests, WobbleAndProgressionAreRatiosOfMeans) {
  const casa::MotilityAnalyzer analyzer(makeConfig(3, 1.0));
  const std::vector<casa::Track_t> tracks{
      makeTrack(0, {casa::Point2d(0.0, 0.0), casa::Point2d(10.0, 0.0), casa::Point2d(20.0, 0.0)}, {0, 1, 3}),
      makeTrack(1, {casa::Point2d(0.0, 0.0), casa::Point2d(1.0, 0.0), casa::Point2d(2.0, 0.0)}, {0, 1, 2})};

  const casa::MotilityResult_t result = analyzer.analyze(tracks);
  ASSERT_EQ(result.tracks.size(), 2u);
  EXPECT_NEAR(result.tracks[0].vap, 7.5, 1e-9);
  EXPECT_NEAR(result.tracks[0].vcl, 20.0 / 3.0, 1e-9);

  const double meanVcl = (20.0 / 3.0 + 1.0) / 2.0;
  const double meanVsl = meanVcl;
  const double meanVap = (7.5 + 1.0) / 2.0;
  EXPECT_NEAR(result.vcl, meanVcl, 1e-9);
  EXPECT_NEAR(result.vap, meanVap, 1e-9);
  EXPECT_NEAR(result.wobble, meanVap / meanVcl, 1e-9);
  EXPECT_NEAR(result.progression, meanVsl / meanVap, 1e-9);

  const double meanOfRatios = (7.5 / (20.0 / 3.0) + 1.0) / 2.0;
  EXPECT_GT(std::abs(result.wobble - meanOfRatios), 1e-3);
}

TEST(MotilityAnalyzerTests, LinearityIsMeanOfPerTrackRatios) {
  const casa::MotilityAnalyzer analyzer(makeConfig(3, 1.0));
  const std::vector<casa::Track_t> tracks{
      makeTrack(0, {casa::Point2d(0.0, 0.0), casa::Point2d(3.0, 4.0), casa::Point2d(6.0, 0.0)}, {0, 1, 2}),
      makeLinearTrack(1, casa::Point2d(0.0, 0.0), casa::Point2d(1.0, 0.0), 5)};

  const casa::MotilityResult_t result = analyzer.analyze(tracks);
  EXPECT_NEAR(result.tracks[0].lin, 0.6, 1e-9);
  EXPECT_NEAR(result.lin, 0.8, 1e-9);
  for (const auto& metrics : result.tracks) {
    EXPECT_LE(metrics.straightDistance, metrics.totalDistance + 1e-9);
    EXPECT_GE(metrics.lin, 0.0);
    EXPECT_LE(metrics.lin, 1.0);
  }
}

TEST(MotilityAnalyzerTests, DistancesScaleByCalibrationFactor) {
  const casa::MotilityAnalyzer analyzer(makeConfig(3, 10.0, 0.5));
  const std::vector<casa::Track_t> tracks{
      makeLinearTrack(0, casa::Point2d(0.0, 0.0), casa::Point2d(4.0, 0.0), 11)};

  const casa::MotilityResult_t result = analyzer.analyze(tracks);
  const casa::TrackMetrics_t& metrics = result.tracks[0];
  EXPECT_NEAR(metrics.totalDistance, 20.0, 1e-9);
  EXPECT_NEAR(metrics.vcl, 20.0, 1e-9);
  EXPECT_NEAR(metrics.vap, 20.0, 1e-9);
  EXPECT_NEAR(metrics.lin, 1.0, 1e-9);
}

TEST(MotilityAnalyzerTests, MotilityThresholdUnitIsConfigurable) {
  casa::AnalyzerConfig_t config = makeConfig(3, 10.0, 0.5);
  config.motileDistanceThreshold = 15.0;
  // 20 px of travel, 10 after scaling.
  const std::vector<casa::Track_t> tracks{
      makeLinearTrack(0, casa::Point2d(0.0, 0.0), casa::Point2d(2.0, 0.0), 11)};

  config.motileDistanceUnit = casa::DistanceUnit_e::kPixels;
  EXPECT_TRUE(casa::MotilityAnalyzer(config).isMotile(tracks[0]));

  config.motileDistanceUnit = casa::DistanceUnit_e::kMicrons;
  EXPECT_FALSE(casa::MotilityAnalyzer(config).isMotile(tracks[0]));
}

TEST(MotilityAnalyzerTests, CountsDirectionReversalsPerSecond) {
  const casa::MotilityAnalyzer analyzer(makeConfig(3, 10.0));
  const casa::Track_t zigzag = makeTrack(
      0,
      {casa::Point2d(0.0, 0.0), casa::Point2d(1.0, 1.0), casa::Point2d(2.0, 0.0), casa::Point2d(3.0, 1.0),
       casa::Point2d(4.0, 0.0)},
      {0, 1, 2, 3, 4});

  const auto frequency = analyzer.directionChangeFrequency(zigzag);
  ASSERT_TRUE(frequency.has_value());
  EXPECT_NEAR(*frequency, 7.5, 1e-9);

  const casa::Track_t pair = makeTrack(1, {casa::Point2d(0.0, 0.0), casa::Point2d(1.0, 0.0)}, {0, 1});
  EXPECT_FALSE(analyzer.directionChangeFrequency(pair).has_value());
}

TEST(MotilityAnalyzerTests, AggregateBeatFrequencySkipsShortTracks) {
  const casa::MotilityAnalyzer analyzer(makeConfig(2, 10.0));
  const std::vector<casa::Track_t> tracks{
      makeTrack(0,
                {casa::Point2d(0.0, 0.0), casa::Point2d(1.0, 1.0), casa::Point2d(2.0, 0.0), casa::Point2d(3.0, 1.0),
                 casa::Point2d(4.0, 0.0)},
                {0, 1, 2, 3, 4}),
      makeLinearTrack(1, casa::Point2d(50.0, 50.0), casa::Point2d(1.0, 0.0), 5),
      makeTrack(2, {casa::Point2d(0.0, 0.0), casa::Point2d(30.0, 0.0)}, {0, 1})};

  const casa::MotilityResult_t result = analyzer.analyze(tracks);
  EXPECT_EQ(result.totalCount, 3u);
  EXPECT_NEAR(result.bcf, (7.5 + 0.0) / 2.0, 1e-9);
}

TEST(MotilityAnalyzerTests, ClassifiesByCurvilinearVelocity) {
  const casa::MotilityAnalyzer analyzer(makeConfig(5, 10.0));
  const std::vector<casa::Track_t> tracks{
      makeLinearTrack(0, casa::Point2d(0.0, 0.0), casa::Point2d(12.0, 0.0), 10),
      makeLinearTrack(1, casa::Point2d(0.0, 0.0), casa::Point2d(8.0, 0.0), 10),
      makeLinearTrack(2, casa::Point2d(0.0, 0.0), casa::Point2d(3.0, 0.0), 10),
      makeLinearTrack(3, casa::Point2d(0.0, 0.0), casa::Point2d(0.5, 0.0), 10),
      makeLinearTrack(4, casa::Point2d(0.0, 0.0), casa::Point2d(30.0, 0.0), 3)};

  const casa::MotilityCategories_t categories = analyzer.classifyTracks(tracks);
  EXPECT_EQ(categories.rapid, 1u);
  EXPECT_EQ(categories.medium, 1u);
  EXPECT_EQ(categories.slow, 1u);
  EXPECT_EQ(categories.immotile, 2u);
  EXPECT_EQ(categories.total(), tracks.size());

  const casa::MotilityResult_t result = analyzer.analyze(tracks);
  EXPECT_EQ(result.totalCount, 4u);
  EXPECT_EQ(result.motileCount, 3u);
  EXPECT_NEAR(result.motilityPercent, 75.0, 1e-9);
  EXPECT_GE(result.motilityPercent, 0.0);
  EXPECT_LE(result.motilityPercent, 100.0);
  EXPECT_EQ(result.categories.immotile, 2u);
}

TEST(MotilityAnalyzerTests, RejectsInvalidCalibration) {
  EXPECT_THROW(casa::MotilityAnalyzer(makeConfig(10, 0.0)), casa::ConfigError);
  EXPECT_THROW(casa::MotilityAnalyzer(makeConfig(10, 30.0, -1.0)), casa::ConfigError);
  EXPECT_THROW(casa::MotilityAnalyzer(makeConfig(0, 30.0)), casa::ConfigError);
}
