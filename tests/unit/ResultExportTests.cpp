#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "casa/analysis/MotilityAnalyzer.hpp"
#include "casa/analysis/ResultExport.hpp"

namespace {

std::vector<casa::Track_t> makeTracks() {
  std::vector<casa::Track_t> tracks;
  for (int id = 0; id < 3; ++id) {
    casa::Track_t track = casa::makeTrack(id, casa::Point2d(0.0, 10.0 * id), 0);
    for (int frame = 1; frame < 12; ++frame) {
      track.append(casa::Point2d(2.0 * id * frame, 10.0 * id), frame);
    }
    tracks.push_back(track);
  }
  return tracks;
}

} // namespace

TEST(ResultExportTests, SummaryCarriesAggregateKeys) {
  const casa::MotilityAnalyzer analyzer{casa::AnalyzerConfig_t{}};
  const casa::MotilityResult_t result = analyzer.analyze(makeTracks());

  const nlohmann::json summary = result.summary();
  for (const char* key : {"total_count", "motile_count", "immotile_count", "motility_percent", "vcl", "vsl", "vap",
                          "lin", "wobble", "progression", "bcf"}) {
    EXPECT_TRUE(summary.contains(key)) << key;
  }
  EXPECT_EQ(summary.at("total_count").get<std::size_t>(), 3u);
}

TEST(ResultExportTests, JsonHoldsCategoriesAndTrackRows) {
  const casa::MotilityAnalyzer analyzer{casa::AnalyzerConfig_t{}};
  const casa::MotilityResult_t result = analyzer.analyze(makeTracks());

  const nlohmann::json document = casa::toJson(result);
  ASSERT_TRUE(document.at("tracks").is_array());
  EXPECT_EQ(document.at("tracks").size(), 3u);
  EXPECT_EQ(document.at("tracks")[0].at("category").get<std::string>(), "immotile");
  EXPECT_EQ(document.at("categories").at("immotile").get<std::size_t>(), result.categories.immotile);
}

TEST(ResultExportTests, CsvHasHeaderAndOneRowPerTrack) {
  const casa::MotilityAnalyzer analyzer{casa::AnalyzerConfig_t{}};
  const casa::MotilityResult_t result = analyzer.analyze(makeTracks());

  std::ostringstream out;
  casa::writeTrackCsv(out, result);

  std::istringstream in(out.str());
  std::string line;
  std::vector<std::string> lines;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0].rfind("track_id,length,duration", 0), 0u);
  EXPECT_EQ(lines[1].rfind("0,12,", 0), 0u);
}

TEST(ResultExportTests, TracksSerialiseWithFrameIndices) {
  const nlohmann::json list = casa::tracksToJson(makeTracks());
  ASSERT_EQ(list.size(), 3u);
  EXPECT_EQ(list[1].at("id").get<int>(), 1);
  EXPECT_EQ(list[1].at("positions").size(), 12u);
  EXPECT_EQ(list[1].at("frame_indices").size(), 12u);
  EXPECT_DOUBLE_EQ(list[1].at("positions")[11][0].get<double>(), 22.0);
}
