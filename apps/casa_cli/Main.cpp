#include <fmt/core.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "casa/analysis/MotilityAnalyzer.hpp"
#include "casa/analysis/ResultExport.hpp"
#include "casa/core/Config.hpp"
#include "casa/core/Errors.hpp"
#include "casa/core/Logger.hpp"
#include "casa/data/MaskDirectorySource.hpp"
#include "casa/pipeline/TrackingEngine.hpp"

namespace {

struct CliOptions_t {
  std::string configPath;
  std::string masksPath;
  std::string outputPath;
  std::string csvPath;
  std::string tracksPath;
  double fps = 0.0;
  double pixelsPerMicron = 0.0;
  bool showHelp = false;
  std::string error;
};

bool parseDouble(const std::string& text, double& out) {
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    return false;
  }
  out = value;
  return true;
}

CliOptions_t parseArgs(int argc, char** argv) {
  CliOptions_t options;
  options.configPath = "config/default.json";
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool hasValue = i + 1 < argc;
    if (arg == "--help" || arg == "-h") {
      options.showHelp = true;
      return options;
    } else if (arg == "--config" && hasValue) {
      options.configPath = argv[++i];
    } else if (arg == "--masks" && hasValue) {
      options.masksPath = argv[++i];
    } else if (arg == "--output" && hasValue) {
      options.outputPath = argv[++i];
    } else if (arg == "--csv" && hasValue) {
      options.csvPath = argv[++i];
    } else if (arg == "--tracks" && hasValue) {
      options.tracksPath = argv[++i];
    } else if (arg == "--fps" && hasValue) {
      if (!parseDouble(argv[++i], options.fps)) {
        options.error = "invalid --fps value";
      }
    } else if (arg == "--ppm" && hasValue) {
      if (!parseDouble(argv[++i], options.pixelsPerMicron)) {
        options.error = "invalid --ppm value";
      }
    } else {
      options.error = "unknown or incomplete argument: " + arg;
    }
  }
  if (options.error.empty() && !options.showHelp && options.masksPath.empty()) {
    options.error = "--masks is required";
  }
  return options;
}

void applyLoggingConfig(const nlohmann::json& config) {
  const nlohmann::json loggingNode = config.value("logging", nlohmann::json::object());
  const bool enabled = loggingNode.value("enabled", true);
  const std::string level = loggingNode.value("level", "info");
  const auto fileNode = loggingNode.value("file", nlohmann::json::object());
  casa::FileSinkConfig_t fileConfig;
  fileConfig.enabled = fileNode.value("enabled", false);
  fileConfig.path = fileNode.value("path", fileConfig.path);
  fileConfig.maxSizeBytes = fileNode.value("maxSizeBytes", fileConfig.maxSizeBytes);
  fileConfig.maxFiles = fileNode.value("maxFiles", fileConfig.maxFiles);
  casa::Logger::ConfigureFileSink(fileConfig);
  const auto classNode = loggingNode.value("classLogs", nlohmann::json::object());
  casa::ClassSinkConfig_t classConfig;
  classConfig.enabled = classNode.value("enabled", false);
  classConfig.directory = classNode.value("directory", classConfig.directory);
  classConfig.maxSizeBytes = classNode.value("maxSizeBytes", classConfig.maxSizeBytes);
  classConfig.maxFiles = classNode.value("maxFiles", classConfig.maxFiles);
  casa::Logger::ConfigureClassSink(classConfig);
  casa::Logger::SetEnabled(enabled);
  casa::Logger::SetLevel(casa::Logger::ParseLevel(level));
}

void writeJsonFile(const std::string& path, const nlohmann::json& document) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open output file: " + path);
  }
  file << document.dump(2) << '\n';
}

void printSummary(const casa::MotilityResult_t& result, const casa::TrackingResult_t& tracking) {
  fmt::print("Frames processed:  {} ({} skipped)\n", tracking.stats.framesProcessed(), tracking.stats.framesSkipped());
  fmt::print("Tracks completed:  {} ({} terminated, {} flushed at end, {} pruned)\n", tracking.completedTracks.size(),
             tracking.stats.tracksTerminated(), tracking.stats.tracksFlushed(), tracking.stats.tracksPruned());
  fmt::print("Analysed tracks:   {}\n", result.totalCount);
  fmt::print("Motile:            {} ({:.1f}%)\n", result.motileCount, result.motilityPercent);
  fmt::print("Immotile:          {}\n", result.immotileCount);
  fmt::print("VCL / VSL / VAP:   {:.2f} / {:.2f} / {:.2f} units/s\n", result.vcl, result.vsl, result.vap);
  fmt::print("LIN / WOB / PROG:  {:.3f} / {:.3f} / {:.3f}\n", result.lin, result.wobble, result.progression);
  fmt::print("BCF:               {:.2f} Hz\n", result.bcf);
  fmt::print("Rapid / medium / slow / immotile: {} / {} / {} / {}\n", result.categories.rapid,
             result.categories.medium, result.categories.slow, result.categories.immotile);
}

} // namespace

int main(int argc, char** argv) {
  casa::Logger::Initialize();
  const CliOptions_t cliOptions = parseArgs(argc, argv);
  if (cliOptions.showHelp) {
    fmt::print("Usage: casa_cli --masks <dir> [--config <path>] [--fps <v>] [--ppm <v>] [--output <json>] "
               "[--csv <path>] [--tracks <json>]\n");
    return 0;
  }
  if (!cliOptions.error.empty()) {
    fmt::print(stderr, "casa_cli: {}\n", cliOptions.error);
    return 2;
  }

  try {
    const nlohmann::json config = casa::loadConfigFile(cliOptions.configPath);
    applyLoggingConfig(config);
    if (auto logger = casa::Logger::Get()) {
      logger->info("casa_cli using config: {}", cliOptions.configPath);
    }

    const casa::TrackerConfig_t trackerConfig =
        casa::trackerConfigFromJson(config.value("tracker", nlohmann::json::object()));
    casa::AnalyzerConfig_t analyzerConfig =
        casa::analyzerConfigFromJson(config.value("analyzer", nlohmann::json::object()));
    if (cliOptions.fps > 0.0) {
      analyzerConfig.fps = cliOptions.fps;
    }
    if (cliOptions.pixelsPerMicron > 0.0) {
      analyzerConfig.pixelsPerMicron = cliOptions.pixelsPerMicron;
    }

    casa::TrackingEngine engine(trackerConfig);
    casa::MotilityAnalyzer analyzer(analyzerConfig);

    casa::MaskDirectorySource source(cliOptions.masksPath);
    if (!source.good()) {
      if (auto logger = casa::Logger::Get()) {
        logger->error("Failed to open mask directory: {}", cliOptions.masksPath);
      } else {
        fmt::print(stderr, "Failed to open mask directory.\n");
      }
      return 1;
    }

    const casa::TrackingResult_t tracking = engine.track(source);
    if (tracking.aborted) {
      if (auto logger = casa::Logger::Get()) {
        logger->warn("Tracking stopped early: {}", tracking.errorMessage);
      }
    }
    const casa::MotilityResult_t result = analyzer.analyze(tracking.completedTracks);
    printSummary(result, tracking);

    if (!cliOptions.outputPath.empty()) {
      nlohmann::json document = casa::toJson(result);
      document["tracker"] = casa::toJson(trackerConfig);
      document["analyzer"] = casa::toJson(analyzerConfig);
      document["aborted"] = tracking.aborted;
      writeJsonFile(cliOptions.outputPath, document);
    }
    if (!cliOptions.tracksPath.empty()) {
      writeJsonFile(cliOptions.tracksPath, casa::tracksToJson(tracking.completedTracks));
    }
    if (!cliOptions.csvPath.empty()) {
      std::ofstream csv(cliOptions.csvPath);
      if (!csv.is_open()) {
        throw std::runtime_error("Failed to open CSV file: " + cliOptions.csvPath);
      }
      casa::writeTrackCsv(csv, result);
    }
  } catch (const casa::ConfigError& ex) {
    fmt::print(stderr, "casa_cli: {}\n", ex.what());
    return 1;
  } catch (const std::exception& ex) {
    if (auto logger = casa::Logger::Get()) {
      logger->error("{}", ex.what());
    } else {
      fmt::print(stderr, "casa_cli: {}\n", ex.what());
    }
    return 1;
  }

  if (auto logger = casa::Logger::Get()) {
    logger->info("casa_cli done");
  }
  return 0;
}
