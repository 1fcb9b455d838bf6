#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "casa/core/Logger.hpp"

namespace {

// Restores the default logging setup when a test changes it.
class LoggerStateGuard {
 public:
  ~LoggerStateGuard() {
    casa::Logger::ConfigureClassSink(casa::ClassSinkConfig_t{});
    casa::Logger::SetEnabled(true);
    casa::Logger::SetLevel(spdlog::level::info);
  }
};

} // namespace

TEST(LoggerTests, ParsesLevelNames) {
  EXPECT_EQ(casa::Logger::ParseLevel("debug"), spdlog::level::debug);
  EXPECT_EQ(casa::Logger::ParseLevel("warning"), spdlog::level::warn);
  EXPECT_EQ(casa::Logger::ParseLevel("error"), spdlog::level::err);
  EXPECT_EQ(casa::Logger::ParseLevel("off"), spdlog::level::off);
  EXPECT_EQ(casa::Logger::ParseLevel("verbose"), spdlog::level::info);
}

TEST(LoggerTests, DisabledLoggingYieldsNoLoggers) {
  LoggerStateGuard guard;
  casa::Logger::SetEnabled(false);
  EXPECT_EQ(casa::Logger::Get(), nullptr);
  EXPECT_EQ(casa::Logger::GetClass("Detector"), nullptr);

  casa::Logger::SetEnabled(true);
  ASSERT_NE(casa::Logger::Get(), nullptr);
  EXPECT_EQ(casa::Logger::GetClass("Detector"), casa::Logger::Get());
}

TEST(LoggerTests, LevelAppliesToComponentLoggers) {
  LoggerStateGuard guard;
  const std::filesystem::path dir = std::filesystem::temp_directory_path() / "casa_logger_level";
  casa::ClassSinkConfig_t classConfig;
  classConfig.enabled = true;
  classConfig.directory = dir.string();
  casa::Logger::ConfigureClassSink(classConfig);

  auto component = casa::Logger::GetClass("TrackingEngine");
  ASSERT_NE(component, nullptr);
  EXPECT_NE(component, casa::Logger::Get());
  casa::Logger::SetLevel(spdlog::level::debug);
  EXPECT_EQ(component->level(), spdlog::level::debug);
  EXPECT_TRUE(std::filesystem::exists(dir / "TrackingEngine.log"));
}

TEST(LoggerTests, ConcurrentLookupsShareOneComponentLogger) {
  LoggerStateGuard guard;
  casa::ClassSinkConfig_t classConfig;
  classConfig.enabled = true;
  classConfig.directory = (std::filesystem::temp_directory_path() / "casa_logger_threads").string();
  casa::Logger::ConfigureClassSink(classConfig);

  constexpr int kThreads = 8;
  std::vector<std::shared_ptr<spdlog::logger>> seen(kThreads);
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&seen, t]() {
      for (int i = 0; i < 200; ++i) {
        seen[t] = casa::Logger::GetClass("Associator");
        casa::Logger::GetClass(i % 2 == 0 ? "Detector" : "TrackLifecycle");
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  ASSERT_NE(seen[0], nullptr);
  for (const auto& logger : seen) {
    EXPECT_EQ(logger, seen[0]);
  }
}
