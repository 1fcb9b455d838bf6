#include "casa/core/Logger.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace casa {

namespace {

constexpr const char* kRootName = "casa";
constexpr const char* kPattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";

// Process-wide logging state. Independent tracking runs may log from several
// threads, so every access goes through the mutex.
struct Registry_t {
  std::mutex mutex;
  std::shared_ptr<spdlog::logger> root;
  bool enabled = true;
  spdlog::level::level_enum level = spdlog::level::info;
  FileSinkConfig_t fileConfig{};
  ClassSinkConfig_t classConfig{};
  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> components;
};

Registry_t& registry() {
  static Registry_t instance;
  return instance;
}

void createParentDirectory(const std::filesystem::path& path) {
  if (!path.has_parent_path()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
}

// Callers hold the registry mutex for every function below.
void releaseComponents(Registry_t& state) {
  for (const auto& entry : state.components) {
    spdlog::drop(entry.first);
  }
  state.components.clear();
}

void rebuildRoot(Registry_t& state) {
  spdlog::drop(kRootName);
  state.root.reset();
  if (!state.enabled) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  std::string sinkFailure;
  if (state.fileConfig.enabled) {
    createParentDirectory(state.fileConfig.path);
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          state.fileConfig.path, state.fileConfig.maxSizeBytes, state.fileConfig.maxFiles));
    } catch (const spdlog::spdlog_ex& ex) {
      sinkFailure = ex.what();
    }
  }

  state.root = std::make_shared<spdlog::logger>(kRootName, sinks.begin(), sinks.end());
  state.root->set_pattern(kPattern);
  state.root->set_level(state.level);
  spdlog::register_logger(state.root);
  if (!sinkFailure.empty()) {
    state.root->warn("Log file {} unavailable, console only: {}", state.fileConfig.path, sinkFailure);
  }
}

std::shared_ptr<spdlog::logger> rootOf(Registry_t& state) {
  if (state.enabled && !state.root) {
    rebuildRoot(state);
  }
  return state.enabled ? state.root : nullptr;
}

// Falls back to the root logger when the component file can not be opened.
std::shared_ptr<spdlog::logger> componentOf(Registry_t& state, const std::string& name) {
  auto found = state.components.find(name);
  if (found != state.components.end()) {
    return found->second;
  }
  const std::filesystem::path path = std::filesystem::path(state.classConfig.directory) / (name + ".log");
  createParentDirectory(path);
  std::shared_ptr<spdlog::logger> component;
  try {
    component = std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.string(), state.classConfig.maxSizeBytes,
                                                                      state.classConfig.maxFiles));
  } catch (const spdlog::spdlog_ex& ex) {
    auto root = rootOf(state);
    if (root) {
      root->warn("Component log {} unavailable: {}", path.string(), ex.what());
    }
    return root;
  }
  component->set_pattern(kPattern);
  component->set_level(state.level);
  spdlog::drop(name);
  spdlog::register_logger(component);
  state.components.emplace(name, component);
  return component;
}

} // namespace

void Logger::Initialize() {
  Registry_t& state = registry();
  std::lock_guard<std::mutex> lock(state.mutex);
  rootOf(state);
}

std::shared_ptr<spdlog::logger> Logger::Get() {
  Registry_t& state = registry();
  std::lock_guard<std::mutex> lock(state.mutex);
  return rootOf(state);
}

std::shared_ptr<spdlog::logger> Logger::GetClass(const std::string& name) {
  Registry_t& state = registry();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (!state.enabled) {
    return nullptr;
  }
  if (!state.classConfig.enabled) {
    return rootOf(state);
  }
  return componentOf(state, name);
}

void Logger::SetEnabled(bool enabled) {
  Registry_t& state = registry();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.enabled = enabled;
  releaseComponents(state);
  rebuildRoot(state);
}

void Logger::SetLevel(spdlog::level::level_enum level) {
  Registry_t& state = registry();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.level = level;
  if (auto root = rootOf(state)) {
    root->set_level(level);
  }
  for (auto& entry : state.components) {
    entry.second->set_level(level);
  }
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& value) {
  static const std::unordered_map<std::string, spdlog::level::level_enum> kLevels = {
      {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},  {"info", spdlog::level::info},
      {"warn", spdlog::level::warn},   {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
      {"critical", spdlog::level::critical}, {"off", spdlog::level::off}};
  auto found = kLevels.find(value);
  return found == kLevels.end() ? spdlog::level::info : found->second;
}

void Logger::ConfigureFileSink(const FileSinkConfig_t& config) {
  Registry_t& state = registry();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.fileConfig = config;
  rebuildRoot(state);
}

void Logger::ConfigureClassSink(const ClassSinkConfig_t& config) {
  Registry_t& state = registry();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.classConfig = config;
  releaseComponents(state);
}

} // namespace casa
