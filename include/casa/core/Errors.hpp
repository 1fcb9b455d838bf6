#pragma once

#include <stdexcept>
#include <string>

namespace casa {

// Raised eagerly when a configuration value is out of range.
class ConfigError : public std::invalid_argument {
public:
  ConfigError(const std::string& field, const std::string& reason)
      : std::invalid_argument("invalid config '" + field + "': " + reason), fieldName(field) {}

  const std::string& field() const { return fieldName; }

private:
  std::string fieldName;
};

// Raised by the detector when a mask can not be interpreted.
class DetectionError : public std::runtime_error {
public:
  explicit DetectionError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace casa
