#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace pitwall {

inline std::string with_context(std::string message, std::string_view context) {
  if (!context.empty()) {
    message = std::string(context) + ": " + message;
  }
  return message;
}

inline std::string with_location(std::string message, const char* file, int line) {
  return with_context(std::move(message), std::string("at ") + file + ":" + std::to_string(line));
}

class PitwallError : public std::runtime_error {
public:
  explicit PitwallError(const std::string& message) : std::runtime_error(message) {}
};

// A single schedule or session could not be loaded. Recoverable per slice.
class DataUnavailableError : public PitwallError {
public:
  using PitwallError::PitwallError;
};

// No slice (including the previous-season fallback) produced any lap record.
class EmptyHistoryError : public PitwallError {
public:
  using PitwallError::PitwallError;
};

class NoCompoundModelsError : public PitwallError {
public:
  using PitwallError::PitwallError;
};

class ConfigError : public PitwallError {
public:
  using PitwallError::PitwallError;
};

} // namespace pitwall

#define PITWALL_LOC(msg) ::pitwall::with_location((msg), __FILE__, __LINE__)
