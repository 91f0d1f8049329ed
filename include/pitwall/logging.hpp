#pragma once
#include <iostream>
#include <string_view>

namespace pitwall {

enum class LogLevel {
  Debug = 0,
  Info,
  Warning,
  Error,
};

class LogSink {
public:
  virtual ~LogSink() = default;
  virtual void log(LogLevel level, std::string_view message) = 0;
};

// Null sink is allowed: library code logs through this and never prints directly.
inline void log(LogSink* sink, LogLevel level, std::string_view message) {
  if (sink) sink->log(level, message);
}

class OstreamLogSink : public LogSink {
public:
  explicit OstreamLogSink(std::ostream& os, LogLevel min_level = LogLevel::Info)
    : os_(os), min_level_(min_level) {}

  void log(LogLevel level, std::string_view message) override {
    if (level < min_level_) return;
    os_ << prefix(level) << message << std::endl;
  }

  void set_min_level(LogLevel level) { min_level_ = level; }

private:
  std::ostream& os_;
  LogLevel min_level_;

  static constexpr const char* prefix(LogLevel level) {
    switch (level) {
      case LogLevel::Debug:   return "[debug] ";
      case LogLevel::Info:    return "[info ] ";
      case LogLevel::Warning: return "[warn ] ";
      case LogLevel::Error:   return "[error] ";
    }
    return "";
  }
};

} // namespace pitwall
