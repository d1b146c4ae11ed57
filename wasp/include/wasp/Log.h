#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace wasp {

enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

const char* to_string(LogLevel level);

class ILogSink {
 public:
  virtual ~ILogSink() = default;
  virtual void log(LogLevel level, std::string_view component, std::string_view message) = 0;
};

class NoopLogSink final : public ILogSink {
 public:
  void log(LogLevel, std::string_view, std::string_view) override {}
};

// One line per record: "<unix_ms> <LEVEL> [component] message".
class StderrLogSink final : public ILogSink {
 public:
  explicit StderrLogSink(LogLevel min_level = LogLevel::Info) : min_level_(min_level) {}
  void log(LogLevel level, std::string_view component, std::string_view message) override;

 private:
  LogLevel min_level_{LogLevel::Info};
  std::mutex mu_;
};

// Binds a component name to a sink so call sites stay short.
class Logger {
 public:
  Logger(ILogSink* sink, std::string component) : sink_(sink), component_(std::move(component)) {}

  void debug(std::string_view msg) const { write(LogLevel::Debug, msg); }
  void info(std::string_view msg) const { write(LogLevel::Info, msg); }
  void warn(std::string_view msg) const { write(LogLevel::Warn, msg); }
  void error(std::string_view msg) const { write(LogLevel::Error, msg); }

 private:
  void write(LogLevel level, std::string_view msg) const {
    if (sink_) sink_->log(level, component_, msg);
  }

  ILogSink* sink_{nullptr};
  std::string component_;
};

} // namespace wasp
