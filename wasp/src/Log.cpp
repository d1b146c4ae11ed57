#include "wasp/Log.h"
#include "wasp/Util.h"
#include <cstdio>

namespace wasp {

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "?";
}

void StderrLogSink::log(LogLevel level, std::string_view component, std::string_view message) {
  if (level < min_level_) return;
  std::lock_guard<std::mutex> lock(mu_);
  std::fprintf(stderr, "%llu %s [%.*s] %.*s\n",
               static_cast<unsigned long long>(wall_clock_ms()), to_string(level),
               static_cast<int>(component.size()), component.data(),
               static_cast<int>(message.size()), message.data());
}

} // namespace wasp
