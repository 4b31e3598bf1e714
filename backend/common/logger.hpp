#pragma once

#include <cstdint>
#include <string>

namespace common {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3,
  Trace = 4
};

class Logger {
public:
  static void setLevel(LogLevel level) noexcept;
  static LogLevel level() noexcept;

  // Accepts "error", "warn", "info", "debug", "trace" (any case). Unknown names map to Info.
  static LogLevel parseLevel(const std::string& name) noexcept;

  static void log(LogLevel level, const std::string& message) noexcept;

  static void error(const std::string& msg) noexcept { log(LogLevel::Error, msg); }
  static void warn(const std::string& msg) noexcept { log(LogLevel::Warn, msg); }
  static void info(const std::string& msg) noexcept { log(LogLevel::Info, msg); }
  static void debug(const std::string& msg) noexcept { log(LogLevel::Debug, msg); }
  static void trace(const std::string& msg) noexcept { log(LogLevel::Trace, msg); }

private:
  static const char* levelName(LogLevel level) noexcept;
};

// Names the calling thread in log lines, e.g. "job-worker".
void setThreadName(const std::string& name);

} // namespace common

#define LOG_ERROR(msg) ::common::Logger::error(msg)
#define LOG_WARN(msg)  ::common::Logger::warn(msg)
#define LOG_INFO(msg)  ::common::Logger::info(msg)
#define LOG_DEBUG(msg) ::common::Logger::debug(msg)
#define LOG_TRACE(msg) ::common::Logger::trace(msg)
