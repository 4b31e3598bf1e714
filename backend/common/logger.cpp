#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace common {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_output_mutex;
std::mutex g_names_mutex;
std::unordered_map<std::thread::id, std::string> g_thread_names;

std::string currentThreadName() {
  std::lock_guard<std::mutex> lock{g_names_mutex};
  auto it = g_thread_names.find(std::this_thread::get_id());
  if (it != g_thread_names.end()) {
    return it->second;
  }
  std::ostringstream oss;
  oss << "T" << std::this_thread::get_id();
  return oss.str();
}

} // namespace

void Logger::setLevel(LogLevel level) noexcept {
  g_level.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() noexcept {
  return g_level.load(std::memory_order_relaxed);
}

LogLevel Logger::parseLevel(const std::string& name) noexcept {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
    [](unsigned char c) { return std::tolower(c); });

  if (lowered == "error") return LogLevel::Error;
  if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
  if (lowered == "debug") return LogLevel::Debug;
  if (lowered == "trace") return LogLevel::Trace;
  return LogLevel::Info;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
  if (static_cast<std::uint8_t>(level) > static_cast<std::uint8_t>(Logger::level())) {
    return;
  }

  try {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream line;
    line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
         << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
         << " [" << levelName(level) << "]"
         << " [" << currentThreadName() << "] "
         << message;

    std::lock_guard<std::mutex> lock{g_output_mutex};
    std::cerr << line.str() << std::endl;
  } catch (const std::exception&) {
    // logging must never take the caller down
  }
}

const char* Logger::levelName(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn:  return "WARN ";
    case LogLevel::Info:  return "INFO ";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Trace: return "TRACE";
  }
  return "UNKN ";
}

void setThreadName(const std::string& name) {
  std::lock_guard<std::mutex> lock{g_names_mutex};
  g_thread_names[std::this_thread::get_id()] = name;
}

} // namespace common
