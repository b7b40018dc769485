#include <f1uc/log.hpp>
#include <f1uc/compound.hpp>
#include <atomic>
#include <iostream>
#include <mutex>

namespace f1uc {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
std::mutex g_sink_mutex;

const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "?";
}

} // namespace

void set_log_level(LogLevel level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel level) {
  return level != LogLevel::Off &&
         static_cast<int>(level) >= g_level.load(std::memory_order_relaxed);
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
  const auto u = to_upper(s);
  if (u == "DEBUG") return LogLevel::Debug;
  if (u == "INFO")  return LogLevel::Info;
  if (u == "WARN" || u == "WARNING") return LogLevel::Warn;
  if (u == "ERROR") return LogLevel::Error;
  if (u == "OFF")   return LogLevel::Off;
  return std::nullopt;
}

void log_message(LogLevel level, const std::string& msg) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  std::clog << "[f1uc] " << level_tag(level) << ' ' << msg << '\n';
}

} // namespace f1uc
