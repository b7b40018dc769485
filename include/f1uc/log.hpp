#pragma once
#include <optional>
#include <sstream>
#include <string>

namespace f1uc {

enum class LogLevel : int {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
  Off = 4
};

// Process-wide threshold; messages below it are dropped. Default: Warn.
void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

std::optional<LogLevel> parse_log_level(const std::string& s);

// Writes "[f1uc] LEVEL message" to std::clog. Thread-safe.
void log_message(LogLevel level, const std::string& msg);

namespace detail {
inline void append(std::ostringstream&) {}
template <class T, class... Rest>
void append(std::ostringstream& os, const T& v, const Rest&... rest) {
  os << v;
  append(os, rest...);
}
} // namespace detail

template <class... Args>
void log(LogLevel level, const Args&... args) {
  if (!log_enabled(level)) return;
  std::ostringstream os;
  detail::append(os, args...);
  log_message(level, os.str());
}

template <class... Args> void log_debug(const Args&... a) { log(LogLevel::Debug, a...); }
template <class... Args> void log_info(const Args&... a)  { log(LogLevel::Info, a...); }
template <class... Args> void log_warn(const Args&... a)  { log(LogLevel::Warn, a...); }
template <class... Args> void log_error(const Args&... a) { log(LogLevel::Error, a...); }

} // namespace f1uc
