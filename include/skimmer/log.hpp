#pragma once
#include <cstdio>
#include <ostream>
#include <string>

namespace skimmer::log {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Redirect output (default std::clog). The stream must outlive all logging.
void set_sink(std::ostream& out);
void set_level(Level lvl);
Level level();

const char* level_name(Level lvl);

// Writes "[YYYY-mm-dd HH:MM:SS] LEVEL message" as one line. Thread-safe.
void write(Level lvl, const std::string& msg);

template <class... Args>
void logf(Level lvl, const char* fmt, Args... args) {
  if (lvl < level()) return;
  char buf[512];
  if constexpr (sizeof...(Args) == 0) {
    std::snprintf(buf, sizeof(buf), "%s", fmt);
  } else {
    std::snprintf(buf, sizeof(buf), fmt, args...);
  }
  write(lvl, buf);
}

template <class... Args> void debug(const char* fmt, Args... args) { logf(Level::Debug, fmt, args...); }
template <class... Args> void info(const char* fmt, Args... args)  { logf(Level::Info,  fmt, args...); }
template <class... Args> void warn(const char* fmt, Args... args)  { logf(Level::Warn,  fmt, args...); }
template <class... Args> void error(const char* fmt, Args... args) { logf(Level::Error, fmt, args...); }

} // namespace skimmer::log
