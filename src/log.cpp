#include <skimmer/log.hpp>
#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>

namespace skimmer::log {

namespace {

std::mutex g_mu;
std::ostream* g_sink = &std::clog;
std::atomic<int> g_level{static_cast<int>(Level::Info)};

std::string timestamp_() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buf);
}

} // namespace

void set_sink(std::ostream& out) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_sink = &out;
}

void set_level(Level lvl) { g_level.store(static_cast<int>(lvl), std::memory_order_relaxed); }

Level level() { return static_cast<Level>(g_level.load(std::memory_order_relaxed)); }

const char* level_name(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
    default: return "OFF";
  }
}

void write(Level lvl, const std::string& msg) {
  if (lvl < level() || lvl == Level::Off) return;
  const std::string line = "[" + timestamp_() + "] " + level_name(lvl) + " " + msg + "\n";
  std::lock_guard<std::mutex> lk(g_mu);
  *g_sink << line << std::flush;
}

} // namespace skimmer::log
