#include <skimmer/config.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <functional>
#include <unordered_map>

namespace skimmer {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static bool to_double_safe(const std::string& s, double& out) {
  try {
    size_t idx = 0;
    const double v = std::stod(s, &idx);
    if (idx != s.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

namespace {

using Setter = std::function<bool(LoopConfig&, const std::string&)>;

Setter number(double LoopConfig::*field) {
  return [field](LoopConfig& c, const std::string& v) {
    double d = 0.0;
    if (!to_double_safe(v, d)) return false;
    c.*field = d;
    return true;
  };
}

Setter seconds(Seconds LoopConfig::*field) {
  return [field](LoopConfig& c, const std::string& v) {
    double d = 0.0;
    if (!to_double_safe(v, d)) return false;
    c.*field = Seconds{d};
    return true;
  };
}

Setter integer(int LoopConfig::*field) {
  return [field](LoopConfig& c, const std::string& v) {
    double d = 0.0;
    if (!to_double_safe(v, d) || d != std::floor(d)) return false;
    c.*field = static_cast<int>(d);
    return true;
  };
}

Setter count(std::uint32_t LoopConfig::*field) {
  return [field](LoopConfig& c, const std::string& v) {
    double d = 0.0;
    if (!to_double_safe(v, d) || d < 0.0 || d != std::floor(d)) return false;
    c.*field = static_cast<std::uint32_t>(d);
    return true;
  };
}

const std::unordered_map<std::string, Setter>& setters() {
  static const std::unordered_map<std::string, Setter> table{
    {"confidence_threshold",  number(&LoopConfig::confidence_threshold)},
    {"min_safe_distance_cm",  number(&LoopConfig::min_safe_distance_cm)},
    {"max_range_cm",          number(&LoopConfig::max_range_cm)},
    {"cycle_period_s",        seconds(&LoopConfig::cycle_period)},
    {"error_backoff_s",       seconds(&LoopConfig::error_backoff)},
    {"status_every_n_cycles", count(&LoopConfig::status_every_n_cycles)},
    {"bin_full_dwell_s",      seconds(&LoopConfig::bin_full_dwell)},
    {"avoid_turn_time_s",     seconds(&LoopConfig::avoid_turn_time)},
    {"avoid_settle_time_s",   seconds(&LoopConfig::avoid_settle_time)},
    {"detect_hold_s",         seconds(&LoopConfig::detect_hold)},
    {"collection_duration_s", seconds(&LoopConfig::collection_duration)},
    {"turn_speed",            integer(&LoopConfig::turn_speed)},
    {"cruise_speed",          integer(&LoopConfig::cruise_speed)},
    {"rotation_interval_s",   seconds(&LoopConfig::rotation_interval)},
    {"max_payload_kg",        number(&LoopConfig::max_payload_kg)},
    {"max_consecutive_actuation_faults", count(&LoopConfig::max_consecutive_actuation_faults)},
    {"audit_log_path", [](LoopConfig& c, const std::string& v) {
       if (v.empty()) return false;
       c.audit_log_path = v;
       return true;
     }},
  };
  return table;
}

} // namespace

LoopConfig config_from_stream(std::istream& in, std::vector<std::string>* warnings) {
  LoopConfig cfg;
  std::string line;
  std::size_t line_no = 0;
  bool header_consumed = false;
  auto warn = [&](const std::string& msg) {
    if (warnings) warnings->push_back("line " + std::to_string(line_no) + ": " + msg);
  };

  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto comma = raw.find(',');
    if (comma == std::string::npos) { warn("expected key,value"); continue; }
    const std::string key = lower(trim(raw.substr(0, comma)));
    const std::string value = trim(raw.substr(comma + 1));

    if (!header_consumed && key == "key") {
      header_consumed = true;
      continue;
    }

    const auto& table = setters();
    auto it = table.find(key);
    if (it == table.end()) { warn("unknown key '" + key + "'"); continue; }
    if (!it->second(cfg, value)) warn("bad value '" + value + "' for " + key);
  }
  return cfg;
}

std::optional<LoopConfig> load_config(const std::string& path, std::vector<std::string>* warnings) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return config_from_stream(f, warnings);
}

std::vector<std::string> validate(const LoopConfig& cfg) {
  std::vector<std::string> problems;
  if (cfg.confidence_threshold < 0.0 || cfg.confidence_threshold >= 1.0)
    problems.emplace_back("confidence_threshold must be in [0,1)");
  if (cfg.min_safe_distance_cm <= 0.0)
    problems.emplace_back("min_safe_distance_cm must be positive");
  if (cfg.max_range_cm <= cfg.min_safe_distance_cm)
    problems.emplace_back("max_range_cm must exceed min_safe_distance_cm");
  if (cfg.cycle_period.count() <= 0.0)
    problems.emplace_back("cycle_period_s must be positive");
  if (cfg.error_backoff.count() < 0.0 || cfg.bin_full_dwell.count() < 0.0 ||
      cfg.avoid_turn_time.count() < 0.0 || cfg.avoid_settle_time.count() < 0.0 ||
      cfg.detect_hold.count() < 0.0 || cfg.collection_duration.count() < 0.0)
    problems.emplace_back("durations must not be negative");
  if (cfg.rotation_interval.count() <= 0.0)
    problems.emplace_back("rotation_interval_s must be positive");
  if (cfg.turn_speed < 0 || cfg.turn_speed > 100)
    problems.emplace_back("turn_speed must be in [0,100]");
  if (cfg.cruise_speed < 0 || cfg.cruise_speed > 100)
    problems.emplace_back("cruise_speed must be in [0,100]");
  if (cfg.status_every_n_cycles == 0)
    problems.emplace_back("status_every_n_cycles must be at least 1");
  if (cfg.max_consecutive_actuation_faults == 0)
    problems.emplace_back("max_consecutive_actuation_faults must be at least 1");
  if (cfg.max_payload_kg <= 0.0)
    problems.emplace_back("max_payload_kg must be positive");
  return problems;
}

} // namespace skimmer
