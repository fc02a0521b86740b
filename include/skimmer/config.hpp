#pragma once
#include <chrono>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace skimmer {

using Seconds = std::chrono::duration<double>;

// Tunables for the supervisory loop. Defaults match the field-tested robot.
struct LoopConfig {
  // Arbitration
  double confidence_threshold = 0.7;   // detection must be strictly above
  double min_safe_distance_cm = 10.0;  // obstacle when clearance strictly below
  double max_range_cm = 400.0;         // echo sensor upper bound

  // Cadence
  Seconds cycle_period{2.0};
  Seconds error_backoff{5.0};
  std::uint32_t status_every_n_cycles = 30;

  // Maneuvers
  Seconds bin_full_dwell{10.0};
  Seconds avoid_turn_time{2.0};
  Seconds avoid_settle_time{1.0};
  Seconds detect_hold{1.0};
  Seconds collection_duration{5.0};
  int turn_speed = 30;    // [0,100]
  int cruise_speed = 0;   // [0,100], 0 holds station while scanning

  // Presentation
  Seconds rotation_interval{5.0};

  // Safety
  double max_payload_kg = 10.0;
  std::uint32_t max_consecutive_actuation_faults = 3;

  // Persistence
  std::string audit_log_path = "collection_log.csv";
};

// Parse "key,value" lines. Accepts an optional "key,value" header; ignores
// blank lines and lines starting with '#'. Whitespace around fields is trimmed.
// Unknown keys and unparsable values are skipped; a note is added to
// *warnings for each when warnings is non-null. Starts from the defaults.
LoopConfig config_from_stream(std::istream& in, std::vector<std::string>* warnings = nullptr);

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<LoopConfig> load_config(const std::string& path,
                                      std::vector<std::string>* warnings = nullptr);

// Human-readable problems; empty when the config is usable.
std::vector<std::string> validate(const LoopConfig& cfg);

} // namespace skimmer
