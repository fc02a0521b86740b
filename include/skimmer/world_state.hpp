#pragma once
#include <optional>

namespace skimmer {

struct GeoFix {
  double lat_deg = 0.0;
  double lon_deg = 0.0;
};

struct Orientation {
  double pitch_deg = 0.0;
  double roll_deg = 0.0;
};

struct Detection {
  bool is_target = false;
  double confidence = 0.0;   // [0,1]
};

// One fused, possibly partial reading of everything the robot senses.
// Built once per cycle and handed to the loop as const.
struct WorldState {
  std::optional<GeoFix> position;        // absent without a satellite fix
  std::optional<double> clearance_cm;    // absent on fault or out-of-range echo
  double payload_mass_kg = 0.0;          // 0 when the load cell cannot be read
  bool payload_measured = false;         // false => payload_mass_kg is a default
  bool bin_full = false;                 // fail-open when the switch is unreadable
  bool bin_switch_readable = false;
  std::optional<Orientation> orientation;
  Detection detection{};
};

// Echo sensors report nothing useful below this distance.
constexpr double kMinClearanceCm = 2.0;
constexpr double kDefaultMaxRangeCm = 400.0;

// Confidence clamped into [0,1]; NaN becomes 0.
Detection make_detection(bool is_target, double confidence);

// Raw distance -> clearance. Outside [2, max_range_cm] or non-finite => absent.
std::optional<double> clearance_from_raw(double raw_cm,
                                         double max_range_cm = kDefaultMaxRangeCm);

// Tilt from a gravity vector in g. Returns nullopt for an all-zero or non-finite vector.
std::optional<Orientation> orientation_from_accel(double ax, double ay, double az);

// True when every field holds its absent/default value.
bool is_all_default(const WorldState& ws);

} // namespace skimmer
