#include <skimmer/world_state.hpp>
#include <cmath>
#include <numbers>

namespace skimmer {

static constexpr double kRadToDeg = 180.0 / std::numbers::pi;

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

Detection make_detection(bool is_target, double confidence) {
  if (!std::isfinite(confidence)) {
    // +inf still means "certain"; NaN carries no information
    confidence = std::isnan(confidence) ? 0.0 : (confidence > 0.0 ? 1.0 : 0.0);
  }
  return Detection{is_target, clamp01(confidence)};
}

std::optional<double> clearance_from_raw(double raw_cm, double max_range_cm) {
  if (!std::isfinite(raw_cm)) return std::nullopt;
  if (raw_cm < kMinClearanceCm || raw_cm > max_range_cm) return std::nullopt;
  return raw_cm;
}

std::optional<Orientation> orientation_from_accel(double ax, double ay, double az) {
  if (!std::isfinite(ax) || !std::isfinite(ay) || !std::isfinite(az)) return std::nullopt;
  if (ax == 0.0 && ay == 0.0 && az == 0.0) return std::nullopt;
  const double pitch = std::atan2(ay, std::sqrt(ax * ax + az * az));
  const double roll  = std::atan2(-ax, az);
  return Orientation{pitch * kRadToDeg, roll * kRadToDeg};
}

bool is_all_default(const WorldState& ws) {
  return !ws.position && !ws.clearance_cm && ws.payload_mass_kg == 0.0 &&
         !ws.payload_measured && !ws.bin_full && !ws.bin_switch_readable &&
         !ws.orientation && !ws.detection.is_target && ws.detection.confidence == 0.0;
}

} // namespace skimmer
