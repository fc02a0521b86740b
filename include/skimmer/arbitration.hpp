#pragma once
#include <skimmer/config.hpp>
#include <skimmer/world_state.hpp>

namespace skimmer {

enum class ActionKind : int {
  BinFull = 0,
  AvoidObstacle = 1,
  Collect = 2,
  Idle = 3,
};

struct Action {
  ActionKind kind = ActionKind::Idle;
  double clearance_cm = 0.0;  // AvoidObstacle only
  double confidence = 0.0;    // Collect only

  friend bool operator==(const Action&, const Action&) = default;
};

struct Thresholds {
  double confidence = 0.7;
  double min_safe_distance_cm = 10.0;
};

inline Thresholds thresholds_from(const LoopConfig& cfg) {
  return Thresholds{cfg.confidence_threshold, cfg.min_safe_distance_cm};
}

// Fixed-priority policy, first match wins:
//   BinFull > AvoidObstacle > Collect > Idle.
// Total and pure: the same state and thresholds always give the same action.
Action decide(const WorldState& ws, const Thresholds& th);

const char* action_name(ActionKind k);

} // namespace skimmer
