#include <skimmer/arbitration.hpp>

namespace skimmer {

Action decide(const WorldState& ws, const Thresholds& th) {
  if (ws.bin_full) {
    return Action{ActionKind::BinFull};
  }
  if (ws.clearance_cm && *ws.clearance_cm < th.min_safe_distance_cm) {
    return Action{ActionKind::AvoidObstacle, *ws.clearance_cm, 0.0};
  }
  if (ws.detection.is_target && ws.detection.confidence > th.confidence) {
    return Action{ActionKind::Collect, 0.0, ws.detection.confidence};
  }
  return Action{ActionKind::Idle};
}

const char* action_name(ActionKind k) {
  switch (k) {
    case ActionKind::BinFull:       return "BinFull";
    case ActionKind::AvoidObstacle: return "AvoidObstacle";
    case ActionKind::Collect:       return "Collect";
    case ActionKind::Idle:          return "Idle";
    default: return "Unknown";
  }
}

} // namespace skimmer
