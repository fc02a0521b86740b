#include <skimmer/events.hpp>
#include <cctype>

namespace skimmer {

const char* event_kind_name(EventKind k) {
  switch (k) {
    case EventKind::Detection: return "Detection";
    case EventKind::BinFull:   return "BinFull";
    case EventKind::Obstacle:  return "Obstacle";
    case EventKind::Error:     return "Error";
    case EventKind::Lifecycle: return "Lifecycle";
    default: return "Unknown";
  }
}

static inline std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::optional<EventKind> event_kind_from_name(const std::string& s) {
  const auto S = upper(s);
  if (S == "DETECTION") return EventKind::Detection;
  if (S == "BINFULL")   return EventKind::BinFull;
  if (S == "OBSTACLE")  return EventKind::Obstacle;
  if (S == "ERROR")     return EventKind::Error;
  if (S == "LIFECYCLE") return EventKind::Lifecycle;
  return std::nullopt;
}

} // namespace skimmer
