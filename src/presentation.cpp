#include <skimmer/presentation.hpp>
#include <cmath>
#include <cstdio>

namespace skimmer {

std::string truncate_to(const std::string& s, std::size_t n) {
  return s.size() <= n ? s : s.substr(0, n);
}

const char* view_name(View v) {
  switch (v) {
    case View::Ready:      return "Ready";
    case View::Scanning:   return "Scanning";
    case View::Position:   return "Position";
    case View::Payload:    return "Payload";
    case View::Detected:   return "Detected";
    case View::Collecting: return "Collecting";
    case View::Obstacle:   return "Obstacle";
    case View::BinFull:    return "BinFull";
    case View::Error:      return "Error";
    case View::Warning:    return "Warning";
    case View::Status:     return "Status";
    case View::Shutdown:   return "Shutdown";
    default: return "Unknown";
  }
}

TextPanel format_panel(View v, const ViewData& d) {
  char l1[64];
  char l2[64];
  l1[0] = l2[0] = '\0';

  switch (v) {
    case View::Ready:
      std::snprintf(l1, sizeof(l1), "System Ready");
      std::snprintf(l2, sizeof(l2), "Starting loop");
      break;
    case View::Scanning:
      std::snprintf(l1, sizeof(l1), "Scanning...");
      std::snprintf(l2, sizeof(l2), "Collected: %llu", (unsigned long long)d.collection_count);
      break;
    case View::Position:
      if (d.position) {
        std::snprintf(l1, sizeof(l1), "Lat: %.4f", d.position->lat_deg);
        std::snprintf(l2, sizeof(l2), "Lon: %.4f", d.position->lon_deg);
      } else {
        std::snprintf(l1, sizeof(l1), "GPS:");
        std::snprintf(l2, sizeof(l2), "No Fix");
      }
      break;
    case View::Payload:
      std::snprintf(l1, sizeof(l1), "Total Collected");
      if (d.payload_measured) std::snprintf(l2, sizeof(l2), "%.2f kg", d.payload_kg);
      else                    std::snprintf(l2, sizeof(l2), "%.2f kg (n/a)", d.payload_kg);
      break;
    case View::Detected:
      std::snprintf(l1, sizeof(l1), "ALGAE DETECTED!");
      std::snprintf(l2, sizeof(l2), "Cnt:%llu C:%d%%",
                    (unsigned long long)d.collection_count,
                    (int)std::floor(d.confidence * 100.0));
      break;
    case View::Collecting:
      std::snprintf(l1, sizeof(l1), "Collecting");
      std::snprintf(l2, sizeof(l2), "Algae...");
      break;
    case View::Obstacle:
      std::snprintf(l1, sizeof(l1), "OBSTACLE!");
      if (d.clearance_cm) std::snprintf(l2, sizeof(l2), "Distance: %.0fcm", *d.clearance_cm);
      else                std::snprintf(l2, sizeof(l2), "Distance: ---");
      break;
    case View::BinFull:
      std::snprintf(l1, sizeof(l1), "*** WARNING ***");
      std::snprintf(l2, sizeof(l2), "BIN FULL!");
      break;
    case View::Error:
      return TextPanel{"ERROR!", truncate_to(d.message, kPanelColumns)};
    case View::Warning:
      return TextPanel{"WARNING", truncate_to(d.message, kPanelColumns)};
    case View::Status:
      std::snprintf(l1, sizeof(l1), "Cyc:%llu N:%llu",
                    (unsigned long long)d.cycle_index,
                    (unsigned long long)d.collection_count);
      if (d.clearance_cm) std::snprintf(l2, sizeof(l2), "D:%.0f W:%.2f", *d.clearance_cm, d.payload_kg);
      else                std::snprintf(l2, sizeof(l2), "D:--- W:%.2f", d.payload_kg);
      break;
    case View::Shutdown:
      std::snprintf(l1, sizeof(l1), "Shutting Down");
      std::snprintf(l2, sizeof(l2), "Goodbye!");
      break;
    default:
      break;
  }
  return TextPanel{truncate_to(l1, kPanelColumns), truncate_to(l2, kPanelColumns)};
}

} // namespace skimmer
