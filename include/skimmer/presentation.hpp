#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <skimmer/world_state.hpp>

namespace skimmer {

enum class View : int {
  Ready = 0,
  Scanning,
  Position,
  Payload,
  Detected,
  Collecting,
  Obstacle,
  BinFull,
  Error,
  Warning,
  Status,
  Shutdown,
  Count
};

// Everything a view may need; each view reads only its own fields.
struct ViewData {
  std::uint64_t collection_count = 0;
  std::uint64_t cycle_index = 0;
  double confidence = 0.0;
  std::optional<GeoFix> position;
  double payload_kg = 0.0;
  bool payload_measured = true;
  std::optional<double> clearance_cm;
  std::string message;
};

// Two rows of a character display.
struct TextPanel {
  std::string line1;
  std::string line2;
};

constexpr std::size_t kPanelColumns = 16;

const char* view_name(View v);

// Lay a view out for a 16x2 character display. Never throws; long text is cut.
TextPanel format_panel(View v, const ViewData& d);

// Cut s to at most n characters.
std::string truncate_to(const std::string& s, std::size_t n);

} // namespace skimmer
