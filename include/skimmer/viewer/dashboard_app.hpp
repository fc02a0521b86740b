#pragma once
#include <cstdint>
#include <skimmer/dashboard.hpp>

namespace skimmer {

class MissionRunner;

// RAII operator window: pond map, character panel and live readouts.
class DashboardApp {
public:
  explicit DashboardApp(MissionRunner& mission);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void pump_snapshots_();
  // Rendering
  void render_frame_();
  void draw_pond_(const DashboardSnapshot& s);
  void draw_panel_(const DashboardSnapshot& s);
  void draw_readouts_(const DashboardSnapshot& s);
  void draw_hud_(const DashboardSnapshot& s);

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f worldToScreen_(double x, double y) const;

  // Dependencies
  MissionRunner& mission_;
  DashboardSnapshot last_{};
  std::uint64_t cursor_{0};

  // Map layout (pixels)
  float map_x0_{20.0f};
  float map_y0_{60.0f};
  float scale_px_per_m_{14.0f};
};

} // namespace skimmer
