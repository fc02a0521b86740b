#include <raylib.h>
#include <cmath>
#include <cstdio>
#include <string>

#include <skimmer/viewer/dashboard_app.hpp>
#include <skimmer/mission_runner.hpp>

namespace skimmer {

namespace {

static const Color kWater   {24, 70, 110, 255};
static const Color kBank    {90, 80, 60, 255};
static const Color kAlgae   {70, 180, 60, 255};
static const Color kPicked  {70, 90, 70, 120};
static const Color kHull    {235, 235, 240, 255};
static const Color kText    {220, 230, 220, 255};
static const Color kDim     {170, 180, 170, 255};
static const Color kLcdBack {40, 90, 200, 255};
static const Color kLcdText {230, 240, 255, 255};

static Color actionColor(ActionKind k) {
  switch (k) {
    case ActionKind::BinFull:       return Color{231, 76, 60, 255};
    case ActionKind::AvoidObstacle: return Color{241, 196, 15, 255};
    case ActionKind::Collect:       return Color{46, 204, 113, 255};
    default:                        return kDim;
  }
}

static void fmt_opt(const std::optional<double>& v, const char* fmt, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (!v) { std::snprintf(out, (size_t)cap, "%s", "N/A"); return; }
  std::snprintf(out, (size_t)cap, fmt, *v);
}

} // namespace

DashboardApp::DashboardApp(MissionRunner& mission) : mission_(mission) {}

DashboardApp::Vec2f DashboardApp::worldToScreen_(double x, double y) const {
  // Pond y grows north; screen y grows down.
  const float h = float(last_.pond.height_m) * scale_px_per_m_;
  return { map_x0_ + float(x) * scale_px_per_m_, map_y0_ + h - float(y) * scale_px_per_m_ };
}

int DashboardApp::run() {
  const int W = 1100, H = 620;
  InitWindow(W, H, "Skimmer - Operator Dashboard");
  SetTargetFPS(30);

  while (!WindowShouldClose()) {
    process_input_();
    pump_snapshots_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void DashboardApp::process_input_() {
  // F: inject one actuation fault, G: three in a row (trips the fatal limit)
  if (IsKeyPressed(KEY_F)) mission_.request_actuation_faults(1);
  if (IsKeyPressed(KEY_G)) mission_.request_actuation_faults(3);

  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      scale_px_per_m_ *= 1.01f;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) scale_px_per_m_ *= 0.99f;
}

void DashboardApp::pump_snapshots_() {
  auto& buf = mission_.buffer();
  while (buf.try_consume_latest(cursor_, last_)) {}
}

void DashboardApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{18, 20, 24, 255});
  draw_pond_(last_);
  draw_panel_(last_);
  draw_readouts_(last_);
  draw_hud_(last_);
  EndDrawing();
}

void DashboardApp::draw_pond_(const DashboardSnapshot& s) {
  const auto& p = s.pond;
  if (p.width_m <= 0.0 || p.height_m <= 0.0) return;

  const auto tl = worldToScreen_(0.0, p.height_m);
  const float w = float(p.width_m) * scale_px_per_m_;
  const float h = float(p.height_m) * scale_px_per_m_;
  DrawRectangle(int(tl.x) - 4, int(tl.y) - 4, int(w) + 8, int(h) + 8, kBank);
  DrawRectangle(int(tl.x), int(tl.y), int(w), int(h), kWater);

  for (const auto& a : p.patches) {
    const auto c = worldToScreen_(a.x_m, a.y_m);
    DrawCircleV({c.x, c.y}, float(a.radius_m) * scale_px_per_m_, a.collected ? kPicked : kAlgae);
  }

  // Hull triangle
  const auto pos = worldToScreen_(p.pose.x_m, p.pose.y_m);
  const float len = 0.6f * scale_px_per_m_, wid = 0.35f * scale_px_per_m_;
  const float c = std::cos(float(p.pose.heading_rad)), sn = std::sin(float(p.pose.heading_rad));
  Vector2 nose  = { pos.x + c*len,           pos.y - sn*len };
  Vector2 tailL = { pos.x - c*len - sn*wid,  pos.y + sn*len - c*wid };
  Vector2 tailR = { pos.x - c*len + sn*wid,  pos.y + sn*len + c*wid };
  DrawTriangle(nose, tailL, tailR, p.collector_running ? kAlgae : kHull);

  // Echo ray
  if (s.world && s.world->clearance_cm) {
    const double r = *s.world->clearance_cm / 100.0;
    const auto end = worldToScreen_(p.pose.x_m + std::cos(p.pose.heading_rad) * r,
                                    p.pose.y_m + std::sin(p.pose.heading_rad) * r);
    DrawLineEx({pos.x, pos.y}, {end.x, end.y}, 1.5f, Color{255, 255, 255, 90});
  }
}

void DashboardApp::draw_panel_(const DashboardSnapshot& s) {
  const int x0 = GetScreenWidth() - 360, y0 = 60;
  DrawRectangle(x0 - 6, y0 - 6, 332, 84, Color{0, 0, 0, 120});
  DrawRectangle(x0, y0, 320, 72, kLcdBack);
  DrawText(s.panel.line1.c_str(), x0 + 12, y0 + 10, 24, kLcdText);
  DrawText(s.panel.line2.c_str(), x0 + 12, y0 + 40, 24, kLcdText);
  DrawText(TextFormat("view: %s", view_name(s.view)), x0, y0 + 84, 14, kDim);
}

void DashboardApp::draw_readouts_(const DashboardSnapshot& s) {
  const int x0 = GetScreenWidth() - 360;
  int y = 180;
  const int row_h = 20;
  char buf[64];

  DrawText("World state", x0, y, 18, kText); y += row_h + 4;
  if (!s.world) {
    DrawText("(no reading yet)", x0, y, 16, kDim);
    return;
  }
  const WorldState& ws = *s.world;

  if (ws.position) std::snprintf(buf, sizeof(buf), "%.6f, %.6f", ws.position->lat_deg, ws.position->lon_deg);
  else             std::snprintf(buf, sizeof(buf), "no fix");
  DrawText(TextFormat("GPS        %s", buf), x0, y, 16, kText); y += row_h;

  fmt_opt(ws.clearance_cm, "%.1f cm", buf, sizeof(buf));
  DrawText(TextFormat("Clearance  %s", buf), x0, y, 16, kText); y += row_h;

  DrawText(TextFormat("Payload    %.2f kg%s", ws.payload_mass_kg, ws.payload_measured ? "" : " (unmeasured)"),
           x0, y, 16, ws.payload_measured ? kText : Color{241, 196, 15, 255}); y += row_h;

  DrawText(TextFormat("Bin        %s%s", ws.bin_full ? "FULL" : "ok", ws.bin_switch_readable ? "" : " (switch n/a)"),
           x0, y, 16, ws.bin_full ? Color{231, 76, 60, 255} : kText); y += row_h;

  if (ws.orientation) std::snprintf(buf, sizeof(buf), "P:%.1f R:%.1f", ws.orientation->pitch_deg, ws.orientation->roll_deg);
  else                std::snprintf(buf, sizeof(buf), "N/A");
  DrawText(TextFormat("Tilt       %s", buf), x0, y, 16, kText); y += row_h;

  DrawText(TextFormat("Detection  %s %.0f%%", ws.detection.is_target ? "yes" : "no", ws.detection.confidence * 100.0),
           x0, y, 16, kText); y += row_h + 10;

  DrawText("Arbitration", x0, y, 18, kText); y += row_h + 4;
  DrawText(TextFormat("Action     %s", action_name(s.last_action)), x0, y, 16, actionColor(s.last_action)); y += row_h;
  DrawText(TextFormat("Drive      L%d R%d", s.pond.left_cmd, s.pond.right_cmd), x0, y, 16, kText); y += row_h;
  if (s.last_cycle_error) {
    DrawText(TextFormat("Error      %s", s.last_error.c_str()), x0, y, 14, Color{231, 76, 60, 255});
  }
  y += row_h + 10;

  DrawText("Audit", x0, y, 18, kText); y += row_h + 4;
  DrawText(TextFormat("Entries %llu  Detections %llu  Avg %.1f%%",
                      (unsigned long long)s.audit.count,
                      (unsigned long long)s.audit.detections,
                      s.audit.avg_confidence * 100.0),
           x0, y, 16, kText);
}

void DashboardApp::draw_hud_(const DashboardSnapshot& s) {
  const std::string fatal = mission_.fatal_error();
  DrawText(TextFormat("cycle=%llu  collected=%llu  payload=%.2fkg  sim=%.1fs  %s",
                      (unsigned long long)s.cycle_index,
                      (unsigned long long)s.collection_count,
                      s.pond.payload_kg,
                      s.pond.sim_time_s,
                      mission_.running() ? "RUNNING" : "STOPPED"),
           20, 20, 20, kText);
  if (!fatal.empty()) {
    DrawText(TextFormat("FATAL: %s", fatal.c_str()), 20, GetScreenHeight() - 50, 16, Color{231, 76, 60, 255});
  }
  DrawText("F: inject actuation fault | G: inject 3 faults | W/S or +/-: Zoom | Esc: Quit",
           20, GetScreenHeight() - 24, 14, kDim);
}

} // namespace skimmer
