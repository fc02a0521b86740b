#include <skimmer/sim.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <string>
#include <utility>
#include <skimmer/faults.hpp>

namespace skimmer {

static constexpr double kPI = std::numbers::pi;
static constexpr double kMetresPerDegLat = 111320.0;

static double wrap_angle(double a) {
  while (a > kPI)   a -= 2.0 * kPI;
  while (a <= -kPI) a += 2.0 * kPI;
  return a;
}

static int clamp_speed(int v) { return std::clamp(v, -100, 100); }

// ---- SimPond ----

SimPond::SimPond(PondConfig cfg, const Clock& clock)
  : cfg_(std::move(cfg)), clock_(clock), last_(clock.now()) {
  pose_ = Pose{cfg_.width_m * 0.5, cfg_.height_m * 0.5, 0.0};

  std::mt19937 rng(cfg_.seed);
  const double margin = 1.5;
  std::uniform_real_distribution<double> ux(margin, std::max(margin, cfg_.width_m - margin));
  std::uniform_real_distribution<double> uy(margin, std::max(margin, cfg_.height_m - margin));
  patches_.reserve(cfg_.patch_count);
  for (std::size_t i = 0; i < cfg_.patch_count; ++i) {
    patches_.push_back(AlgaePatch{ux(rng), uy(rng), cfg_.patch_radius_m, false});
  }
}

void SimPond::step(double dt_sec) {
  if (dt_sec <= 0.0) return;
  const double vl = (left_ / 100.0) * cfg_.max_speed_mps;
  const double vr = (right_ / 100.0) * cfg_.max_speed_mps;
  const double v = 0.5 * (vl + vr);
  const double w = cfg_.track_width_m > 0.0 ? (vr - vl) / cfg_.track_width_m : 0.0;

  pose_.heading_rad = wrap_angle(pose_.heading_rad + w * dt_sec);
  pose_.x_m += v * std::cos(pose_.heading_rad) * dt_sec;
  pose_.y_m += v * std::sin(pose_.heading_rad) * dt_sec;

  // Hull bumps against the bank; the pad sits inside the 10 cm safe echo distance
  const double pad = 0.05;
  pose_.x_m = std::clamp(pose_.x_m, pad, std::max(pad, cfg_.width_m - pad));
  pose_.y_m = std::clamp(pose_.y_m, pad, std::max(pad, cfg_.height_m - pad));
  sim_time_ += dt_sec;
}

void SimPond::advance_() {
  const auto now = clock_.now();
  if (collector_until_ && now >= *collector_until_) {
    collector_ = false;
    collector_until_.reset();
  }
  if (now <= last_) return;
  double dt = std::chrono::duration<double>(now - last_).count();
  last_ = now;
  // Sub-step so long sleeps still integrate turns smoothly
  const double max_dt = 0.05;
  while (dt > 0.0) {
    const double h = std::min(dt, max_dt);
    step(h);
    dt -= h;
  }
}

void SimPond::set_drive(int left, int right) {
  std::lock_guard<std::mutex> lk(mu_);
  advance_();
  left_ = clamp_speed(left);
  right_ = clamp_speed(right);
}

void SimPond::set_collector(bool running, Clock::duration max_run) {
  std::lock_guard<std::mutex> lk(mu_);
  advance_();
  collector_ = running;
  if (running && max_run > Clock::duration::zero()) collector_until_ = clock_.now() + max_run;
  else collector_until_.reset();
}

Pose SimPond::pose() {
  std::lock_guard<std::mutex> lk(mu_);
  advance_();
  return pose_;
}

double SimPond::ray_to_wall_(double x, double y, double heading) const {
  const double c = std::cos(heading), s = std::sin(heading);
  double best = std::numeric_limits<double>::infinity();
  auto consider = [&](double t){ if (t > 0.0) best = std::min(best, t); };
  if (c > 1e-9)  consider((cfg_.width_m - x) / c);
  if (c < -1e-9) consider(-x / c);
  if (s > 1e-9)  consider((cfg_.height_m - y) / s);
  if (s < -1e-9) consider(-y / s);
  return best;
}

double SimPond::echo_raw_cm() {
  std::lock_guard<std::mutex> lk(mu_);
  advance_();
  return ray_to_wall_(pose_.x_m, pose_.y_m, pose_.heading_rad) * 100.0;
}

double SimPond::payload_kg() {
  std::lock_guard<std::mutex> lk(mu_);
  return payload_kg_;
}

bool SimPond::bin_full() {
  std::lock_guard<std::mutex> lk(mu_);
  return payload_kg_ >= cfg_.bin_capacity_kg;
}

GeoFix SimPond::geo_fix() {
  std::lock_guard<std::mutex> lk(mu_);
  advance_();
  const double lat = cfg_.origin_lat_deg + pose_.y_m / kMetresPerDegLat;
  const double lon = cfg_.origin_lon_deg +
    pose_.x_m / (kMetresPerDegLat * std::cos(cfg_.origin_lat_deg * kPI / 180.0));
  return GeoFix{lat, lon};
}

std::optional<Orientation> SimPond::tilt() {
  std::lock_guard<std::mutex> lk(mu_);
  advance_();
  const double ax = 0.02 * std::sin(0.9 * sim_time_);
  const double ay = 0.03 * std::cos(0.7 * sim_time_);
  return orientation_from_accel(ax, ay, 1.0);
}

std::optional<std::size_t> SimPond::nearest_in_view_(double max_range_m) const {
  const double half_fov = 0.5 * cfg_.camera_fov_deg * kPI / 180.0;
  std::optional<std::size_t> best;
  double best_d = max_range_m;
  for (std::size_t i = 0; i < patches_.size(); ++i) {
    const auto& p = patches_[i];
    if (p.collected) continue;
    const double dx = p.x_m - pose_.x_m, dy = p.y_m - pose_.y_m;
    const double d = std::sqrt(dx * dx + dy * dy);
    if (d > best_d) continue;
    const double bearing = wrap_angle(std::atan2(dy, dx) - pose_.heading_rad);
    if (std::fabs(bearing) > half_fov) continue;
    best = i;
    best_d = d;
  }
  return best;
}

Frame SimPond::render_frame() {
  std::lock_guard<std::mutex> lk(mu_);
  advance_();

  Frame f;
  f.width = std::max(1, cfg_.frame_width);
  f.height = std::max(1, cfg_.frame_height);
  f.rgb.resize(std::size_t(f.width) * std::size_t(f.height) * 3);
  for (std::size_t i = 0; i < f.rgb.size(); i += 3) {
    f.rgb[i] = 30; f.rgb[i + 1] = 90; f.rgb[i + 2] = 140;   // open water
  }

  const double half_fov = 0.5 * cfg_.camera_fov_deg * kPI / 180.0;
  const double focal_px = (f.width * 0.5) / std::tan(half_fov);
  for (const auto& p : patches_) {
    if (p.collected) continue;
    const double dx = p.x_m - pose_.x_m, dy = p.y_m - pose_.y_m;
    const double d = std::sqrt(dx * dx + dy * dy);
    if (d < 1e-3 || d > cfg_.camera_range_m) continue;
    const double bearing = wrap_angle(std::atan2(dy, dx) - pose_.heading_rad);
    if (std::fabs(bearing) >= 0.5 * kPI) continue;

    const double cx = f.width * 0.5 - std::tan(bearing) * focal_px;
    const double cy = f.height * 0.5;
    const double half = std::min(p.radius_m / d * focal_px, double(f.width));
    const int x0 = std::max(0, int(std::floor(cx - half)));
    const int x1 = std::min(f.width, int(std::ceil(cx + half)));
    const int y0 = std::max(0, int(std::floor(cy - half)));
    const int y1 = std::min(f.height, int(std::ceil(cy + half)));
    for (int y = y0; y < y1; ++y) {
      for (int x = x0; x < x1; ++x) {
        const std::size_t o = (std::size_t(y) * f.width + x) * 3;
        f.rgb[o] = 60; f.rgb[o + 1] = 170; f.rgb[o + 2] = 50;
      }
    }
  }
  return f;
}

bool SimPond::collect_ahead() {
  std::lock_guard<std::mutex> lk(mu_);
  advance_();
  const auto idx = nearest_in_view_(cfg_.collector_reach_m);
  if (!idx) return false;
  patches_[*idx].collected = true;
  payload_kg_ += cfg_.kg_per_collection;
  return true;
}

PondView SimPond::view() {
  std::lock_guard<std::mutex> lk(mu_);
  advance_();
  PondView v;
  v.pose = pose_;
  v.patches = patches_;
  v.width_m = cfg_.width_m;
  v.height_m = cfg_.height_m;
  v.payload_kg = payload_kg_;
  v.left_cmd = left_;
  v.right_cmd = right_;
  v.collector_running = collector_;
  v.sim_time_s = sim_time_;
  return v;
}

// ---- SimActuation ----

void SimActuation::maybe_fail_(const char* what) {
  if (pending_faults_ > 0) {
    --pending_faults_;
    throw ActuationFault(std::string(what) + ": driver did not acknowledge");
  }
}

void SimActuation::drive(int left_speed, int right_speed) {
  maybe_fail_("drive");
  pond_.set_drive(left_speed, right_speed);
}

void SimActuation::stop_drive() {
  maybe_fail_("stop_drive");
  pond_.set_drive(0, 0);
}

void SimActuation::run_collector(CollectorDirection dir, Clock::duration max_run) {
  maybe_fail_("run_collector");
  collector_started_ = clock_.now();
  collector_max_ = max_run;
  collector_dir_ = dir;
  pond_.set_collector(true, max_run);
}

void SimActuation::stop_collector() {
  maybe_fail_("stop_collector");
  pond_.set_collector(false);
  if (!collector_started_) return;
  const auto ran = std::min(clock_.now() - *collector_started_, collector_max_);
  collector_started_.reset();
  // A run cut short does not lift anything into the bin, nor does a reversed belt.
  if (collector_dir_ == CollectorDirection::Forward && ran * 5 >= collector_max_ * 4) {
    ++completed_runs_;
    (void)pond_.collect_ahead();
  }
}

void SimActuation::stop_all() {
  pond_.set_drive(0, 0);
  pond_.set_collector(false);
  collector_started_.reset();
}

// ---- SimSensorFusion ----

bool SimSensorFusion::drops_(double p) {
  if (p <= 0.0) return false;
  std::uniform_real_distribution<double> U(0.0, 1.0);
  return U(rng_) < p;
}

WorldState SimSensorFusion::sample() {
  WorldState ws;
  if (!drops_(drop_.gps)) ws.position = pond_.geo_fix();
  if (!drops_(drop_.echo)) ws.clearance_cm = clearance_from_raw(pond_.echo_raw_cm());
  if (!drops_(drop_.load_cell)) {
    ws.payload_mass_kg = pond_.payload_kg();
    ws.payload_measured = true;
  }
  if (!drops_(drop_.float_switch)) {
    ws.bin_full = pond_.bin_full();
    ws.bin_switch_readable = true;
  }
  if (!drops_(drop_.imu)) ws.orientation = pond_.tilt();
  return ws;
}

// ---- GreenRatioClassifier ----

double GreenRatioClassifier::green_fraction(const Frame& frame) {
  const std::size_t n = frame.rgb.size() / 3;
  if (n == 0) return 0.0;
  std::size_t green = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const int r = frame.rgb[3 * i], g = frame.rgb[3 * i + 1], b = frame.rgb[3 * i + 2];
    if (g > r + 30 && g > b + 30) ++green;
  }
  return double(green) / double(n);
}

Detection GreenRatioClassifier::classify(const Frame& frame) {
  if (frame.empty()) return Detection{};
  const double frac = green_fraction(frame);
  return make_detection(frac >= min_fraction_, frac * gain_);
}

} // namespace skimmer
