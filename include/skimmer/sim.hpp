#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <vector>
#include <skimmer/clock.hpp>
#include <skimmer/ports.hpp>

namespace skimmer {

// Rectangular pond in local metres, x east, y north, origin at the SW corner.
struct PondConfig {
  double width_m = 40.0;
  double height_m = 25.0;
  double origin_lat_deg = 14.5995;
  double origin_lon_deg = 120.9842;

  double max_speed_mps = 0.6;       // at drive 100/100
  double track_width_m = 0.6;

  std::size_t patch_count = 12;
  double patch_radius_m = 0.5;
  double kg_per_collection = 0.8;
  double bin_capacity_kg = 10.0;

  double camera_fov_deg = 50.0;
  double camera_range_m = 8.0;
  double collector_reach_m = 2.5;
  int frame_width = 32;
  int frame_height = 24;

  std::uint32_t seed = 7;
};

struct Pose {
  double x_m = 0.0;
  double y_m = 0.0;
  double heading_rad = 0.0;   // 0 = east, CCW positive
};

struct AlgaePatch {
  double x_m = 0.0;
  double y_m = 0.0;
  double radius_m = 0.5;
  bool collected = false;
};

// Immutable copy of the pond for renderers.
struct PondView {
  Pose pose{};
  std::vector<AlgaePatch> patches;
  double width_m = 0.0;
  double height_m = 0.0;
  double payload_kg = 0.0;
  int left_cmd = 0;
  int right_cmd = 0;
  bool collector_running = false;
  double sim_time_s = 0.0;
};

// Differential-drive boat on a walled pond. Integrates on demand: every query
// first advances the world to the clock's current time.
class SimPond {
public:
  SimPond(PondConfig cfg, const Clock& clock);

  // Actuation surface
  void set_drive(int left, int right);
  // A non-zero max_run stops the belt on its own once that much time has passed.
  void set_collector(bool running, Clock::duration max_run = Clock::duration::zero());

  // Sensor surface
  Pose pose();
  double echo_raw_cm();                       // distance to the wall dead ahead
  double payload_kg();
  bool bin_full();
  GeoFix geo_fix();
  std::optional<Orientation> tilt();
  Frame render_frame();

  // Removes the nearest reachable patch in view and loads the bin.
  bool collect_ahead();

  PondView view();
  const PondConfig& config() const { return cfg_; }

  // Fixed-step integration. Public so tests can drive it without a clock.
  void step(double dt_sec);

private:
  void advance_();
  std::optional<std::size_t> nearest_in_view_(double max_range_m) const;
  double ray_to_wall_(double x, double y, double heading) const;

  PondConfig cfg_;
  const Clock& clock_;
  Clock::time_point last_;
  std::mutex mu_;
  Pose pose_{};
  std::vector<AlgaePatch> patches_;
  double payload_kg_{0.0};
  int left_{0}, right_{0};
  bool collector_{false};
  std::optional<Clock::time_point> collector_until_;
  double sim_time_{0.0};
};

// Actuation port over a SimPond, with optional injected failures.
class SimActuation final : public ActuationPort {
public:
  SimActuation(SimPond& pond, const Clock& clock) : pond_(pond), clock_(clock) {}

  void drive(int left_speed, int right_speed) override;
  void stop_drive() override;
  void run_collector(CollectorDirection dir, Clock::duration max_run) override;
  void stop_collector() override;
  void stop_all() override;

  // The next n commands (stop_all excluded) throw ActuationFault.
  void inject_faults(int n) { pending_faults_ = n; }
  // Forward runs that lasted long enough to lift a patch. Reverse runs clear
  // the belt and never lift anything.
  std::uint64_t completed_runs() const { return completed_runs_; }

private:
  void maybe_fail_(const char* what);

  SimPond& pond_;
  const Clock& clock_;
  std::optional<Clock::time_point> collector_started_;
  Clock::duration collector_max_{};
  CollectorDirection collector_dir_{CollectorDirection::Forward};
  int pending_faults_{0};
  std::uint64_t completed_runs_{0};
};

// Per-sensor dropout probabilities, each in [0,1].
struct SensorDropouts {
  double gps = 0.0;
  double echo = 0.0;
  double load_cell = 0.0;
  double float_switch = 0.0;
  double imu = 0.0;
};

class SimSensorFusion final : public SensorFusionPort {
public:
  SimSensorFusion(SimPond& pond, SensorDropouts dropouts, std::uint32_t seed)
    : pond_(pond), drop_(dropouts), rng_(seed) {}
  WorldState sample() override;

private:
  bool drops_(double p);

  SimPond& pond_;
  SensorDropouts drop_;
  std::mt19937 rng_;
};

class SimCamera final : public FrameSource {
public:
  explicit SimCamera(SimPond& pond) : pond_(pond) {}
  std::optional<Frame> capture() override { return pond_.render_frame(); }

private:
  SimPond& pond_;
};

// Scores a frame by the share of strongly green pixels.
class GreenRatioClassifier final : public PerceptionPort {
public:
  explicit GreenRatioClassifier(double gain = 2.5, double min_fraction = 0.05)
    : gain_(gain), min_fraction_(min_fraction) {}
  Detection classify(const Frame& frame) override;

  static double green_fraction(const Frame& frame);

private:
  double gain_;
  double min_fraction_;
};

} // namespace skimmer
