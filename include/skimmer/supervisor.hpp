#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <skimmer/arbitration.hpp>
#include <skimmer/clock.hpp>
#include <skimmer/config.hpp>
#include <skimmer/ports.hpp>
#include <skimmer/rotation.hpp>

namespace skimmer {

// Process-lifetime state of one loop instance. Written only by the loop thread,
// except that collection_count and running may be read from anywhere.
struct LoopState {
  std::atomic<std::uint64_t> collection_count{0};
  std::atomic<bool> running{false};
  std::atomic<std::uint64_t> cycle_index{0};
  Clock::time_point started_at{};
};

// The subsystems one loop drives. camera may be null (no frames, no detections).
struct Collaborators {
  ActuationPort& actuation;
  SensorFusionPort& sensors;
  FrameSource* camera;
  PerceptionPort& perception;
  PresentationPort& presentation;
  AuditLogPort& audit;
};

// What one cycle saw and did.
struct CycleReport {
  std::uint64_t cycle_index = 0;
  std::optional<WorldState> world;   // absent only if acquisition itself blew up
  Action action{};
  bool error = false;
  std::string error_message;
  Clock::duration elapsed{};         // sense + decide + act
  Clock::duration slept{};           // pacing sleep or error backoff
};

using CycleObserver = std::function<void(const CycleReport&)>;

// Sense -> decide -> act -> present -> log, paced to cfg.cycle_period.
class SupervisoryLoop {
public:
  SupervisoryLoop(Collaborators c, LoopConfig cfg, Clock& clock);
  SupervisoryLoop(const SupervisoryLoop&) = delete;
  SupervisoryLoop& operator=(const SupervisoryLoop&) = delete;

  // Blocks until stop() or a FatalFault. Throws FatalFault when the actuation
  // port is unreachable at startup or keeps failing; stop_all() has been
  // attempted before anything leaves this function.
  void run();

  // Safe from any thread. Observed at the next cycle boundary.
  void stop() noexcept { stop_requested_.store(true, std::memory_order_release); }
  bool stop_requested() const noexcept { return stop_requested_.load(std::memory_order_acquire); }

  // One full cycle including its pacing sleep (or error backoff).
  // Throws FatalFault only; every other failure is absorbed and reported.
  CycleReport run_cycle();

  void set_cycle_observer(CycleObserver obs) { observer_ = std::move(obs); }

  const LoopState& state() const { return state_; }
  std::uint64_t collection_count() const { return state_.collection_count.load(); }
  const LoopConfig& config() const { return cfg_; }
  const PresentationRotation& rotation() const { return rotation_; }

private:
  WorldState acquire_();
  void execute_(const Action& a, const WorldState& ws);
  void handle_bin_full_(const WorldState& ws);
  void handle_obstacle_(const Action& a, const WorldState& ws);
  void handle_collect_(const Action& a, const WorldState& ws);
  void handle_idle_(const WorldState& ws);
  void commit_collection_(const WorldState& ws, double confidence);
  void note_payload_(const WorldState& ws);
  void periodic_status_(const WorldState& ws);

  void audit_(EventKind kind, const WorldState* ws, std::string message);
  void audit_lifecycle_(std::string message) noexcept;
  void report_error_(const std::string& message, const WorldState* ws);
  void present_(View v, const ViewData& d);
  ViewData view_data_(const WorldState* ws) const;
  void safe_stop_all_() noexcept;
  void resume_cruise_();
  void startup_();
  void shutdown_();

  Collaborators io_;
  LoopConfig cfg_;
  Thresholds th_;
  Clock& clock_;
  LoopState state_;
  PresentationRotation rotation_;
  CycleObserver observer_;

  std::atomic<bool> stop_requested_{false};
  std::mutex commit_mu_;
  std::uint32_t consecutive_actuation_faults_{0};
  bool payload_fault_reported_{false};
  bool payload_limit_reported_{false};
};

} // namespace skimmer
