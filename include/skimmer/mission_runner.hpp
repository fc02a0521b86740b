#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <skimmer/clock.hpp>
#include <skimmer/config.hpp>
#include <skimmer/dashboard.hpp>
#include <skimmer/sim.hpp>
#include <skimmer/supervisor.hpp>

namespace skimmer {

struct MissionOptions {
  LoopConfig loop{};
  PondConfig pond{};
  SensorDropouts dropouts{};
  bool persist_audit = true;   // CSV at loop.audit_log_path, else in memory
};

// Owns the supervisory loop thread over a simulated pond and publishes
// dashboard snapshots.
class MissionRunner {
public:
  explicit MissionRunner(MissionOptions opts);
  ~MissionRunner() { stop(); }
  MissionRunner(const MissionRunner&) = delete;
  MissionRunner& operator=(const MissionRunner&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Safe to call from the UI thread; applied at the next cycle boundary.
  void request_actuation_faults(int n);

  DashboardBuffer& buffer() { return buffer_; }
  const DashboardBuffer& buffer() const { return buffer_; }
  const MissionOptions& options() const { return opts_; }

  // Message of the FatalFault that ended the loop, empty otherwise.
  std::string fatal_error() const;

private:
  void thread_main_();

  MissionOptions opts_;
  SteadyClock clock_;
  SimPond pond_;
  SimActuation actuation_;
  SimSensorFusion sensors_;
  SimCamera camera_;
  GreenRatioClassifier classifier_;
  std::unique_ptr<AuditLogPort> audit_;
  DashboardBuffer buffer_;
  DashboardPresenter presenter_;
  std::unique_ptr<SupervisoryLoop> loop_;

  std::thread th_;
  std::atomic<bool> running_{false};
  std::atomic<int> pending_faults_{0};
  mutable std::mutex err_mu_;
  std::string fatal_error_;
};

} // namespace skimmer
