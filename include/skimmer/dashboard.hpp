#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <skimmer/arbitration.hpp>
#include <skimmer/latest_buffer.hpp>
#include <skimmer/ports.hpp>
#include <skimmer/sim.hpp>
#include <skimmer/supervisor.hpp>

namespace skimmer {

// Everything the operator window draws for one frame.
struct DashboardSnapshot {
  std::uint64_t cycle_index = 0;
  std::uint64_t collection_count = 0;
  View view = View::Ready;
  TextPanel panel{};
  std::optional<WorldState> world;
  ActionKind last_action = ActionKind::Idle;
  bool last_cycle_error = false;
  std::string last_error;
  AuditSummary audit{};
  PondView pond{};
};

using DashboardBuffer = LatestBuffer<DashboardSnapshot>;

// Presentation port that publishes snapshots for the raylib dashboard.
// show() and on_cycle() both run on the loop thread.
class DashboardPresenter final : public PresentationPort {
public:
  using PondProvider = std::function<PondView()>;

  DashboardPresenter(DashboardBuffer& out, PondProvider pond, const AuditLogPort* audit)
    : out_(out), pond_(std::move(pond)), audit_(audit) {}

  void show(View view, const ViewData& data) override;

  // Install as the loop's cycle observer.
  void on_cycle(const CycleReport& rep);

private:
  void publish_();

  DashboardBuffer& out_;
  PondProvider pond_;
  const AuditLogPort* audit_;
  std::mutex mu_;
  DashboardSnapshot cur_{};
};

} // namespace skimmer
