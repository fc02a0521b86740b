#include <skimmer/mission_runner.hpp>
#include <skimmer/audit_log.hpp>
#include <skimmer/faults.hpp>
#include <skimmer/log.hpp>

namespace skimmer {

static std::unique_ptr<AuditLogPort> make_audit_(const MissionOptions& o) {
  if (o.persist_audit) {
    if (auto csv = CsvAuditLog::open(o.loop.audit_log_path)) return csv;
    log::warn("cannot open %s, keeping the audit trail in memory", o.loop.audit_log_path.c_str());
  }
  return std::make_unique<MemoryAuditLog>();
}

MissionRunner::MissionRunner(MissionOptions opts)
  : opts_(std::move(opts)),
    pond_(opts_.pond, clock_),
    actuation_(pond_, clock_),
    sensors_(pond_, opts_.dropouts, opts_.pond.seed + 1),
    camera_(pond_),
    audit_(make_audit_(opts_)),
    presenter_(buffer_, [this]{ return pond_.view(); }, audit_.get()) {
  Collaborators io{actuation_, sensors_, &camera_, classifier_, presenter_, *audit_};
  loop_ = std::make_unique<SupervisoryLoop>(io, opts_.loop, clock_);
  loop_->set_cycle_observer([this](const CycleReport& rep) {
    presenter_.on_cycle(rep);
    const int n = pending_faults_.exchange(0);
    if (n > 0) actuation_.inject_faults(n);
  });
}

void MissionRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&MissionRunner::thread_main_, this);
}

void MissionRunner::stop() {
  if (loop_) loop_->stop();
  if (th_.joinable()) th_.join();
  running_.store(false);
}

void MissionRunner::request_actuation_faults(int n) {
  if (n > 0) pending_faults_.fetch_add(n);
}

std::string MissionRunner::fatal_error() const {
  std::lock_guard<std::mutex> lk(err_mu_);
  return fatal_error_;
}

void MissionRunner::thread_main_() {
  try {
    loop_->run();
  } catch (const FatalFault& e) {
    std::lock_guard<std::mutex> lk(err_mu_);
    fatal_error_ = e.what();
  }
  running_.store(false);
}

} // namespace skimmer
