#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <skimmer/audit_log.hpp>
#include <skimmer/clock.hpp>
#include <skimmer/config.hpp>
#include <skimmer/faults.hpp>
#include <skimmer/log.hpp>
#include <skimmer/sim.hpp>
#include <skimmer/supervisor.hpp>
#include <skimmer/text_presenter.hpp>

using namespace skimmer;

namespace {

std::atomic<SupervisoryLoop*> g_loop{nullptr};

extern "C" void on_signal(int) {
  if (auto* loop = g_loop.load()) loop->stop();
}

} // namespace

// Headless run over the simulated pond with a text panel on stdout.
// Usage: skimmer [config.csv]
int main(int argc, char** argv) {
  LoopConfig cfg;
  if (argc > 1) {
    std::vector<std::string> warnings;
    auto loaded = load_config(argv[1], &warnings);
    if (!loaded) {
      log::error("cannot read config %s", argv[1]);
      return 1;
    }
    for (const auto& w : warnings) log::warn("config: %s", w.c_str());
    cfg = *loaded;
  } else {
    cfg.cruise_speed = 40;
  }
  const auto problems = validate(cfg);
  for (const auto& p : problems) log::error("config: %s", p.c_str());
  if (!problems.empty()) return 1;

  SteadyClock clock;
  PondConfig pond_cfg;
  SimPond pond(pond_cfg, clock);
  SimActuation actuation(pond, clock);
  SimSensorFusion sensors(pond, SensorDropouts{0.05, 0.05, 0.02, 0.0, 0.05}, pond_cfg.seed + 1);
  SimCamera camera(pond);
  GreenRatioClassifier classifier;
  TextPresenter presenter(std::cout);

  std::string audit_source = cfg.audit_log_path;
  std::unique_ptr<AuditLogPort> audit = CsvAuditLog::open(cfg.audit_log_path);
  if (!audit) {
    log::warn("cannot open %s, keeping the audit trail in memory", cfg.audit_log_path.c_str());
    audit = std::make_unique<MemoryAuditLog>();
    audit_source = "memory";
  }

  SupervisoryLoop loop({actuation, sensors, &camera, classifier, presenter, *audit}, cfg, clock);
  g_loop.store(&loop);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  int code = 0;
  try {
    loop.run();
  } catch (const FatalFault& e) {
    log::error("stopped on fatal fault: %s", e.what());
    code = 2;
  }
  g_loop.store(nullptr);

  write_summary_report(std::cout, audit->summary(), audit_source);
  return code;
}
