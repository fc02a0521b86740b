#include <skimmer/supervisor.hpp>
#include <chrono>
#include <cstdio>
#include <exception>
#include <utility>
#include <skimmer/faults.hpp>
#include <skimmer/log.hpp>

namespace skimmer {

static std::string fmt_double(const char* fmt, double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return std::string(buf);
}

SupervisoryLoop::SupervisoryLoop(Collaborators c, LoopConfig cfg, Clock& clock)
  : io_(c),
    cfg_(std::move(cfg)),
    th_(thresholds_from(cfg_)),
    clock_(clock),
    rotation_(to_clock(cfg_.rotation_interval), clock.now()) {}

// ---- lifecycle ----

void SupervisoryLoop::startup_() {
  // Probe the drive: if we cannot even stop it we must not start moving.
  try {
    io_.actuation.stop_all();
  } catch (const std::exception& e) {
    throw FatalFault(std::string("actuation unreachable at startup: ") + e.what());
  }

  state_.started_at = clock_.now();
  state_.running.store(true);
  rotation_.reset(state_.started_at);
  consecutive_actuation_faults_ = 0;

  present_(View::Ready, view_data_(nullptr));
  audit_lifecycle_("loop started");
  log::info("supervisory loop started (period %.2fs, threshold %.2f, min clearance %.1fcm)",
            cfg_.cycle_period.count(), cfg_.confidence_threshold, cfg_.min_safe_distance_cm);
}

void SupervisoryLoop::shutdown_() {
  safe_stop_all_();
  const auto n = state_.collection_count.load();
  const double runtime_s =
    std::chrono::duration<double>(clock_.now() - state_.started_at).count();
  audit_lifecycle_("loop stopped - total collections: " + std::to_string(n));
  present_(View::Shutdown, view_data_(nullptr));
  state_.running.store(false);
  log::info("supervisory loop stopped after %llu cycles, %.0fs, %llu collections",
            (unsigned long long)state_.cycle_index.load(), runtime_s, (unsigned long long)n);
}

void SupervisoryLoop::run() {
  startup_();
  try {
    while (!stop_requested()) {
      (void)run_cycle();
    }
  } catch (const FatalFault& e) {
    log::error("fatal: %s", e.what());
    safe_stop_all_();
    report_error_(e.what(), nullptr);
    state_.running.store(false);
    throw;
  } catch (...) {
    log::error("non-standard exception escaped the cycle, stopping");
    safe_stop_all_();
    state_.running.store(false);
    throw;
  }
  shutdown_();
}

// ---- one cycle ----

CycleReport SupervisoryLoop::run_cycle() {
  const auto cycle_start = clock_.now();
  CycleReport rep;
  rep.cycle_index = state_.cycle_index.fetch_add(1) + 1;

  try {
    rep.world.emplace(acquire_());
    const WorldState& ws = *rep.world;
    note_payload_(ws);
    rep.action = decide(ws, th_);
    execute_(rep.action, ws);
    consecutive_actuation_faults_ = 0;

    switch (rep.action.kind) {
      case ActionKind::BinFull:
        audit_(EventKind::BinFull, &ws, "collection bin full");
        break;
      case ActionKind::AvoidObstacle:
        audit_(EventKind::Obstacle, &ws,
               "obstacle at " + fmt_double("%.1f", rep.action.clearance_cm) + " cm");
        break;
      default:
        break;  // Collect audits atomically with the count; Idle is not audited
    }

    if (rep.cycle_index % cfg_.status_every_n_cycles == 0) periodic_status_(ws);
  } catch (const FatalFault&) {
    throw;
  } catch (const ActuationFault& e) {
    safe_stop_all_();
    ++consecutive_actuation_faults_;
    rep.error = true;
    rep.error_message = std::string("actuation: ") + e.what();
    report_error_(rep.error_message, rep.world ? &*rep.world : nullptr);
    if (consecutive_actuation_faults_ >= cfg_.max_consecutive_actuation_faults) {
      throw FatalFault("actuation failed " + std::to_string(consecutive_actuation_faults_) +
                       " cycles in a row: " + e.what());
    }
  } catch (const std::exception& e) {
    safe_stop_all_();
    rep.error = true;
    rep.error_message = e.what();
    report_error_(rep.error_message, rep.world ? &*rep.world : nullptr);
  }

  rep.elapsed = clock_.now() - cycle_start;
  if (rep.error) {
    rep.slept = to_clock(cfg_.error_backoff);
  } else {
    const auto period = to_clock(cfg_.cycle_period);
    // Overruns start the next cycle at once; no catch-up, nothing skipped.
    rep.slept = rep.elapsed < period ? period - rep.elapsed : Clock::duration::zero();
  }

  if (observer_) observer_(rep);
  clock_.sleep_for(rep.slept);
  return rep;
}

WorldState SupervisoryLoop::acquire_() {
  Detection det{};
  try {
    std::optional<Frame> frame;
    if (io_.camera) frame = io_.camera->capture();
    if (frame) {
      const Detection raw = io_.perception.classify(*frame);
      det = make_detection(raw.is_target, raw.confidence);
    }
  } catch (const std::exception& e) {
    log::warn("perception unavailable, treating as no detection: %s", e.what());
    det = Detection{};
  }

  WorldState ws;
  try {
    ws = io_.sensors.sample();
  } catch (const std::exception& e) {
    log::warn("sensor fusion failed, all fields defaulted: %s", e.what());
    ws = WorldState{};
  }

  if (ws.clearance_cm) ws.clearance_cm = clearance_from_raw(*ws.clearance_cm, cfg_.max_range_cm);
  if (!ws.payload_measured) ws.payload_mass_kg = 0.0;
  ws.detection = det;
  return ws;
}

void SupervisoryLoop::execute_(const Action& a, const WorldState& ws) {
  switch (a.kind) {
    case ActionKind::BinFull:       handle_bin_full_(ws); break;
    case ActionKind::AvoidObstacle: handle_obstacle_(a, ws); break;
    case ActionKind::Collect:       handle_collect_(a, ws); break;
    case ActionKind::Idle:          handle_idle_(ws); break;
  }
}

// ---- maneuvers ----

void SupervisoryLoop::handle_bin_full_(const WorldState& ws) {
  log::warn("collection bin is full, holding for operator");
  io_.actuation.stop_all();
  present_(View::BinFull, view_data_(&ws));
  clock_.sleep_for(to_clock(cfg_.bin_full_dwell));
}

void SupervisoryLoop::handle_obstacle_(const Action& a, const WorldState& ws) {
  log::warn("obstacle at %.1f cm, turning away", a.clearance_cm);
  present_(View::Obstacle, view_data_(&ws));
  io_.actuation.stop_drive();
  // Open-loop turn to the right; clearance is not re-checked mid-turn.
  io_.actuation.drive(cfg_.turn_speed, -cfg_.turn_speed);
  clock_.sleep_for(to_clock(cfg_.avoid_turn_time));
  io_.actuation.stop_drive();
  clock_.sleep_for(to_clock(cfg_.avoid_settle_time));
}

void SupervisoryLoop::handle_collect_(const Action& a, const WorldState& ws) {
  log::info("target detected, confidence %.2f%%", a.confidence * 100.0);
  ViewData d = view_data_(&ws);
  d.confidence = a.confidence;
  present_(View::Detected, d);

  io_.actuation.stop_drive();
  clock_.sleep_for(to_clock(cfg_.detect_hold));

  present_(View::Collecting, d);
  const auto run_for = to_clock(cfg_.collection_duration);
  io_.actuation.run_collector(CollectorDirection::Forward, run_for);
  clock_.sleep_for(run_for);
  io_.actuation.stop_collector();

  commit_collection_(ws, a.confidence);
  rotation_.reset(clock_.now());
  log::info("collection complete, total %llu",
            (unsigned long long)state_.collection_count.load());
  resume_cruise_();
}

void SupervisoryLoop::handle_idle_(const WorldState& ws) {
  ViewData d = view_data_(&ws);
  if (ws.payload_measured && ws.payload_mass_kg >= cfg_.max_payload_kg) {
    d.message = "Payload " + fmt_double("%.2f", ws.payload_mass_kg) + "kg";
    present_(View::Warning, d);
  } else {
    present_(rotation_.update(clock_.now()), d);
  }
  resume_cruise_();
}

void SupervisoryLoop::resume_cruise_() {
  if (cfg_.cruise_speed > 0) io_.actuation.drive(cfg_.cruise_speed, cfg_.cruise_speed);
}

// The count only moves once the matching audit row is in the log.
void SupervisoryLoop::commit_collection_(const WorldState& ws, double confidence) {
  std::lock_guard<std::mutex> lk(commit_mu_);
  const auto next = state_.collection_count.load() + 1;
  CollectionEvent ev;
  ev.timestamp = clock_.wall_now();
  ev.kind = EventKind::Detection;
  ev.snapshot = ws;
  ev.collection_count = next;
  ev.message = "collected, confidence " + fmt_double("%.4f", confidence);
  io_.audit.append(ev);
  state_.collection_count.store(next);
}

// ---- reporting ----

void SupervisoryLoop::note_payload_(const WorldState& ws) {
  if (!ws.payload_measured) {
    if (!payload_fault_reported_) {
      log::warn("load cell unavailable, payload reported as 0 kg");
      payload_fault_reported_ = true;
    }
  } else if (payload_fault_reported_) {
    log::info("load cell readings restored");
    payload_fault_reported_ = false;
  }

  const bool over = ws.payload_measured && ws.payload_mass_kg >= cfg_.max_payload_kg;
  if (over && !payload_limit_reported_) {
    log::warn("payload %.2f kg at or above capacity %.2f kg", ws.payload_mass_kg, cfg_.max_payload_kg);
  }
  payload_limit_reported_ = over;
}

void SupervisoryLoop::periodic_status_(const WorldState& ws) {
  const double runtime_s =
    std::chrono::duration<double>(clock_.now() - state_.started_at).count();
  const std::string gps = ws.position
    ? fmt_double("%.6f", ws.position->lat_deg) + ", " + fmt_double("%.6f", ws.position->lon_deg)
    : std::string("no fix");
  const std::string dist = ws.clearance_cm ? fmt_double("%.1f cm", *ws.clearance_cm) : std::string("n/a");
  const std::string tilt = ws.orientation
    ? fmt_double("P:%.1f", ws.orientation->pitch_deg) + fmt_double(" R:%.1f", ws.orientation->roll_deg)
    : std::string("n/a");
  log::info("status: runtime %.0fs, cycle %llu, collections %llu, payload %.2f kg%s, gps %s, clearance %s, tilt %s",
            runtime_s,
            (unsigned long long)state_.cycle_index.load(),
            (unsigned long long)state_.collection_count.load(),
            ws.payload_mass_kg, ws.payload_measured ? "" : " (unmeasured)",
            gps.c_str(), dist.c_str(), tilt.c_str());
  present_(View::Status, view_data_(&ws));
}

void SupervisoryLoop::audit_(EventKind kind, const WorldState* ws, std::string message) {
  CollectionEvent ev;
  ev.timestamp = clock_.wall_now();
  ev.kind = kind;
  if (ws) ev.snapshot = *ws;
  ev.collection_count = state_.collection_count.load();
  ev.message = std::move(message);
  io_.audit.append(ev);
}

void SupervisoryLoop::audit_lifecycle_(std::string message) noexcept {
  try {
    audit_(EventKind::Lifecycle, nullptr, std::move(message));
  } catch (const std::exception& e) {
    log::error("could not audit lifecycle event: %s", e.what());
  }
}

// Runs on the error path, so it must not throw itself.
void SupervisoryLoop::report_error_(const std::string& message, const WorldState* ws) {
  log::error("cycle %llu: %s", (unsigned long long)state_.cycle_index.load(), message.c_str());
  ViewData d = view_data_(ws);
  d.message = message;
  present_(View::Error, d);
  try {
    audit_(EventKind::Error, ws, message);
  } catch (const std::exception& e) {
    log::error("could not audit error: %s", e.what());
  }
}

void SupervisoryLoop::present_(View v, const ViewData& d) {
  try {
    io_.presentation.show(v, d);
  } catch (const std::exception& e) {
    log::warn("presentation failed for view %s: %s", view_name(v), e.what());
  }
}

ViewData SupervisoryLoop::view_data_(const WorldState* ws) const {
  ViewData d;
  d.collection_count = state_.collection_count.load();
  d.cycle_index = state_.cycle_index.load();
  if (ws) {
    d.confidence = ws->detection.confidence;
    d.position = ws->position;
    d.payload_kg = ws->payload_mass_kg;
    d.payload_measured = ws->payload_measured;
    d.clearance_cm = ws->clearance_cm;
  }
  return d;
}

void SupervisoryLoop::safe_stop_all_() noexcept {
  try {
    io_.actuation.stop_all();
  } catch (const std::exception& e) {
    log::error("stop_all failed: %s", e.what());
  }
}

} // namespace skimmer
