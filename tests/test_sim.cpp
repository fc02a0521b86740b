#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <chrono>

#include "fakes.hpp"
#include <skimmer/faults.hpp>
#include <skimmer/sim.hpp>
#include <skimmer/supervisor.hpp>

using Catch::Approx;
using namespace skimmer;
using namespace skimmer::test;
using namespace std::chrono_literals;

static PondConfig empty_pond() {
  PondConfig cfg;
  cfg.patch_count = 0;
  return cfg;
}

TEST_CASE("SimPond integrates differential drive") {
  ManualClock clock;
  SimPond pond(empty_pond(), clock);
  const auto start = pond.pose();
  REQUIRE(start.x_m == Approx(20.0));
  REQUIRE(start.y_m == Approx(12.5));

  SECTION("straight ahead") {
    pond.set_drive(100, 100);
    pond.step(1.0);
    const auto p = pond.pose();
    REQUIRE(p.x_m == Approx(20.6));
    REQUIRE(p.y_m == Approx(12.5));
    REQUIRE(p.heading_rad == Approx(0.0).margin(1e-12));
  }

  SECTION("opposite tracks spin to the right in place") {
    pond.set_drive(30, -30);
    pond.step(1.0);
    const auto p = pond.pose();
    REQUIRE(p.heading_rad == Approx(-0.6));
    REQUIRE(p.x_m == Approx(20.0));
  }

  SECTION("time passing on the clock moves the boat") {
    pond.set_drive(50, 50);
    clock.advance(to_clock(2s));
    REQUIRE(pond.pose().x_m == Approx(20.6));
    REQUIRE(pond.view().sim_time_s == Approx(2.0));
  }

  SECTION("the bank stops the hull") {
    pond.set_drive(100, 100);
    for (int i = 0; i < 700; ++i) pond.step(0.05);
    REQUIRE(pond.pose().x_m == Approx(39.95));
    REQUIRE(pond.echo_raw_cm() == Approx(5.0));
  }
}

TEST_CASE("SimPond echo reads the wall dead ahead") {
  ManualClock clock;
  SimPond pond(empty_pond(), clock);
  REQUIRE(pond.echo_raw_cm() == Approx(2000.0));

  SimSensorFusion sensors(pond, SensorDropouts{}, 1);
  const auto ws = sensors.sample();
  // beyond the sensor's range
  REQUIRE_FALSE(ws.clearance_cm.has_value());
  REQUIRE(ws.position.has_value());
  REQUIRE(ws.position->lat_deg == Approx(14.5995 + 12.5 / 111320.0));
  REQUIRE(ws.payload_measured);
  REQUIRE(ws.bin_switch_readable);
  REQUIRE_FALSE(ws.bin_full);
  REQUIRE(ws.orientation.has_value());
}

TEST_CASE("SimSensorFusion drops every reading at probability one") {
  ManualClock clock;
  SimPond pond(empty_pond(), clock);
  SimSensorFusion sensors(pond, SensorDropouts{1.0, 1.0, 1.0, 1.0, 1.0}, 3);
  for (int i = 0; i < 10; ++i) {
    REQUIRE(is_all_default(sensors.sample()));
  }
}

TEST_CASE("float switch closes at bin capacity") {
  ManualClock clock;
  PondConfig cfg = empty_pond();
  cfg.bin_capacity_kg = 0.0;
  SimPond pond(cfg, clock);
  SimSensorFusion sensors(pond, SensorDropouts{}, 1);
  REQUIRE(sensors.sample().bin_full);
}

TEST_CASE("SimActuation stop_all is idempotent and never faults") {
  ManualClock clock;
  SimPond pond(empty_pond(), clock);
  SimActuation act(pond, clock);

  act.drive(60, 60);
  act.run_collector(CollectorDirection::Forward, to_clock(5s));
  act.inject_faults(5);
  REQUIRE_NOTHROW(act.stop_all());
  REQUIRE_NOTHROW(act.stop_all());

  const auto v = pond.view();
  REQUIRE(v.left_cmd == 0);
  REQUIRE(v.right_cmd == 0);
  REQUIRE_FALSE(v.collector_running);
  REQUIRE(act.completed_runs() == 0);
}

TEST_CASE("SimActuation injected faults") {
  ManualClock clock;
  SimPond pond(empty_pond(), clock);
  SimActuation act(pond, clock);

  act.inject_faults(1);
  REQUIRE_THROWS_AS(act.drive(40, 40), ActuationFault);
  REQUIRE_NOTHROW(act.drive(40, 40));
  REQUIRE(pond.view().left_cmd == 40);
}

TEST_CASE("SimActuation counts only full collector runs") {
  ManualClock clock;
  SimPond pond(empty_pond(), clock);
  SimActuation act(pond, clock);

  act.run_collector(CollectorDirection::Forward, to_clock(5s));
  clock.advance(to_clock(2s));
  act.stop_collector();
  REQUIRE(act.completed_runs() == 0);

  act.run_collector(CollectorDirection::Forward, to_clock(5s));
  clock.advance(to_clock(5s));
  act.stop_collector();
  REQUIRE(act.completed_runs() == 1);
  REQUIRE_FALSE(pond.view().collector_running);
}

TEST_CASE("GreenRatioClassifier") {
  Frame f{5, 2, {}};
  for (int i = 0; i < 10; ++i) {
    const bool green = i < 2;
    f.rgb.push_back(green ? 60 : 30);
    f.rgb.push_back(green ? 170 : 90);
    f.rgb.push_back(green ? 50 : 140);
  }
  REQUIRE(GreenRatioClassifier::green_fraction(f) == Approx(0.2));

  GreenRatioClassifier clf;
  auto d = clf.classify(f);
  REQUIRE(d.is_target);
  REQUIRE(d.confidence == Approx(0.5));

  REQUIRE_FALSE(clf.classify(Frame{}).is_target);
}

TEST_CASE("SimCamera renders open water when nothing is in view") {
  ManualClock clock;
  SimPond pond(empty_pond(), clock);
  SimCamera cam(pond);
  const auto frame = cam.capture();
  REQUIRE(frame.has_value());
  REQUIRE(frame->width == 32);
  REQUIRE(frame->height == 24);
  REQUIRE(frame->rgb.size() == 32u * 24u * 3u);
  REQUIRE(GreenRatioClassifier::green_fraction(*frame) == Approx(0.0));
}

TEST_CASE("SimActuation collector stops on its own after max_run") {
  ManualClock clock;
  SimPond pond(empty_pond(), clock);
  SimActuation act(pond, clock);

  act.run_collector(CollectorDirection::Forward, to_clock(5s));
  clock.advance(to_clock(4s));
  REQUIRE(pond.view().collector_running);

  clock.advance(to_clock(56s));
  REQUIRE_FALSE(pond.view().collector_running);

  // a late stop still counts the full run that happened
  act.stop_collector();
  REQUIRE(act.completed_runs() == 1);
}

TEST_CASE("SimActuation reversed belt lifts nothing") {
  ManualClock clock;
  SimPond pond(empty_pond(), clock);
  SimActuation act(pond, clock);

  act.run_collector(CollectorDirection::Reverse, to_clock(5s));
  REQUIRE(pond.view().collector_running);
  clock.advance(to_clock(5s));
  act.stop_collector();
  REQUIRE(act.completed_runs() == 0);
  REQUIRE(pond.payload_kg() == 0.0);
}

TEST_CASE("cruising into the bank triggers avoidance") {
  QuietLogs quiet;
  ManualClock clock;
  SimPond pond(empty_pond(), clock);
  SimActuation act(pond, clock);
  SimSensorFusion sensors(pond, SensorDropouts{}, 1);
  SimCamera camera(pond);
  GreenRatioClassifier classifier;
  RecordingPresenter presenter;
  MemoryAuditLog audit;

  LoopConfig cfg;
  cfg.cruise_speed = 40;
  SupervisoryLoop loop({act, sensors, &camera, classifier, presenter, audit}, cfg, clock);

  int obstacle_cycles = 0;
  double min_clearance = 1e9;
  for (int i = 0; i < 400 && obstacle_cycles == 0; ++i) {
    const auto rep = loop.run_cycle();
    REQUIRE_FALSE(rep.error);
    if (rep.world->clearance_cm) min_clearance = std::min(min_clearance, *rep.world->clearance_cm);
    if (rep.action.kind == ActionKind::AvoidObstacle) ++obstacle_cycles;
  }
  REQUIRE(obstacle_cycles == 1);
  REQUIRE(min_clearance < cfg.min_safe_distance_cm);
  REQUIRE(audit.events().back().kind == EventKind::Obstacle);

  // the turn leaves the hull pointing away from the east bank
  REQUIRE(pond.pose().heading_rad < -1.0);
}
