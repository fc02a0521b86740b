#include <catch2/catch_test_macros.hpp>
#include <chrono>

#include "fakes.hpp"
#include <skimmer/faults.hpp>
#include <skimmer/supervisor.hpp>

using namespace skimmer;
using namespace skimmer::test;
using namespace std::chrono_literals;

TEST_CASE("actuation fault mid-collection does not count") {
  QuietLogs quiet;
  Rig rig;
  rig.sensors.fallback = world(false, 50.0);
  rig.perception.result = Detection{true, 0.9};
  SupervisoryLoop loop(rig.io(), LoopConfig{}, rig.clock);

  rig.actuation.fail_next(1, "run_collector");
  auto rep = loop.run_cycle();

  REQUIRE(rep.error);
  REQUIRE(rep.action.kind == ActionKind::Collect);
  REQUIRE(loop.collection_count() == 0);
  REQUIRE(rig.actuation.stop_all_calls == 1);
  REQUIRE(rig.presenter.saw(View::Error));

  auto evs = rig.audit.inner.events();
  REQUIRE(evs.size() == 1);
  REQUIRE(evs[0].kind == EventKind::Error);
  REQUIRE(evs[0].snapshot.has_value());
  REQUIRE(evs[0].collection_count == 0);

  rep = loop.run_cycle();
  REQUIRE_FALSE(rep.error);
  REQUIRE(loop.collection_count() == 1);
  evs = rig.audit.inner.events();
  REQUIRE(evs.size() == 2);
  REQUIRE(evs[1].kind == EventKind::Detection);
  REQUIRE(evs[1].collection_count == 1);
}

TEST_CASE("repeated actuation faults become fatal") {
  QuietLogs quiet;
  Rig rig;
  rig.sensors.fallback = world(false, 200.0);
  LoopConfig cfg;
  cfg.cruise_speed = 40;
  SupervisoryLoop loop(rig.io(), cfg, rig.clock);

  SECTION("three in a row") {
    rig.actuation.fail_next(100, "drive");
    REQUIRE(loop.run_cycle().error);
    REQUIRE(loop.run_cycle().error);
    REQUIRE_THROWS_AS(loop.run_cycle(), FatalFault);
    REQUIRE(rig.actuation.stop_all_calls == 3);
  }

  SECTION("a clean cycle resets the streak") {
    rig.actuation.fail_next(2, "drive");
    REQUIRE(loop.run_cycle().error);
    REQUIRE(loop.run_cycle().error);
    REQUIRE_FALSE(loop.run_cycle().error);
    rig.actuation.fail_next(2, "drive");
    REQUIRE(loop.run_cycle().error);
    REQUIRE_NOTHROW(loop.run_cycle());
  }
}

TEST_CASE("run stops the robot before a fatal fault escapes") {
  QuietLogs quiet;
  Rig rig;
  rig.sensors.fallback = world(false, 200.0);
  LoopConfig cfg;
  cfg.cruise_speed = 40;
  SupervisoryLoop loop(rig.io(), cfg, rig.clock);

  rig.actuation.fail_next(100, "drive");
  REQUIRE_THROWS_AS(loop.run(), FatalFault);

  REQUIRE_FALSE(loop.state().running.load());
  REQUIRE(rig.actuation.left == 0);
  REQUIRE(rig.actuation.right == 0);
  // startup probe, three cycle errors, final safe stop
  REQUIRE(rig.actuation.stop_all_calls == 5);

  const auto evs = rig.audit.inner.events();
  REQUIRE(evs.front().kind == EventKind::Lifecycle);
  REQUIRE(evs.back().kind == EventKind::Error);
}

TEST_CASE("non-standard exception still stops the robot before leaving run") {
  QuietLogs quiet;
  Rig rig;
  rig.sensors.fallback = world(false, 200.0);
  LoopConfig cfg;
  cfg.cruise_speed = 40;
  SupervisoryLoop loop(rig.io(), cfg, rig.clock);

  int cycles = 0;
  loop.set_cycle_observer([&](const CycleReport&) {
    if (++cycles == 2) rig.sensors.throws_int = true;
  });
  REQUIRE_THROWS_AS(loop.run(), int);

  REQUIRE(cycles == 2);
  REQUIRE_FALSE(loop.state().running.load());
  // startup probe, then the safe stop on the way out
  REQUIRE(rig.actuation.stop_all_calls == 2);
  REQUIRE(rig.actuation.left == 0);
  REQUIRE(rig.actuation.right == 0);
}

TEST_CASE("unreachable actuation at startup is fatal") {
  QuietLogs quiet;
  Rig rig;
  rig.actuation.stop_all_fails = true;
  SupervisoryLoop loop(rig.io(), LoopConfig{}, rig.clock);

  REQUIRE_THROWS_AS(loop.run(), FatalFault);
  REQUIRE_FALSE(loop.state().running.load());
  REQUIRE(loop.state().cycle_index.load() == 0);
  REQUIRE(rig.audit.inner.size() == 0);
}

TEST_CASE("perception failures mean no detection") {
  QuietLogs quiet;
  Rig rig;
  rig.sensors.fallback = world(false, 50.0);
  rig.perception.result = Detection{true, 0.99};
  SupervisoryLoop loop(rig.io(), LoopConfig{}, rig.clock);

  SECTION("classifier throws") {
    rig.perception.throws = true;
  }
  SECTION("camera throws") {
    rig.camera.throws = true;
  }
  SECTION("no frame") {
    rig.camera.available = false;
  }

  const auto rep = loop.run_cycle();
  REQUIRE_FALSE(rep.error);
  REQUIRE(rep.action.kind == ActionKind::Idle);
  REQUIRE_FALSE(rep.world->detection.is_target);
  REQUIRE(loop.collection_count() == 0);
}

TEST_CASE("sensor fusion failure yields an all-default world") {
  QuietLogs quiet;
  Rig rig;
  rig.sensors.throws = true;
  SupervisoryLoop loop(rig.io(), LoopConfig{}, rig.clock);

  const auto rep = loop.run_cycle();
  REQUIRE_FALSE(rep.error);
  REQUIRE(rep.action.kind == ActionKind::Idle);
  REQUIRE(is_all_default(*rep.world));
}

TEST_CASE("sensor failure still lets a detection through") {
  QuietLogs quiet;
  Rig rig;
  rig.sensors.throws = true;
  rig.perception.result = Detection{true, 0.9};
  SupervisoryLoop loop(rig.io(), LoopConfig{}, rig.clock);

  REQUIRE(loop.run_cycle().action.kind == ActionKind::Collect);
  REQUIRE(loop.collection_count() == 1);
}

TEST_CASE("failed audit append leaves the count unchanged") {
  QuietLogs quiet;
  Rig rig;
  rig.sensors.fallback = world(false, 50.0);
  rig.perception.result = Detection{true, 0.9};
  SupervisoryLoop loop(rig.io(), LoopConfig{}, rig.clock);

  rig.audit.fail_next = 1;
  auto rep = loop.run_cycle();
  REQUIRE(rep.error);
  REQUIRE(rep.error_message == "disk full");
  REQUIRE(loop.collection_count() == 0);
  REQUIRE_FALSE(rig.actuation.collector_running);
  REQUIRE(rep.slept == to_clock(5s));

  // the error itself made it into the log
  auto evs = rig.audit.inner.events();
  REQUIRE(evs.size() == 1);
  REQUIRE(evs[0].kind == EventKind::Error);

  rep = loop.run_cycle();
  REQUIRE_FALSE(rep.error);
  REQUIRE(loop.collection_count() == 1);
  evs = rig.audit.inner.events();
  REQUIRE(evs.back().kind == EventKind::Detection);
  REQUIRE(evs.back().collection_count == 1);
}

TEST_CASE("audit failure while reporting an error is absorbed") {
  QuietLogs quiet;
  Rig rig;
  rig.sensors.fallback = world(false, 5.0);
  SupervisoryLoop loop(rig.io(), LoopConfig{}, rig.clock);

  // obstacle audit fails, then so does the error audit
  rig.audit.fail_next = 2;
  const auto rep = loop.run_cycle();
  REQUIRE(rep.error);
  REQUIRE(rig.audit.inner.size() == 0);
  REQUIRE(rig.actuation.stop_all_calls == 1);
}
