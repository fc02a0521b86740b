#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <skimmer/rotation.hpp>

using namespace skimmer;
using namespace std::chrono_literals;

TEST_CASE("rotation advances once per elapsed interval") {
  const Clock::time_point t0{std::chrono::hours(1)};
  PresentationRotation rot(5s, t0);

  REQUIRE(rot.update(t0) == View::Scanning);
  REQUIRE(rot.update(t0 + 4s) == View::Scanning);
  REQUIRE(rot.update(t0 + 5s) == View::Position);
  REQUIRE(rot.update(t0 + 9s) == View::Position);
  REQUIRE(rot.update(t0 + 10s) == View::Payload);
  REQUIRE(rot.update(t0 + 15s) == View::Scanning);
  REQUIRE(rot.index() == 0);
}

TEST_CASE("rotation advances at most one view per update") {
  const Clock::time_point t0{};
  PresentationRotation rot(5s, t0);
  // a long stall still moves only one step
  REQUIRE(rot.update(t0 + 60s) == View::Position);
  REQUIRE(rot.update(t0 + 61s) == View::Position);
}

TEST_CASE("rotation is paced by time, not by update frequency") {
  const Clock::time_point t0{};
  PresentationRotation fast(5s, t0);
  PresentationRotation slow(5s, t0);

  for (int ms = 0; ms <= 12000; ms += 100) fast.update(t0 + std::chrono::milliseconds(ms));
  for (int ms = 0; ms <= 12000; ms += 2000) slow.update(t0 + std::chrono::milliseconds(ms));

  REQUIRE(fast.current() == View::Payload);
  REQUIRE(slow.current() == View::Payload);
}

TEST_CASE("reset returns to the first view and restarts the interval") {
  const Clock::time_point t0{};
  PresentationRotation rot(5s, t0);
  rot.update(t0 + 5s);
  REQUIRE(rot.current() == View::Position);

  rot.reset(t0 + 7s);
  REQUIRE(rot.current() == View::Scanning);
  REQUIRE(rot.update(t0 + 11s) == View::Scanning);
  REQUIRE(rot.update(t0 + 12s) == View::Position);
}
