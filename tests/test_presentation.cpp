#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>

#include <skimmer/presentation.hpp>
#include <skimmer/text_presenter.hpp>

using namespace skimmer;

TEST_CASE("format_panel: idle rotation views") {
  ViewData d;
  d.collection_count = 7;

  auto p = format_panel(View::Scanning, d);
  REQUIRE(p.line1 == "Scanning...");
  REQUIRE(p.line2 == "Collected: 7");

  p = format_panel(View::Position, d);
  REQUIRE(p.line1 == "GPS:");
  REQUIRE(p.line2 == "No Fix");

  d.position = GeoFix{14.59951, 120.98423};
  p = format_panel(View::Position, d);
  REQUIRE(p.line1 == "Lat: 14.5995");
  REQUIRE(p.line2 == "Lon: 120.9842");

  d.payload_kg = 3.456;
  p = format_panel(View::Payload, d);
  REQUIRE(p.line1 == "Total Collected");
  REQUIRE(p.line2 == "3.46 kg");

  d.payload_kg = 0.0;
  d.payload_measured = false;
  REQUIRE(format_panel(View::Payload, d).line2 == "0.00 kg (n/a)");
}

TEST_CASE("format_panel: event views") {
  ViewData d;
  d.collection_count = 3;
  d.confidence = 0.876;

  auto p = format_panel(View::Detected, d);
  REQUIRE(p.line1 == "ALGAE DETECTED!");
  REQUIRE(p.line2 == "Cnt:3 C:87%");

  REQUIRE(format_panel(View::Collecting, d).line1 == "Collecting");

  d.clearance_cm = 6.4;
  p = format_panel(View::Obstacle, d);
  REQUIRE(p.line1 == "OBSTACLE!");
  REQUIRE(p.line2 == "Distance: 6cm");
  d.clearance_cm.reset();
  REQUIRE(format_panel(View::Obstacle, d).line2 == "Distance: ---");

  p = format_panel(View::BinFull, d);
  REQUIRE(p.line1 == "*** WARNING ***");
  REQUIRE(p.line2 == "BIN FULL!");

  p = format_panel(View::Shutdown, d);
  REQUIRE(p.line1 == "Shutting Down");
  REQUIRE(p.line2 == "Goodbye!");
}

TEST_CASE("format_panel: status line") {
  ViewData d;
  d.cycle_index = 30;
  d.collection_count = 4;
  d.clearance_cm = 120.0;
  d.payload_kg = 2.5;
  auto p = format_panel(View::Status, d);
  REQUIRE(p.line1 == "Cyc:30 N:4");
  REQUIRE(p.line2 == "D:120 W:2.50");
}

TEST_CASE("format_panel never exceeds the display width") {
  ViewData d;
  d.message = "actuation fault: left motor driver over temperature";
  d.collection_count = 18446744073709551615ull;
  d.cycle_index = 18446744073709551615ull;
  d.position = GeoFix{-179.123456, -179.123456};
  d.clearance_cm = 399.0;
  d.payload_kg = 123456.789;

  for (int v = 0; v < static_cast<int>(View::Count); ++v) {
    const auto p = format_panel(static_cast<View>(v), d);
    REQUIRE(p.line1.size() <= kPanelColumns);
    REQUIRE(p.line2.size() <= kPanelColumns);
  }

  const auto err = format_panel(View::Error, d);
  REQUIRE(err.line1 == "ERROR!");
  REQUIRE(err.line2 == "actuation fault:");
}

TEST_CASE("truncate_to") {
  REQUIRE(truncate_to("abc", 5) == "abc");
  REQUIRE(truncate_to("abcdef", 3) == "abc");
}

TEST_CASE("TextPresenter frames each panel") {
  std::ostringstream out;
  TextPresenter tp(out);
  ViewData d;
  d.collection_count = 2;
  tp.show(View::Scanning, d);

  REQUIRE(tp.last_view() == View::Scanning);
  REQUIRE(tp.last_panel().line2 == "Collected: 2");
  const std::string text = out.str();
  REQUIRE(text.find("|Scanning...     |") != std::string::npos);
  REQUIRE(text.find("|Collected: 2    |") != std::string::npos);
}
