#pragma once
#include <array>
#include <cstddef>
#include <skimmer/clock.hpp>
#include <skimmer/presentation.hpp>

namespace skimmer {

// Cycles the idle views on a wall-clock interval, independent of cycle cadence.
class PresentationRotation {
public:
  static constexpr std::array<View, 3> kViews{View::Scanning, View::Position, View::Payload};

  PresentationRotation(Clock::duration interval, Clock::time_point start)
    : interval_(interval), last_switch_(start) {}

  // Advances at most one view per call once the interval has elapsed.
  View update(Clock::time_point now);

  // Next update shows the first view again; the interval restarts at now.
  void reset(Clock::time_point now);

  View current() const { return kViews[index_]; }
  std::size_t index() const { return index_; }

private:
  Clock::duration interval_;
  Clock::time_point last_switch_;
  std::size_t index_{0};
};

} // namespace skimmer
