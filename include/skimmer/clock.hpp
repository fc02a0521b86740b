#pragma once
#include <chrono>

namespace skimmer {

// Time source for the loop. Steady time paces cycles and rotations,
// wall time stamps audit events.
class Clock {
public:
  using steady = std::chrono::steady_clock;
  using time_point = steady::time_point;
  using duration = steady::duration;

  virtual ~Clock() = default;
  virtual time_point now() const = 0;
  virtual std::chrono::system_clock::time_point wall_now() const = 0;
  virtual void sleep_for(duration d) = 0;
};

class SteadyClock final : public Clock {
public:
  time_point now() const override { return steady::now(); }
  std::chrono::system_clock::time_point wall_now() const override {
    return std::chrono::system_clock::now();
  }
  void sleep_for(duration d) override;
};

template <class Rep, class Period>
inline Clock::duration to_clock(std::chrono::duration<Rep, Period> d) {
  return std::chrono::duration_cast<Clock::duration>(d);
}

} // namespace skimmer
