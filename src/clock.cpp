#include <skimmer/clock.hpp>
#include <thread>

namespace skimmer {

void SteadyClock::sleep_for(duration d) {
  if (d <= duration::zero()) return;
  std::this_thread::sleep_for(d);
}

} // namespace skimmer
