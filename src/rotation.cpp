#include <skimmer/rotation.hpp>

namespace skimmer {

View PresentationRotation::update(Clock::time_point now) {
  if (now - last_switch_ >= interval_) {
    index_ = (index_ + 1) % kViews.size();
    last_switch_ = now;
  }
  return kViews[index_];
}

void PresentationRotation::reset(Clock::time_point now) {
  index_ = 0;
  last_switch_ = now;
}

} // namespace skimmer
