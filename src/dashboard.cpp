#include <skimmer/dashboard.hpp>

namespace skimmer {

void DashboardPresenter::show(View view, const ViewData& data) {
  std::lock_guard<std::mutex> lk(mu_);
  cur_.view = view;
  cur_.panel = format_panel(view, data);
  cur_.collection_count = data.collection_count;
  cur_.cycle_index = data.cycle_index;
  publish_();
}

void DashboardPresenter::on_cycle(const CycleReport& rep) {
  std::lock_guard<std::mutex> lk(mu_);
  cur_.cycle_index = rep.cycle_index;
  cur_.world = rep.world;
  cur_.last_action = rep.action.kind;
  cur_.last_cycle_error = rep.error;
  if (rep.error) cur_.last_error = rep.error_message;
  publish_();
}

void DashboardPresenter::publish_() {
  if (pond_) cur_.pond = pond_();
  if (audit_) cur_.audit = audit_->summary();
  out_.publish(cur_);
}

} // namespace skimmer
