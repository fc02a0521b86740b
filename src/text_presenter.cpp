#include <skimmer/text_presenter.hpp>
#include <string>

namespace skimmer {

static std::string pad(const std::string& s) {
  std::string out = s;
  out.resize(kPanelColumns, ' ');
  return out;
}

void TextPresenter::show(View view, const ViewData& data) {
  std::lock_guard<std::mutex> lk(mu_);
  last_ = view;
  panel_ = format_panel(view, data);
  out_ << "+----------------+\n"
       << '|' << pad(panel_.line1) << "|\n"
       << '|' << pad(panel_.line2) << "|\n"
       << "+----------------+" << std::endl;
}

} // namespace skimmer
