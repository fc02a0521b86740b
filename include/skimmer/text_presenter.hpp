#pragma once
#include <mutex>
#include <ostream>
#include <skimmer/ports.hpp>

namespace skimmer {

// Character-display emulation: prints each panel as two framed rows.
class TextPresenter final : public PresentationPort {
public:
  explicit TextPresenter(std::ostream& out) : out_(out) {}

  void show(View view, const ViewData& data) override;

  View last_view() const { return last_; }
  const TextPanel& last_panel() const { return panel_; }

private:
  std::ostream& out_;
  std::mutex mu_;
  View last_{View::Ready};
  TextPanel panel_{};
};

} // namespace skimmer
