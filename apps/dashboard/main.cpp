#include <string>
#include <vector>

#include <skimmer/config.hpp>
#include <skimmer/log.hpp>
#include <skimmer/mission_runner.hpp>
#include <skimmer/viewer/dashboard_app.hpp>

using namespace skimmer;

int main(int argc, char** argv) {
  MissionOptions opts;
  if (argc > 1) {
    std::vector<std::string> warnings;
    auto cfg = load_config(argv[1], &warnings);
    if (!cfg) {
      log::error("cannot read config %s", argv[1]);
      return 1;
    }
    for (const auto& w : warnings) log::warn("config: %s", w.c_str());
    opts.loop = *cfg;
  } else {
    opts.loop.cruise_speed = 40;
  }
  const auto problems = validate(opts.loop);
  for (const auto& p : problems) log::error("config: %s", p.c_str());
  if (!problems.empty()) return 1;

  MissionRunner mission(opts);
  mission.start();

  DashboardApp app(mission);
  const int code = app.run();

  mission.stop();
  return code;
}
