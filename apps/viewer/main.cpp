#include <afopt/analysis.hpp>
#include <afopt/config.hpp>
#include <afopt/error.hpp>
#include <afopt/log.hpp>
#include <afopt/viewer/app.hpp>

using namespace afopt;

int main(int argc, char** argv) {
  const char* config_path = argc > 1 ? argv[1] : "config.yaml";
  auto cfg = load_config(config_path);
  if (!cfg) return 1;
  set_log_level(cfg->log_level);

  try {
    const auto analysis = run_analysis(*cfg);
    if (!analysis) return 1;
    ViewerApp app(*analysis);
    return app.run();
  } catch (const PlannerInvariantError& e) {
    log_error("overtake planner defect: %s", e.what());
    return 3;
  }
}
