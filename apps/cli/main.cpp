#include <getopt.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <afopt/analysis.hpp>
#include <afopt/config.hpp>
#include <afopt/error.hpp>
#include <afopt/log.hpp>
#include <afopt/time_codec.hpp>

using namespace afopt;

namespace {

void print_usage(const char* argv0) {
  std::printf("Usage: %s [--config FILE] [--user NAME] [--top N]\n"
              "  --config FILE  YAML config (default: config.yaml)\n"
              "  --user NAME    player username, overrides the config\n"
              "  --top N        rows per summary section (default: 5)\n",
              argv0);
}

void print_plan(const char* label, const OvertakePlan& p) {
  std::printf("  %-11s %zu tracks, %s total improvement, +%d/%d positions, AF %.3f -> %.3f%s\n",
              label, p.items.size(), format_time(p.time_investment).c_str(),
              p.positions_gained, p.positions_needed, p.current_af, p.new_af,
              p.feasible ? "" : "  (not enough available)");
  for (const auto& it : p.items) {
    if (it.is_na) {
      std::printf("      %-32s submit any time, rank %d -> %d\n",
                  it.variant.key().c_str(), it.current_rank, it.new_rank);
    } else {
      std::printf("      %-32s %s -> %s (-%s), rank %d -> %d\n",
                  it.variant.key().c_str(), format_time(it.current_time).c_str(),
                  format_time(it.target_time).c_str(), format_time(it.time_delta).c_str(),
                  it.current_rank, it.new_rank);
    }
  }
}

void print_summary(const Analysis& a, std::size_t top) {
  std::vector<const Opportunity*> na_opps, ranked_opps;
  std::size_t no_improvement = 0;
  for (const auto& o : a.opportunities) {
    if (o.is_na) na_opps.push_back(&o);
    else if (!o.tiers.empty()) ranked_opps.push_back(&o);
    else ++no_improvement;
  }

  std::printf("============================================================\n");
  std::printf("  Player:         %s\n", a.username.c_str());
  std::printf("  Average Finish: %.3f%s\n", a.current_af, a.current_af_estimated ? " (estimated)" : "");
  std::printf("  Tracks:         %d in scope\n", a.total_tracks);
  std::printf("  N/A tracks:     %zu (submit any time for big AF boost)\n", na_opps.size());
  std::printf("  Improvable:     %zu tracks (%zu with nobody above)\n", ranked_opps.size(), no_improvement);
  std::printf("============================================================\n");

  if (!na_opps.empty()) {
    std::printf("\n  Top priority - submit times for:\n");
    for (std::size_t i = 0; i < na_opps.size() && i < top; ++i) {
      const auto& o = *na_opps[i];
      std::printf("    - %s (%s)\n", o.track_name.c_str(), o.variant.key().c_str());
    }
  }

  if (!ranked_opps.empty()) {
    std::printf("\n  Best efficiency improvements:\n");
    for (std::size_t i = 0; i < ranked_opps.size() && i < top; ++i) {
      const auto& o = *ranked_opps[i];
      const Tier& t = *o.best_tier();
      std::printf("    - %s (%s): rank %d -> %d, need %s faster, AF -%.4f\n",
                  o.track_name.c_str(), o.variant.key().c_str(), o.current_rank, t.target_rank,
                  format_time(t.time_delta).c_str(), t.af_improvement);
    }
  }

  if (a.min_time && a.min_tracks) {
    std::printf("\n  Overtake %s (AF %.3f):\n", a.min_time->target_username.c_str(), a.min_time->target_af);
    print_plan("Min time:", *a.min_time);
    print_plan("Min tracks:", *a.min_tracks);
  }
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path = "config.yaml";
  std::string user;
  int top = 5;

  static const option long_opts[] = {
    {"config", required_argument, nullptr, 'c'},
    {"user",   required_argument, nullptr, 'u'},
    {"top",    required_argument, nullptr, 'n'},
    {"help",   no_argument,       nullptr, 'h'},
    {nullptr,  0,                 nullptr, 0},
  };
  int opt = 0;
  while ((opt = getopt_long(argc, argv, "c:u:n:h", long_opts, nullptr)) != -1) {
    switch (opt) {
      case 'c': config_path = optarg; break;
      case 'u': user = optarg; break;
      case 'n': top = std::max(1, std::atoi(optarg)); break;
      case 'h': print_usage(argv[0]); return 0;
      default:  print_usage(argv[0]); return 2;
    }
  }

  auto cfg = load_config(config_path);
  if (!cfg) return 1;
  set_log_level(cfg->log_level);
  if (!user.empty()) cfg->username = user;
  if (cfg->username.empty()) {
    log_error("no username given (config 'username' or --user)");
    return 2;
  }

  try {
    const auto analysis = run_analysis(*cfg);
    if (!analysis) return 1;
    print_summary(*analysis, static_cast<std::size_t>(top));
  } catch (const PlannerInvariantError& e) {
    log_error("overtake planner defect: %s", e.what());
    return 3;
  }
  return 0;
}
