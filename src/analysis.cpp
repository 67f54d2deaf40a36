#include <afopt/analysis.hpp>
#include <afopt/log.hpp>
#include <afopt/opportunity.hpp>
#include <afopt/overrides.hpp>
#include <afopt/overtake.hpp>
#include <utility>

namespace afopt {

Analysis analyze(Snapshot snap, const Config& cfg) {
  Analysis a;
  a.username = cfg.username;
  a.total_tracks = snap.total_tracks();
  a.current_af = cfg.current_af;

  if (a.current_af <= 0.0) {
    a.current_af = estimate_average_finish(
        compute_opportunities(snap.standings, snap.leaderboards, a.total_tracks, cfg.username),
        a.total_tracks);
    a.current_af_estimated = true;
    log_info("current AF not configured, estimated %.3f from standings", a.current_af);
  }

  if (!cfg.time_overrides.empty() && a.total_tracks > 0) {
    const auto res = apply_time_overrides(snap.standings, snap.leaderboards, cfg.time_overrides, cfg.username);
    a.overrides_applied = res.tracks_affected;
    if (res.tracks_affected > 0) {
      const double delta = static_cast<double>(res.rank_delta) / static_cast<double>(a.total_tracks);
      log_info("AF adjusted %.3f -> %.3f by %d overrides", a.current_af, a.current_af + delta, res.tracks_affected);
      a.current_af += delta;
    }
  }

  a.opportunities = compute_opportunities(snap.standings, snap.leaderboards, a.total_tracks, cfg.username);

  if (!cfg.rival_username.empty()) {
    OvertakeRequest req;
    req.current_af = a.current_af;
    req.target_af = cfg.rival_af;
    req.total_tracks = a.total_tracks;
    req.target_username = cfg.rival_username;
    req.exclude = cfg.exclude_from_plans;
    if (!req.exclude.empty()) log_info("excluding %zu track/vehicle combos from plans", req.exclude.size());

    const auto options = build_planning_options(snap.standings, snap.leaderboards, a.total_tracks, cfg.username);
    a.min_time = plan_overtake_min_time(options, req);
    a.min_tracks = plan_overtake_min_tracks(options, req);
  }
  return a;
}

std::optional<Analysis> run_analysis(const Config& cfg) {
  auto snap = load_snapshot(cfg.standings_csv, cfg.leaderboards_csv);
  if (!snap) return std::nullopt;
  log_info("%zu standings, %d track variants in scope", snap->standings.size(), snap->total_tracks());
  if (snap->total_tracks() == 0) {
    log_error("no leaderboards loaded from '%s'", cfg.leaderboards_csv.c_str());
    return std::nullopt;
  }
  return analyze(std::move(*snap), cfg);
}

} // namespace afopt
