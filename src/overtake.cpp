#include <afopt/overtake.hpp>
#include <afopt/error.hpp>
#include <afopt/log.hpp>
#include <afopt/opportunity.hpp>
#include <afopt/time_codec.hpp>
#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>

namespace afopt {

namespace {

constexpr double kBoundaryEps = 1e-9;
constexpr double kInf = std::numeric_limits<double>::infinity();

// One mutually exclusive choice inside a track's group.
struct Option {
  int positions = 0;
  Centis raw_cost = 0;
  double weighted_cost = 0.0;
  std::size_t tier_idx = 0;
};

struct Group {
  const Opportunity* opp = nullptr;
  std::vector<Option> options;
  int max_positions = 0;
};

// Shared front half of both planners.
struct PlanSetup {
  OvertakePlan plan;
  int remaining = 0;
  std::vector<const Opportunity*> ranked;
  bool done = false;
};

bool is_excluded(const TrackVariant& v, const std::vector<PlanExclusion>& ex) {
  return std::any_of(ex.begin(), ex.end(), [&](const PlanExclusion& e){
    return e.track == v.track && e.vehicle == v.vehicle;
  });
}

OvertakePlanItem make_item(const Opportunity& o, const Tier& t) {
  OvertakePlanItem it;
  it.variant          = o.variant;
  it.track_name       = o.track_name;
  it.is_na            = o.is_na;
  it.current_rank     = o.current_rank;
  it.current_time     = o.current_time;
  it.new_rank         = t.target_rank;
  it.target_time      = t.target_time;
  it.opponent_time    = t.opponent_time;
  it.positions_gained = t.positions_gained;
  it.af_improvement   = t.af_improvement;
  it.time_delta       = t.time_delta;
  it.efficiency       = t.efficiency;
  return it;
}

PlanSetup begin_plan(const std::vector<Opportunity>& options, const OvertakeRequest& req) {
  PlanSetup s;
  auto& p = s.plan;
  p.target_username = req.target_username;
  p.target_af       = req.target_af;
  p.current_af      = req.current_af;
  p.af_gap          = req.current_af - req.target_af;
  p.new_af          = req.current_af;

  if (p.af_gap <= 0.0) {
    s.done = true;
    return s;
  }
  if (req.total_tracks <= 0) {
    log_warn("overtake %s: no track variants in scope", req.target_username.c_str());
    p.feasible = false;
    s.done = true;
    return s;
  }

  p.positions_needed = positions_required(p.af_gap, req.total_tracks);

  int na_gain = 0;
  for (const auto& o : options) {
    if (o.tiers.empty() || is_excluded(o.variant, req.exclude)) continue;
    if (o.is_na) {
      const Tier& t = o.tiers.front();
      if (t.positions_gained <= 0) continue;
      p.items.push_back(make_item(o, t));
      na_gain += t.positions_gained;
    } else {
      s.ranked.push_back(&o);
    }
  }

  s.remaining = p.positions_needed - na_gain;
  if (s.remaining <= 0) s.done = true;
  return s;
}

void finish_plan(OvertakePlan& p, const OvertakeRequest& req) {
  p.positions_gained = 0;
  p.time_investment = 0;
  for (const auto& it : p.items) {
    p.positions_gained += it.positions_gained;
    if (!it.is_na) p.time_investment += it.time_delta;
  }
  if (req.total_tracks > 0) {
    p.new_af = req.current_af - static_cast<double>(p.positions_gained) / static_cast<double>(req.total_tracks);
  }
  std::stable_sort(p.items.begin(), p.items.end(), [](const OvertakePlanItem& a, const OvertakePlanItem& b){
    return a.af_improvement > b.af_improvement;
  });
}

Group make_group(const Opportunity& o) {
  Group g;
  g.opp = &o;
  g.options.reserve(o.tiers.size());
  for (std::size_t i = 0; i < o.tiers.size(); ++i) {
    const Tier& t = o.tiers[i];
    const double w = difficulty_weight(t.target_rank, o.current_rank);
    g.options.push_back(Option{t.positions_gained, t.time_delta, static_cast<double>(t.time_delta) * w, i});
    g.max_positions = std::max(g.max_positions, t.positions_gained);
  }
  return g;
}

// Index of the largest-gain option; cheaper raw cost breaks ties.
std::size_t max_gain_option(const Group& g) {
  std::size_t best = 0;
  for (std::size_t k = 1; k < g.options.size(); ++k) {
    const auto& a = g.options[k];
    const auto& b = g.options[best];
    if (a.positions > b.positions || (a.positions == b.positions && a.raw_cost < b.raw_cost)) best = k;
  }
  return best;
}

} // namespace

int positions_required(double af_gap, int total_tracks) {
  if (af_gap <= 0.0 || total_tracks <= 0) return 0;
  const double needed = std::ceil(af_gap * static_cast<double>(total_tracks) + kBoundaryEps);
  constexpr int kMaxPositions = std::numeric_limits<int>::max();
  if (!(needed < static_cast<double>(kMaxPositions))) return kMaxPositions;
  return static_cast<int>(needed);
}

std::vector<Opportunity> build_planning_options(const std::vector<PlayerStanding>& standings,
                                                const Leaderboards& leaderboards,
                                                int total_tracks,
                                                const std::string& username) {
  std::vector<Opportunity> out;
  out.reserve(standings.size());
  for (const auto& s : standings) {
    auto lb = leaderboards.find(s.variant);
    if (lb == leaderboards.end()) continue;
    out.push_back(build_opportunity(s, lb->second, total_tracks, username, TierSet::Full));
  }
  return out;
}

OvertakePlan plan_overtake_min_time(const std::vector<Opportunity>& options,
                                    const OvertakeRequest& req) {
  PlanSetup setup = begin_plan(options, req);
  OvertakePlan& plan = setup.plan;
  if (setup.done) {
    finish_plan(plan, req);
    return plan;
  }

  std::vector<Group> groups;
  groups.reserve(setup.ranked.size());
  int max_sum = 0;
  for (const Opportunity* o : setup.ranked) {
    groups.push_back(make_group(*o));
    max_sum += groups.back().max_positions;
  }

  const int remaining = setup.remaining;
  if (max_sum < remaining) {
    // Not enough available even using every ranked track: report the
    // largest attainable climb on each one.
    for (const auto& g : groups) {
      const Option& opt = g.options[max_gain_option(g)];
      plan.items.push_back(make_item(*g.opp, g.opp->tiers[opt.tier_idx]));
    }
    plan.feasible = false;
    finish_plan(plan, req);
    log_info("overtake %s: infeasible, need %d positions, %d available",
             req.target_username.c_str(), plan.positions_needed, plan.positions_gained);
    return plan;
  }

  // cost[s]: min weighted cost to gain exactly s positions over groups seen so far.
  // choice[g * width + s]: option taken in group g to reach s, -1 = skipped.
  const std::size_t width = static_cast<std::size_t>(max_sum) + 1;
  std::vector<double> cost(width, kInf);
  std::vector<double> next(width, kInf);
  std::vector<int> choice(groups.size() * width, -1);
  cost[0] = 0.0;

  for (std::size_t g = 0; g < groups.size(); ++g) {
    next = cost; // skip this group
    int* row = choice.data() + g * width;
    for (std::size_t s = 0; s < width; ++s) {
      if (cost[s] == kInf) continue;
      for (std::size_t k = 0; k < groups[g].options.size(); ++k) {
        const Option& opt = groups[g].options[k];
        const std::size_t t = s + static_cast<std::size_t>(opt.positions);
        if (t >= width) continue;
        const double c = cost[s] + opt.weighted_cost;
        if (c < next[t]) {
          next[t] = c;
          row[t] = static_cast<int>(k);
        }
      }
    }
    cost.swap(next);
  }

  std::size_t best_state = width;
  double best_cost = kInf;
  for (std::size_t s = static_cast<std::size_t>(remaining); s < width; ++s) {
    if (cost[s] < best_cost) {
      best_cost = cost[s];
      best_state = s;
    }
  }
  if (best_state == width) {
    throw PlannerInvariantError("overtake search found no state with " + std::to_string(remaining) +
                                " positions although " + std::to_string(max_sum) + " are available");
  }

  std::size_t s = best_state;
  for (std::size_t g = groups.size(); g-- > 0;) {
    const int k = choice[g * width + s];
    if (k < 0) continue;
    const Option& opt = groups[g].options[static_cast<std::size_t>(k)];
    if (static_cast<std::size_t>(opt.positions) > s) {
      throw PlannerInvariantError("overtake backtrack underflow in group " + std::to_string(g));
    }
    plan.items.push_back(make_item(*groups[g].opp, groups[g].opp->tiers[opt.tier_idx]));
    s -= static_cast<std::size_t>(opt.positions);
  }
  if (s != 0) {
    throw PlannerInvariantError("overtake backtrack ended at " + std::to_string(s) + " positions, expected 0");
  }

  finish_plan(plan, req);
  log_debug("overtake %s: %zu items, weighted cost %.1f, raw %s",
            req.target_username.c_str(), plan.items.size(), best_cost,
            format_time(plan.time_investment).c_str());
  return plan;
}

OvertakePlan plan_overtake_min_tracks(const std::vector<Opportunity>& options,
                                      const OvertakeRequest& req) {
  PlanSetup setup = begin_plan(options, req);
  OvertakePlan& plan = setup.plan;
  if (setup.done) {
    finish_plan(plan, req);
    return plan;
  }

  // Best return per track: positions gained per unit of difficulty.
  std::vector<OvertakePlanItem> candidates;
  candidates.reserve(setup.ranked.size());
  for (const Opportunity* o : setup.ranked) {
    std::size_t best = 0;
    double best_ret = -1.0;
    for (std::size_t i = 0; i < o->tiers.size(); ++i) {
      const Tier& t = o->tiers[i];
      const double ret = static_cast<double>(t.positions_gained) / difficulty_weight(t.target_rank, o->current_rank);
      if (ret > best_ret) {
        best_ret = ret;
        best = i;
      }
    }
    candidates.push_back(make_item(*o, o->tiers[best]));
  }

  std::stable_sort(candidates.begin(), candidates.end(), [](const OvertakePlanItem& a, const OvertakePlanItem& b){
    if (a.positions_gained != b.positions_gained) return a.positions_gained > b.positions_gained;
    return a.time_delta < b.time_delta;
  });

  int remaining = setup.remaining;
  for (const auto& c : candidates) {
    if (remaining <= 0) break;
    plan.items.push_back(c);
    remaining -= c.positions_gained;
  }
  plan.feasible = remaining <= 0;

  finish_plan(plan, req);
  return plan;
}

} // namespace afopt
