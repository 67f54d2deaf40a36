#include <afopt/opportunity.hpp>
#include <afopt/tiers.hpp>
#include <afopt/log.hpp>
#include <algorithm>
#include <cctype>

namespace afopt {

static inline std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::vector<LeaderboardEntry> real_entries(const std::vector<LeaderboardEntry>& entries) {
  std::vector<LeaderboardEntry> out;
  out.reserve(entries.size());
  for (const auto& e : entries) {
    if (!e.is_placeholder) out.push_back(e);
  }
  return out;
}

static Opportunity empty_opportunity(const PlayerStanding& s, int rank, Centis time) {
  Opportunity o;
  o.variant      = s.variant;
  o.track_name   = s.track_name;
  o.current_rank = rank;
  o.current_time = time;
  o.is_na        = s.is_na;
  return o;
}

Opportunity build_na_opportunity(const PlayerStanding& standing,
                                 const std::vector<LeaderboardEntry>& entries,
                                 int total_tracks) {
  const auto real = real_entries(entries);
  if (real.empty() || total_tracks <= 0) return empty_opportunity(standing, 0, 0);

  // Unranked counts as one past the worst real entry, which is also where a
  // first submitted time lands. Placeholders and the standing's rank are ignored.
  const auto& worst = real.back();
  const int new_rank = worst.rank + 1;
  const int last_place = new_rank;

  Tier t;
  t.target_rank      = new_rank;
  t.opponent_time    = worst.time;
  t.target_time      = worst.time;
  t.positions_gained = last_place - new_rank;
  t.af_improvement   = static_cast<double>(t.positions_gained) / static_cast<double>(total_tracks);
  t.time_delta       = 0;
  t.efficiency       = Efficiency::unbounded();

  Opportunity o = empty_opportunity(standing, last_place, 0);
  o.tiers.push_back(t);
  o.best_efficiency = Efficiency::unbounded();
  o.best_tier_idx   = 0;
  return o;
}

Opportunity build_ranked_opportunity(const PlayerStanding& standing,
                                     const std::vector<LeaderboardEntry>& entries,
                                     int total_tracks,
                                     const std::string& username,
                                     TierSet set) {
  const auto real = real_entries(entries);
  const auto me = lower(username);

  auto it = std::find_if(real.begin(), real.end(),
                         [&](const LeaderboardEntry& e){ return lower(e.username) == me; });

  int rank = standing.rank;
  Centis time = standing.time;
  std::vector<LeaderboardEntry> above;
  if (it != real.end()) {
    rank = it->rank;
    time = it->time;
    above.assign(real.begin(), it);
  } else {
    for (const auto& e : real) {
      if (e.time < time) above.push_back(e);
    }
    if (rank <= 0) {
      rank = static_cast<int>(above.size()) + 1;
      log_warn("%s: %s not on leaderboard and no rank given, assuming rank %d",
               standing.variant.key().c_str(), username.c_str(), rank);
    } else {
      log_debug("%s: %s not on leaderboard, using standing rank %d",
                standing.variant.key().c_str(), username.c_str(), standing.rank);
    }
  }

  Opportunity o = empty_opportunity(standing, rank, time);
  if (above.empty() || rank <= 1) return o;

  const auto climbs = (set == TierSet::Full) ? full_climb_range(above.size()) : kDisplayClimbs;
  o.tiers = derive_tiers(time, above, total_tracks, climbs);

  for (std::size_t i = 0; i < o.tiers.size(); ++i) {
    if (o.tiers[i].efficiency > o.best_efficiency) {
      o.best_efficiency = o.tiers[i].efficiency;
      o.best_tier_idx = i;
    }
  }
  return o;
}

Opportunity build_opportunity(const PlayerStanding& standing,
                              const std::vector<LeaderboardEntry>& entries,
                              int total_tracks,
                              const std::string& username,
                              TierSet set) {
  if (standing.is_na) return build_na_opportunity(standing, entries, total_tracks);
  return build_ranked_opportunity(standing, entries, total_tracks, username, set);
}

std::vector<Opportunity> compute_opportunities(const std::vector<PlayerStanding>& standings,
                                               const Leaderboards& leaderboards,
                                               int total_tracks,
                                               const std::string& username) {
  std::vector<Opportunity> out;
  out.reserve(standings.size());
  for (const auto& s : standings) {
    auto lb = leaderboards.find(s.variant);
    if (lb == leaderboards.end()) continue;
    out.push_back(build_opportunity(s, lb->second, total_tracks, username));
  }

  std::stable_sort(out.begin(), out.end(), [](const Opportunity& a, const Opportunity& b){
    return a.best_efficiency > b.best_efficiency;
  });
  return out;
}

double estimate_average_finish(const std::vector<Opportunity>& opportunities, int total_tracks) {
  if (total_tracks <= 0) return 0.0;
  long long sum = 0;
  for (const auto& o : opportunities) sum += std::max(1, o.current_rank);
  return static_cast<double>(sum) / static_cast<double>(total_tracks);
}

} // namespace afopt
