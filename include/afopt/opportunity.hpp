#pragma once
#include <string>
#include <vector>
#include <afopt/model.hpp>

namespace afopt {

enum class TierSet {
  Display, // kDisplayClimbs
  Full     // every reachable rank, for planning
};

// Real (non-placeholder) entries, order preserved.
std::vector<LeaderboardEntry> real_entries(const std::vector<LeaderboardEntry>& entries);

// Player has no time on the variant. Submitting any time is modeled as landing
// just below the worst real entry: one tier, zero investment, unbounded efficiency.
Opportunity build_na_opportunity(const PlayerStanding& standing,
                                 const std::vector<LeaderboardEntry>& entries,
                                 int total_tracks);

// Player has a time. Locates the player's entry by case-insensitive username,
// falling back to the standing's own rank/time when absent.
Opportunity build_ranked_opportunity(const PlayerStanding& standing,
                                     const std::vector<LeaderboardEntry>& entries,
                                     int total_tracks,
                                     const std::string& username,
                                     TierSet set = TierSet::Display);

// Dispatches on standing.is_na.
Opportunity build_opportunity(const PlayerStanding& standing,
                              const std::vector<LeaderboardEntry>& entries,
                              int total_tracks,
                              const std::string& username,
                              TierSet set = TierSet::Display);

// One Opportunity per standing whose variant has a leaderboard, sorted by
// best efficiency descending (unbounded first). Stable for equal values.
std::vector<Opportunity> compute_opportunities(const std::vector<PlayerStanding>& standings,
                                               const Leaderboards& leaderboards,
                                               int total_tracks,
                                               const std::string& username);

// Mean current rank over the given opportunities (unranked counts as 1),
// divided by total_tracks. Used when the ranking's own AF is not known.
double estimate_average_finish(const std::vector<Opportunity>& opportunities, int total_tracks);

} // namespace afopt
