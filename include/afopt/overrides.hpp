#pragma once
#include <string>
#include <vector>
#include <afopt/model.hpp>

namespace afopt {

// A newer time the player has driven but that is not in the snapshot yet.
struct TimeOverride {
  TrackVariant variant;
  Centis time = 0;
};

struct OverrideResult {
  int rank_delta = 0;      // sum of (new rank - old rank); negative = better
  int tracks_affected = 0;
};

// Rewrites matching standing/leaderboard pairs in place, before analysis.
// The player's entry is updated (or inserted), the board re-sorted (real
// entries by time, placeholders after) and re-ranked with shared ranks for
// equal real times. Overrides without a standing or leaderboard are skipped.
// Callers shift AF by rank_delta / total_tracks.
OverrideResult apply_time_overrides(std::vector<PlayerStanding>& standings,
                                    Leaderboards& leaderboards,
                                    const std::vector<TimeOverride>& overrides,
                                    const std::string& username);

// Re-rank in place after a time change.
void rerank_leaderboard(std::vector<LeaderboardEntry>& entries);

} // namespace afopt
