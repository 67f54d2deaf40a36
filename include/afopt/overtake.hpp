#pragma once
#include <cmath>
#include <string>
#include <vector>
#include <afopt/model.hpp>

namespace afopt {

// Exponent scale of the difficulty penalty.
inline constexpr double kDifficultyK = 5.0;

// Cost multiplier for climbing from current_rank to target_rank:
//   exp(K * (1 - target_rank / current_rank))
// 1.0 when target_rank == current_rank, growing as target_rank approaches 1.
// Steers the search only; positions and reported costs are never reweighted.
inline double difficulty_weight(int target_rank, int current_rank) {
  if (current_rank <= 0) return 1.0;
  const double ratio = static_cast<double>(target_rank) / static_cast<double>(current_rank);
  return std::exp(kDifficultyK * (1.0 - ratio));
}

// Positions that must be gained to strictly overtake a rival af_gap ahead.
// ceil(af_gap * total_tracks + 1e-9); 0 when the gap is closed already.
int positions_required(double af_gap, int total_tracks);

// (track, vehicle) pair the player does not want proposed in plans.
struct PlanExclusion {
  std::string track;
  std::string vehicle;
};

struct OvertakeRequest {
  double current_af = 0.0;
  double target_af = 0.0;
  int total_tracks = 0;
  std::string target_username; // label only
  std::vector<PlanExclusion> exclude;
};

// Per-track option sets shared by both planners: every variant with a
// leaderboard, ranked tracks carrying one tier per reachable rank.
std::vector<Opportunity> build_planning_options(const std::vector<PlayerStanding>& standings,
                                                const Leaderboards& leaderboards,
                                                int total_tracks,
                                                const std::string& username);

// Minimum difficulty-weighted time that closes the gap: multi-choice knapsack
// over ranked tracks (at most one tier per track), N/A tracks always included.
// Throws PlannerInvariantError if the search contradicts its feasibility check.
OvertakePlan plan_overtake_min_time(const std::vector<Opportunity>& options,
                                    const OvertakeRequest& req);

// Fewest tracks: each ranked track offers its best positions-per-difficulty
// tier; candidates are taken largest gain first until the gap is closed.
OvertakePlan plan_overtake_min_tracks(const std::vector<Opportunity>& options,
                                      const OvertakeRequest& req);

} // namespace afopt
