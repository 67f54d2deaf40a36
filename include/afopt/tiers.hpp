#pragma once
#include <cstddef>
#include <vector>
#include <afopt/model.hpp>

namespace afopt {

// Climb sizes shown per track in the opportunity list.
inline const std::vector<int> kDisplayClimbs = {1, 3, 5, 10, 15, 20, 25};

// {1..n}, used when planning so every reachable rank is an option.
std::vector<int> full_climb_range(std::size_t n);

// Derive reachable tiers for one track.
//   above: real entries ahead of the player, furthest-ahead first.
//   climbs: requested position jumps; each is clamped to above.size(),
//           duplicates after clamping are computed once.
// Tiers come out in ascending climb order. A climb whose investment would be
// <= 0 (player's time already beats the nominal target) is dropped.
std::vector<Tier> derive_tiers(Centis current_time,
                               const std::vector<LeaderboardEntry>& above,
                               int total_tracks,
                               const std::vector<int>& climbs);

} // namespace afopt
