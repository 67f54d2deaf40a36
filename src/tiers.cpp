#include <afopt/tiers.hpp>
#include <afopt/log.hpp>
#include <algorithm>

namespace afopt {

std::vector<int> full_climb_range(std::size_t n) {
  std::vector<int> out;
  out.reserve(n);
  for (std::size_t i = 1; i <= n; ++i) out.push_back(static_cast<int>(i));
  return out;
}

std::vector<Tier> derive_tiers(Centis current_time,
                               const std::vector<LeaderboardEntry>& above,
                               int total_tracks,
                               const std::vector<int>& climbs) {
  std::vector<Tier> out;
  if (above.empty() || total_tracks <= 0) return out;

  // Clamp, then dedupe and order so positions_gained is strictly increasing.
  const int reach = static_cast<int>(above.size());
  std::vector<int> sizes;
  sizes.reserve(climbs.size());
  for (int n : climbs) {
    if (n <= 0) continue;
    sizes.push_back(std::min(n, reach));
  }
  std::sort(sizes.begin(), sizes.end());
  sizes.erase(std::unique(sizes.begin(), sizes.end()), sizes.end());

  out.reserve(sizes.size());
  for (int n : sizes) {
    const auto& target = above[above.size() - static_cast<std::size_t>(n)];
    const Centis target_time = target.time - 1;
    const Centis delta = current_time - target_time;
    if (delta <= 0) {
      log_debug("tier +%d dropped: %s already at or below %s",
                n, format_time(current_time).c_str(), format_time(target_time).c_str());
      continue;
    }

    Tier t;
    t.target_rank      = target.rank;
    t.opponent_time    = target.time;
    t.target_time      = target_time;
    t.positions_gained = n;
    t.af_improvement   = static_cast<double>(n) / static_cast<double>(total_tracks);
    t.time_delta       = delta;
    t.efficiency       = Efficiency{t.af_improvement / static_cast<double>(delta), false};
    out.push_back(t);
  }
  return out;
}

} // namespace afopt
