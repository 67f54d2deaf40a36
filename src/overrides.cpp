#include <afopt/overrides.hpp>
#include <afopt/log.hpp>
#include <algorithm>
#include <cctype>

namespace afopt {

static inline std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Rank an unranked player holds: one past the worst real entry.
static int last_place(const std::vector<LeaderboardEntry>& entries) {
  int worst_real = 0;
  for (const auto& e : entries) {
    if (!e.is_placeholder) worst_real = std::max(worst_real, e.rank);
  }
  return worst_real + 1;
}

void rerank_leaderboard(std::vector<LeaderboardEntry>& entries) {
  std::stable_sort(entries.begin(), entries.end(), [](const LeaderboardEntry& a, const LeaderboardEntry& b){
    if (a.is_placeholder != b.is_placeholder) return !a.is_placeholder;
    return a.time < b.time;
  });

  int rank = 1;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    auto& e = entries[i];
    if (e.is_placeholder) {
      e.rank = rank;
      continue;
    }
    const bool tied = i > 0 && !entries[i - 1].is_placeholder && entries[i - 1].time == e.time;
    e.rank = tied ? entries[i - 1].rank : rank;
    ++rank;
  }
}

OverrideResult apply_time_overrides(std::vector<PlayerStanding>& standings,
                                    Leaderboards& leaderboards,
                                    const std::vector<TimeOverride>& overrides,
                                    const std::string& username) {
  OverrideResult res;
  const auto me = lower(username);

  for (const auto& ovr : overrides) {
    const auto key = ovr.variant.key();
    auto st = std::find_if(standings.begin(), standings.end(),
                           [&](const PlayerStanding& s){ return s.variant == ovr.variant; });
    if (st == standings.end()) {
      log_warn("override for %s has no matching player track", key.c_str());
      continue;
    }
    auto lb = leaderboards.find(ovr.variant);
    if (lb == leaderboards.end() || lb->second.empty()) {
      log_warn("override for %s: no leaderboard", key.c_str());
      continue;
    }

    auto& entries = lb->second;
    auto mine = [&](const LeaderboardEntry& e){ return !e.is_placeholder && lower(e.username) == me; };
    auto it = std::find_if(entries.begin(), entries.end(), mine);

    const bool was_na = st->is_na;
    const Centis old_time = st->time;
    int old_rank = (it != entries.end()) ? it->rank : st->rank;
    if (it == entries.end() && was_na) old_rank = last_place(entries);

    if (it != entries.end()) {
      it->time = ovr.time;
    } else {
      // Drop a placeholder row held under the player's name, if any.
      entries.erase(std::remove_if(entries.begin(), entries.end(), [&](const LeaderboardEntry& e){
        return e.is_placeholder && lower(e.username) == me;
      }), entries.end());
      entries.push_back(LeaderboardEntry{0, username, username, ovr.time, false});
    }

    rerank_leaderboard(entries);
    const auto now = std::find_if(entries.begin(), entries.end(), mine);
    const int new_rank = now->rank;

    st->time = ovr.time;
    st->rank = new_rank;
    st->is_na = false;

    res.rank_delta += new_rank - old_rank;
    ++res.tracks_affected;
    log_info("%s: %s -> %s, rank %d -> %d", key.c_str(),
             was_na ? "N/A" : format_time(old_time).c_str(), format_time(ovr.time).c_str(),
             old_rank, new_rank);
  }
  return res;
}

} // namespace afopt
