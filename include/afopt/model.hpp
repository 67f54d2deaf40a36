#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <tuple>
#include <vector>
#include <afopt/time_codec.hpp>

namespace afopt {

// One scored combination of track, vehicle class, category and lap count.
struct TrackVariant {
  std::string track;    // slug, e.g. "ancient-lake"
  std::string vehicle;  // car, hover, plane
  std::string category; // standard, shortcut
  std::string laps;     // 3-laps, 1-lap

  std::string key() const { return track + "/" + vehicle + "/" + category + "/" + laps; }

  bool operator==(const TrackVariant& o) const {
    return std::tie(track, vehicle, category, laps) == std::tie(o.track, o.vehicle, o.category, o.laps);
  }
  bool operator<(const TrackVariant& o) const {
    return std::tie(track, vehicle, category, laps) < std::tie(o.track, o.vehicle, o.category, o.laps);
  }
};

struct PlayerStanding {
  TrackVariant variant;
  std::string track_name;
  int rank = 0;      // 1 = best, 0 = unranked
  Centis time = 0;   // 0 when N/A
  bool is_na = false;
};

struct LeaderboardEntry {
  int rank = 0;
  std::string username;
  std::string display_name;
  Centis time = 0;
  bool is_placeholder = false; // synthetic "default time" row
};

// Absent key = no leaderboard exists; the variant is out of scope.
using Leaderboards = std::map<TrackVariant, std::vector<LeaderboardEntry>>;

// Metric gain per centisecond. N/A tracks are unbounded; that case is a flag,
// not an IEEE infinity, and it orders before every finite value.
struct Efficiency {
  double value = 0.0;
  bool infinite = false;

  static Efficiency unbounded() { return Efficiency{0.0, true}; }

  bool operator>(const Efficiency& o) const {
    if (infinite != o.infinite) return infinite;
    return !infinite && value > o.value;
  }
  bool operator==(const Efficiency& o) const {
    return infinite == o.infinite && (infinite || value == o.value);
  }
};

struct Tier {
  int target_rank = 0;
  Centis opponent_time = 0;  // opponent's actual time
  Centis target_time = 0;    // opponent_time - 1 (beat, not tie)
  int positions_gained = 0;
  double af_improvement = 0.0;
  Centis time_delta = 0;     // current time - target time
  Efficiency efficiency{};
};

struct Opportunity {
  TrackVariant variant;
  std::string track_name;
  int current_rank = 0;
  Centis current_time = 0;   // 0 for N/A
  bool is_na = false;
  std::vector<Tier> tiers;   // increasing positions_gained
  Efficiency best_efficiency{};
  std::size_t best_tier_idx = 0;

  const Tier* best_tier() const { return tiers.empty() ? nullptr : &tiers[best_tier_idx]; }
};

struct OvertakePlanItem {
  TrackVariant variant;
  std::string track_name;
  bool is_na = false;
  int current_rank = 0;
  Centis current_time = 0;
  int new_rank = 0;
  Centis target_time = 0;
  Centis opponent_time = 0;
  int positions_gained = 0;
  double af_improvement = 0.0;
  Centis time_delta = 0;
  Efficiency efficiency{};
};

struct OvertakePlan {
  std::string target_username;
  double target_af = 0.0;
  double current_af = 0.0;
  double af_gap = 0.0;
  int positions_needed = 0;
  int positions_gained = 0;
  Centis time_investment = 0; // ranked items only, unweighted
  double new_af = 0.0;
  std::vector<OvertakePlanItem> items;
  bool feasible = true;
};

} // namespace afopt
