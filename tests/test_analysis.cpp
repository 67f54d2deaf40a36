#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>

#include <afopt/analysis.hpp>

using Catch::Approx;
using namespace afopt;

static const TrackVariant kLake{"lake", "car", "standard", "3-laps"};
static const TrackVariant kPeak{"peak", "plane", "standard", "1-lap"};
static const TrackVariant kCove{"cove", "hover", "standard", "1-lap"};

static LeaderboardEntry entry(int rank, const std::string& user, Centis time, bool placeholder = false) {
  return LeaderboardEntry{rank, user, user, time, placeholder};
}

// lake: third of three. peak: no time, two real entries and two placeholders. cove: first.
static Snapshot make_snapshot() {
  Snapshot s;
  s.standings = {
    PlayerStanding{kLake, "Lake", 3, 10000, false},
    PlayerStanding{kPeak, "Peak", 0, 0, true},
    PlayerStanding{kCove, "Cove", 1, 6000, false},
  };
  s.leaderboards[kLake] = {entry(1, "a", 9000), entry(2, "b", 9500), entry(3, "me", 10000)};
  s.leaderboards[kPeak] = {entry(1, "x", 5000), entry(2, "y", 5100), entry(3, "p1", 0, true), entry(4, "p2", 0, true)};
  s.leaderboards[kCove] = {entry(1, "me", 6000), entry(2, "a", 6200)};
  return s;
}

TEST_CASE("analyze estimates AF and plans against a rival") {
  Config cfg;
  cfg.username = "me";
  cfg.rival_username = "rival";
  cfg.rival_af = 2.0;

  const auto a = analyze(make_snapshot(), cfg);
  REQUIRE(a.total_tracks == 3);
  REQUIRE(a.current_af_estimated);
  REQUIRE(a.current_af == Approx(7.0 / 3.0)); // ranks 3, 3 (one past the worst real entry) and 1

  REQUIRE(a.opportunities.size() == 3);
  REQUIRE(a.opportunities.front().variant == kPeak);
  REQUIRE(a.opportunities.back().variant == kCove);
  REQUIRE(a.opportunities.back().tiers.empty());

  REQUIRE(a.min_time.has_value());
  REQUIRE(a.min_time->feasible);
  REQUIRE(a.min_time->positions_needed == 2);
  REQUIRE(a.min_time->positions_gained == 2);
  REQUIRE(a.min_time->time_investment == 1001); // lake straight to first
  REQUIRE(a.min_time->items.size() == 1);      // the N/A track adds nothing
  REQUIRE(a.min_time->new_af == Approx(7.0 / 3.0 - 2.0 / 3.0));

  // The best-return climb on lake is a single step, leaving the plan one short.
  REQUIRE(a.min_tracks.has_value());
  REQUIRE_FALSE(a.min_tracks->feasible);
  REQUIRE(a.min_tracks->positions_gained == 1);
}

TEST_CASE("analyze applies time overrides before ranking") {
  Config cfg;
  cfg.username = "me";
  cfg.current_af = 3.0;
  cfg.time_overrides = {TimeOverride{kLake, 9400}};

  const auto a = analyze(make_snapshot(), cfg);
  REQUIRE_FALSE(a.current_af_estimated);
  REQUIRE(a.overrides_applied == 1);
  REQUIRE(a.current_af == Approx(3.0 - 1.0 / 3.0));
  REQUIRE_FALSE(a.min_time.has_value());
  REQUIRE_FALSE(a.min_tracks.has_value());

  bool found = false;
  for (const auto& o : a.opportunities) {
    if (!(o.variant == kLake)) continue;
    found = true;
    REQUIRE(o.current_rank == 2);
    REQUIRE(o.current_time == 9400);
  }
  REQUIRE(found);
}

TEST_CASE("run_analysis fails cleanly without input files") {
  Config cfg;
  cfg.username = "me";
  cfg.standings_csv = "this_file_does_not_exist.csv";
  cfg.leaderboards_csv = "nor_this_one.csv";
  REQUIRE_FALSE(run_analysis(cfg).has_value());
}
