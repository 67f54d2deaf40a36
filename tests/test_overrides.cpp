#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include <afopt/overrides.hpp>

using namespace afopt;

static const TrackVariant kLake{"lake", "car", "standard", "3-laps"};

static LeaderboardEntry entry(int rank, const std::string& user, Centis time, bool placeholder = false) {
  return LeaderboardEntry{rank, user, user, time, placeholder};
}

TEST_CASE("rerank_leaderboard sorts by time with placeholders last") {
  std::vector<LeaderboardEntry> e{
    entry(0, "b", 9500),
    entry(0, "ph", 9100, true),
    entry(0, "a", 9000),
    entry(0, "c", 9500),
    entry(0, "d", 9800),
  };
  rerank_leaderboard(e);
  REQUIRE(e[0].username == "a");
  REQUIRE(e[0].rank == 1);
  REQUIRE(e[1].username == "b");
  REQUIRE(e[1].rank == 2);
  REQUIRE(e[2].username == "c");
  REQUIRE(e[2].rank == 2); // tie shares the rank
  REQUIRE(e[3].username == "d");
  REQUIRE(e[3].rank == 4);
  REQUIRE(e[4].username == "ph");
  REQUIRE(e[4].rank == 5);
}

TEST_CASE("override improves an existing leaderboard entry") {
  std::vector<PlayerStanding> standings{PlayerStanding{kLake, "Lake", 3, 10000, false}};
  Leaderboards boards;
  boards[kLake] = {entry(1, "a", 9000), entry(2, "b", 9500), entry(3, "Me", 10000), entry(4, "c", 10500)};

  const auto res = apply_time_overrides(standings, boards, {TimeOverride{kLake, 9400}}, "me");
  REQUIRE(res.tracks_affected == 1);
  REQUIRE(res.rank_delta == -1);

  REQUIRE(standings[0].rank == 2);
  REQUIRE(standings[0].time == 9400);
  const auto& e = boards[kLake];
  REQUIRE(e.size() == 4);
  REQUIRE(e[1].username == "Me");
  REQUIRE(e[1].rank == 2);
  REQUIRE(e[2].rank == 3);
}

TEST_CASE("override inserts a first time for an N/A track") {
  std::vector<PlayerStanding> standings{PlayerStanding{kLake, "Lake", 0, 0, true}};
  Leaderboards boards;
  boards[kLake] = {entry(1, "a", 9000), entry(2, "b", 9500), entry(3, "me", 0, true), entry(4, "ghost", 0, true)};

  const auto res = apply_time_overrides(standings, boards, {TimeOverride{kLake, 9200}}, "me");
  REQUIRE(res.tracks_affected == 1);
  REQUIRE(res.rank_delta == 2 - 3); // from one past the worst real entry to second

  REQUIRE_FALSE(standings[0].is_na);
  REQUIRE(standings[0].rank == 2);
  const auto& e = boards[kLake];
  REQUIRE(e.size() == 4);
  REQUIRE(e[1].username == "me");
  REQUIRE_FALSE(e[1].is_placeholder);
  REQUIRE(e[2].username == "b");
  REQUIRE(e[2].rank == 3);
  REQUIRE(e[3].username == "ghost");
  REQUIRE(e[3].rank == 4);
}

TEST_CASE("override landing last on an N/A track leaves the rank unchanged") {
  std::vector<PlayerStanding> standings{PlayerStanding{kLake, "Lake", 0, 0, true}};
  Leaderboards boards;
  boards[kLake] = {entry(1, "a", 9000), entry(2, "b", 9500), entry(3, "ghost", 0, true)};

  const auto res = apply_time_overrides(standings, boards, {TimeOverride{kLake, 9900}}, "me");
  REQUIRE(res.tracks_affected == 1);
  REQUIRE(res.rank_delta == 0);
  REQUIRE(standings[0].rank == 3);
}

TEST_CASE("overrides without a standing or leaderboard are skipped") {
  const TrackVariant cove{"cove", "hover", "standard", "1-lap"};
  const TrackVariant peak{"peak", "plane", "standard", "1-lap"};
  std::vector<PlayerStanding> standings{PlayerStanding{cove, "Cove", 2, 7000, false}};
  Leaderboards boards;
  boards[peak] = {entry(1, "a", 5000)};

  const auto res = apply_time_overrides(standings, boards,
                                        {TimeOverride{cove, 6000}, TimeOverride{peak, 4000}}, "me");
  REQUIRE(res.tracks_affected == 0);
  REQUIRE(res.rank_delta == 0);
  REQUIRE(standings[0].time == 7000);
  REQUIRE(boards[peak].size() == 1);
}
