#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <afopt/tiers.hpp>

using Catch::Approx;
using namespace afopt;

static LeaderboardEntry entry(int rank, const char* user, Centis time) {
  return LeaderboardEntry{rank, user, user, time, false};
}

// Ranks 1..4 ahead of a player on rank 5 at 100.00s.
static std::vector<LeaderboardEntry> four_ahead() {
  return {entry(1, "a", 9000), entry(2, "b", 9200), entry(3, "c", 9400), entry(4, "d", 9600)};
}

TEST_CASE("derive_tiers: one position up from rank 5") {
  const auto tiers = derive_tiers(10000, four_ahead(), 10, {1});
  REQUIRE(tiers.size() == 1);
  const auto& t = tiers[0];
  REQUIRE(t.target_rank == 4);
  REQUIRE(t.opponent_time == 9600);
  REQUIRE(t.target_time == 9599);
  REQUIRE(t.time_delta == 401);
  REQUIRE(t.positions_gained == 1);
  REQUIRE(t.af_improvement == Approx(0.1));
  REQUIRE_FALSE(t.efficiency.infinite);
  REQUIRE(t.efficiency.value == Approx(0.1 / 401.0));
}

TEST_CASE("derive_tiers clamps and dedupes climb sizes") {
  const auto tiers = derive_tiers(10000, four_ahead(), 10, kDisplayClimbs);
  // {1,3,5,10,...} clamped to 4 -> {1,3,4}
  REQUIRE(tiers.size() == 3);
  REQUIRE(tiers[0].positions_gained == 1);
  REQUIRE(tiers[1].positions_gained == 3);
  REQUIRE(tiers[2].positions_gained == 4);
  REQUIRE(tiers[2].target_rank == 1);
  REQUIRE(tiers[2].target_time == 8999);
  REQUIRE(tiers[2].time_delta == 1001);
}

TEST_CASE("derive_tiers yields monotonic tiers") {
  const auto tiers = derive_tiers(10000, four_ahead(), 10, full_climb_range(4));
  REQUIRE(tiers.size() == 4);
  for (std::size_t i = 1; i < tiers.size(); ++i) {
    REQUIRE(tiers[i].positions_gained > tiers[i-1].positions_gained);
    REQUIRE(tiers[i].time_delta > tiers[i-1].time_delta);
    REQUIRE(tiers[i].target_time < tiers[i-1].target_time);
  }
}

TEST_CASE("derive_tiers walks ties by position, not rank") {
  // Two players tied on rank 2.
  std::vector<LeaderboardEntry> above{entry(1, "a", 9000), entry(2, "b", 9500), entry(2, "c", 9500)};
  const auto tiers = derive_tiers(9800, above, 5, {1, 2, 3});
  REQUIRE(tiers.size() == 3);
  REQUIRE(tiers[0].target_rank == 2);
  REQUIRE(tiers[1].target_rank == 2);
  REQUIRE(tiers[1].positions_gained == 2);
  REQUIRE(tiers[0].time_delta == tiers[1].time_delta);
  REQUIRE(tiers[2].target_rank == 1);
}

TEST_CASE("derive_tiers drops non-positive investments") {
  // Stale data: player's time already beats the nearest entry.
  std::vector<LeaderboardEntry> above{entry(1, "a", 9000), entry(2, "b", 9700)};
  const auto tiers = derive_tiers(9600, above, 10, {1, 2});
  REQUIRE(tiers.size() == 1);
  REQUIRE(tiers[0].positions_gained == 2);
  REQUIRE(tiers[0].time_delta == 601);
}

TEST_CASE("derive_tiers edges") {
  SECTION("empty above set") {
    REQUIRE(derive_tiers(10000, {}, 10, kDisplayClimbs).empty());
  }
  SECTION("non-positive climb sizes ignored") {
    REQUIRE(derive_tiers(10000, four_ahead(), 10, {0, -3}).empty());
  }
  SECTION("full_climb_range") {
    REQUIRE(full_climb_range(0).empty());
    REQUIRE(full_climb_range(3) == std::vector<int>{1, 2, 3});
  }
}
