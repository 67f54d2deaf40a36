#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <afopt/config.hpp>

using Catch::Approx;
using namespace afopt;

static std::string full_yaml = R"(
username: me
standings_csv: data/standings.csv
current_af: 12.5
rival:
  username: rival
  af: 11.75
log_level: debug
time_overrides:
  - {track: lake, vehicle: car, laps: 3-laps, time: "01:35:00"}
  - {track: cove, vehicle: car, laps: 1-lap, time: "fast"}
  - {track: peak, vehicle: plane, category: hard, laps: 1-lap, time: "00:59:00"}
exclude_from_plans:
  - {track: dune, vehicle: hover}
  - {track: dune}
)";

TEST_CASE("config_from_yaml_stream reads every section") {
  std::istringstream ss(full_yaml);
  auto cfg = config_from_yaml_stream(ss);
  REQUIRE(cfg.has_value());

  REQUIRE(cfg->username == "me");
  REQUIRE(cfg->standings_csv == "data/standings.csv");
  REQUIRE(cfg->leaderboards_csv == "leaderboards.csv");
  REQUIRE(cfg->current_af == Approx(12.5));
  REQUIRE(cfg->rival_username == "rival");
  REQUIRE(cfg->rival_af == Approx(11.75));
  REQUIRE(cfg->log_level == LogLevel::Debug);

  SECTION("malformed overrides are skipped, category defaults to standard") {
    REQUIRE(cfg->time_overrides.size() == 2);
    REQUIRE(cfg->time_overrides[0].variant == TrackVariant{"lake", "car", "standard", "3-laps"});
    REQUIRE(cfg->time_overrides[0].time == 9500);
    REQUIRE(cfg->time_overrides[1].variant.category == "hard");
    REQUIRE(cfg->time_overrides[1].time == 5900);
  }
  SECTION("exclusions need track and vehicle") {
    REQUIRE(cfg->exclude_from_plans.size() == 1);
    REQUIRE(cfg->exclude_from_plans[0].track == "dune");
    REQUIRE(cfg->exclude_from_plans[0].vehicle == "hover");
  }
}

TEST_CASE("empty config keeps defaults") {
  std::istringstream ss("");
  auto cfg = config_from_yaml_stream(ss);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->username.empty());
  REQUIRE(cfg->standings_csv == "standings.csv");
  REQUIRE(cfg->current_af == 0.0);
  REQUIRE(cfg->rival_username.empty());
  REQUIRE(cfg->log_level == LogLevel::Info);
  REQUIRE(cfg->time_overrides.empty());
}

TEST_CASE("invalid config yields nullopt") {
  SECTION("syntax error") {
    std::istringstream ss("username: [unclosed\n");
    REQUIRE_FALSE(config_from_yaml_stream(ss).has_value());
  }
  SECTION("top level is not a mapping") {
    std::istringstream ss("- a\n- b\n");
    REQUIRE_FALSE(config_from_yaml_stream(ss).has_value());
  }
  SECTION("wrong value type") {
    std::istringstream ss("current_af: lots\n");
    REQUIRE_FALSE(config_from_yaml_stream(ss).has_value());
  }
  SECTION("missing file") {
    REQUIRE_FALSE(load_config("this_file_does_not_exist.yaml").has_value());
  }
}

TEST_CASE("log levels parse case-insensitively") {
  REQUIRE(log_level_from_string("WARN") == LogLevel::Warn);
  REQUIRE(log_level_from_string("warning") == LogLevel::Warn);
  REQUIRE(log_level_from_string("Error") == LogLevel::Error);
  REQUIRE(log_level_from_string("whatever") == LogLevel::Info);
}
