#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <afopt/log.hpp>
#include <afopt/overrides.hpp>
#include <afopt/overtake.hpp>

namespace afopt {

struct Config {
  std::string username;
  std::string standings_csv = "standings.csv";
  std::string leaderboards_csv = "leaderboards.csv";

  // Player's current Average Finish; 0 = derive from standings.
  double current_af = 0.0;

  // Rival to overtake; planning is skipped when rival_username is empty.
  std::string rival_username;
  double rival_af = 0.0;

  LogLevel log_level = LogLevel::Info;
  std::vector<TimeOverride> time_overrides;
  std::vector<PlanExclusion> exclude_from_plans;
};

// Parse YAML text. Missing keys keep their defaults; override entries with a
// malformed time or missing fields are skipped with a warning.
// Returns nullopt (after logging) on a YAML syntax or type error.
std::optional<Config> config_from_yaml_stream(std::istream& in);

// Filesystem wrapper; nullopt if the file cannot be opened or parsed.
std::optional<Config> load_config(const std::string& path);

} // namespace afopt
