#include <afopt/config.hpp>
#include <afopt/time_codec.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace afopt {

namespace {

template <typename T>
T yaml_load_value(const YAML::Node& node, const char* key, const T& default_v) {
  if (node[key]) return node[key].as<T>();
  return default_v;
}

std::optional<TimeOverride> parse_override(const YAML::Node& n) {
  if (!n.IsMap() || !n["track"] || !n["vehicle"] || !n["laps"] || !n["time"]) return std::nullopt;
  auto t = try_parse_time(n["time"].as<std::string>());
  if (!t) return std::nullopt;
  TimeOverride o;
  o.variant.track    = n["track"].as<std::string>();
  o.variant.vehicle  = n["vehicle"].as<std::string>();
  o.variant.category = yaml_load_value<std::string>(n, "category", "standard");
  o.variant.laps     = n["laps"].as<std::string>();
  o.time = *t;
  return o;
}

} // namespace

std::optional<Config> config_from_yaml_stream(std::istream& in) {
  Config cfg;
  try {
    const YAML::Node root = YAML::Load(in);
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) {
      log_error("config: top level must be a mapping");
      return std::nullopt;
    }

    cfg.username         = yaml_load_value(root, "username", cfg.username);
    cfg.standings_csv    = yaml_load_value(root, "standings_csv", cfg.standings_csv);
    cfg.leaderboards_csv = yaml_load_value(root, "leaderboards_csv", cfg.leaderboards_csv);
    cfg.current_af       = yaml_load_value(root, "current_af", cfg.current_af);
    cfg.log_level = log_level_from_string(yaml_load_value<std::string>(root, "log_level", "info"));

    if (const auto rival = root["rival"]; rival && rival.IsMap()) {
      cfg.rival_username = yaml_load_value(rival, "username", cfg.rival_username);
      cfg.rival_af       = yaml_load_value(rival, "af", cfg.rival_af);
    }

    if (const auto ovr = root["time_overrides"]; ovr && ovr.IsSequence()) {
      for (const auto& n : ovr) {
        if (auto o = parse_override(n); o.has_value()) cfg.time_overrides.push_back(*o);
        else log_warn("config: time override skipped (needs track, vehicle, laps, time MM:SS:CC)");
      }
    }

    if (const auto ex = root["exclude_from_plans"]; ex && ex.IsSequence()) {
      for (const auto& n : ex) {
        if (!n.IsMap() || !n["track"] || !n["vehicle"]) {
          log_warn("config: plan exclusion skipped (needs track and vehicle)");
          continue;
        }
        cfg.exclude_from_plans.push_back(PlanExclusion{n["track"].as<std::string>(), n["vehicle"].as<std::string>()});
      }
    }
  } catch (const YAML::Exception& e) {
    log_error("config: %s", e.what());
    return std::nullopt;
  }
  return cfg;
}

std::optional<Config> load_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    log_error("cannot open config file '%s'", path.c_str());
    return std::nullopt;
  }
  return config_from_yaml_stream(f);
}

} // namespace afopt
