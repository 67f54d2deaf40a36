#include <afopt/snapshot.hpp>
#include <afopt/log.hpp>
#include <afopt/time_codec.hpp>
#include <algorithm>
#include <fstream>
#include <utility>
#include <cctype>

namespace afopt {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // Simple CSV: no quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static bool is_header_row(const std::vector<std::string>& cols, std::size_t min_cols) {
  if (cols.size() < min_cols) return false;
  return (cols[0] == "track" || cols[0] == "Track");
}

static bool to_int_safe(const std::string& s, int& out) {
  try {
    std::size_t idx = 0;
    out = std::stoi(s, &idx);
    return idx == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

static std::optional<bool> to_flag(const std::string& s) {
  const auto u = upper(s);
  if (u.empty() || u == "0" || u == "FALSE" || u == "NO") return false;
  if (u == "1" || u == "TRUE" || u == "YES") return true;
  return std::nullopt;
}

static std::optional<TrackVariant> parse_variant(const std::vector<std::string>& cols) {
  TrackVariant v{cols[0], cols[1], cols[2], cols[3]};
  if (v.track.empty() || v.vehicle.empty() || v.category.empty() || v.laps.empty()) return std::nullopt;
  return v;
}

static std::optional<PlayerStanding> parse_standing_row(const std::vector<std::string>& cols) {
  if (cols.size() < 7) return std::nullopt;
  auto v = parse_variant(cols);
  if (!v) return std::nullopt;

  PlayerStanding s;
  s.variant = *v;
  s.track_name = cols[4].empty() ? v->track : cols[4];

  const auto time_col = upper(cols[6]);
  if (time_col == "N/A" || time_col == "NA" || time_col.empty()) {
    s.is_na = true;
    return s;
  }
  auto t = try_parse_time(cols[6]);
  if (!t) return std::nullopt;
  s.time = *t;
  if (!cols[5].empty() && !to_int_safe(cols[5], s.rank)) return std::nullopt;
  if (s.rank < 0) s.rank = 0;
  if (s.rank == 0) {
    log_warn("%s: time %s without a rank, rank will come from the leaderboard",
             v->key().c_str(), format_time(s.time).c_str());
  }
  return s;
}

std::vector<PlayerStanding> standings_from_csv_stream(std::istream& in) {
  std::vector<PlayerStanding> out;
  std::string line;
  bool header_consumed = false;
  std::size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split_csv_line(raw);
    if (!header_consumed && is_header_row(cols, 7)) {
      header_consumed = true;
      continue;
    }

    if (auto row = parse_standing_row(cols); row.has_value()) {
      out.push_back(*row);
    } else {
      log_warn("standings line %zu skipped: '%s'", line_no, raw.c_str());
    }
  }
  return out;
}

Leaderboards leaderboards_from_csv_stream(std::istream& in) {
  Leaderboards out;
  std::string line;
  bool header_consumed = false;
  std::size_t line_no = 0;
  TrackVariant prev_variant;
  int prev_rank = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split_csv_line(raw);
    if (!header_consumed && is_header_row(cols, 9)) {
      header_consumed = true;
      continue;
    }

    auto skip = [&]{ log_warn("leaderboard line %zu skipped: '%s'", line_no, raw.c_str()); };
    if (cols.size() < 9) { skip(); continue; }
    auto v = parse_variant(cols);
    auto t = try_parse_time(cols[7]);
    auto placeholder = to_flag(cols[8]);
    if (!v || !t || !placeholder || cols[5].empty()) { skip(); continue; }

    if (!(*v == prev_variant)) prev_rank = 0;
    int rank = prev_rank;
    if (!cols[4].empty() && !to_int_safe(cols[4], rank)) { skip(); continue; }
    if (rank <= 0) { skip(); continue; }
    prev_rank = rank;
    prev_variant = *v;

    LeaderboardEntry e;
    e.rank = rank;
    e.username = cols[5];
    e.display_name = cols[6].empty() ? cols[5] : cols[6];
    e.time = *t;
    e.is_placeholder = *placeholder;
    out[*v].push_back(e);
  }
  return out;
}

std::optional<std::vector<PlayerStanding>> load_standings_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return standings_from_csv_stream(f);
}

std::optional<Leaderboards> load_leaderboards_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return leaderboards_from_csv_stream(f);
}

std::optional<Snapshot> load_snapshot(const std::string& standings_path,
                                      const std::string& leaderboards_path) {
  auto standings = load_standings_csv(standings_path);
  if (!standings) {
    log_error("cannot open standings file '%s'", standings_path.c_str());
    return std::nullopt;
  }
  auto boards = load_leaderboards_csv(leaderboards_path);
  if (!boards) {
    log_error("cannot open leaderboards file '%s'", leaderboards_path.c_str());
    return std::nullopt;
  }
  return Snapshot{std::move(*standings), std::move(*boards)};
}

} // namespace afopt
