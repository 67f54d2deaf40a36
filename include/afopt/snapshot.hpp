#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <afopt/model.hpp>

namespace afopt {

// Immutable input of one analysis run.
struct Snapshot {
  std::vector<PlayerStanding> standings;
  Leaderboards leaderboards;

  // Denominator of the ranking metric: variants with a leaderboard.
  int total_tracks() const { return static_cast<int>(leaderboards.size()); }
};

// Stream-based CSV loaders (test-friendly; no filesystem required).
// Accept an optional header row; ignore lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
//
// standings:    track,vehicle,category,laps,track_name,rank,time
//               time is MM:SS:CC or N/A
std::vector<PlayerStanding> standings_from_csv_stream(std::istream& in);

// leaderboards: track,vehicle,category,laps,rank,username,display_name,time,placeholder
//               an empty rank repeats the previous row's rank (tie)
Leaderboards leaderboards_from_csv_stream(std::istream& in);

// Filesystem wrappers; return nullopt if the file cannot be opened.
std::optional<std::vector<PlayerStanding>> load_standings_csv(const std::string& path);
std::optional<Leaderboards> load_leaderboards_csv(const std::string& path);

// Both files; nullopt if either cannot be opened.
std::optional<Snapshot> load_snapshot(const std::string& standings_path,
                                      const std::string& leaderboards_path);

} // namespace afopt
