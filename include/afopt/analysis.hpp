#pragma once
#include <optional>
#include <string>
#include <vector>
#include <afopt/config.hpp>
#include <afopt/model.hpp>
#include <afopt/snapshot.hpp>

namespace afopt {

// Everything one run produces, ready for printing or drawing.
struct Analysis {
  std::string username;
  int total_tracks = 0;
  double current_af = 0.0;
  bool current_af_estimated = false;
  int overrides_applied = 0;
  std::vector<Opportunity> opportunities;  // best efficiency first
  std::optional<OvertakePlan> min_time;    // set when a rival is configured
  std::optional<OvertakePlan> min_tracks;
};

// Overrides -> opportunities -> plans over an already loaded snapshot.
// The snapshot is taken by value: overrides rewrite the local copy only.
// Throws PlannerInvariantError from the cost-minimizing planner.
Analysis analyze(Snapshot snap, const Config& cfg);

// Loads the snapshot named by cfg and analyzes it; nullopt (after logging)
// when the input files cannot be read or contain no leaderboards.
std::optional<Analysis> run_analysis(const Config& cfg);

} // namespace afopt
