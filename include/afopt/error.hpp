#pragma once
#include <stdexcept>
#include <string>

namespace afopt {

// Malformed time text (wrong field count or non-numeric field).
class FormatError : public std::runtime_error {
public:
  explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};

// Raised when the overtake search contradicts its own feasibility check.
// Indicates a defect in the planner or a corrupt option table.
class PlannerInvariantError : public std::logic_error {
public:
  explicit PlannerInvariantError(const std::string& what) : std::logic_error(what) {}
};

} // namespace afopt
