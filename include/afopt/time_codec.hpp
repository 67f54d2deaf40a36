#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace afopt {

// All times are integer centiseconds.
using Centis = std::int64_t;

// "MM:SS:CC" (':' or '.' separators) -> centiseconds.
// Throws FormatError on a wrong field count or a non-numeric field.
Centis parse_time(const std::string& text);

// Non-throwing variant for loaders that skip bad rows.
std::optional<Centis> try_parse_time(const std::string& text);

// centiseconds -> "MM:SS.CC", two-digit zero padded.
std::string format_time(Centis cs);

} // namespace afopt
