#include <afopt/time_codec.hpp>
#include <afopt/error.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <vector>

namespace afopt {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_fields(const std::string& text) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : text) {
    if (c == ':' || c == '.') { out.push_back(cur); cur.clear(); }
    else { cur.push_back(c); }
  }
  out.push_back(cur);
  return out;
}

static bool to_int_safe(const std::string& s, long long& out) {
  if (s.empty()) return false;
  try {
    std::size_t idx = 0;
    out = std::stoll(s, &idx);
    return idx == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

std::optional<Centis> try_parse_time(const std::string& text) {
  const auto fields = split_fields(trim(text));
  if (fields.size() != 3) return std::nullopt;
  long long mm = 0, ss = 0, cc = 0;
  if (!to_int_safe(fields[0], mm) || !to_int_safe(fields[1], ss) || !to_int_safe(fields[2], cc)) {
    return std::nullopt;
  }
  return static_cast<Centis>(mm * 6000 + ss * 100 + cc);
}

Centis parse_time(const std::string& text) {
  if (auto v = try_parse_time(text); v.has_value()) return *v;
  throw FormatError("invalid time format: '" + text + "', expected MM:SS:CC");
}

std::string format_time(Centis cs) {
  const long long minutes = cs / 6000;
  const long long rem     = cs % 6000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld.%02lld", minutes, rem / 100, rem % 100);
  return std::string(buf);
}

} // namespace afopt
