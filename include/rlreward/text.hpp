#pragma once

// rlreward/text.hpp - Small byte-oriented string helpers shared by the text stages.
//
// All helpers are ASCII-only. Lowercasing preserves length, so an index found in
// a lowered copy is valid in the original text.

#include <string>
#include <string_view>

namespace rlreward::text {

inline bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string_view trim_view(std::string_view s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

inline std::string trim(std::string_view s) { return std::string(trim_view(s)); }

inline std::string ascii_lower(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

inline bool starts_with(std::string_view v, std::string_view prefix) {
  return v.size() >= prefix.size() && v.compare(0, prefix.size(), prefix) == 0;
}

// Leading run of spaces and tabs.
inline std::string_view leading_indent(std::string_view line) {
  std::size_t i = 0;
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
  return line.substr(0, i);
}

}  // namespace rlreward::text
