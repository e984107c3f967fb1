#pragma once

// rlreward/jsonlite.hpp - Minimal JSON emission helpers for events and stats.
//
// Output only. Nothing in the engine parses JSON.

#include <cstdio>
#include <string>
#include <string_view>

namespace rlreward::jsonlite {

inline std::string escape(std::string_view s) {
  // Fast path: most ids and error codes need no escaping.
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return std::string(s);

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    } else {
      o += c;
    }
  }
  return o;
}

// Locale-independent fixed-point formatting.
inline std::string format_double(double d, int precision = 6) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", precision, d);
  return buf;
}

}  // namespace rlreward::jsonlite
