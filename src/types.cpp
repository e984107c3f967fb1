#include "rlreward/types.hpp"

namespace rlreward {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::empty_code: return "empty_code";
    case ErrorCode::missing_test: return "missing_test";
    case ErrorCode::entry_point_missing: return "entry_point_missing";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::scratch_failed: return "scratch_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::nonzero_exit: return "nonzero_exit";
    case ErrorCode::marker_missing: return "marker_missing";
    case ErrorCode::tests_failed: return "tests_failed";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::length_mismatch: return "length_mismatch";
    case ErrorCode::internal: return "internal";
  }
  return "";
}

std::string to_string(RewardPolicy policy) {
  switch (policy) {
    case RewardPolicy::strict: return "strict";
    case RewardPolicy::fractional: return "fractional";
  }
  return "";
}

bool parse_reward_policy(const std::string& text, RewardPolicy& out) {
  if (text == "strict") {
    out = RewardPolicy::strict;
    return true;
  }
  if (text == "fractional") {
    out = RewardPolicy::fractional;
    return true;
  }
  return false;
}

}  // namespace rlreward
