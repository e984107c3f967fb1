#pragma once

// rlreward/types.hpp - Core data structures for the rlreward evaluation engine.
//
// OWNERSHIP:
//   - All string members are value-owned. No borrowed references.
//   - ExecutionOutcome is produced once per sample per run and returned by value.
//     It is never persisted; the evaluator reduces it to a reward and drops it.
//
// ERROR MODEL:
//   - Per-sample failures (no code, timeout, crash, missing marker) are VALUES:
//     ExecutionOutcome::error carries an ErrorCode and the sample scores 0.0.
//   - Caller misuse (batch length mismatch, invalid configuration) is the only
//     condition surfaced as an exception (UsageError), and it is raised before
//     any sandboxed execution begins.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace rlreward {

enum class ErrorCode {
  none,
  empty_code,
  missing_test,
  entry_point_missing,
  spawn_failed,
  scratch_failed,
  timeout,
  nonzero_exit,
  marker_missing,
  tests_failed,
  config_invalid,
  length_mismatch,
  internal,
};

std::string to_string(ErrorCode code);

// Raised for caller misuse only. Never raised for a property of candidate code.
class UsageError : public std::invalid_argument {
 public:
  UsageError(ErrorCode code, const std::string& message)
      : std::invalid_argument(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// How a fully parsed test summary maps to a reward.
enum class RewardPolicy {
  strict,      // 1.0 iff every assertion passed, else 0.0
  fractional,  // passed / total
};

std::string to_string(RewardPolicy policy);
bool parse_reward_policy(const std::string& text, RewardPolicy& out);

// Result of one sandboxed run of candidate code + instrumented harness.
struct ExecutionOutcome {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};

  // Parsed from the TESTS_PASSED:<passed>/<total> marker.
  bool marker_found{false};
  std::uint64_t passed{0};
  std::uint64_t total{0};

  ErrorCode error{ErrorCode::none};
  std::string error_message;

  std::uint64_t duration_ns{0};

  bool errored() const { return error != ErrorCode::none; }
  bool all_passed() const {
    return !timed_out && !errored() && marker_found && exit_code == 0 &&
           total > 0 && passed == total;
  }
};

}  // namespace rlreward
