#pragma once

// rlreward/evaluator.hpp - Batch reward evaluation.
//
// Pipeline per sample (execution reward):
//   completion --extract_code--> candidate source
//   test program --wrap_tests--> instrumented harness
//   typing prelude + candidate + harness --run_tests--> ExecutionOutcome
//   ExecutionOutcome --outcome_reward--> reward in [0, 1]
//
// GUARANTEES:
//   - One reward per input sample, in input order, for every batch call.
//   - Samples are independent: a crash, hang or timeout in one sample changes
//     neither the reward nor the timing of another (each runs in its own
//     process, bounded by its own deadline).
//   - Per-sample failures score 0.0 and are never thrown. Only UsageError
//     (length mismatch, invalid configuration) escapes, before any run starts.
//   - An evaluator holds only its read-only configuration. Instances with
//     different timeouts can be used concurrently.
//
// Example:
//   rlreward::EvaluatorConfig cfg;
//   cfg.timeout_seconds = 20;
//   rlreward::RewardEvaluator evaluator(cfg);
//   auto format = evaluator.format_reward(completions);
//   auto exec   = evaluator.execution_reward(completions, tests, entry_points);

#include <string>
#include <string_view>
#include <vector>

#include "rlreward/completion.hpp"
#include "rlreward/config.hpp"
#include "rlreward/sandbox.hpp"
#include "rlreward/types.hpp"

namespace rlreward {

// Imports made available to every candidate program.
inline constexpr std::string_view kTypingPrelude =
    "from typing import List, Optional, Dict, Set, Tuple, Any\n\n";

struct SampleResult {
  double reward{0.0};
  bool sandboxed{false};     // false when a pre-check decided the reward
  ErrorCode error{ErrorCode::none};
  std::string execution_id;  // program digest of the sandboxed unit
  ExecutionOutcome outcome;  // meaningful only when sandboxed
};

class RewardEvaluator {
 public:
  // Throws UsageError(config_invalid) when validate_config() reports errors.
  explicit RewardEvaluator(EvaluatorConfig config = EvaluatorConfig{});

  const EvaluatorConfig& config() const { return config_; }
  const SandboxLimits& limits() const { return limits_; }

  // 1.0 for completions in <think>..</think><answer>..</answer> form, else 0.0.
  std::vector<double> format_reward(const std::vector<Completion>& completions) const;

  // Throws UsageError(length_mismatch) when the three sequences differ in length.
  std::vector<double> execution_reward(const std::vector<Completion>& completions,
                                       const std::vector<std::string>& tests,
                                       const std::vector<std::string>& entry_points) const;

  SampleResult evaluate_sample(std::string_view completion, std::string_view test,
                               std::string_view entry_point) const;

 private:
  EvaluatorConfig config_;
  SandboxLimits limits_;
};

// Reduction of one outcome to a reward under `policy`.
double outcome_reward(const ExecutionOutcome& outcome, RewardPolicy policy);

// Pre-sandbox rejection of a sample; ErrorCode::none when it must be run.
//   missing_test         test is empty or the literal "null"
//   empty_code           extracted code is blank
//   entry_point_missing  no "def <name>" for the entry point's last component,
//                        or "Solution()." entry point without "class Solution"
// An empty or "null" entry point skips the definition checks.
ErrorCode precheck_sample(std::string_view test, std::string_view code,
                          std::string_view entry_point);

// Process-wide evaluator built from EvaluatorConfig::from_env() on first use.
const RewardEvaluator& default_evaluator();

std::vector<double> format_reward(const std::vector<Completion>& completions);
std::vector<double> execution_reward(const std::vector<Completion>& completions,
                                     const std::vector<std::string>& tests,
                                     const std::vector<std::string>& entry_points);

}  // namespace rlreward
