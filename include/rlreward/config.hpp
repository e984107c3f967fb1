#pragma once

// rlreward/config.hpp - Evaluator configuration.
//
// EvaluatorConfig is a value type. An evaluator copies it at construction and
// never mutates it, so any number of evaluators with different settings can be
// used side by side.
//
// ENVIRONMENT (EvaluatorConfig::from_env, overlays the defaults):
//   RLREWARD_TIMEOUT_SECONDS   wall-clock budget per sample
//   RLREWARD_MEMORY_LIMIT_MB   address-space limit of the sandboxed process
//   RLREWARD_CPU_TIME_LIMIT    CPU-seconds limit of the sandboxed process
//   RLREWARD_NUM_THREADS       batch worker count
//   RLREWARD_INTERPRETER       interpreter used to run candidate programs
//   RLREWARD_REWARD_POLICY     "strict" or "fractional"

#include <cstdint>
#include <string>
#include <vector>

#include "rlreward/types.hpp"

namespace rlreward {

struct EvaluatorConfig {
  // Total real time per sample, including sleep and I/O. The process group is
  // killed when it runs out.
  std::uint64_t timeout_seconds{15};

  std::uint64_t memory_limit_mb{512};

  // CPU time (user + system). Normally lower than timeout_seconds.
  std::uint64_t cpu_time_limit{12};

  // Upper bound on concurrently running samples in one batch call.
  std::size_t num_threads{32};

  // Per-stream capture cap for the sandboxed process.
  std::size_t max_output_bytes{64 * 1024};

  // Bare names are resolved through PATH at evaluator construction.
  std::string interpreter{"python3"};

  // Best effort: needs CAP_SYS_ADMIN. Failure is not an error.
  bool isolate_network{true};

  RewardPolicy reward_policy{RewardPolicy::strict};

  static EvaluatorConfig from_env();
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const EvaluatorConfig& config);

std::string config_to_json(const EvaluatorConfig& config);

}  // namespace rlreward
