#include "rlreward/evaluator.hpp"

#include <iostream>

#include "rlreward/extract.hpp"
#include "rlreward/format.hpp"
#include "rlreward/harness.hpp"
#include "rlreward/hash.hpp"
#include "rlreward/observability.hpp"
#include "rlreward/text.hpp"
#include "rlreward/worker.hpp"

namespace rlreward {

namespace {

constexpr std::string_view kNull = "null";

bool absent(std::string_view field) { return field.empty() || field == kNull; }

std::string join(const std::vector<std::string>& items, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) out.append(sep);
    out += items[i];
  }
  return out;
}

SandboxLimits limits_from(const EvaluatorConfig& cfg) {
  SandboxLimits l;
  l.interpreter = resolve_executable(cfg.interpreter);
  l.timeout_ms = cfg.timeout_seconds * 1000;
  l.memory_limit_bytes = cfg.memory_limit_mb * 1024 * 1024;
  l.cpu_time_seconds = cfg.cpu_time_limit;
  l.max_output_bytes = cfg.max_output_bytes;
  l.isolate_network = cfg.isolate_network;
  return l;
}

void check_lengths(std::size_t completions, std::size_t tests, std::size_t entry_points) {
  if (tests != completions) {
    throw UsageError(ErrorCode::length_mismatch,
                     "Length mismatch: test has " + std::to_string(tests) +
                         " items but expected " + std::to_string(completions) +
                         " (same as completions)");
  }
  if (entry_points != completions) {
    throw UsageError(ErrorCode::length_mismatch,
                     "Length mismatch: entry_point has " + std::to_string(entry_points) +
                         " items but expected " + std::to_string(completions) +
                         " (same as completions)");
  }
}

}  // namespace

double outcome_reward(const ExecutionOutcome& outcome, RewardPolicy policy) {
  if (outcome.all_passed()) return 1.0;
  if (policy == RewardPolicy::strict) return 0.0;
  if (outcome.timed_out || outcome.errored() || !outcome.marker_found || outcome.total == 0) {
    return 0.0;
  }
  return static_cast<double>(outcome.passed) / static_cast<double>(outcome.total);
}

ErrorCode precheck_sample(std::string_view test, std::string_view code,
                          std::string_view entry_point) {
  if (absent(test)) return ErrorCode::missing_test;
  if (text::trim_view(code).empty()) return ErrorCode::empty_code;
  if (absent(entry_point)) return ErrorCode::none;

  // "Solution().twoSum" -> "twoSum", "add" -> "add"
  const std::size_t dot = entry_point.rfind('.');
  const std::string_view method =
      dot == std::string_view::npos ? entry_point : entry_point.substr(dot + 1);
  if (code.find("def " + std::string(method)) == std::string_view::npos) {
    return ErrorCode::entry_point_missing;
  }
  if (entry_point.find("Solution().") != std::string_view::npos &&
      code.find("class Solution") == std::string_view::npos) {
    return ErrorCode::entry_point_missing;
  }
  return ErrorCode::none;
}

RewardEvaluator::RewardEvaluator(EvaluatorConfig config) : config_(std::move(config)) {
  const ConfigValidationResult v = validate_config(config_);
  if (!v.ok) {
    throw UsageError(ErrorCode::config_invalid, "Invalid configuration: " + join(v.errors, "; "));
  }
  for (const auto& w : v.warnings) std::cerr << "[rlreward] warning: " << w << "\n";

  limits_ = limits_from(config_);
  if (limits_.interpreter.empty()) {
    std::cerr << "[rlreward] warning: interpreter '" << config_.interpreter
              << "' not found; every execution reward will be 0.0\n";
  }
}

std::vector<double> RewardEvaluator::format_reward(
    const std::vector<Completion>& completions) const {
  return format_rewards(completions);
}

SampleResult RewardEvaluator::evaluate_sample(std::string_view completion, std::string_view test,
                                              std::string_view entry_point) const {
  SampleResult r;
  EvaluationEvent ev;
  ev.entry_point = std::string(entry_point);
  {
    ScopeTimer timer(ev.duration_ns);

    const std::string code = extract_code(completion);
    r.error = precheck_sample(test, code, entry_point);
    if (r.error == ErrorCode::none) {
      std::string candidate;
      candidate.reserve(kTypingPrelude.size() + code.size());
      candidate.append(kTypingPrelude).append(code);
      const std::string harness = wrap_tests(test, entry_point);

      r.sandboxed = true;
      r.outcome = run_tests(candidate, harness, limits_);
      r.reward = outcome_reward(r.outcome, config_.reward_policy);
      r.error = r.outcome.error;
      if (r.error == ErrorCode::none && !r.outcome.all_passed()) r.error = ErrorCode::tests_failed;
      r.execution_id = program_digest(candidate + "\n\n" + harness);
    }
  }

  ev.execution_id = r.execution_id;
  ev.reward = r.reward;
  ev.sandboxed = r.sandboxed;
  ev.error = r.error;
  if (r.sandboxed) {
    ev.passed = r.outcome.passed;
    ev.total = r.outcome.total;
    ev.exit_code = r.outcome.exit_code;
    ev.timed_out = r.outcome.timed_out;
    ev.sandbox_ns = r.outcome.duration_ns;
    ev.bytes_stdout = r.outcome.stdout_text.size();
    ev.bytes_stderr = r.outcome.stderr_text.size();
  }
  emit_evaluation_event(ev);
  return r;
}

std::vector<double> RewardEvaluator::execution_reward(
    const std::vector<Completion>& completions, const std::vector<std::string>& tests,
    const std::vector<std::string>& entry_points) const {
  check_lengths(completions.size(), tests.size(), entry_points.size());

  const std::vector<std::string> texts = completion_texts(completions);
  return map_indexed<double>(texts.size(), config_.num_threads, [&](std::size_t i) {
    try {
      return evaluate_sample(texts[i], tests[i], entry_points[i]).reward;
    } catch (const std::exception& e) {
      // One sample's internal failure must not take the batch down with it.
      std::cerr << "[rlreward] sample " << i << " failed: " << e.what() << "\n";
      EvaluationEvent ev;
      ev.entry_point = entry_points[i];
      ev.error = ErrorCode::internal;
      emit_evaluation_event(ev);
      return 0.0;
    }
  });
}

const RewardEvaluator& default_evaluator() {
  static const RewardEvaluator inst(EvaluatorConfig::from_env());
  return inst;
}

std::vector<double> format_reward(const std::vector<Completion>& completions) {
  return default_evaluator().format_reward(completions);
}

std::vector<double> execution_reward(const std::vector<Completion>& completions,
                                     const std::vector<std::string>& tests,
                                     const std::vector<std::string>& entry_points) {
  return default_evaluator().execution_reward(completions, tests, entry_points);
}

}  // namespace rlreward
