#include "rlreward/config.hpp"

#include <cstdlib>

#include "rlreward/jsonlite.hpp"

namespace rlreward {

namespace {

constexpr std::uint64_t kMinMemoryLimitMb = 64;
// Upper bounds keep the ms and byte conversions of the sandbox limits in range.
constexpr std::uint64_t kMaxSeconds = 24 * 60 * 60;
constexpr std::uint64_t kMaxMemoryLimitMb = 1024 * 1024;  // 1 TiB
constexpr std::size_t kMinOutputBytes = 64;

const char* env_value(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? v : nullptr;
}

// Unparseable values are left at the default; validate_config() reports ranges.
void overlay_u64(const char* name, std::uint64_t& field) {
  const char* v = env_value(name);
  if (!v) return;
  char* end = nullptr;
  const unsigned long long parsed = std::strtoull(v, &end, 10);
  if (end && *end == '\0') field = parsed;
}

}  // namespace

EvaluatorConfig EvaluatorConfig::from_env() {
  EvaluatorConfig cfg;
  overlay_u64("RLREWARD_TIMEOUT_SECONDS", cfg.timeout_seconds);
  overlay_u64("RLREWARD_MEMORY_LIMIT_MB", cfg.memory_limit_mb);
  overlay_u64("RLREWARD_CPU_TIME_LIMIT", cfg.cpu_time_limit);

  std::uint64_t threads = cfg.num_threads;
  overlay_u64("RLREWARD_NUM_THREADS", threads);
  cfg.num_threads = static_cast<std::size_t>(threads);

  if (const char* v = env_value("RLREWARD_INTERPRETER")) cfg.interpreter = v;
  if (const char* v = env_value("RLREWARD_REWARD_POLICY")) {
    RewardPolicy policy;
    if (parse_reward_policy(v, policy)) cfg.reward_policy = policy;
  }
  return cfg;
}

ConfigValidationResult validate_config(const EvaluatorConfig& config) {
  ConfigValidationResult r;
  if (config.timeout_seconds == 0 || config.timeout_seconds > kMaxSeconds) {
    r.errors.push_back("timeout_seconds must be between 1 and " + std::to_string(kMaxSeconds) +
                       ", got " + std::to_string(config.timeout_seconds));
  }
  if (config.memory_limit_mb < kMinMemoryLimitMb || config.memory_limit_mb > kMaxMemoryLimitMb) {
    r.errors.push_back("memory_limit_mb must be between " + std::to_string(kMinMemoryLimitMb) +
                       " and " + std::to_string(kMaxMemoryLimitMb) + ", got " +
                       std::to_string(config.memory_limit_mb));
  }
  if (config.cpu_time_limit == 0 || config.cpu_time_limit > kMaxSeconds) {
    r.errors.push_back("cpu_time_limit must be between 1 and " + std::to_string(kMaxSeconds) +
                       ", got " + std::to_string(config.cpu_time_limit));
  }
  if (config.num_threads == 0) {
    r.errors.push_back("num_threads must be at least 1");
  }
  if (config.max_output_bytes < kMinOutputBytes) {
    r.errors.push_back("max_output_bytes must be at least " + std::to_string(kMinOutputBytes));
  }
  if (config.interpreter.empty()) {
    r.errors.push_back("interpreter must not be empty");
  }
  if (config.timeout_seconds > 0 && config.timeout_seconds < config.cpu_time_limit) {
    r.warnings.push_back("timeout_seconds (" + std::to_string(config.timeout_seconds) +
                         ") is lower than cpu_time_limit (" +
                         std::to_string(config.cpu_time_limit) +
                         "); the wall-clock timeout will be hit first");
  }
  r.ok = r.errors.empty();
  return r;
}

std::string config_to_json(const EvaluatorConfig& config) {
  std::string out;
  out.reserve(256);
  out += "{\"timeout_seconds\":";
  out += std::to_string(config.timeout_seconds);
  out += ",\"memory_limit_mb\":";
  out += std::to_string(config.memory_limit_mb);
  out += ",\"cpu_time_limit\":";
  out += std::to_string(config.cpu_time_limit);
  out += ",\"num_threads\":";
  out += std::to_string(config.num_threads);
  out += ",\"max_output_bytes\":";
  out += std::to_string(config.max_output_bytes);
  out += ",\"interpreter\":\"";
  out += jsonlite::escape(config.interpreter);
  out += "\",\"isolate_network\":";
  out += config.isolate_network ? "true" : "false";
  out += ",\"reward_policy\":\"";
  out += to_string(config.reward_policy);
  out += "\"}";
  return out;
}

}  // namespace rlreward
