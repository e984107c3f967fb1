#include "rlreward/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "rlreward/jsonlite.hpp"

namespace rlreward {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0; one BSR/CLZ instruction.
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<EvaluationEventHook> g_event_hook{nullptr};

}  // namespace

std::string event_to_json(const EvaluationEvent& ev) {
  std::string line;
  line.reserve(320);
  line += "{\"execution_id\":\"";
  line += ev.execution_id;
  line += "\",\"entry_point\":\"";
  line += jsonlite::escape(ev.entry_point);
  line += "\",\"reward\":";
  line += jsonlite::format_double(ev.reward, 4);
  line += ",\"passed\":";
  line += std::to_string(ev.passed);
  line += ",\"total\":";
  line += std::to_string(ev.total);
  line += ",\"exit_code\":";
  line += std::to_string(ev.exit_code);
  line += ",\"timed_out\":";
  line += ev.timed_out ? "true" : "false";
  line += ",\"sandboxed\":";
  line += ev.sandboxed ? "true" : "false";
  line += ",\"error_code\":\"";
  line += to_string(ev.error);
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"sandbox_ns\":";
  line += std::to_string(ev.sandbox_ns);
  line += ",\"bytes_stdout\":";
  line += std::to_string(ev.bytes_stdout);
  line += ",\"bytes_stderr\":";
  line += std::to_string(ev.bytes_stderr);
  line += '}';
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const auto target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target && cumulative > 0) {
      // Midpoint of [2^(i-1), 2^i) us; bucket 0 reports 0.5us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  out += jsonlite::format_double(mean_us(), 2);
  out += ",\"p50_ms\":";
  out += jsonlite::format_double(percentile(0.50) / 1000.0, 3);
  out += ",\"p95_ms\":";
  out += jsonlite::format_double(percentile(0.95) / 1000.0, 3);
  out += ",\"p99_ms\":";
  out += jsonlite::format_double(percentile(0.99) / 1000.0, 3);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record(const EvaluationEvent& ev) {
  total_evaluations.fetch_add(1, std::memory_order_relaxed);
  if (ev.reward > 0.0) rewarded_evaluations.fetch_add(1, std::memory_order_relaxed);
  if (ev.sandboxed) {
    sandbox_runs.fetch_add(1, std::memory_order_relaxed);
    latency_histogram.record(ev.sandbox_ns);
  }
  if (ev.timed_out) timeouts.fetch_add(1, std::memory_order_relaxed);
  if (ev.error != ErrorCode::none) {
    failures_[static_cast<std::size_t>(ev.error)].fetch_add(1, std::memory_order_relaxed);
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::uint64_t EngineStats::failures(ErrorCode code) const {
  return failures_[static_cast<std::size_t>(code)].load(std::memory_order_relaxed);
}

std::vector<EvaluationEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  // Oldest first.
  std::vector<EvaluationEvent> out;
  out.reserve(ring_buffer_.size());
  for (std::size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(768);
  const std::uint64_t total = total_evaluations.load(std::memory_order_relaxed);
  const std::uint64_t rewarded = rewarded_evaluations.load(std::memory_order_relaxed);
  const double reward_rate =
      total > 0 ? static_cast<double>(rewarded) / static_cast<double>(total) : 0.0;

  out += "{\"total_evaluations\":";
  out += std::to_string(total);
  out += ",\"rewarded_evaluations\":";
  out += std::to_string(rewarded);
  out += ",\"reward_rate\":";
  out += jsonlite::format_double(reward_rate);
  out += ",\"sandbox_runs\":";
  out += std::to_string(sandbox_runs.load(std::memory_order_relaxed));
  out += ",\"timeouts\":";
  out += std::to_string(timeouts.load(std::memory_order_relaxed));

  out += ",\"failure_categories\":{";
  bool first = true;
  for (std::size_t i = 1; i < kErrorCodes; ++i) {
    const std::uint64_t n = failures_[i].load(std::memory_order_relaxed);
    if (n == 0) continue;
    if (!first) out += ',';
    first = false;
    out += '"';
    out += to_string(static_cast<ErrorCode>(i));
    out += "\":";
    out += std::to_string(n);
  }
  out += '}';

  out += ",\"latency\":";
  out += latency_histogram.to_json();
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

void set_evaluation_event_hook(EvaluationEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_evaluation_event(const EvaluationEvent& ev) {
  global_engine_stats().record(ev);

  if (EvaluationEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  // Activation: RLREWARD_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("RLREWARD_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';
  // Single fwrite per line; "a" mode appends atomically for short lines on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace rlreward
