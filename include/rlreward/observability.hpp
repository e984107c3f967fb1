#pragma once

// rlreward/observability.hpp - Structured evaluation observability layer.
//
// DESIGN:
//   EvaluationEvent is the observable unit. Every scored sample emits exactly
//   one event, which is:
//     - always folded into the global EngineStats;
//     - handed to a registered hook, if any (embedding trainers);
//     - otherwise appended as one JSON line to $RLREWARD_EVENT_LOG, if set.
//   Emission never throws and never waits on another sample's run.
//
//   Events carry digests and counters only. Candidate stdout/stderr content is
//   never logged.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "rlreward/types.hpp"

namespace rlreward {

struct EvaluationEvent {
  std::string execution_id;  // program digest; empty when no run was needed
  std::string entry_point;

  double reward{0.0};
  std::uint64_t passed{0};
  std::uint64_t total{0};

  int exit_code{0};
  bool timed_out{false};
  bool sandboxed{false};  // false when a pre-check scored the sample
  ErrorCode error{ErrorCode::none};

  std::uint64_t duration_ns{0};  // whole evaluation of the sample
  std::uint64_t sandbox_ns{0};   // spawn -> reap
  std::size_t bytes_stdout{0};
  std::size_t bytes_stderr{0};
};

std::string event_to_json(const EvaluationEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0]. 0.0 when empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats - aggregated statistics, thread-safe
// ---------------------------------------------------------------------------
class EngineStats {
 public:
  static constexpr std::size_t kErrorCodes = static_cast<std::size_t>(ErrorCode::internal) + 1;
  static constexpr std::size_t kMaxRecentEvents = 256;

  void record(const EvaluationEvent& ev);
  std::string to_json() const;

  std::uint64_t failures(ErrorCode code) const;
  std::vector<EvaluationEvent> recent_events_snapshot() const;

  alignas(64) std::atomic<std::uint64_t> total_evaluations{0};
  alignas(64) std::atomic<std::uint64_t> rewarded_evaluations{0};  // reward > 0
  alignas(64) std::atomic<std::uint64_t> sandbox_runs{0};
  alignas(64) std::atomic<std::uint64_t> timeouts{0};

  LatencyHistogram latency_histogram;  // sandbox_ns of sandboxed samples

 private:
  std::array<std::atomic<std::uint64_t>, kErrorCodes> failures_{};

  // Circular buffer; ring_head_ is the next slot to overwrite once full.
  mutable std::mutex ring_mu_;
  std::vector<EvaluationEvent> ring_buffer_;
  std::size_t ring_head_{0};
};

EngineStats& global_engine_stats();

void emit_evaluation_event(const EvaluationEvent& ev);

using EvaluationEventHook = void (*)(const EvaluationEvent&);
void set_evaluation_event_hook(EvaluationEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace rlreward
