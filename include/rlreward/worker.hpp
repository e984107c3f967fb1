#pragma once

// rlreward/worker.hpp - Bounded worker pool for batch evaluation.
//
// DESIGN:
//   A batch of N independent jobs is run by min(workers, N) threads that pull
//   indices from one atomic cursor in input order. Each job writes only its own
//   pre-sized result slot, addressed by its original index, so output order is
//   input order regardless of which worker finishes first. No stable sort or
//   reordering pass is needed, and no lock guards the results.
//
//   Threads live for one batch call. Nothing is shared between calls, so
//   independent evaluators never contend on a common pool.
//
// EXCEPTIONS:
//   The first exception thrown by a job is rethrown on the calling thread after
//   all workers have joined. Remaining jobs still run.

#include <cstddef>
#include <functional>
#include <vector>

namespace rlreward {

void run_indexed(std::size_t count, std::size_t workers,
                 const std::function<void(std::size_t)>& job);

template <typename T, typename Fn>
std::vector<T> map_indexed(std::size_t count, std::size_t workers, Fn&& fn) {
  std::vector<T> out(count);
  run_indexed(count, workers, [&](std::size_t i) { out[i] = fn(i); });
  return out;
}

}  // namespace rlreward
