#include "rlreward/worker.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>

namespace rlreward {

void run_indexed(std::size_t count, std::size_t workers,
                 const std::function<void(std::size_t)>& job) {
  if (count == 0) return;
  const std::size_t n_workers = std::max<std::size_t>(1, std::min(workers, count));

  std::atomic<std::size_t> next_job{0};
  std::exception_ptr first_error;
  std::mutex error_mu;

  auto worker_loop = [&]() {
    for (;;) {
      const std::size_t idx = next_job.fetch_add(1);
      if (idx >= count) break;
      try {
        job(idx);
      } catch (...) {
        std::lock_guard<std::mutex> lk(error_mu);
        if (!first_error) first_error = std::current_exception();
      }
    }
  };

  // The calling thread is one of the workers.
  std::vector<std::thread> threads;
  threads.reserve(n_workers - 1);
  for (std::size_t w = 1; w < n_workers; ++w) {
    try {
      threads.emplace_back(worker_loop);
    } catch (const std::system_error& e) {
      std::cerr << "[rlreward] worker pool: started " << threads.size() + 1 << " of "
                << n_workers << " workers: " << e.what() << "\n";
      break;
    }
  }
  worker_loop();
  for (auto& t : threads) t.join();

  if (first_error) std::rethrow_exception(first_error);
}

}  // namespace rlreward
