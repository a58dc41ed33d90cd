#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace l3merge {

// Runs fn(i) for i in [0, n) on up to `workers` threads. Workers claim the
// next index from a shared counter. After the first exception no new index is
// claimed; that exception is rethrown once every worker has joined.
template <typename Fn>
void run_indexed(std::size_t n, int workers, Fn&& fn) {
  if (n == 0) return;
  const std::size_t W =
      std::min<std::size_t>(n, static_cast<std::size_t>(std::max(1, workers)));

  std::atomic<std::size_t> idx{0};
  std::atomic<bool> stop{false};
  std::exception_ptr first_error;
  std::mutex err_mu;

  auto worker = [&]() {
    while (!stop.load(std::memory_order_relaxed)) {
      std::size_t i = idx.fetch_add(1);
      if (i >= n) break;
      try {
        fn(i);
      } catch (...) {
        std::lock_guard<std::mutex> lk(err_mu);
        if (!first_error) first_error = std::current_exception();
        stop = true;
      }
    }
  };

  if (W == 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    pool.reserve(W);
    for (std::size_t t = 0; t < W; ++t) pool.emplace_back(worker);
    for (auto& t : pool) t.join();
  }
  if (first_error) std::rethrow_exception(first_error);
}

}  // namespace l3merge
