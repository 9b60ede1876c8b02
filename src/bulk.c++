#include "bulk.h++"
#include <exception>
#include <mutex>
#include <thread>
#include <unordered_set>

using std::exception_ptr, std::lock_guard, std::mutex, std::thread, std::vector;

namespace Flake {
  auto generate_bulk(Generator gen, uint64_t count, uint64_t threads) -> BulkResult {
    if (threads == 0) threads = 1;
    vector<vector<uint64_t>> results(threads);
    vector<thread> workers;
    exception_ptr failure;
    mutex failure_mx;
    const auto per_thread = count / threads;
    const auto start = std::chrono::steady_clock::now();
    for (uint64_t t = 0; t < threads; t++) {
      const auto n = per_thread + (t < count % threads ? 1 : 0);
      workers.emplace_back([gen, n, &out = results[t], &failure, &failure_mx]() mutable {
        out.reserve(n);
        try {
          for (uint64_t i = 0; i < n; i++) out.push_back(gen.next());
        } catch (const std::exception& e) {
          spdlog::debug("Worker stopped after {} IDs: {}", out.size(), e.what());
          lock_guard<mutex> lock(failure_mx);
          if (!failure) failure = std::current_exception();
        }
      });
    }
    for (auto& w : workers) w.join();
    if (failure) std::rethrow_exception(failure);

    BulkResult result {
      .ids = {},
      .seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count(),
      .unique = 0
    };
    result.ids.reserve(count);
    for (const auto& r : results) result.ids.insert(result.ids.end(), r.begin(), r.end());
    result.unique = std::unordered_set<uint64_t>(result.ids.begin(), result.ids.end()).size();
    return result;
  }
}
