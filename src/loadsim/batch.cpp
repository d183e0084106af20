#include "loadsim/batch.h"

#include "loadsim/simulation.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace loadsim {

std::vector<MetricsSnapshot> RunBatch(const std::vector<ScenarioParameters>& scenarios,
                                      int threads) {
  // Fail before starting any worker.
  for (const auto& p : scenarios) ValidateScenario(p);

  std::vector<MetricsSnapshot> results(scenarios.size());
  if (scenarios.empty()) return results;

  std::size_t workers = threads > 0 ? static_cast<std::size_t>(threads)
                                    : std::max(1u, std::thread::hardware_concurrency());
  workers = std::min(workers, scenarios.size());

  std::atomic<std::size_t> next{0};
  std::mutex error_mutex;
  std::exception_ptr first_error;

  auto worker = [&]() {
    for (;;) {
      const std::size_t i = next.fetch_add(1);
      if (i >= scenarios.size()) return;
      try {
        results[i] = Run(scenarios[i]);
      } catch (...) {
        std::lock_guard lock(error_mutex);
        if (!first_error) first_error = std::current_exception();
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (std::size_t t = 0; t < workers; ++t) pool.emplace_back(worker);
  for (auto& th : pool) {
    if (th.joinable()) th.join();
  }

  if (first_error) std::rethrow_exception(first_error);
  return results;
}

}  // namespace loadsim
