#pragma once

#include "loadsim/config.h"
#include "loadsim/metrics.h"

#include <vector>

namespace loadsim {

// Runs independent scenarios on up to `threads` workers (0 = hardware concurrency).
// Results come back in input order and match single-threaded runs exactly.
// The first exception thrown by any run is rethrown after all workers join.
std::vector<MetricsSnapshot> RunBatch(const std::vector<ScenarioParameters>& scenarios,
                                      int threads = 0);

}  // namespace loadsim
