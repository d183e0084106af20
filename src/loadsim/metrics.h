#pragma once

#include "loadsim/types.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace loadsim {

// Streaming quantile sketch over non-negative values.
// Log-spaced buckets with relative accuracy `alpha`: every estimate is within alpha * true value
// of a sample of the requested rank, and never outside the exact [min, max].
// Memory grows with the value range (log scale), not with the number of samples.
class QuantileEstimator {
 public:
  explicit QuantileEstimator(double alpha = 0.005);

  void Add(double value);
  double Quantile(double q) const;
  double P50() const { return Quantile(0.50); }
  double P95() const { return Quantile(0.95); }
  double P99() const { return Quantile(0.99); }
  double P999() const { return Quantile(0.999); }

  std::uint64_t Count() const { return count_; }
  std::size_t BucketCount() const { return buckets_.size(); }

 private:
  int BucketIndex(double value) const;
  double BucketValue(int index) const;

  double gamma_;
  double log_gamma_;
  std::map<int, std::uint64_t> buckets_;
  std::uint64_t zero_count_ = 0;
  std::uint64_t count_ = 0;
  double min_ = 0.0;
  double max_ = 0.0;
};

// Count / sum / min / max / variance accumulator.
struct RunningStats {
  std::uint64_t count = 0;
  double sum = 0.0;
  double sum_sq = 0.0;
  double min = 0.0;
  double max = 0.0;

  void Add(double v);
  double Mean() const { return count ? sum / static_cast<double>(count) : 0.0; }
  double Stddev() const;  // sample stddev, 0 below two samples
};

struct OutcomeCounts {
  std::uint64_t total = 0;
  std::uint64_t success = 0;
  std::uint64_t timed_out = 0;
  std::uint64_t error = 0;

  void Add(RequestOutcome o);
};

struct Percentiles {
  double p50 = 0.0;
  double p95 = 0.0;
  double p99 = 0.0;
  double p999 = 0.0;
};

struct ServerStats {
  ServerId server_id = 0;
  OutcomeCounts counts;
  double avg_response_ms = 0.0;
  double min_response_ms = 0.0;
  double max_response_ms = 0.0;
  Percentiles response_percentiles_ms;
  double avg_queue_wait_ms = 0.0;
  double max_queue_wait_ms = 0.0;
  double avg_utilization = 0.0;
  double max_utilization = 0.0;
  double avg_queue_depth = 0.0;
};

// One row per sampling interval; request figures cover requests finished inside the interval.
struct TimeseriesSample {
  double time = 0.0;
  std::uint64_t completions = 0;
  double mean_response_ms = 0.0;
  double mean_queue_wait_ms = 0.0;
  int queue_depth = 0;
  int in_flight = 0;
  double mean_utilization = 0.0;
};

// Final result of a run. All times are milliseconds, rates per second.
struct MetricsSnapshot {
  std::string scenario;
  double duration = 0.0;

  OutcomeCounts counts;
  std::uint64_t truncated_requests = 0;

  double avg_response_ms = 0.0;
  double min_response_ms = 0.0;
  double max_response_ms = 0.0;
  double response_stddev_ms = 0.0;
  Percentiles response_percentiles_ms;

  double avg_queue_wait_ms = 0.0;
  double min_queue_wait_ms = 0.0;
  double max_queue_wait_ms = 0.0;
  Percentiles queue_wait_percentiles_ms;

  double successful_throughput = 0.0;
  double total_throughput = 0.0;
  double success_rate = 0.0;

  double avg_server_utilization = 0.0;
  double max_server_utilization = 0.0;
  double avg_queue_depth = 0.0;
  double max_queue_depth = 0.0;

  std::vector<ServerStats> servers;
  std::vector<TimeseriesSample> timeseries;
};

// Aggregates terminal requests and periodic server samples without keeping raw samples.
class MetricsCollector {
 public:
  explicit MetricsCollector(int num_servers);

  // Exactly once per terminal request. Throws std::logic_error after Finalize().
  void Observe(const Request& r);

  // Periodic reading of one server; CloseInterval() turns the readings into a time-series row.
  void SampleServer(ServerId id, double utilization, int queue_depth, int in_flight);
  void CloseInterval(double time);

  void AddTruncated(std::uint64_t n) { truncated_ += n; }

  // Computes derived rates over `duration` seconds. Callable once.
  MetricsSnapshot Finalize(const std::string& scenario, double duration);

  std::uint64_t observed() const { return global_.counts.total; }
  bool finalized() const { return finalized_; }

 private:
  struct Accumulator {
    OutcomeCounts counts;
    RunningStats response_ms;
    RunningStats queue_wait_ms;
    QuantileEstimator response_q;
    QuantileEstimator queue_wait_q;
    RunningStats utilization;
    RunningStats queue_depth;
  };

  struct IntervalAccumulator {
    std::uint64_t completions = 0;
    double response_sum_ms = 0.0;
    double queue_wait_sum_ms = 0.0;
    int queue_depth = 0;
    int in_flight = 0;
    double utilization_sum = 0.0;
    int samples = 0;
  };

  static Percentiles PercentilesOf(const QuantileEstimator& q);

  Accumulator global_;
  std::vector<Accumulator> per_server_;
  IntervalAccumulator interval_;
  std::vector<TimeseriesSample> timeseries_;
  std::uint64_t truncated_ = 0;
  bool finalized_ = false;
};

}  // namespace loadsim
