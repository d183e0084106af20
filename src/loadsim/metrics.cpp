#include "loadsim/metrics.h"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace loadsim {

namespace {

// Values at or below this are counted as exact zeros.
constexpr double kMinTrackable = 1e-9;

}  // namespace

// -----------------------------------------------------------------------------
// QuantileEstimator
// -----------------------------------------------------------------------------

QuantileEstimator::QuantileEstimator(double alpha)
    : gamma_((1.0 + alpha) / (1.0 - alpha)), log_gamma_(std::log(gamma_)) {
  if (alpha <= 0.0 || alpha >= 1.0) {
    throw std::runtime_error("QuantileEstimator: alpha must be in (0, 1)");
  }
}

int QuantileEstimator::BucketIndex(double value) const {
  return static_cast<int>(std::ceil(std::log(value) / log_gamma_));
}

double QuantileEstimator::BucketValue(int index) const {
  return 2.0 * std::pow(gamma_, index) / (gamma_ + 1.0);
}

void QuantileEstimator::Add(double value) {
  if (std::isnan(value)) return;
  value = std::max(0.0, value);
  if (count_ == 0) {
    min_ = max_ = value;
  } else {
    min_ = std::min(min_, value);
    max_ = std::max(max_, value);
  }
  ++count_;
  if (value <= kMinTrackable) {
    ++zero_count_;
  } else {
    ++buckets_[BucketIndex(value)];
  }
}

double QuantileEstimator::Quantile(double q) const {
  if (count_ == 0) return 0.0;
  // The extremes are tracked exactly.
  if (q <= 0.0) return min_;
  if (q >= 1.0) return max_;
  const double rank = q * static_cast<double>(count_ - 1);

  double estimate = max_;
  std::uint64_t seen = zero_count_;
  if (static_cast<double>(seen) > rank) {
    estimate = 0.0;
  } else {
    for (const auto& [index, n] : buckets_) {
      seen += n;
      if (static_cast<double>(seen) > rank) {
        estimate = BucketValue(index);
        break;
      }
    }
  }
  return std::min(max_, std::max(min_, estimate));
}

// -----------------------------------------------------------------------------
// Accumulators
// -----------------------------------------------------------------------------

void RunningStats::Add(double v) {
  if (count == 0) {
    min = max = v;
  } else {
    min = std::min(min, v);
    max = std::max(max, v);
  }
  ++count;
  sum += v;
  sum_sq += v * v;
}

double RunningStats::Stddev() const {
  if (count < 2) return 0.0;
  const double n = static_cast<double>(count);
  const double var = (sum_sq - sum * sum / n) / (n - 1.0);
  return var > 0.0 ? std::sqrt(var) : 0.0;
}

void OutcomeCounts::Add(RequestOutcome o) {
  switch (o) {
    case RequestOutcome::Success: ++success; break;
    case RequestOutcome::TimedOut: ++timed_out; break;
    case RequestOutcome::Error: ++error; break;
    case RequestOutcome::Pending:
      throw std::logic_error("OutcomeCounts: pending request is not terminal");
  }
  ++total;
}

// -----------------------------------------------------------------------------
// MetricsCollector
// -----------------------------------------------------------------------------

MetricsCollector::MetricsCollector(int num_servers)
    : per_server_(static_cast<std::size_t>(std::max(0, num_servers))) {}

void MetricsCollector::Observe(const Request& r) {
  if (finalized_) throw std::logic_error("MetricsCollector: Observe after Finalize");
  if (!IsTerminal(r.outcome)) {
    throw std::logic_error("MetricsCollector: request " + std::to_string(r.id) +
                           " observed before reaching a terminal outcome");
  }
  if (r.server >= per_server_.size()) {
    throw std::logic_error("MetricsCollector: request " + std::to_string(r.id) +
                           " has no valid server");
  }

  const double response_ms = r.response_time() * 1000.0;
  const double queue_ms = r.queue_wait() * 1000.0;

  for (Accumulator* acc : {&global_, &per_server_[r.server]}) {
    acc->counts.Add(r.outcome);
    acc->response_ms.Add(response_ms);
    acc->queue_wait_ms.Add(queue_ms);
    acc->response_q.Add(response_ms);
    acc->queue_wait_q.Add(queue_ms);
  }

  ++interval_.completions;
  interval_.response_sum_ms += response_ms;
  interval_.queue_wait_sum_ms += queue_ms;
}

void MetricsCollector::SampleServer(ServerId id, double utilization, int queue_depth,
                                    int in_flight) {
  if (finalized_) throw std::logic_error("MetricsCollector: SampleServer after Finalize");
  if (id >= per_server_.size()) throw std::logic_error("MetricsCollector: unknown server");
  per_server_[id].utilization.Add(utilization);
  per_server_[id].queue_depth.Add(queue_depth);
  global_.utilization.Add(utilization);
  global_.queue_depth.Add(queue_depth);

  interval_.queue_depth += queue_depth;
  interval_.in_flight += in_flight;
  interval_.utilization_sum += utilization;
  ++interval_.samples;
}

void MetricsCollector::CloseInterval(double time) {
  TimeseriesSample s;
  s.time = time;
  s.completions = interval_.completions;
  if (interval_.completions > 0) {
    const double n = static_cast<double>(interval_.completions);
    s.mean_response_ms = interval_.response_sum_ms / n;
    s.mean_queue_wait_ms = interval_.queue_wait_sum_ms / n;
  }
  s.queue_depth = interval_.queue_depth;
  s.in_flight = interval_.in_flight;
  if (interval_.samples > 0) s.mean_utilization = interval_.utilization_sum / interval_.samples;
  timeseries_.push_back(s);
  interval_ = IntervalAccumulator{};
}

Percentiles MetricsCollector::PercentilesOf(const QuantileEstimator& q) {
  Percentiles p;
  p.p50 = q.P50();
  p.p95 = q.P95();
  p.p99 = q.P99();
  p.p999 = q.P999();
  return p;
}

MetricsSnapshot MetricsCollector::Finalize(const std::string& scenario, double duration) {
  if (finalized_) throw std::logic_error("MetricsCollector: Finalize called twice");
  finalized_ = true;

  MetricsSnapshot m;
  m.scenario = scenario;
  m.duration = duration;
  m.counts = global_.counts;
  m.truncated_requests = truncated_;

  m.avg_response_ms = global_.response_ms.Mean();
  m.min_response_ms = global_.response_ms.min;
  m.max_response_ms = global_.response_ms.max;
  m.response_stddev_ms = global_.response_ms.Stddev();
  m.response_percentiles_ms = PercentilesOf(global_.response_q);

  m.avg_queue_wait_ms = global_.queue_wait_ms.Mean();
  m.min_queue_wait_ms = global_.queue_wait_ms.min;
  m.max_queue_wait_ms = global_.queue_wait_ms.max;
  m.queue_wait_percentiles_ms = PercentilesOf(global_.queue_wait_q);

  if (duration > 0.0) {
    m.successful_throughput = static_cast<double>(m.counts.success) / duration;
    m.total_throughput = static_cast<double>(m.counts.total) / duration;
  }
  if (m.counts.total > 0) {
    m.success_rate = static_cast<double>(m.counts.success) / static_cast<double>(m.counts.total);
  }

  m.avg_server_utilization = global_.utilization.Mean();
  m.max_server_utilization = global_.utilization.max;
  m.avg_queue_depth = global_.queue_depth.Mean();
  m.max_queue_depth = global_.queue_depth.max;

  m.servers.reserve(per_server_.size());
  for (std::size_t i = 0; i < per_server_.size(); ++i) {
    const Accumulator& acc = per_server_[i];
    ServerStats s;
    s.server_id = static_cast<ServerId>(i);
    s.counts = acc.counts;
    s.avg_response_ms = acc.response_ms.Mean();
    s.min_response_ms = acc.response_ms.min;
    s.max_response_ms = acc.response_ms.max;
    s.response_percentiles_ms = PercentilesOf(acc.response_q);
    s.avg_queue_wait_ms = acc.queue_wait_ms.Mean();
    s.max_queue_wait_ms = acc.queue_wait_ms.max;
    s.avg_utilization = acc.utilization.Mean();
    s.max_utilization = acc.utilization.max;
    s.avg_queue_depth = acc.queue_depth.Mean();
    m.servers.push_back(s);
  }
  m.timeseries = timeseries_;
  return m;
}

}  // namespace loadsim
