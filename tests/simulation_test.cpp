#include "loadsim/simulation.h"

#include "loadsim/batch.h"
#include "loadsim/report.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace loadsim {
namespace {

using testutil::NeutralScenario;

std::string AllCsv(const MetricsSnapshot& m) {
  std::ostringstream os;
  WriteSummaryCsv(os, m);
  WriteServersCsv(os, m);
  WriteTimeseriesCsv(os, m);
  return os.str();
}

// A run with every source of randomness switched on.
ScenarioParameters NoisyScenario() {
  ScenarioParameters p;
  p.name = "noisy";
  p.duration = 30.0;
  p.num_servers = 3;
  p.worker_slots = 2;
  p.traffic.base_rate = 25.0;
  p.traffic.spikes.push_back(TrafficSpike{10.0, 5.0, 3.0});
  p.strategy = BalancingStrategy::Random;
  p.processing_time_ms = 2000.0;
  p.processing_time_stddev_ms = 800.0;
  p.processing_distribution = Distribution::Lognormal;
  p.network_latency_mean_ms = 5.0;
  p.network_latency_stddev_ms = 2.0;
  p.request_timeout_ms = 1000.0;
  p.seed = 1234;
  return p;
}

TEST(SimulationTest, ConstantOneRequestPerSecond) {
  ScenarioParameters p = NeutralScenario(1.0, 500.0, 10.0);
  Simulation sim(p);
  const MetricsSnapshot m = sim.Run();

  EXPECT_EQ(sim.arrivals(), 10u);
  EXPECT_EQ(sim.unfinished(), 0u);
  EXPECT_EQ(m.counts.total, 10u);
  EXPECT_EQ(m.counts.success, 10u);
  EXPECT_DOUBLE_EQ(m.avg_response_ms, 500.0);
  EXPECT_DOUBLE_EQ(m.response_percentiles_ms.p50, 500.0);
  EXPECT_DOUBLE_EQ(m.response_percentiles_ms.p99, 500.0);
  EXPECT_DOUBLE_EQ(m.avg_queue_wait_ms, 0.0);
  EXPECT_DOUBLE_EQ(m.max_queue_wait_ms, 0.0);
  EXPECT_DOUBLE_EQ(m.success_rate, 1.0);
  EXPECT_DOUBLE_EQ(m.successful_throughput, 1.0);
}

TEST(SimulationTest, OverloadedSingleSlotQueueGrows) {
  ScenarioParameters p = NeutralScenario(10.0, 200.0, 10.0);
  p.request_timeout_ms = 0.0;
  const MetricsSnapshot m = loadsim::Run(p);

  EXPECT_EQ(m.counts.total, 100u);
  EXPECT_EQ(m.counts.success, m.counts.total);
  EXPECT_GT(m.max_queue_wait_ms, 9000.0);

  double previous = -1.0;
  int intervals = 0;
  for (const auto& row : m.timeseries) {
    if (row.completions == 0) continue;
    EXPECT_GT(row.mean_queue_wait_ms, previous) << "interval ending at " << row.time;
    previous = row.mean_queue_wait_ms;
    ++intervals;
  }
  EXPECT_GE(intervals, 15);
}

TEST(SimulationTest, TimeoutsDecreaseAsLimitGrows) {
  std::uint64_t previous_timeouts = ~0ull;
  std::uint64_t previous_success = 0;
  for (double timeout_ms : {250.0, 1000.0, 3000.0, 30000.0}) {
    ScenarioParameters p = NeutralScenario(10.0, 200.0, 10.0);
    p.request_timeout_ms = timeout_ms;
    const MetricsSnapshot m = loadsim::Run(p);

    EXPECT_EQ(m.counts.success + m.counts.timed_out + m.counts.error, m.counts.total);
    EXPECT_LE(m.counts.timed_out, previous_timeouts) << "timeout " << timeout_ms;
    EXPECT_GE(m.counts.success, previous_success) << "timeout " << timeout_ms;
    previous_timeouts = m.counts.timed_out;
    previous_success = m.counts.success;
  }
  EXPECT_EQ(previous_timeouts, 0u);
}

TEST(SimulationTest, TimedOutRequestsAreCutAtTheLimit) {
  ScenarioParameters p = NeutralScenario(10.0, 200.0, 10.0);
  p.request_timeout_ms = 1000.0;
  const MetricsSnapshot m = loadsim::Run(p);
  EXPECT_GT(m.counts.timed_out, 0u);
  EXPECT_LE(m.max_response_ms, 1000.0 + 1e-6);
}

TEST(SimulationTest, TimeoutWhileOnTheWireSkipsService) {
  ScenarioParameters p = NeutralScenario(1.0, 100.0, 3.0);
  p.network_latency_mean_ms = 300.0;
  p.network_latency_stddev_ms = 0.0;
  p.request_timeout_ms = 100.0;

  std::ostringstream trace_out;
  MetricsSnapshot m;
  {
    TraceWriter trace(trace_out);
    RunOptions options;
    options.trace = &trace;
    m = loadsim::Run(p, options);
  }

  EXPECT_EQ(m.counts.total, 3u);
  EXPECT_EQ(m.counts.timed_out, 3u);
  EXPECT_NEAR(m.max_response_ms, 100.0, 1e-6);
  const std::string trace = trace_out.str();
  EXPECT_NE(trace.find("\"ev\":\"ServiceStart\""), std::string::npos);
  EXPECT_EQ(trace.find("\"ev\":\"ServiceComplete\""), std::string::npos);
  EXPECT_NE(trace.find("\"outcome\":\"timed_out\""), std::string::npos);
}

TEST(SimulationTest, TimeoutBeatsCompletionAtTheSameInstant) {
  ScenarioParameters p = NeutralScenario(1.0, 200.0, 5.0);
  p.request_timeout_ms = 200.0;
  const MetricsSnapshot m = loadsim::Run(p);

  EXPECT_EQ(m.counts.total, 5u);
  EXPECT_EQ(m.counts.timed_out, 5u);
  EXPECT_EQ(m.counts.success, 0u);
  EXPECT_NEAR(m.avg_response_ms, 200.0, 1e-6);
}

TEST(SimulationTest, BurstyTrafficArrivesInClusters) {
  ScenarioParameters p = NeutralScenario(0.0, 50.0, 20.0);
  p.hardware = testutil::NeutralHardware(16);
  p.traffic.pattern = TrafficPattern::Bursty;
  p.traffic.burst_size_mean = 5.0;
  p.traffic.burst_interval = 2.0;
  Simulation sim(p);
  const MetricsSnapshot m = sim.Run();

  EXPECT_GE(sim.arrivals(), 25u);
  EXPECT_LE(sim.arrivals(), 80u);
  EXPECT_EQ(m.counts.total, sim.arrivals());
  // Bursts start on even seconds and finish before the next sample.
  std::uint64_t in_burst_intervals = 0;
  for (const auto& row : m.timeseries) {
    const int second = static_cast<int>(row.time + 0.5);
    if (second % 2 == 1) in_burst_intervals += row.completions;
  }
  EXPECT_EQ(in_burst_intervals, m.counts.total);
}

TEST(SimulationTest, RoundRobinSplitsEvenly) {
  ScenarioParameters p = NeutralScenario(1.0, 500.0, 12.0);
  p.num_servers = 3;
  p.strategy = BalancingStrategy::RoundRobin;
  const MetricsSnapshot m = loadsim::Run(p);
  ASSERT_EQ(m.servers.size(), 3u);
  for (const auto& s : m.servers) EXPECT_EQ(s.counts.total, 4u) << "server " << s.server_id;
}

TEST(SimulationTest, WeightedRoundRobinFollowsWeights) {
  ScenarioParameters p = NeutralScenario(1.0, 100.0, 12.0);
  p.num_servers = 2;
  p.strategy = BalancingStrategy::WeightedRoundRobin;
  p.server_weights = {3, 1};
  const MetricsSnapshot m = loadsim::Run(p);
  EXPECT_EQ(m.servers[0].counts.total, 9u);
  EXPECT_EQ(m.servers[1].counts.total, 3u);
}

TEST(SimulationTest, LeastConnectionsKeepsIdleTrafficOnFirstServer) {
  ScenarioParameters p = NeutralScenario(1.0, 500.0, 10.0);
  p.num_servers = 2;
  p.strategy = BalancingStrategy::LeastConnections;
  const MetricsSnapshot m = loadsim::Run(p);
  EXPECT_EQ(m.servers[0].counts.total, 10u);
  EXPECT_EQ(m.servers[1].counts.total, 0u);
}

TEST(SimulationTest, LeastConnectionsSpreadsConcurrentLoad) {
  ScenarioParameters p = NeutralScenario(4.0, 900.0, 10.0);
  p.num_servers = 4;
  p.strategy = BalancingStrategy::LeastConnections;
  const MetricsSnapshot m = loadsim::Run(p);
  for (const auto& s : m.servers) EXPECT_EQ(s.counts.total, 10u) << "server " << s.server_id;
  EXPECT_DOUBLE_EQ(m.max_queue_wait_ms, 0.0);
}

TEST(SimulationTest, SameSeedSameOutput) {
  const ScenarioParameters p = NoisyScenario();
  EXPECT_EQ(AllCsv(loadsim::Run(p)), AllCsv(loadsim::Run(p)));

  ScenarioParameters other = p;
  other.seed = 4321;
  EXPECT_NE(AllCsv(loadsim::Run(p)), AllCsv(loadsim::Run(other)));
}

TEST(SimulationTest, ObserversDoNotChangeResults) {
  const ScenarioParameters p = NoisyScenario();
  const std::string plain = AllCsv(loadsim::Run(p));

  std::ostringstream trace_out;
  int progress_calls = 0;
  double last_time = -1.0;
  MetricsSnapshot observed;
  {
    TraceWriter trace(trace_out);
    RunOptions options;
    options.trace = &trace;
    options.progress_steps = 10;
    options.progress = [&](double t, double duration) {
      ++progress_calls;
      EXPECT_GE(t, last_time);
      EXPECT_LE(t, duration);
      last_time = t;
    };
    observed = loadsim::Run(p, options);
    EXPECT_GT(trace.emitted(), observed.counts.total);
  }

  EXPECT_EQ(AllCsv(observed), plain);
  EXPECT_LE(progress_calls, 11);
  EXPECT_GE(progress_calls, 2);
  EXPECT_DOUBLE_EQ(last_time, p.duration);
  const std::string trace = trace_out.str();
  EXPECT_EQ(trace.front(), '[');
  EXPECT_NE(trace.find("\"ev\":\"Arrival\""), std::string::npos);
  EXPECT_NE(trace.find("\"outcome\":\"success\""), std::string::npos);
}

TEST(SimulationTest, EveryArrivalEndsExactlyOnce) {
  const ScenarioParameters p = NoisyScenario();
  Simulation sim(p);
  const MetricsSnapshot m = sim.Run();
  EXPECT_EQ(m.counts.total, sim.arrivals());
  EXPECT_EQ(m.counts.success + m.counts.timed_out + m.counts.error, m.counts.total);
  EXPECT_EQ(m.truncated_requests, 0u);
  EXPECT_EQ(sim.unfinished(), 0u);
  EXPECT_GT(m.counts.timed_out, 0u);

  std::uint64_t per_server = 0;
  for (const auto& s : m.servers) per_server += s.counts.total;
  EXPECT_EQ(per_server, m.counts.total);
  for (const auto& s : sim.servers()) {
    EXPECT_EQ(s.in_flight(), 0);
    EXPECT_EQ(s.queue_depth(), 0);
  }
}

TEST(SimulationTest, NegativeServiceSampleEndsInError) {
  ScenarioParameters p = NeutralScenario(10.0, 1.0, 5.0);
  p.processing_time_stddev_ms = 100.0;
  const MetricsSnapshot m = loadsim::Run(p);
  EXPECT_GT(m.counts.error, 0u);
  EXPECT_GT(m.counts.success, 0u);
  EXPECT_EQ(m.counts.success + m.counts.timed_out + m.counts.error, m.counts.total);
  EXPECT_LT(m.success_rate, 1.0);
}

TEST(SimulationTest, StopTimeTruncatesUnfinishedWork) {
  ScenarioParameters p = NeutralScenario(20.0, 200.0, 10.0);
  p.request_timeout_ms = 0.0;
  p.stop_time = 5.0;
  Simulation sim(p);
  const MetricsSnapshot m = sim.Run();

  EXPECT_GT(m.truncated_requests, 0u);
  EXPECT_EQ(m.counts.total + m.truncated_requests, sim.arrivals());
  EXPECT_LE(sim.clock().Now(), 5.0);
}

TEST(SimulationTest, SpikeAddsTraffic) {
  ScenarioParameters base = NeutralScenario(10.0, 10.0, 60.0);
  base.traffic.pattern = TrafficPattern::Poisson;
  base.hardware = testutil::NeutralHardware(8);
  ScenarioParameters spiked = base;
  spiked.traffic.spikes.push_back(TrafficSpike{20.0, 20.0, 4.0});

  const MetricsSnapshot a = loadsim::Run(base);
  const MetricsSnapshot b = loadsim::Run(spiked);
  EXPECT_GT(b.counts.total, a.counts.total + 300);
}

TEST(SimulationTest, DegradationSlowsLoadedServers) {
  ScenarioParameters p = NeutralScenario(30.0, 200.0, 30.0);
  p.traffic.pattern = TrafficPattern::Poisson;
  p.hardware = testutil::NeutralHardware(8);
  p.request_timeout_ms = 0.0;
  const MetricsSnapshot flat = loadsim::Run(p);
  p.cpu_degradation_enabled = true;
  const MetricsSnapshot degraded = loadsim::Run(p);
  EXPECT_GT(degraded.avg_response_ms, flat.avg_response_ms);
}

TEST(SimulationTest, RejectsInvalidParametersAndReuse) {
  ScenarioParameters bad = NeutralScenario(1.0, 100.0, 10.0);
  bad.num_servers = 0;
  EXPECT_THROW(loadsim::Run(bad), std::runtime_error);

  Simulation sim(NeutralScenario(1.0, 100.0, 1.0));
  sim.Run();
  EXPECT_THROW(sim.Run(), std::logic_error);
}

TEST(SimulationTest, EmptyTrafficGivesEmptySnapshot) {
  const MetricsSnapshot m = loadsim::Run(NeutralScenario(0.0, 100.0, 5.0));
  EXPECT_EQ(m.counts.total, 0u);
  EXPECT_DOUBLE_EQ(m.avg_response_ms, 0.0);
  EXPECT_EQ(m.timeseries.size(), 5u);
}

TEST(BatchTest, MatchesSequentialRunsInOrder) {
  std::vector<ScenarioParameters> scenarios;
  for (int i = 0; i < 5; ++i) {
    ScenarioParameters p = NoisyScenario();
    p.name = "batch_" + std::to_string(i);
    p.seed = 100 + static_cast<std::uint64_t>(i);
    p.duration = 10.0;
    scenarios.push_back(p);
  }
  const auto results = RunBatch(scenarios, 3);
  ASSERT_EQ(results.size(), scenarios.size());
  for (std::size_t i = 0; i < scenarios.size(); ++i) {
    EXPECT_EQ(results[i].scenario, scenarios[i].name);
    EXPECT_EQ(AllCsv(results[i]), AllCsv(loadsim::Run(scenarios[i])));
  }
}

TEST(BatchTest, InvalidScenarioFailsTheBatch) {
  std::vector<ScenarioParameters> scenarios(2, NeutralScenario(1.0, 100.0, 5.0));
  scenarios[1].duration = 0.0;
  EXPECT_THROW(RunBatch(scenarios, 2), std::runtime_error);
  EXPECT_TRUE(RunBatch({}, 2).empty());
}

}  // namespace
}  // namespace loadsim
