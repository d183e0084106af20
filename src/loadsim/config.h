#pragma once

#include "loadsim/distributions.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loadsim {

// Machine capability descriptor. Service time is divided by processing_power.
struct HardwareConfig {
  std::string name = "standard";
  double cpu_speed_ghz = 2.4;
  int memory_gb = 8;
  double io_latency_ms = 1.0;     // adds a quarter of itself to every request
  double processing_power = 5.0;
  int num_cores = 8;

  // Effective service time (ms) for work that takes base_ms on a reference machine.
  double EstimateServiceMs(double base_ms) const {
    return base_ms / processing_power + io_latency_ms * 0.25;
  }
};

// Runtime/language cost model. Higher efficiency_factor means faster request handling.
struct LanguageProfile {
  std::string name = "Python";
  double efficiency_factor = 2.0;
  double memory_overhead_mb = 150.0;
  double startup_time_ms = 450.0;
};

std::optional<HardwareConfig> HardwarePreset(std::string_view name);
std::optional<LanguageProfile> LanguagePreset(std::string_view name);
std::vector<std::string> HardwarePresetNames();
std::vector<std::string> LanguagePresetNames();

enum class TrafficPattern {
  Poisson,
  Constant,
  Periodic,
  Wave,
  Bursty,
  ExponentialBurst,
};

enum class WaveType { Sine, Square };

enum class BalancingStrategy {
  RoundRobin,
  WeightedRoundRobin,
  LeastConnections,
  LeastResponseTime,
  Random,
  CpuAware,
};

const char* ToString(TrafficPattern p);
const char* ToString(WaveType w);
const char* ToString(BalancingStrategy s);
std::optional<TrafficPattern> ParseTrafficPattern(std::string_view s);
std::optional<WaveType> ParseWaveType(std::string_view s);
std::optional<BalancingStrategy> ParseBalancingStrategy(std::string_view s);

// Rate multiplier active on [start_time, start_time + duration).
struct TrafficSpike {
  double start_time = 0.0;
  double duration = 0.0;
  double intensity_multiplier = 1.0;
};

struct TrafficParams {
  TrafficPattern pattern = TrafficPattern::Poisson;
  double base_rate = 10.0;  // requests/sec

  // Periodic
  double period = 3600.0;
  double amplitude = 0.5;

  // Wave
  double wave_period = 60.0;
  double amplitude_factor = 0.8;
  WaveType wave_type = WaveType::Sine;

  // Bursty
  double burst_size_mean = 5.0;
  double burst_interval = 2.0;
  // Exponential burst
  double burst_rate = 0.5;        // bursts/sec
  double mean_burst_size = 8.0;
  // Gap between arrivals of one burst.
  double burst_spacing = 0.001;

  std::vector<TrafficSpike> spikes;
};

struct ScenarioParameters {
  std::string name = "scenario";
  double duration = 60.0;  // seconds of simulated arrivals

  int num_servers = 1;
  // Concurrent requests per server; 0 means one per hardware core.
  int worker_slots = 0;
  HardwareConfig hardware;
  LanguageProfile language;

  TrafficParams traffic;

  BalancingStrategy strategy = BalancingStrategy::RoundRobin;
  std::vector<int> server_weights;  // WeightedRoundRobin only; empty = all 1

  double processing_time_ms = 250.0;
  double processing_time_stddev_ms = 0.0;
  Distribution processing_distribution = Distribution::Normal;
  double min_service_time_ms = 0.1;

  double network_latency_mean_ms = 0.0;
  double network_latency_stddev_ms = 0.0;

  double request_timeout_ms = 30'000.0;  // <= 0 disables timeouts

  bool cpu_degradation_enabled = true;
  double degradation_threshold = 0.5;
  double degradation_steepness = 2.0;
  double utilization_smoothing = 0.0;  // weight kept from the previous estimate, [0, 1)

  std::uint64_t seed = 42;
  double sample_interval = 1.0;  // seconds between utilization/queue samples

  // Hard stop for the clock; requests still pending are truncated. Unset drains all work.
  std::optional<double> stop_time;

  int EffectiveWorkerSlots() const {
    return worker_slots > 0 ? worker_slots : hardware.num_cores;
  }
};

// Throws std::runtime_error listing every violated bound.
void ValidateScenario(const ScenarioParameters& p);

// Predefined scenarios: baseline, steady_state_poisson, traffic_spike, bursty_traffic.
std::optional<ScenarioParameters> PresetScenario(std::string_view name);
std::vector<std::string> PresetScenarioNames();

// Sets of scenarios that differ in one dimension, for side-by-side runs.
std::vector<ScenarioParameters> LanguageComparison();
std::vector<ScenarioParameters> HardwareComparison();
std::vector<ScenarioParameters> StrategyComparison();

}  // namespace loadsim
