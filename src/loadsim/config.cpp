#include "loadsim/config.h"

#include <sstream>
#include <stdexcept>

namespace loadsim {

namespace {

constexpr double kMinDuration = 0.01;
constexpr double kMaxDuration = 86'400.0;
constexpr int kMinServers = 1;
constexpr int kMaxServers = 1000;
constexpr double kMaxRequestRate = 100'000.0;
constexpr double kMinTimeoutMs = 100.0;
constexpr double kMaxTimeoutMs = 3'600'000.0;

HardwareConfig MakeHardware(const char* name, double ghz, int mem_gb, double io_ms, double power,
                            int cores) {
  HardwareConfig h;
  h.name = name;
  h.cpu_speed_ghz = ghz;
  h.memory_gb = mem_gb;
  h.io_latency_ms = io_ms;
  h.processing_power = power;
  h.num_cores = cores;
  return h;
}

LanguageProfile MakeLanguage(const char* name, double efficiency, double mem_mb,
                             double startup_ms) {
  LanguageProfile l;
  l.name = name;
  l.efficiency_factor = efficiency;
  l.memory_overhead_mb = mem_mb;
  l.startup_time_ms = startup_ms;
  return l;
}

ScenarioParameters Base(const char* name, double duration) {
  ScenarioParameters p;
  p.name = name;
  p.duration = duration;
  p.hardware = *HardwarePreset("standard");
  p.language = *LanguagePreset("python");
  return p;
}

}  // namespace

std::optional<HardwareConfig> HardwarePreset(std::string_view name) {
  if (name == "entry_level") return MakeHardware("entry_level", 2.0, 4, 2.0, 1.5, 4);
  if (name == "standard") return MakeHardware("standard", 2.4, 8, 1.0, 5.0, 8);
  if (name == "high_performance") return MakeHardware("high_performance", 3.5, 16, 0.4, 12.5, 16);
  if (name == "enterprise") return MakeHardware("enterprise", 4.0, 32, 0.2, 30.0, 32);
  return std::nullopt;
}

std::vector<std::string> HardwarePresetNames() {
  return {"entry_level", "standard", "high_performance", "enterprise"};
}

std::optional<LanguageProfile> LanguagePreset(std::string_view name) {
  if (name == "python") return MakeLanguage("Python", 2.0, 150, 450);
  if (name == "nodejs") return MakeLanguage("Node.js", 4.0, 120, 300);
  if (name == "java") return MakeLanguage("Java", 8.0, 220, 800);
  if (name == "go") return MakeLanguage("Go", 15.0, 70, 150);
  if (name == "rust") return MakeLanguage("Rust", 22.0, 50, 80);
  if (name == "dotnet") return MakeLanguage(".NET", 7.0, 180, 600);
  return std::nullopt;
}

std::vector<std::string> LanguagePresetNames() {
  return {"python", "nodejs", "java", "go", "rust", "dotnet"};
}

const char* ToString(TrafficPattern p) {
  switch (p) {
    case TrafficPattern::Poisson: return "poisson";
    case TrafficPattern::Constant: return "constant";
    case TrafficPattern::Periodic: return "periodic";
    case TrafficPattern::Wave: return "wave";
    case TrafficPattern::Bursty: return "bursty";
    case TrafficPattern::ExponentialBurst: return "exponential_burst";
  }
  return "unknown";
}

const char* ToString(WaveType w) {
  return w == WaveType::Square ? "square" : "sine";
}

const char* ToString(BalancingStrategy s) {
  switch (s) {
    case BalancingStrategy::RoundRobin: return "round_robin";
    case BalancingStrategy::WeightedRoundRobin: return "weighted_round_robin";
    case BalancingStrategy::LeastConnections: return "least_connections";
    case BalancingStrategy::LeastResponseTime: return "least_response_time";
    case BalancingStrategy::Random: return "random";
    case BalancingStrategy::CpuAware: return "cpu_aware";
  }
  return "unknown";
}

std::optional<TrafficPattern> ParseTrafficPattern(std::string_view s) {
  if (s == "poisson") return TrafficPattern::Poisson;
  if (s == "constant") return TrafficPattern::Constant;
  if (s == "periodic") return TrafficPattern::Periodic;
  if (s == "wave") return TrafficPattern::Wave;
  if (s == "bursty") return TrafficPattern::Bursty;
  if (s == "exponential_burst") return TrafficPattern::ExponentialBurst;
  return std::nullopt;
}

std::optional<WaveType> ParseWaveType(std::string_view s) {
  if (s == "sine") return WaveType::Sine;
  if (s == "square") return WaveType::Square;
  return std::nullopt;
}

std::optional<BalancingStrategy> ParseBalancingStrategy(std::string_view s) {
  if (s == "round_robin") return BalancingStrategy::RoundRobin;
  if (s == "weighted_round_robin") return BalancingStrategy::WeightedRoundRobin;
  if (s == "least_connections") return BalancingStrategy::LeastConnections;
  if (s == "least_response_time") return BalancingStrategy::LeastResponseTime;
  if (s == "random") return BalancingStrategy::Random;
  if (s == "cpu_aware") return BalancingStrategy::CpuAware;
  return std::nullopt;
}

void ValidateScenario(const ScenarioParameters& p) {
  std::vector<std::string> errors;
  auto check = [&](bool ok, const std::string& msg) {
    if (!ok) errors.push_back(msg);
  };
  auto num = [](double v) {
    std::ostringstream os;
    os << v;
    return os.str();
  };

  check(!p.name.empty(), "scenario name must be non-empty");
  check(p.duration >= kMinDuration && p.duration <= kMaxDuration,
        "duration must be in [" + num(kMinDuration) + ", " + num(kMaxDuration) + "] s (got " +
            num(p.duration) + ")");
  check(p.num_servers >= kMinServers && p.num_servers <= kMaxServers,
        "num_servers must be in [" + std::to_string(kMinServers) + ", " +
            std::to_string(kMaxServers) + "] (got " + std::to_string(p.num_servers) + ")");
  check(p.worker_slots >= 0, "worker_slots must be >= 0");
  check(p.EffectiveWorkerSlots() >= 1, "servers need at least one worker slot");

  check(p.hardware.processing_power > 0.0, "hardware.processing_power must be > 0");
  check(p.hardware.io_latency_ms >= 0.0, "hardware.io_latency_ms must be >= 0");
  check(p.language.efficiency_factor > 0.0, "language.efficiency_factor must be > 0");

  const TrafficParams& t = p.traffic;
  check(t.base_rate >= 0.0 && t.base_rate <= kMaxRequestRate,
        "traffic.base_rate must be in [0, " + num(kMaxRequestRate) + "] (got " +
            num(t.base_rate) + ")");
  if (t.pattern == TrafficPattern::Periodic) {
    check(t.period > 0.0, "traffic.period must be > 0");
    check(t.amplitude >= 0.0, "traffic.amplitude must be >= 0");
  }
  if (t.pattern == TrafficPattern::Wave) {
    check(t.wave_period > 0.0, "traffic.wave_period must be > 0");
    check(t.amplitude_factor >= 0.0, "traffic.amplitude_factor must be >= 0");
  }
  if (t.pattern == TrafficPattern::Bursty) {
    check(t.burst_size_mean > 0.0, "traffic.burst_size_mean must be > 0");
    check(t.burst_interval > 0.0, "traffic.burst_interval must be > 0");
  }
  if (t.pattern == TrafficPattern::ExponentialBurst) {
    check(t.burst_rate >= 0.0, "traffic.burst_rate must be >= 0");
    check(t.mean_burst_size > 0.0, "traffic.mean_burst_size must be > 0");
  }
  check(t.burst_spacing >= 0.0, "traffic.burst_spacing must be >= 0");
  for (const auto& s : t.spikes) {
    check(s.start_time >= 0.0, "spike start_time must be >= 0");
    check(s.duration > 0.0, "spike duration must be > 0");
    check(s.intensity_multiplier > 0.0, "spike intensity_multiplier must be > 0");
  }

  if (!p.server_weights.empty()) {
    check(static_cast<int>(p.server_weights.size()) == p.num_servers,
          "server_weights must have one entry per server");
    for (int w : p.server_weights) check(w >= 1, "server weights must be >= 1");
  }

  check(p.processing_time_ms > 0.0,
        "processing_time_ms must be positive (got " + num(p.processing_time_ms) + ")");
  check(p.processing_time_stddev_ms >= 0.0, "processing_time_stddev_ms must be >= 0");
  check(p.min_service_time_ms >= 0.0, "min_service_time_ms must be >= 0");
  check(p.network_latency_mean_ms >= 0.0, "network_latency_mean_ms must be >= 0");
  check(p.network_latency_stddev_ms >= 0.0, "network_latency_stddev_ms must be >= 0");
  check(p.request_timeout_ms <= 0.0 ||
            (p.request_timeout_ms >= kMinTimeoutMs && p.request_timeout_ms <= kMaxTimeoutMs),
        "request_timeout_ms must be 0 (disabled) or in [" + num(kMinTimeoutMs) + ", " +
            num(kMaxTimeoutMs) + "] (got " + num(p.request_timeout_ms) + ")");
  check(p.degradation_threshold >= 0.0 && p.degradation_threshold < 1.0,
        "degradation_threshold must be in [0, 1)");
  check(p.degradation_steepness >= 0.0, "degradation_steepness must be >= 0");
  check(p.utilization_smoothing >= 0.0 && p.utilization_smoothing < 1.0,
        "utilization_smoothing must be in [0, 1)");
  check(p.sample_interval > 0.0, "sample_interval must be > 0");
  if (p.stop_time) check(*p.stop_time > 0.0, "stop_time must be > 0");

  if (errors.empty()) return;
  std::string msg = "Invalid scenario parameters:";
  for (const auto& e : errors) msg += "\n  " + e;
  throw std::runtime_error(msg);
}

std::optional<ScenarioParameters> PresetScenario(std::string_view name) {
  if (name == "baseline") {
    ScenarioParameters p = Base("baseline", 600.0);
    p.traffic.pattern = TrafficPattern::Constant;
    p.traffic.base_rate = 10.0;
    return p;
  }
  if (name == "steady_state_poisson") {
    ScenarioParameters p = Base("steady_state_poisson", 1800.0);
    p.num_servers = 4;
    p.language = *LanguagePreset("nodejs");
    p.traffic.base_rate = 20.0;
    p.strategy = BalancingStrategy::LeastConnections;
    return p;
  }
  if (name == "traffic_spike") {
    ScenarioParameters p = Base("traffic_spike", 600.0);
    p.num_servers = 3;
    p.hardware = *HardwarePreset("high_performance");
    p.language = *LanguagePreset("go");
    p.traffic.base_rate = 15.0;
    p.traffic.spikes.push_back(TrafficSpike{300.0, 60.0, 5.0});
    p.strategy = BalancingStrategy::LeastConnections;
    return p;
  }
  if (name == "bursty_traffic") {
    ScenarioParameters p = Base("bursty_traffic", 1200.0);
    p.num_servers = 2;
    p.language = *LanguagePreset("java");
    p.traffic.pattern = TrafficPattern::Bursty;
    p.traffic.burst_size_mean = 8.0;
    p.traffic.burst_interval = 3.0;
    p.strategy = BalancingStrategy::LeastConnections;
    return p;
  }
  return std::nullopt;
}

std::vector<std::string> PresetScenarioNames() {
  return {"baseline", "steady_state_poisson", "traffic_spike", "bursty_traffic"};
}

std::vector<ScenarioParameters> LanguageComparison() {
  std::vector<ScenarioParameters> out;
  const char* langs[] = {"python", "nodejs", "java", "go", "rust"};
  std::uint64_t seed = 42;
  for (const char* lang : langs) {
    ScenarioParameters p = Base("language_comparison", 600.0);
    p.name += std::string("_") + lang;
    p.num_servers = 2;
    p.language = *LanguagePreset(lang);
    p.traffic.base_rate = 20.0;
    p.strategy = BalancingStrategy::LeastConnections;
    p.seed = seed++;
    out.push_back(p);
  }
  return out;
}

std::vector<ScenarioParameters> HardwareComparison() {
  std::vector<ScenarioParameters> out;
  std::uint64_t seed = 42;
  for (const auto& hw : HardwarePresetNames()) {
    ScenarioParameters p = Base("hardware_comparison", 600.0);
    p.name += "_" + hw;
    p.num_servers = 2;
    p.hardware = *HardwarePreset(hw);
    p.language = *LanguagePreset("nodejs");
    p.traffic.base_rate = 20.0;
    p.strategy = BalancingStrategy::LeastConnections;
    p.seed = seed++;
    out.push_back(p);
  }
  return out;
}

std::vector<ScenarioParameters> StrategyComparison() {
  std::vector<ScenarioParameters> out;
  const BalancingStrategy strategies[] = {
      BalancingStrategy::RoundRobin, BalancingStrategy::LeastConnections,
      BalancingStrategy::LeastResponseTime, BalancingStrategy::CpuAware};
  for (BalancingStrategy s : strategies) {
    ScenarioParameters p = Base("balancing_comparison", 600.0);
    p.name += std::string("_") + ToString(s);
    p.num_servers = 3;
    p.language = *LanguagePreset("nodejs");
    p.traffic.base_rate = 25.0;
    p.strategy = s;
    // Same seed so the traffic is identical across strategies.
    p.seed = 42;
    out.push_back(p);
  }
  return out;
}

}  // namespace loadsim
