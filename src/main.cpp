#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "loadsim/batch.h"
#include "loadsim/config.h"
#include "loadsim/report.h"
#include "loadsim/simulation.h"
#include "loadsim/trace.h"

namespace fs = std::filesystem;

enum class Comparison {
  none,
  languages,
  hardware,
  strategies,
};

// Values left unset keep whatever the preset (or the defaults) say.
struct CliOptions {
  std::string scenario;
  std::optional<double> duration;
  std::optional<int> servers;
  std::optional<int> slots;
  std::optional<std::string> hardware;
  std::optional<std::string> language;
  std::optional<double> rate;
  std::optional<loadsim::TrafficPattern> pattern;
  std::optional<loadsim::BalancingStrategy> strategy;
  std::optional<double> processing_ms;
  std::optional<double> processing_stddev_ms;
  std::optional<loadsim::Distribution> distribution;
  std::optional<double> network_ms;
  std::optional<double> network_stddev_ms;
  std::optional<double> timeout_ms;
  std::optional<std::uint64_t> seed;
  std::vector<loadsim::TrafficSpike> spikes;
  bool no_degradation = false;
  std::optional<double> stop_time;

  double time_scale = 0.0;
  std::string out_dir = "out";
  loadsim::ExportFormat export_format = loadsim::ExportFormat::Json;
  bool trace = false;
  Comparison compare = Comparison::none;
  int threads = 0;
};

static std::string ToString(Comparison c) {
  switch (c) {
    case Comparison::none: return "none";
    case Comparison::languages: return "languages";
    case Comparison::hardware: return "hardware";
    case Comparison::strategies: return "strategies";
  }
  return "unknown";
}

static std::optional<Comparison> ParseComparison(std::string_view s) {
  if (s == "languages") return Comparison::languages;
  if (s == "hardware") return Comparison::hardware;
  if (s == "strategies") return Comparison::strategies;
  return std::nullopt;
}

static void PrintUsage(std::ostream& os, const char* argv0) {
  os << "Usage:\n"
     << "  " << argv0 << " [--scenario NAME] [options] [flags]\n"
     << "  " << argv0 << " --compare languages|hardware|strategies [--threads N] [--out_dir PATH]\n"
     << "      [--export_format json|csv|both]\n"
     << "\n"
     << "Options:\n"
     << "  --scenario NAME          Preset: baseline, steady_state_poisson, traffic_spike,\n"
     << "                           bursty_traffic (default: custom scenario from flags)\n"
     << "  --duration S             Seconds of simulated arrivals (default: 60)\n"
     << "  --servers N              Number of servers (default: 1)\n"
     << "  --slots N                Worker slots per server (default: hardware cores)\n"
     << "  --hardware NAME          entry_level, standard, high_performance, enterprise\n"
     << "  --language NAME          python, nodejs, java, go, rust, dotnet\n"
     << "  --rate R                 Base arrival rate in requests/sec (default: 10)\n"
     << "  --pattern NAME           poisson, constant, periodic, wave, bursty, exponential_burst\n"
     << "  --strategy NAME          round_robin, weighted_round_robin, least_connections,\n"
     << "                           least_response_time, random, cpu_aware\n"
     << "  --processing_ms MS       Base processing time (default: 250)\n"
     << "  --processing_stddev_ms MS\n"
     << "  --distribution NAME      normal, lognormal, exponential (default: normal)\n"
     << "  --network_ms MS          Mean network latency (default: 0)\n"
     << "  --network_stddev_ms MS\n"
     << "  --timeout_ms MS          Request timeout, 0 disables (default: 30000)\n"
     << "  --seed N                 RNG seed (default: 42)\n"
     << "  --spike START:DUR:MULT   Rate multiplier window, repeatable\n"
     << "  --stop_time S            Hard stop; unfinished requests are truncated\n"
     << "  --time_scale X           Wall seconds per simulated second, 0 = no pacing (default: 0)\n"
     << "  --out_dir PATH           Output directory (default: out)\n"
     << "  --export_format FMT      json, csv or both (default: json)\n"
     << "  --compare SET            Run a comparison set instead of one scenario\n"
     << "  --threads N              Workers for --compare, 0 = all cores (default: 0)\n"
     << "\n"
     << "Flags:\n"
     << "  --no_degradation         Disable CPU contention slowdown\n"
     << "  --trace                  Write every dispatched event to out_dir/trace.json\n"
     << "  -h, --help               Show this help\n";
}

static std::string RequireValue(const std::vector<std::string>& args, std::size_t i) {
  if (i + 1 >= args.size()) {
    throw std::runtime_error("Missing value for argument: " + args[i]);
  }
  return args[i + 1];
}

static int ParseInt(const std::string& s, const std::string& flag_name) {
  std::size_t idx = 0;
  int v = 0;
  try {
    v = std::stoi(s, &idx, 10);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid integer for " + flag_name + ": " + s);
  }
  if (idx != s.size()) {
    throw std::runtime_error("Invalid integer for " + flag_name + ": " + s);
  }
  return v;
}

static std::uint64_t ParseU64(const std::string& s, const std::string& flag_name) {
  std::size_t idx = 0;
  unsigned long long v = 0;
  try {
    v = std::stoull(s, &idx, 10);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid integer for " + flag_name + ": " + s);
  }
  if (idx != s.size()) {
    throw std::runtime_error("Invalid integer for " + flag_name + ": " + s);
  }
  return static_cast<std::uint64_t>(v);
}

static double ParseDouble(const std::string& s, const std::string& flag_name) {
  std::size_t idx = 0;
  double v = 0.0;
  try {
    v = std::stod(s, &idx);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid number for " + flag_name + ": " + s);
  }
  if (idx != s.size()) {
    throw std::runtime_error("Invalid number for " + flag_name + ": " + s);
  }
  return v;
}

static loadsim::TrafficSpike ParseSpike(const std::string& s) {
  const auto first = s.find(':');
  const auto second = first == std::string::npos ? first : s.find(':', first + 1);
  if (second == std::string::npos) {
    throw std::runtime_error("Invalid --spike, expected START:DURATION:MULT: " + s);
  }
  loadsim::TrafficSpike spike;
  spike.start_time = ParseDouble(s.substr(0, first), "--spike start");
  spike.duration = ParseDouble(s.substr(first + 1, second - first - 1), "--spike duration");
  spike.intensity_multiplier = ParseDouble(s.substr(second + 1), "--spike multiplier");
  return spike;
}

static void Validate(const CliOptions& o) {
  if (o.time_scale < 0.0) throw std::runtime_error("time_scale must be >= 0");
  if (o.threads < 0) throw std::runtime_error("threads must be >= 0");
  if (o.out_dir.empty()) throw std::runtime_error("out_dir must be non-empty");
  if (!o.scenario.empty() && !loadsim::PresetScenario(o.scenario)) {
    throw std::runtime_error("Unknown scenario: " + o.scenario);
  }
  if (o.hardware && !loadsim::HardwarePreset(*o.hardware)) {
    throw std::runtime_error("Unknown hardware: " + *o.hardware);
  }
  if (o.language && !loadsim::LanguagePreset(*o.language)) {
    throw std::runtime_error("Unknown language: " + *o.language);
  }
}

static CliOptions ParseArgs(int argc, char** argv) {
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) args.emplace_back(argv[i]);

  CliOptions o;
  for (std::size_t i = 1; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "-h" || a == "--help") {
      PrintUsage(std::cout, argv[0]);
      std::exit(0);
    }

    if (a == "--no_degradation") {
      o.no_degradation = true;
      continue;
    }
    if (a == "--trace") {
      o.trace = true;
      continue;
    }

    if (a == "--scenario") {
      o.scenario = RequireValue(args, i);
      ++i;
      continue;
    }
    if (a == "--duration") {
      o.duration = ParseDouble(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--servers") {
      o.servers = ParseInt(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--slots") {
      o.slots = ParseInt(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--hardware") {
      o.hardware = RequireValue(args, i);
      ++i;
      continue;
    }
    if (a == "--language") {
      o.language = RequireValue(args, i);
      ++i;
      continue;
    }
    if (a == "--rate") {
      o.rate = ParseDouble(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--pattern") {
      auto p = loadsim::ParseTrafficPattern(RequireValue(args, i));
      if (!p) throw std::runtime_error("Unknown pattern: " + RequireValue(args, i));
      o.pattern = *p;
      ++i;
      continue;
    }
    if (a == "--strategy") {
      auto s = loadsim::ParseBalancingStrategy(RequireValue(args, i));
      if (!s) throw std::runtime_error("Unknown strategy: " + RequireValue(args, i));
      o.strategy = *s;
      ++i;
      continue;
    }
    if (a == "--processing_ms") {
      o.processing_ms = ParseDouble(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--processing_stddev_ms") {
      o.processing_stddev_ms = ParseDouble(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--distribution") {
      auto d = loadsim::ParseDistribution(RequireValue(args, i));
      if (!d) throw std::runtime_error("Unknown distribution: " + RequireValue(args, i));
      o.distribution = *d;
      ++i;
      continue;
    }
    if (a == "--network_ms") {
      o.network_ms = ParseDouble(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--network_stddev_ms") {
      o.network_stddev_ms = ParseDouble(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--timeout_ms") {
      o.timeout_ms = ParseDouble(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--seed") {
      o.seed = ParseU64(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--spike") {
      o.spikes.push_back(ParseSpike(RequireValue(args, i)));
      ++i;
      continue;
    }
    if (a == "--stop_time") {
      o.stop_time = ParseDouble(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--time_scale") {
      o.time_scale = ParseDouble(RequireValue(args, i), a);
      ++i;
      continue;
    }
    if (a == "--out_dir") {
      o.out_dir = RequireValue(args, i);
      ++i;
      continue;
    }
    if (a == "--export_format") {
      auto f = loadsim::ParseExportFormat(RequireValue(args, i));
      if (!f) throw std::runtime_error("Unknown export format: " + RequireValue(args, i));
      o.export_format = *f;
      ++i;
      continue;
    }
    if (a == "--compare") {
      auto c = ParseComparison(RequireValue(args, i));
      if (!c) throw std::runtime_error("Unknown comparison: " + RequireValue(args, i));
      o.compare = *c;
      ++i;
      continue;
    }
    if (a == "--threads") {
      o.threads = ParseInt(RequireValue(args, i), a);
      ++i;
      continue;
    }

    throw std::runtime_error("Unknown argument: " + a);
  }

  Validate(o);
  return o;
}

static loadsim::ScenarioParameters BuildScenario(const CliOptions& o) {
  loadsim::ScenarioParameters p;
  if (!o.scenario.empty()) {
    p = *loadsim::PresetScenario(o.scenario);
  } else {
    p.name = "custom";
  }

  if (o.duration) p.duration = *o.duration;
  if (o.servers) p.num_servers = *o.servers;
  if (o.slots) p.worker_slots = *o.slots;
  if (o.hardware) p.hardware = *loadsim::HardwarePreset(*o.hardware);
  if (o.language) p.language = *loadsim::LanguagePreset(*o.language);
  if (o.rate) p.traffic.base_rate = *o.rate;
  if (o.pattern) p.traffic.pattern = *o.pattern;
  if (o.strategy) p.strategy = *o.strategy;
  if (o.processing_ms) p.processing_time_ms = *o.processing_ms;
  if (o.processing_stddev_ms) p.processing_time_stddev_ms = *o.processing_stddev_ms;
  if (o.distribution) p.processing_distribution = *o.distribution;
  if (o.network_ms) p.network_latency_mean_ms = *o.network_ms;
  if (o.network_stddev_ms) p.network_latency_stddev_ms = *o.network_stddev_ms;
  if (o.timeout_ms) p.request_timeout_ms = *o.timeout_ms;
  if (o.seed) p.seed = *o.seed;
  for (const auto& s : o.spikes) p.traffic.spikes.push_back(s);
  if (o.no_degradation) p.cpu_degradation_enabled = false;
  if (o.stop_time) p.stop_time = *o.stop_time;
  return p;
}

static void PrintScenario(std::ostream& os, const loadsim::ScenarioParameters& p) {
  os << "loadsim config:\n"
     << "  scenario=" << p.name << "\n"
     << "  duration=" << p.duration << "\n"
     << "  servers=" << p.num_servers << "\n"
     << "  slots=" << p.EffectiveWorkerSlots() << "\n"
     << "  hardware=" << p.hardware.name << "\n"
     << "  language=" << p.language.name << "\n"
     << "  pattern=" << loadsim::ToString(p.traffic.pattern) << "\n"
     << "  rate=" << p.traffic.base_rate << "\n"
     << "  strategy=" << loadsim::ToString(p.strategy) << "\n"
     << "  processing_ms=" << p.processing_time_ms << "\n"
     << "  distribution=" << loadsim::DistributionName(p.processing_distribution) << "\n"
     << "  timeout_ms=" << p.request_timeout_ms << "\n"
     << "  spikes=" << p.traffic.spikes.size() << "\n"
     << "  degradation=" << (p.cpu_degradation_enabled ? "true" : "false") << "\n"
     << "  seed=" << p.seed << "\n";
}

static void CreateOutDir(const std::string& out_dir) {
  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    throw std::runtime_error("Failed to create out_dir '" + out_dir + "': " + ec.message());
  }
}

// Progress bar on stderr; with time_scale > 0 also holds the run back to wall-clock pace.
static std::function<void(double, double)> MakeProgress(double time_scale) {
  const auto start = std::chrono::steady_clock::now();
  return [start, time_scale](double sim_time, double duration) {
    if (time_scale > 0.0) {
      const auto target = start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                      std::chrono::duration<double>(sim_time * time_scale));
      std::this_thread::sleep_until(target);
    }
    const int width = 40;
    const double frac = duration > 0.0 ? sim_time / duration : 1.0;
    const int filled = static_cast<int>(frac * width);
    std::cerr << "\r[" << std::string(static_cast<std::size_t>(filled), '#')
              << std::string(static_cast<std::size_t>(width - filled), ' ') << "] "
              << static_cast<int>(frac * 100.0) << "%";
    std::cerr.flush();
  };
}

static void PrintOutputs(std::ostream& os, const std::vector<std::string>& paths) {
  os << "  outputs:";
  for (std::size_t i = 0; i < paths.size(); ++i) os << (i > 0 ? ", " : " ") << paths[i];
  os << "\n";
}

static int RunScenario(const CliOptions& o) {
  const loadsim::ScenarioParameters params = BuildScenario(o);
  loadsim::ValidateScenario(params);
  CreateOutDir(o.out_dir);
  PrintScenario(std::cout, params);

  std::ofstream trace_file;
  std::unique_ptr<loadsim::TraceWriter> trace;
  if (o.trace) {
    trace_file.open(o.out_dir + "/trace.json");
    if (!trace_file) throw std::runtime_error("Failed to open " + o.out_dir + "/trace.json");
    trace = std::make_unique<loadsim::TraceWriter>(trace_file);
  }

  loadsim::RunOptions run_options;
  run_options.progress = MakeProgress(o.time_scale);
  run_options.trace = trace.get();

  const loadsim::MetricsSnapshot snapshot = loadsim::Run(params, run_options);
  std::cerr << "\n";
  trace.reset();

  std::vector<std::string> outputs =
      loadsim::WriteRunOutputs(o.out_dir, snapshot, o.export_format);
  if (o.trace) outputs.push_back(o.out_dir + "/trace.json");
  loadsim::PrintSummary(std::cout, snapshot);
  PrintOutputs(std::cout, outputs);
  return 0;
}

static int RunComparison(const CliOptions& o) {
  std::vector<loadsim::ScenarioParameters> scenarios;
  switch (o.compare) {
    case Comparison::languages: scenarios = loadsim::LanguageComparison(); break;
    case Comparison::hardware: scenarios = loadsim::HardwareComparison(); break;
    case Comparison::strategies: scenarios = loadsim::StrategyComparison(); break;
    case Comparison::none: return 0;
  }
  CreateOutDir(o.out_dir);
  std::cout << "loadsim comparison: " << ToString(o.compare) << " (" << scenarios.size()
            << " scenarios, threads=" << o.threads << ")\n";

  const auto results = loadsim::RunBatch(scenarios, o.threads);
  const auto outputs = loadsim::WriteComparisonOutputs(o.out_dir, results, o.export_format);
  loadsim::PrintComparison(std::cout, results);
  PrintOutputs(std::cout, outputs);
  return 0;
}

int main(int argc, char** argv) {
  try {
    CliOptions o = ParseArgs(argc, argv);
    if (o.compare != Comparison::none) return RunComparison(o);
    return RunScenario(o);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    PrintUsage(std::cerr, argv[0]);
    return 2;
  }
}
