#pragma once

#include "loadsim/config.h"
#include "loadsim/distributions.h"
#include "loadsim/random.h"
#include "loadsim/types.h"

#include <cstdint>
#include <deque>
#include <optional>
#include <unordered_set>

namespace loadsim {

// Per-request service-time model shared by all servers of a run.
struct ServiceParams {
  double processing_time_ms = 250.0;
  double processing_time_stddev_ms = 0.0;
  Distribution distribution = Distribution::Normal;
  double min_service_time_ms = 0.1;

  double network_latency_mean_ms = 0.0;
  double network_latency_stddev_ms = 0.0;

  bool degradation_enabled = true;
  double degradation_threshold = 0.5;
  double degradation_steepness = 2.0;

  static ServiceParams FromScenario(const ScenarioParameters& p);
};

// Slowdown multiplier at utilization u: 1 up to threshold, then
// exp(steepness * (u - threshold) / (1 - threshold)).
double DegradationFactor(double utilization, double threshold, double steepness);

// One request-processing server: FIFO queue in front of a fixed number of worker slots.
// Requests are referenced by id; the engine owns the Request objects.
class Server {
 public:
  static constexpr std::size_t kResponseWindow = 64;

  Server(ServerId id, const HardwareConfig& hardware, const LanguageProfile& language,
         int worker_slots, double utilization_smoothing = 0.0);

  ServerId id() const { return id_; }
  const HardwareConfig& hardware() const { return hardware_; }
  const LanguageProfile& language() const { return language_; }

  int worker_slots() const { return worker_slots_; }
  int in_flight() const { return static_cast<int>(active_.size()); }
  int queue_depth() const { return static_cast<int>(queue_.size()); }
  int load() const { return in_flight() + queue_depth(); }
  bool has_free_slot() const { return in_flight() < worker_slots_; }

  // Smoothed estimate, recomputed whenever a request enters or leaves a slot.
  double utilization() const { return utilization_; }
  // Mean response time (ms) of the last kResponseWindow terminal requests routed here, timed-out
  // ones included whether they held a slot or not; 0 before any.
  double average_response_time_ms() const;
  std::uint64_t completions() const { return completions_; }

  // Routes a new request here. Takes a slot when one is free (returns true), else queues it.
  bool Accept(Request& r, double now, const ServiceParams& service, SeededRng& rng);

  // Frees the slot of an active request and records its response time.
  // Returns the queued request that should take the slot, if any (already dequeued).
  std::optional<RequestId> Release(Request& r);

  // Moves a dequeued request into the slot Release() just freed.
  void Start(Request& r, double now, const ServiceParams& service, SeededRng& rng);

  // Drops a queued request that timed out before getting a slot and records its response time.
  void Abandon(Request& r);

 private:
  void Activate(Request& r, double now, const ServiceParams& service, SeededRng& rng);
  void UpdateUtilization();
  void RecordResponse(const Request& r);

  ServerId id_;
  HardwareConfig hardware_;
  LanguageProfile language_;
  int worker_slots_;
  double smoothing_;

  std::deque<RequestId> queue_;
  std::unordered_set<RequestId> active_;
  double utilization_ = 0.0;

  std::deque<double> recent_response_ms_;
  double recent_sum_ms_ = 0.0;
  std::uint64_t completions_ = 0;
};

}  // namespace loadsim
