#pragma once

#include "loadsim/balancer.h"
#include "loadsim/config.h"
#include "loadsim/event_queue.h"
#include "loadsim/metrics.h"
#include "loadsim/random.h"
#include "loadsim/server.h"
#include "loadsim/trace.h"
#include "loadsim/traffic.h"
#include "loadsim/types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace loadsim {

// Observers of a run. Neither can change its outcome.
struct RunOptions {
  // Called with (simulated_time, duration) at most progress_steps times plus once at the end.
  std::function<void(double, double)> progress;
  int progress_steps = 100;
  TraceWriter* trace = nullptr;
};

// One scenario run: arrivals are routed by the balancer into servers, every state change goes
// through the event queue, and the collector sees each request once when it finishes.
// Arrivals stop at `duration`; in-flight work is then drained unless stop_time cuts it off.
class Simulation {
 public:
  // Throws std::runtime_error for invalid parameters.
  explicit Simulation(const ScenarioParameters& params, RunOptions options = {});

  // Single use; throws std::logic_error when called again.
  MetricsSnapshot Run();

  const ScenarioParameters& params() const { return params_; }
  const std::vector<Server>& servers() const { return servers_; }
  const EventQueue& clock() const { return events_; }
  std::uint64_t arrivals() const { return arrivals_; }
  std::uint64_t unfinished() const { return unfinished_; }

 private:
  struct LiveRequest {
    Request req;
    int pending_events = 0;  // queued events that still reference this request
  };

  void Dispatch(const Event& ev);
  void OnArrival(const Event& ev);
  void OnServiceStart(const Event& ev);
  void OnServiceComplete(const Event& ev);
  void OnTimeout(const Event& ev);
  void OnSample(const Event& ev);

  void ScheduleFor(LiveRequest& lr, double time, EventKind kind);
  // Called after a request took a worker slot.
  void Activated(LiveRequest& lr);
  void StartNext(Server& server, std::optional<RequestId> next);
  void Finish(LiveRequest& lr, RequestOutcome outcome);
  // Drops a finished request once no queued event refers to it.
  void Retire(RequestId id);
  LiveRequest& Lookup(RequestId id);
  void ReportProgress(double now);

  const ScenarioParameters params_;
  RunOptions options_;
  ServiceParams service_;

  SeededRng traffic_rng_;
  SeededRng service_rng_;
  SeededRng balancer_rng_;

  std::unique_ptr<TrafficGenerator> traffic_;
  std::unique_ptr<LoadBalancer> balancer_;
  std::vector<Server> servers_;
  MetricsCollector metrics_;
  EventQueue events_;

  std::unordered_map<RequestId, LiveRequest> requests_;
  RequestId next_request_id_ = 1;
  std::uint64_t arrivals_ = 0;
  std::uint64_t unfinished_ = 0;
  std::uint64_t samples_taken_ = 0;

  double progress_step_ = 0.0;
  double next_progress_ = 0.0;
  int progress_reports_ = 0;
  bool ran_ = false;
};

// Runs one scenario to completion. Deterministic for a given seed and parameter set.
MetricsSnapshot Run(const ScenarioParameters& params, const RunOptions& options = {});

}  // namespace loadsim
