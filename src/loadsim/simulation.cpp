#include "loadsim/simulation.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace loadsim {

namespace {

// Stream ids for SeededRng::Fork, one per component drawing randomness.
constexpr std::uint64_t kTrafficStream = 1;
constexpr std::uint64_t kServiceStream = 2;
constexpr std::uint64_t kBalancerStream = 3;

const ScenarioParameters& Validated(const ScenarioParameters& p) {
  ValidateScenario(p);
  return p;
}

}  // namespace

Simulation::Simulation(const ScenarioParameters& params, RunOptions options)
    : params_(Validated(params)),
      options_(std::move(options)),
      service_(ServiceParams::FromScenario(params_)),
      traffic_rng_(SeededRng(params_.seed).Fork(kTrafficStream)),
      service_rng_(SeededRng(params_.seed).Fork(kServiceStream)),
      balancer_rng_(SeededRng(params_.seed).Fork(kBalancerStream)),
      traffic_(MakeTrafficGenerator(params_.traffic, traffic_rng_)),
      balancer_(MakeLoadBalancer(params_.strategy, params_.num_servers, params_.server_weights,
                                 balancer_rng_)),
      metrics_(params_.num_servers) {
  servers_.reserve(static_cast<std::size_t>(params_.num_servers));
  for (int i = 0; i < params_.num_servers; ++i) {
    servers_.emplace_back(static_cast<ServerId>(i), params_.hardware, params_.language,
                          params_.EffectiveWorkerSlots(), params_.utilization_smoothing);
  }
  progress_step_ = params_.duration / std::max(1, options_.progress_steps);
  next_progress_ = progress_step_;
}

MetricsSnapshot Simulation::Run() {
  if (ran_) throw std::logic_error("Simulation::Run called twice");
  ran_ = true;

  const double first = traffic_->NextArrival(0.0);
  if (first < params_.duration) events_.Schedule(first, EventKind::Arrival, next_request_id_);
  events_.Schedule(params_.sample_interval, EventKind::Sample);

  const double until = params_.stop_time ? *params_.stop_time : kNever;
  events_.Run(until, [this](const Event& ev) { Dispatch(ev); });

  // Anything still open was cut off by stop_time and is left out of the metrics.
  metrics_.AddTruncated(unfinished_);
  if (options_.progress) options_.progress(std::min(events_.Now(), params_.duration),
                                           params_.duration);
  return metrics_.Finalize(params_.name, params_.duration);
}

void Simulation::Dispatch(const Event& ev) {
  switch (ev.kind) {
    case EventKind::Arrival: OnArrival(ev); break;
    case EventKind::ServiceStart: OnServiceStart(ev); break;
    case EventKind::Timeout: OnTimeout(ev); break;
    case EventKind::ServiceComplete: OnServiceComplete(ev); break;
    case EventKind::Sample: OnSample(ev); break;
  }

  if (options_.trace) {
    ServerId server = kNoServer;
    RequestOutcome outcome = RequestOutcome::Pending;
    auto it = requests_.find(ev.request_id);
    if (ev.kind != EventKind::Sample && it != requests_.end()) {
      server = it->second.req.server;
      outcome = it->second.req.outcome;
    }
    options_.trace->Emit(ev, server, outcome);
  }
  if (ev.kind != EventKind::Sample) Retire(ev.request_id);
  ReportProgress(ev.time);
}

void Simulation::ScheduleFor(LiveRequest& lr, double time, EventKind kind) {
  events_.Schedule(time, kind, lr.req.id);
  ++lr.pending_events;
}

void Simulation::OnArrival(const Event& ev) {
  const double now = events_.Now();
  if (ev.request_id != next_request_id_) {
    throw std::logic_error("Simulation: arrival for unexpected request id " +
                           std::to_string(ev.request_id));
  }

  auto [it, inserted] = requests_.emplace(ev.request_id, LiveRequest{});
  if (!inserted) throw std::logic_error("Simulation: duplicate request id");
  LiveRequest& lr = it->second;
  lr.req.id = ev.request_id;
  lr.req.arrival_time = now;
  ++next_request_id_;
  ++arrivals_;
  ++unfinished_;

  const double next = traffic_->NextArrival(now);
  if (next < params_.duration) events_.Schedule(next, EventKind::Arrival, next_request_id_);

  const ServerId sid = balancer_->Select(servers_, lr.req);
  Server& server = servers_[sid];
  const bool active = server.Accept(lr.req, now, service_, service_rng_);
  if (params_.request_timeout_ms > 0.0) {
    ScheduleFor(lr, lr.req.enqueue_time + params_.request_timeout_ms / 1000.0,
                EventKind::Timeout);
  }
  if (active) Activated(lr);
}

void Simulation::Activated(LiveRequest& lr) {
  ScheduleFor(lr, events_.Now() + lr.req.network_latency, EventKind::ServiceStart);
}

void Simulation::OnServiceStart(const Event& ev) {
  LiveRequest& lr = Lookup(ev.request_id);
  --lr.pending_events;
  // Timed out while the request was still on the wire.
  if (IsTerminal(lr.req.outcome)) return;
  ScheduleFor(lr, events_.Now() + lr.req.service_duration, EventKind::ServiceComplete);
}

void Simulation::OnServiceComplete(const Event& ev) {
  LiveRequest& lr = Lookup(ev.request_id);
  --lr.pending_events;
  if (IsTerminal(lr.req.outcome)) return;

  Server& server = servers_[lr.req.server];
  lr.req.completion_time = events_.Now();
  const std::optional<RequestId> next = server.Release(lr.req);
  lr.req.state = RequestState::Completed;
  Finish(lr, lr.req.clamped ? RequestOutcome::Error : RequestOutcome::Success);
  StartNext(server, next);
}

void Simulation::OnTimeout(const Event& ev) {
  LiveRequest& lr = Lookup(ev.request_id);
  --lr.pending_events;
  if (IsTerminal(lr.req.outcome)) return;

  Server& server = servers_[lr.req.server];
  lr.req.completion_time = events_.Now();
  std::optional<RequestId> next;
  if (lr.req.state == RequestState::Queued) {
    server.Abandon(lr.req);
  } else if (lr.req.state == RequestState::Active) {
    next = server.Release(lr.req);
  } else {
    throw std::logic_error("Simulation: timeout for request " + std::to_string(lr.req.id) +
                           " in unexpected state");
  }
  lr.req.state = RequestState::TimedOut;
  Finish(lr, RequestOutcome::TimedOut);
  StartNext(server, next);
}

void Simulation::OnSample(const Event& ev) {
  for (const Server& s : servers_) {
    metrics_.SampleServer(s.id(), s.utilization(), s.queue_depth(), s.in_flight());
  }
  metrics_.CloseInterval(ev.time);
  ++samples_taken_;

  const double next = static_cast<double>(samples_taken_ + 1) * params_.sample_interval;
  if (next <= params_.duration || unfinished_ > 0) {
    events_.Schedule(next, EventKind::Sample);
  }
}

void Simulation::StartNext(Server& server, std::optional<RequestId> next) {
  if (!next) return;
  LiveRequest& lr = Lookup(*next);
  server.Start(lr.req, events_.Now(), service_, service_rng_);
  Activated(lr);
}

void Simulation::Finish(LiveRequest& lr, RequestOutcome outcome) {
  if (IsTerminal(lr.req.outcome)) {
    throw std::logic_error("Simulation: request " + std::to_string(lr.req.id) +
                           " finished twice");
  }
  lr.req.outcome = outcome;
  --unfinished_;
  metrics_.Observe(lr.req);
}

void Simulation::Retire(RequestId id) {
  auto it = requests_.find(id);
  if (it == requests_.end()) return;
  if (IsTerminal(it->second.req.outcome) && it->second.pending_events == 0) requests_.erase(it);
}

Simulation::LiveRequest& Simulation::Lookup(RequestId id) {
  auto it = requests_.find(id);
  if (it == requests_.end()) {
    throw std::logic_error("Simulation: event for retired request " + std::to_string(id));
  }
  return it->second;
}

void Simulation::ReportProgress(double now) {
  const int steps = std::max(1, options_.progress_steps);
  if (!options_.progress || progress_reports_ >= steps || now < next_progress_) return;
  options_.progress(std::min(now, params_.duration), params_.duration);
  while (progress_reports_ < steps && next_progress_ <= now) {
    ++progress_reports_;
    next_progress_ = (progress_reports_ + 1) * progress_step_;
  }
}

MetricsSnapshot Run(const ScenarioParameters& params, const RunOptions& options) {
  Simulation sim(params, options);
  return sim.Run();
}

}  // namespace loadsim
