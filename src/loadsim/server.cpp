#include "loadsim/server.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace loadsim {

ServiceParams ServiceParams::FromScenario(const ScenarioParameters& p) {
  ServiceParams s;
  s.processing_time_ms = p.processing_time_ms;
  s.processing_time_stddev_ms = p.processing_time_stddev_ms;
  s.distribution = p.processing_distribution;
  s.min_service_time_ms = p.min_service_time_ms;
  s.network_latency_mean_ms = p.network_latency_mean_ms;
  s.network_latency_stddev_ms = p.network_latency_stddev_ms;
  s.degradation_enabled = p.cpu_degradation_enabled;
  s.degradation_threshold = p.degradation_threshold;
  s.degradation_steepness = p.degradation_steepness;
  return s;
}

double DegradationFactor(double utilization, double threshold, double steepness) {
  if (utilization <= threshold) return 1.0;
  const double excess = (std::min(utilization, 1.0) - threshold) / (1.0 - threshold);
  return std::exp(steepness * excess);
}

Server::Server(ServerId id, const HardwareConfig& hardware, const LanguageProfile& language,
               int worker_slots, double utilization_smoothing)
    : id_(id),
      hardware_(hardware),
      language_(language),
      worker_slots_(worker_slots),
      smoothing_(utilization_smoothing) {
  if (worker_slots_ < 1) throw std::runtime_error("Server: worker_slots must be >= 1");
}

double Server::average_response_time_ms() const {
  if (recent_response_ms_.empty()) return 0.0;
  return recent_sum_ms_ / static_cast<double>(recent_response_ms_.size());
}

bool Server::Accept(Request& r, double now, const ServiceParams& service, SeededRng& rng) {
  if (r.state != RequestState::Created) {
    throw std::logic_error("Server: request " + std::to_string(r.id) + " routed twice");
  }
  r.server = id_;
  r.enqueue_time = now;
  if (has_free_slot()) {
    Activate(r, now, service, rng);
    return true;
  }
  r.state = RequestState::Queued;
  queue_.push_back(r.id);
  return false;
}

void Server::Start(Request& r, double now, const ServiceParams& service, SeededRng& rng) {
  if (r.state != RequestState::Queued) {
    throw std::logic_error("Server: only queued requests can be started");
  }
  Activate(r, now, service, rng);
}

void Server::Activate(Request& r, double now, const ServiceParams& service, SeededRng& rng) {
  if (!has_free_slot()) {
    throw std::logic_error("Server " + std::to_string(id_) + ": no free worker slot");
  }

  const double mean_ms =
      hardware_.EstimateServiceMs(service.processing_time_ms / language_.efficiency_factor);
  const DurationSample sample =
      SampleDuration(service.distribution, mean_ms, service.processing_time_stddev_ms,
                     service.min_service_time_ms, rng);
  // Contention is judged on the load this request joins, not including itself.
  const double degradation =
      service.degradation_enabled
          ? DegradationFactor(utilization_, service.degradation_threshold,
                              service.degradation_steepness)
          : 1.0;
  const double network_ms = SampleNetworkLatency(service.network_latency_mean_ms,
                                                 service.network_latency_stddev_ms, rng);

  r.service_duration = sample.value * degradation / 1000.0;
  r.network_latency = network_ms / 1000.0;
  r.clamped = sample.clamped_negative;
  r.service_start_time = now;
  r.state = RequestState::Active;

  active_.insert(r.id);
  UpdateUtilization();
}

std::optional<RequestId> Server::Release(Request& r) {
  if (r.state != RequestState::Active || active_.erase(r.id) == 0) {
    throw std::logic_error("Server " + std::to_string(id_) + ": request " +
                           std::to_string(r.id) + " is not active here");
  }
  UpdateUtilization();
  RecordResponse(r);

  if (queue_.empty()) return std::nullopt;
  const RequestId next = queue_.front();
  queue_.pop_front();
  return next;
}

void Server::Abandon(Request& r) {
  auto it = std::find(queue_.begin(), queue_.end(), r.id);
  if (r.state != RequestState::Queued || it == queue_.end()) {
    throw std::logic_error("Server " + std::to_string(id_) + ": request " +
                           std::to_string(r.id) + " is not queued here");
  }
  queue_.erase(it);
  RecordResponse(r);
}

void Server::UpdateUtilization() {
  const double instant = static_cast<double>(active_.size()) / worker_slots_;
  utilization_ = smoothing_ * utilization_ + (1.0 - smoothing_) * instant;
}

void Server::RecordResponse(const Request& r) {
  const double ms = r.response_time() * 1000.0;
  recent_response_ms_.push_back(ms);
  recent_sum_ms_ += ms;
  if (recent_response_ms_.size() > kResponseWindow) {
    recent_sum_ms_ -= recent_response_ms_.front();
    recent_response_ms_.pop_front();
  }
  ++completions_;
}

}  // namespace loadsim
