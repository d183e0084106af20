#include "loadsim/balancer.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace loadsim {

namespace {

// Index of the minimum score; the first (lowest id) wins ties.
template <typename ScoreFn>
std::size_t ArgMin(const std::vector<Server>& servers, ScoreFn score) {
  std::size_t best = 0;
  double best_score = score(servers[0]);
  for (std::size_t i = 1; i < servers.size(); ++i) {
    const double s = score(servers[i]);
    if (s < best_score) {
      best = i;
      best_score = s;
    }
  }
  return best;
}

}  // namespace

ServerId LoadBalancer::Select(const std::vector<Server>& servers, const Request& request) {
  if (servers.empty()) {
    throw std::runtime_error("LoadBalancer: no servers to route to");
  }
  return servers[Pick(servers, request)].id();
}

std::size_t RoundRobinBalancer::Pick(const std::vector<Server>& servers, const Request&) {
  const std::size_t i = next_ % servers.size();
  next_ = (i + 1) % servers.size();
  return i;
}

WeightedRoundRobinBalancer::WeightedRoundRobinBalancer(std::vector<int> weights)
    : weights_(std::move(weights)) {
  for (int w : weights_) {
    if (w < 1) throw std::runtime_error("WeightedRoundRobinBalancer: weights must be >= 1");
  }
}

int WeightedRoundRobinBalancer::WeightOf(std::size_t i) const {
  return i < weights_.size() ? weights_[i] : 1;
}

std::size_t WeightedRoundRobinBalancer::Pick(const std::vector<Server>& servers,
                                             const Request&) {
  current_ %= servers.size();
  if (turns_used_ >= WeightOf(current_)) {
    current_ = (current_ + 1) % servers.size();
    turns_used_ = 0;
  }
  ++turns_used_;
  return current_;
}

std::size_t LeastConnectionsBalancer::Pick(const std::vector<Server>& servers, const Request&) {
  return ArgMin(servers, [](const Server& s) { return static_cast<double>(s.load()); });
}

std::size_t LeastResponseTimeBalancer::Pick(const std::vector<Server>& servers,
                                            const Request&) {
  return ArgMin(servers, [](const Server& s) { return s.average_response_time_ms(); });
}

std::size_t RandomBalancer::Pick(const std::vector<Server>& servers, const Request&) {
  return static_cast<std::size_t>(rng_.UniformIndex(servers.size()));
}

std::size_t CpuAwareBalancer::Pick(const std::vector<Server>& servers, const Request&) {
  int max_queue = 0;
  for (const auto& s : servers) max_queue = std::max(max_queue, s.queue_depth());
  return ArgMin(servers, [max_queue](const Server& s) {
    const double queue_term =
        max_queue > 0 ? static_cast<double>(s.queue_depth()) / max_queue : 0.0;
    return kAlpha * s.utilization() + kBeta * queue_term;
  });
}

std::unique_ptr<LoadBalancer> MakeLoadBalancer(BalancingStrategy strategy, int num_servers,
                                               const std::vector<int>& weights, SeededRng rng) {
  if (num_servers < 1) {
    throw std::runtime_error("MakeLoadBalancer: at least one server is required");
  }
  switch (strategy) {
    case BalancingStrategy::RoundRobin: return std::make_unique<RoundRobinBalancer>();
    case BalancingStrategy::WeightedRoundRobin:
      return std::make_unique<WeightedRoundRobinBalancer>(weights);
    case BalancingStrategy::LeastConnections:
      return std::make_unique<LeastConnectionsBalancer>();
    case BalancingStrategy::LeastResponseTime:
      return std::make_unique<LeastResponseTimeBalancer>();
    case BalancingStrategy::Random: return std::make_unique<RandomBalancer>(rng);
    case BalancingStrategy::CpuAware: return std::make_unique<CpuAwareBalancer>();
  }
  throw std::runtime_error("Unknown balancing strategy");
}

}  // namespace loadsim
