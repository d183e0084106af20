#pragma once

#include "loadsim/config.h"
#include "loadsim/random.h"
#include "loadsim/server.h"
#include "loadsim/types.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace loadsim {

// Chooses the server for each incoming request from the current server states.
// Only strategy-specific counters survive between calls.
class LoadBalancer {
 public:
  virtual ~LoadBalancer() = default;

  // Throws std::runtime_error when servers is empty.
  ServerId Select(const std::vector<Server>& servers, const Request& request);

  virtual BalancingStrategy strategy() const = 0;

 protected:
  virtual std::size_t Pick(const std::vector<Server>& servers, const Request& request) = 0;
};

class RoundRobinBalancer : public LoadBalancer {
 public:
  BalancingStrategy strategy() const override { return BalancingStrategy::RoundRobin; }

 protected:
  std::size_t Pick(const std::vector<Server>& servers, const Request& request) override;

 private:
  std::size_t next_ = 0;
};

// Server i takes weights[i] consecutive requests before the cycle moves on.
class WeightedRoundRobinBalancer : public LoadBalancer {
 public:
  explicit WeightedRoundRobinBalancer(std::vector<int> weights);
  BalancingStrategy strategy() const override { return BalancingStrategy::WeightedRoundRobin; }

 protected:
  std::size_t Pick(const std::vector<Server>& servers, const Request& request) override;

 private:
  int WeightOf(std::size_t i) const;

  std::vector<int> weights_;
  std::size_t current_ = 0;
  int turns_used_ = 0;
};

// Fewest in-flight + queued requests; ties go to the lowest id.
class LeastConnectionsBalancer : public LoadBalancer {
 public:
  BalancingStrategy strategy() const override { return BalancingStrategy::LeastConnections; }

 protected:
  std::size_t Pick(const std::vector<Server>& servers, const Request& request) override;
};

// Lowest rolling-average response time; a server with no history counts as 0.
class LeastResponseTimeBalancer : public LoadBalancer {
 public:
  BalancingStrategy strategy() const override { return BalancingStrategy::LeastResponseTime; }

 protected:
  std::size_t Pick(const std::vector<Server>& servers, const Request& request) override;
};

class RandomBalancer : public LoadBalancer {
 public:
  explicit RandomBalancer(SeededRng rng) : rng_(rng) {}
  BalancingStrategy strategy() const override { return BalancingStrategy::Random; }

 protected:
  std::size_t Pick(const std::vector<Server>& servers, const Request& request) override;

 private:
  SeededRng rng_;
};

// score = alpha * utilization + beta * queue_depth / max_queue_depth.
class CpuAwareBalancer : public LoadBalancer {
 public:
  static constexpr double kAlpha = 0.7;
  static constexpr double kBeta = 0.3;

  BalancingStrategy strategy() const override { return BalancingStrategy::CpuAware; }

 protected:
  std::size_t Pick(const std::vector<Server>& servers, const Request& request) override;
};

// Throws std::runtime_error for zero servers.
std::unique_ptr<LoadBalancer> MakeLoadBalancer(BalancingStrategy strategy, int num_servers,
                                               const std::vector<int>& weights, SeededRng rng);

}  // namespace loadsim
