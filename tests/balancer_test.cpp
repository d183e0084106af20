#include "loadsim/balancer.h"

#include "test_helpers.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace loadsim {
namespace {

using testutil::NeutralHardware;
using testutil::NeutralLanguage;

class BalancerTest : public ::testing::Test {
 protected:
  BalancerTest() : rng_(1) {
    service_.degradation_enabled = false;
    for (ServerId i = 0; i < 3; ++i) servers_.emplace_back(i, NeutralHardware(), NeutralLanguage(), 1);
  }

  // Routes n fresh requests to server `sid`.
  void Load(ServerId sid, int n) {
    for (int i = 0; i < n; ++i) {
      Request r;
      r.id = next_id_++;
      servers_[sid].Accept(r, 0.0, service_, rng_);
      held_.push_back(r);
    }
  }

  std::vector<ServerId> Route(LoadBalancer& lb, int n) {
    std::vector<ServerId> out;
    Request r;
    for (int i = 0; i < n; ++i) out.push_back(lb.Select(servers_, r));
    return out;
  }

  std::vector<Server> servers_;
  std::vector<Request> held_;
  ServiceParams service_;
  SeededRng rng_;
  RequestId next_id_ = 1;
};

TEST_F(BalancerTest, RoundRobinCycles) {
  RoundRobinBalancer lb;
  EXPECT_EQ(Route(lb, 7), (std::vector<ServerId>{0, 1, 2, 0, 1, 2, 0}));
}

TEST_F(BalancerTest, WeightedRoundRobinRepeatsByWeight) {
  WeightedRoundRobinBalancer lb({2, 1, 3});
  EXPECT_EQ(Route(lb, 12), (std::vector<ServerId>{0, 0, 1, 2, 2, 2, 0, 0, 1, 2, 2, 2}));
}

TEST_F(BalancerTest, WeightedRoundRobinRejectsBadWeights) {
  EXPECT_THROW(WeightedRoundRobinBalancer({1, 0}), std::runtime_error);
}

TEST_F(BalancerTest, LeastConnectionsPicksLowestLoad) {
  Load(0, 2);
  Load(1, 1);
  LeastConnectionsBalancer lb;
  Request r;
  EXPECT_EQ(lb.Select(servers_, r), 2u);
  Load(2, 3);
  EXPECT_EQ(lb.Select(servers_, r), 1u);
}

TEST_F(BalancerTest, LeastConnectionsBreaksTiesByLowestId) {
  Load(0, 1);
  LeastConnectionsBalancer lb;
  Request r;
  EXPECT_EQ(lb.Select(servers_, r), 1u);
}

TEST_F(BalancerTest, LeastResponseTimePrefersServerWithoutHistory) {
  Load(0, 1);
  held_[0].completion_time = 0.5;
  servers_[0].Release(held_[0]);
  LeastResponseTimeBalancer lb;
  Request r;
  EXPECT_EQ(lb.Select(servers_, r), 1u);
}

TEST_F(BalancerTest, CpuAwarePrefersIdleServer) {
  Load(0, 3);
  Load(1, 1);
  CpuAwareBalancer lb;
  Request r;
  EXPECT_EQ(lb.Select(servers_, r), 2u);
}

TEST_F(BalancerTest, RandomIsDeterministicPerSeed) {
  RandomBalancer a(SeededRng(123));
  RandomBalancer b(SeededRng(123));
  const auto picks = Route(a, 300);
  EXPECT_EQ(picks, Route(b, 300));

  std::vector<int> counts(3, 0);
  for (ServerId s : picks) ++counts[s];
  for (int c : counts) EXPECT_GT(c, 60);
}

TEST_F(BalancerTest, EmptyServerListThrows) {
  RoundRobinBalancer lb;
  std::vector<Server> none;
  Request r;
  EXPECT_THROW(lb.Select(none, r), std::runtime_error);
}

TEST(MakeLoadBalancerTest, BuildsRequestedStrategy) {
  auto lb = MakeLoadBalancer(BalancingStrategy::CpuAware, 2, {}, SeededRng(1));
  EXPECT_EQ(lb->strategy(), BalancingStrategy::CpuAware);
  EXPECT_THROW(MakeLoadBalancer(BalancingStrategy::RoundRobin, 0, {}, SeededRng(1)),
               std::runtime_error);
}

}  // namespace
}  // namespace loadsim
