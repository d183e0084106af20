#include "loadsim/traffic.h"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

namespace loadsim {
namespace {

std::vector<double> ArrivalsUntil(TrafficGenerator& gen, double end) {
  std::vector<double> out;
  double t = gen.NextArrival(0.0);
  while (t < end) {
    out.push_back(t);
    t = gen.NextArrival(t);
  }
  return out;
}

TEST(TrafficTest, ConstantIsEvenlySpacedFromZero) {
  TrafficParams p;
  p.pattern = TrafficPattern::Constant;
  p.base_rate = 4.0;
  auto gen = MakeTrafficGenerator(p, SeededRng(1));
  const auto arrivals = ArrivalsUntil(*gen, 10.0);
  ASSERT_EQ(arrivals.size(), 40u);
  EXPECT_DOUBLE_EQ(arrivals.front(), 0.0);
  for (std::size_t i = 1; i < arrivals.size(); ++i) {
    EXPECT_NEAR(arrivals[i] - arrivals[i - 1], 0.25, 1e-9);
  }
}

TEST(TrafficTest, ConstantArrivalsDoNotDrift) {
  TrafficParams p;
  p.pattern = TrafficPattern::Constant;
  p.base_rate = 10.0;
  auto gen = MakeTrafficGenerator(p, SeededRng(1));
  const auto arrivals = ArrivalsUntil(*gen, 10.0);
  ASSERT_EQ(arrivals.size(), 100u);
  for (std::size_t k = 0; k < arrivals.size(); ++k) {
    EXPECT_DOUBLE_EQ(arrivals[k], static_cast<double>(k) / 10.0);
  }
}

TEST(TrafficTest, ConstantRestartsSpacingWhenSpikeBegins) {
  TrafficParams p;
  p.pattern = TrafficPattern::Constant;
  p.base_rate = 2.0;
  p.spikes.push_back(TrafficSpike{5.0, 5.0, 2.0});
  auto gen = MakeTrafficGenerator(p, SeededRng(1));
  const auto arrivals = ArrivalsUntil(*gen, 10.0);
  // 0.5 s apart until 5 s, then 0.25 s apart from the arrival at 5 s.
  ASSERT_EQ(arrivals.size(), 30u);
  EXPECT_DOUBLE_EQ(arrivals[9], 4.5);
  EXPECT_DOUBLE_EQ(arrivals[10], 5.0);
  EXPECT_DOUBLE_EQ(arrivals[11], 5.25);
  EXPECT_DOUBLE_EQ(arrivals.back(), 9.75);
}

TEST(TrafficTest, PoissonRateIsClose) {
  TrafficParams p;
  p.base_rate = 20.0;
  auto gen = MakeTrafficGenerator(p, SeededRng(42));
  const auto arrivals = ArrivalsUntil(*gen, 500.0);
  EXPECT_NEAR(static_cast<double>(arrivals.size()) / 500.0, 20.0, 1.0);
}

TEST(TrafficTest, SameSeedGivesSameSequence) {
  TrafficParams p;
  p.pattern = TrafficPattern::Wave;
  p.base_rate = 15.0;
  auto a = MakeTrafficGenerator(p, SeededRng(99));
  auto b = MakeTrafficGenerator(p, SeededRng(99));
  EXPECT_EQ(ArrivalsUntil(*a, 60.0), ArrivalsUntil(*b, 60.0));
}

TEST(TrafficTest, ZeroRateNeverArrives) {
  TrafficParams p;
  p.base_rate = 0.0;
  auto gen = MakeTrafficGenerator(p, SeededRng(1));
  EXPECT_EQ(gen->NextArrival(0.0), kNever);
}

TEST(TrafficTest, OverlappingSpikesMultiply) {
  TrafficParams p;
  p.base_rate = 10.0;
  p.spikes.push_back(TrafficSpike{10.0, 10.0, 2.0});
  p.spikes.push_back(TrafficSpike{15.0, 10.0, 3.0});
  auto gen = MakeTrafficGenerator(p, SeededRng(1));

  EXPECT_DOUBLE_EQ(gen->RateAt(5.0), 10.0);
  EXPECT_DOUBLE_EQ(gen->RateAt(12.0), 20.0);
  EXPECT_DOUBLE_EQ(gen->RateAt(17.0), 60.0);
  EXPECT_DOUBLE_EQ(gen->RateAt(22.0), 30.0);
  // Windows are half-open.
  EXPECT_DOUBLE_EQ(gen->SpikeMultiplier(20.0), 3.0);
  EXPECT_DOUBLE_EQ(gen->SpikeMultiplier(25.0), 1.0);
}

TEST(TrafficTest, SpikeRaisesArrivalCountInsideWindow) {
  TrafficParams p;
  p.base_rate = 10.0;
  p.spikes.push_back(TrafficSpike{100.0, 100.0, 5.0});
  auto gen = MakeTrafficGenerator(p, SeededRng(7));
  const auto arrivals = ArrivalsUntil(*gen, 200.0);
  std::size_t before = 0;
  std::size_t during = 0;
  for (double t : arrivals) (t < 100.0 ? before : during)++;
  EXPECT_GT(during, 3 * before);
}

TEST(TrafficTest, PeriodicRateFollowsSine) {
  TrafficParams p;
  p.pattern = TrafficPattern::Periodic;
  p.base_rate = 10.0;
  p.period = 100.0;
  p.amplitude = 0.5;
  auto gen = MakeTrafficGenerator(p, SeededRng(1));
  EXPECT_NEAR(gen->RateAt(0.0), 10.0, 1e-9);
  EXPECT_NEAR(gen->RateAt(25.0), 15.0, 1e-9);
  EXPECT_NEAR(gen->RateAt(75.0), 5.0, 1e-9);
}

TEST(TrafficTest, SquareWaveSwitchesBetweenTwoLevels) {
  TrafficParams p;
  p.pattern = TrafficPattern::Wave;
  p.wave_type = WaveType::Square;
  p.base_rate = 10.0;
  p.wave_period = 60.0;
  p.amplitude_factor = 0.8;
  auto gen = MakeTrafficGenerator(p, SeededRng(1));
  EXPECT_NEAR(gen->RateAt(10.0), 18.0, 1e-9);
  EXPECT_NEAR(gen->RateAt(40.0), 2.0, 1e-9);
}

TEST(TrafficTest, BurstyArrivalsClusterAtBurstStarts) {
  TrafficParams p;
  p.pattern = TrafficPattern::Bursty;
  p.burst_size_mean = 5.0;
  p.burst_interval = 2.0;
  auto gen = MakeTrafficGenerator(p, SeededRng(42));
  const auto arrivals = ArrivalsUntil(*gen, 20.0);

  EXPECT_GE(arrivals.size(), 25u);
  EXPECT_LE(arrivals.size(), 80u);
  EXPECT_DOUBLE_EQ(arrivals.front(), 0.0);
  for (double t : arrivals) EXPECT_LT(std::fmod(t, 2.0), 0.1) << "arrival at " << t;

  std::size_t tight = 0;
  for (std::size_t i = 1; i < arrivals.size(); ++i) {
    if (arrivals[i] - arrivals[i - 1] < 0.01) ++tight;
  }
  EXPECT_GT(tight, arrivals.size() / 2);
}

TEST(TrafficTest, ExponentialBurstProducesClusters) {
  TrafficParams p;
  p.pattern = TrafficPattern::ExponentialBurst;
  p.burst_rate = 0.5;
  p.mean_burst_size = 8.0;
  auto gen = MakeTrafficGenerator(p, SeededRng(5));
  const auto arrivals = ArrivalsUntil(*gen, 200.0);
  ASSERT_GT(arrivals.size(), 100u);
  std::size_t tight = 0;
  for (std::size_t i = 1; i < arrivals.size(); ++i) {
    EXPECT_GE(arrivals[i], arrivals[i - 1]);
    if (arrivals[i] - arrivals[i - 1] < 0.01) ++tight;
  }
  EXPECT_GT(tight, arrivals.size() / 2);
}

}  // namespace
}  // namespace loadsim
