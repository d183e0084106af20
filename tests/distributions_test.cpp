#include "loadsim/distributions.h"

#include <gtest/gtest.h>

#include <cmath>

namespace loadsim {
namespace {

TEST(SeededRngTest, SameSeedSameSequence) {
  SeededRng a(7);
  SeededRng b(7);
  for (int i = 0; i < 100; ++i) EXPECT_EQ(a.U64(), b.U64());
}

TEST(SeededRngTest, ForksAreIndependentStreams) {
  SeededRng root(7);
  SeededRng a = root.Fork(1);
  SeededRng b = root.Fork(2);
  int equal = 0;
  for (int i = 0; i < 100; ++i) equal += a.U64() == b.U64();
  EXPECT_EQ(equal, 0);
}

TEST(SeededRngTest, UniformIndexStaysInRange) {
  SeededRng rng(3);
  for (int i = 0; i < 1000; ++i) EXPECT_LT(rng.UniformIndex(7), 7u);
}

TEST(SeededRngTest, PoissonMeanIsClose) {
  SeededRng rng(11);
  double sum = 0.0;
  const int n = 20000;
  for (int i = 0; i < n; ++i) sum += static_cast<double>(rng.Poisson(5.0));
  EXPECT_NEAR(sum / n, 5.0, 0.1);
}

TEST(DistributionsTest, ZeroStddevReturnsMeanExactly) {
  SeededRng rng(1);
  const DurationSample s = SampleDuration(Distribution::Normal, 250.0, 0.0, 0.1, rng);
  EXPECT_DOUBLE_EQ(s.value, 250.0);
  EXPECT_FALSE(s.clamped_negative);
}

TEST(DistributionsTest, NegativeNormalDrawIsClampedAndFlagged) {
  SeededRng rng(5);
  bool saw_clamp = false;
  for (int i = 0; i < 200; ++i) {
    const DurationSample s = SampleDuration(Distribution::Normal, 1.0, 100.0, 0.1, rng);
    EXPECT_GE(s.value, 0.1);
    if (s.clamped_negative) {
      saw_clamp = true;
      EXPECT_DOUBLE_EQ(s.value, 0.1);
    }
  }
  EXPECT_TRUE(saw_clamp);
}

TEST(DistributionsTest, LognormalMatchesRequestedMean) {
  SeededRng rng(9);
  double sum = 0.0;
  const int n = 50000;
  for (int i = 0; i < n; ++i) {
    sum += SampleDuration(Distribution::Lognormal, 100.0, 30.0, 0.0, rng).value;
  }
  EXPECT_NEAR(sum / n, 100.0, 2.0);
}

TEST(DistributionsTest, NetworkLatencyIsZeroWhenDisabled) {
  SeededRng rng(2);
  EXPECT_EQ(SampleNetworkLatency(0.0, 10.0, rng), 0.0);
  for (int i = 0; i < 100; ++i) EXPECT_GE(SampleNetworkLatency(1.0, 5.0, rng), 0.0);
}

TEST(DistributionsTest, ParsesNames) {
  EXPECT_EQ(ParseDistribution("lognormal"), Distribution::Lognormal);
  EXPECT_FALSE(ParseDistribution("gamma").has_value());
  EXPECT_STREQ(DistributionName(Distribution::Exponential), "exponential");
}

}  // namespace
}  // namespace loadsim
