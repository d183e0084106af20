#include "loadsim/random.h"

#include <cmath>
#include <limits>

namespace loadsim {

namespace {

constexpr double kTwoPi = 6.28318530717958647692;

// Box-Muller for normal from uniform
double NormalFromUniform(double u1, double u2) {
  if (u1 <= 0.0 || u1 >= 1.0) return 0.0;
  const double r = std::sqrt(-2.0 * std::log(u1));
  return r * std::cos(kTwoPi * u2);
}

std::uint64_t SplitMix64(std::uint64_t& s) {
  s += 0x9e3779b97f4a7c15ULL;
  std::uint64_t z = s;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

}  // namespace

SeededRng::SeededRng(std::uint64_t seed) : seed_(seed) {
  std::uint64_t s = seed;
  for (int i = 0; i < 4; ++i) s_[i] = SplitMix64(s);
}

SeededRng SeededRng::Fork(std::uint64_t salt) const {
  std::uint64_t s = seed_ ^ (salt * 0xd1b54a32d192ed03ULL);
  return SeededRng(SplitMix64(s));
}

std::uint64_t SeededRng::Rotl(std::uint64_t x, int k) {
  return (x << k) | (x >> (64 - k));
}

std::uint64_t SeededRng::U64() {
  const std::uint64_t result = Rotl(s_[1] * 5, 7) * 9;
  const std::uint64_t t = s_[1] << 17;
  s_[2] ^= s_[0];
  s_[3] ^= s_[1];
  s_[1] ^= s_[2];
  s_[0] ^= s_[3];
  s_[2] ^= t;
  s_[3] = Rotl(s_[3], 45);
  return result;
}

double SeededRng::Uniform01() {
  return static_cast<double>(U64() >> 11) / 9007199254740992.0;  // 2^53
}

double SeededRng::UniformOpen01() {
  double u = Uniform01();
  while (u <= 0.0) u = Uniform01();
  return u;
}

double SeededRng::Uniform(double a, double b) {
  return a + Uniform01() * (b - a);
}

std::uint64_t SeededRng::UniformIndex(std::uint64_t n) {
  if (n <= 1) return 0;
  // Rejection sampling keeps the pick unbiased for any n.
  const std::uint64_t limit = std::numeric_limits<std::uint64_t>::max() -
                              std::numeric_limits<std::uint64_t>::max() % n;
  std::uint64_t x = U64();
  while (x >= limit) x = U64();
  return x % n;
}

bool SeededRng::Bernoulli(double p) {
  if (p <= 0.0) return false;
  if (p >= 1.0) return true;
  return Uniform01() < p;
}

double SeededRng::Normal(double mean, double stddev) {
  const double u1 = UniformOpen01();
  const double u2 = Uniform01();
  return mean + stddev * NormalFromUniform(u1, u2);
}

double SeededRng::Lognormal(double mu, double sigma) {
  const double x = std::exp(Normal(mu, sigma));
  return x > 0.0 ? x : std::numeric_limits<double>::min();
}

double SeededRng::Exponential(double rate) {
  if (rate <= 0.0) return std::numeric_limits<double>::infinity();
  return -std::log(UniformOpen01()) / rate;
}

std::uint64_t SeededRng::Poisson(double mean) {
  if (mean <= 0.0) return 0;
  if (mean > 60.0) {
    const double x = std::round(Normal(mean, std::sqrt(mean)));
    return x > 0.0 ? static_cast<std::uint64_t>(x) : 0;
  }
  // Knuth: multiply uniforms until the product drops below e^-mean.
  const double limit = std::exp(-mean);
  std::uint64_t k = 0;
  double p = Uniform01();
  while (p > limit) {
    ++k;
    p *= Uniform01();
  }
  return k;
}

}  // namespace loadsim
