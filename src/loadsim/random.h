#pragma once

#include <cstdint>

namespace loadsim {

// Deterministic seeded RNG for reproducible simulations.
// Uses xoshiro256** for quality and speed.
class SeededRng {
 public:
  explicit SeededRng(std::uint64_t seed);

  // Independent stream for another component of the same run.
  SeededRng Fork(std::uint64_t salt) const;

  std::uint64_t U64();
  double Uniform01();
  double UniformOpen01();
  double Uniform(double a, double b);
  std::uint64_t UniformIndex(std::uint64_t n);
  bool Bernoulli(double p);
  double Normal(double mean, double stddev);
  double Lognormal(double mu, double sigma);
  double Exponential(double rate);
  std::uint64_t Poisson(double mean);

 private:
  std::uint64_t seed_;
  std::uint64_t s_[4];
  static std::uint64_t Rotl(std::uint64_t x, int k);
};

}  // namespace loadsim
