#include "loadsim/traffic.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace loadsim {

namespace {

constexpr double kTwoPi = 6.28318530717958647692;

}  // namespace

// -----------------------------------------------------------------------------
// TrafficGenerator
// -----------------------------------------------------------------------------

TrafficGenerator::TrafficGenerator(const TrafficParams& params, SeededRng rng)
    : params_(params), rng_(rng) {}

double TrafficGenerator::NextArrival(double now) {
  if (!started_) {
    started_ = true;
    return FirstArrival();
  }
  return NextAfter(now);
}

double TrafficGenerator::FirstArrival() {
  return RateAt(0.0) > 0.0 ? 0.0 : NextAfter(0.0);
}

double TrafficGenerator::SpikeMultiplier(double t) const {
  double m = 1.0;
  for (const auto& s : params_.spikes) {
    if (t >= s.start_time && t < s.start_time + s.duration) m *= s.intensity_multiplier;
  }
  return m;
}

double TrafficGenerator::SpikeBound() const {
  double m = 1.0;
  for (const auto& s : params_.spikes) m *= std::max(1.0, s.intensity_multiplier);
  return m;
}

double TrafficGenerator::Thin(double now, double rate_bound) {
  if (rate_bound <= 0.0) return kNever;
  double t = now;
  for (;;) {
    t += rng_.Exponential(rate_bound);
    if (rng_.Uniform01() * rate_bound < RateAt(t)) return t;
  }
}

// -----------------------------------------------------------------------------
// Rate-driven patterns
// -----------------------------------------------------------------------------

PoissonTraffic::PoissonTraffic(const TrafficParams& params, SeededRng rng)
    : TrafficGenerator(params, rng) {}

double PoissonTraffic::RateAt(double t) const {
  return params_.base_rate * SpikeMultiplier(t);
}

double PoissonTraffic::NextAfter(double now) {
  return Thin(now, params_.base_rate * SpikeBound());
}

ConstantTraffic::ConstantTraffic(const TrafficParams& params, SeededRng rng)
    : TrafficGenerator(params, rng) {}

double ConstantTraffic::RateAt(double t) const {
  return params_.base_rate * SpikeMultiplier(t);
}

double ConstantTraffic::NextAfter(double now) {
  const double rate = RateAt(now);
  if (rate <= 0.0) return kNever;
  if (rate != segment_rate_) {
    segment_start_ = now;
    segment_rate_ = rate;
    index_ = 0;
  }
  ++index_;
  return segment_start_ + static_cast<double>(index_) / segment_rate_;
}

PeriodicTraffic::PeriodicTraffic(const TrafficParams& params, SeededRng rng)
    : TrafficGenerator(params, rng) {}

double PeriodicTraffic::RateAt(double t) const {
  const double wave = std::sin(kTwoPi * t / params_.period);
  const double rate = params_.base_rate * (1.0 + params_.amplitude * wave);
  return std::max(0.0, rate) * SpikeMultiplier(t);
}

double PeriodicTraffic::NextAfter(double now) {
  return Thin(now, params_.base_rate * (1.0 + params_.amplitude) * SpikeBound());
}

WaveTraffic::WaveTraffic(const TrafficParams& params, SeededRng rng)
    : TrafficGenerator(params, rng) {}

double WaveTraffic::RateAt(double t) const {
  const double s = std::sin(kTwoPi * t / params_.wave_period);
  double wave = s;
  if (params_.wave_type == WaveType::Square) wave = s >= 0.0 ? 1.0 : -1.0;
  const double rate = params_.base_rate * (1.0 + params_.amplitude_factor * wave);
  return std::max(0.0, rate) * SpikeMultiplier(t);
}

double WaveTraffic::NextAfter(double now) {
  return Thin(now, params_.base_rate * (1.0 + params_.amplitude_factor) * SpikeBound());
}

// -----------------------------------------------------------------------------
// Burst patterns
// -----------------------------------------------------------------------------

BurstTraffic::BurstTraffic(const TrafficParams& params, SeededRng rng)
    : TrafficGenerator(params, rng) {}

double BurstTraffic::StartBurst(double t) {
  burst_start_ = t;
  remaining_ = BurstSize(t) - 1;
  return t;
}

double BurstTraffic::FirstArrival() {
  return StartBurst(0.0);
}

double BurstTraffic::NextAfter(double now) {
  if (remaining_ > 0) {
    --remaining_;
    return now + params_.burst_spacing;
  }
  const double gap = GapToNextBurst();
  if (gap == kNever) return kNever;
  // A long burst can overrun the gap; the next one then starts right away.
  return StartBurst(std::max(burst_start_ + gap, now));
}

BurstyTraffic::BurstyTraffic(const TrafficParams& params, SeededRng rng)
    : BurstTraffic(params, rng) {}

double BurstyTraffic::RateAt(double t) const {
  return params_.burst_size_mean * SpikeMultiplier(t) / params_.burst_interval;
}

std::uint64_t BurstyTraffic::BurstSize(double t) {
  const std::uint64_t n = rng_.Poisson(params_.burst_size_mean * SpikeMultiplier(t));
  return std::max<std::uint64_t>(1, n);
}

double BurstyTraffic::GapToNextBurst() {
  return params_.burst_interval;
}

ExponentialBurstTraffic::ExponentialBurstTraffic(const TrafficParams& params, SeededRng rng)
    : BurstTraffic(params, rng) {}

double ExponentialBurstTraffic::RateAt(double t) const {
  return params_.burst_rate * params_.mean_burst_size * SpikeMultiplier(t);
}

std::uint64_t ExponentialBurstTraffic::BurstSize(double t) {
  const double mean = params_.mean_burst_size * SpikeMultiplier(t);
  const double x = std::floor(rng_.Exponential(1.0 / mean));
  return x < 1.0 ? 1 : static_cast<std::uint64_t>(x);
}

double ExponentialBurstTraffic::GapToNextBurst() {
  return rng_.Exponential(params_.burst_rate);
}

std::unique_ptr<TrafficGenerator> MakeTrafficGenerator(const TrafficParams& params,
                                                       SeededRng rng) {
  switch (params.pattern) {
    case TrafficPattern::Poisson: return std::make_unique<PoissonTraffic>(params, rng);
    case TrafficPattern::Constant: return std::make_unique<ConstantTraffic>(params, rng);
    case TrafficPattern::Periodic: return std::make_unique<PeriodicTraffic>(params, rng);
    case TrafficPattern::Wave: return std::make_unique<WaveTraffic>(params, rng);
    case TrafficPattern::Bursty: return std::make_unique<BurstyTraffic>(params, rng);
    case TrafficPattern::ExponentialBurst:
      return std::make_unique<ExponentialBurstTraffic>(params, rng);
  }
  throw std::runtime_error("Unknown traffic pattern");
}

}  // namespace loadsim
