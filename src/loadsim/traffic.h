#pragma once

#include "loadsim/config.h"
#include "loadsim/random.h"
#include "loadsim/types.h"

#include <cstdint>
#include <memory>

namespace loadsim {

// Lazy, unbounded sequence of arrival timestamps for one traffic pattern.
// The first arrival is at t = 0 (or the first instant with a positive rate).
// Same params + same rng seed => same sequence.
class TrafficGenerator {
 public:
  virtual ~TrafficGenerator() = default;

  // Absolute time of the next arrival given the previous one at `now`; kNever when exhausted.
  double NextArrival(double now);

  // Mean request rate (req/s) at time t, spikes included.
  virtual double RateAt(double t) const = 0;

  // Product of the multipliers of all spikes active at t.
  double SpikeMultiplier(double t) const;

  const TrafficParams& params() const { return params_; }

 protected:
  TrafficGenerator(const TrafficParams& params, SeededRng rng);

  virtual double FirstArrival();
  virtual double NextAfter(double now) = 0;

  // Upper bound of SpikeMultiplier over all t.
  double SpikeBound() const;
  // Next event of a non-homogeneous Poisson process with rate RateAt(), by thinning.
  double Thin(double now, double rate_bound);

  TrafficParams params_;
  SeededRng rng_;

 private:
  bool started_ = false;
};

class PoissonTraffic : public TrafficGenerator {
 public:
  PoissonTraffic(const TrafficParams& params, SeededRng rng);
  double RateAt(double t) const override;

 protected:
  double NextAfter(double now) override;
};

// Evenly spaced arrivals, 1 / rate apart. Arrival k of a constant-rate segment is placed at
// segment_start + k / rate, so spacing error does not accumulate; a new segment begins at the
// first arrival that sees a different rate.
class ConstantTraffic : public TrafficGenerator {
 public:
  ConstantTraffic(const TrafficParams& params, SeededRng rng);
  double RateAt(double t) const override;

 protected:
  double NextAfter(double now) override;

 private:
  double segment_start_ = 0.0;
  double segment_rate_ = 0.0;
  std::uint64_t index_ = 0;
};

// base * (1 + amplitude * sin(2*pi*t / period)).
class PeriodicTraffic : public TrafficGenerator {
 public:
  PeriodicTraffic(const TrafficParams& params, SeededRng rng);
  double RateAt(double t) const override;

 protected:
  double NextAfter(double now) override;
};

// Like PeriodicTraffic with a sine or square waveform over wave_period / amplitude_factor.
class WaveTraffic : public TrafficGenerator {
 public:
  WaveTraffic(const TrafficParams& params, SeededRng rng);
  double RateAt(double t) const override;

 protected:
  double NextAfter(double now) override;
};

// Clusters of back-to-back arrivals (burst_spacing apart). Subclasses decide how big a burst is
// and when the next one starts.
class BurstTraffic : public TrafficGenerator {
 protected:
  BurstTraffic(const TrafficParams& params, SeededRng rng);

  double FirstArrival() override;
  double NextAfter(double now) override;

  virtual std::uint64_t BurstSize(double t) = 0;
  virtual double GapToNextBurst() = 0;

 private:
  double StartBurst(double t);

  double burst_start_ = 0.0;
  std::uint64_t remaining_ = 0;
};

// Poisson(burst_size_mean) arrivals every burst_interval seconds.
class BurstyTraffic : public BurstTraffic {
 public:
  BurstyTraffic(const TrafficParams& params, SeededRng rng);
  double RateAt(double t) const override;

 protected:
  std::uint64_t BurstSize(double t) override;
  double GapToNextBurst() override;
};

// Exponentially distributed burst sizes; bursts arrive as a Poisson process of burst_rate.
class ExponentialBurstTraffic : public BurstTraffic {
 public:
  ExponentialBurstTraffic(const TrafficParams& params, SeededRng rng);
  double RateAt(double t) const override;

 protected:
  std::uint64_t BurstSize(double t) override;
  double GapToNextBurst() override;
};

std::unique_ptr<TrafficGenerator> MakeTrafficGenerator(const TrafficParams& params,
                                                       SeededRng rng);

}  // namespace loadsim
