#pragma once

#include "loadsim/random.h"

#include <optional>
#include <string_view>

namespace loadsim {

enum class Distribution {
  Normal,
  Lognormal,
  Exponential,
};

const char* DistributionName(Distribution d);
std::optional<Distribution> ParseDistribution(std::string_view s);

struct DurationSample {
  double value = 0.0;
  // The raw draw was negative and was replaced by the floor.
  bool clamped_negative = false;
};

// Draws a duration with the given mean and stddev. Results below min_value are raised to it.
// With stddev <= 0 (Normal/Lognormal) the mean is returned without consuming randomness.
DurationSample SampleDuration(Distribution dist, double mean, double stddev, double min_value,
                              SeededRng& rng);

// Normal(mean, stddev) floored at 0; zero without a draw when mean <= 0.
double SampleNetworkLatency(double mean, double stddev, SeededRng& rng);

// (mu, sigma) of the underlying normal for a lognormal with the given mean and stddev.
void LognormalParams(double mean, double stddev, double* mu, double* sigma);

}  // namespace loadsim
