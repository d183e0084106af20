#include "loadsim/distributions.h"

#include <algorithm>
#include <cmath>

namespace loadsim {

const char* DistributionName(Distribution d) {
  switch (d) {
    case Distribution::Normal: return "normal";
    case Distribution::Lognormal: return "lognormal";
    case Distribution::Exponential: return "exponential";
  }
  return "unknown";
}

std::optional<Distribution> ParseDistribution(std::string_view s) {
  if (s == "normal") return Distribution::Normal;
  if (s == "lognormal") return Distribution::Lognormal;
  if (s == "exponential") return Distribution::Exponential;
  return std::nullopt;
}

void LognormalParams(double mean, double stddev, double* mu, double* sigma) {
  const double cv2 = (stddev / mean) * (stddev / mean);
  *mu = std::log(mean / std::sqrt(1.0 + cv2));
  *sigma = std::sqrt(std::log(1.0 + cv2));
}

DurationSample SampleDuration(Distribution dist, double mean, double stddev, double min_value,
                              SeededRng& rng) {
  double raw = mean;
  switch (dist) {
    case Distribution::Normal:
      if (stddev > 0.0) raw = rng.Normal(mean, stddev);
      break;
    case Distribution::Lognormal:
      if (stddev > 0.0 && mean > 0.0) {
        double mu = 0.0;
        double sigma = 0.0;
        LognormalParams(mean, stddev, &mu, &sigma);
        raw = rng.Lognormal(mu, sigma);
      }
      break;
    case Distribution::Exponential:
      if (mean > 0.0) raw = rng.Exponential(1.0 / mean);
      break;
  }

  DurationSample out;
  out.clamped_negative = raw < 0.0;
  out.value = std::max(raw, min_value);
  return out;
}

double SampleNetworkLatency(double mean, double stddev, SeededRng& rng) {
  if (mean <= 0.0) return 0.0;
  return std::max(0.0, rng.Normal(mean, stddev));
}

}  // namespace loadsim
