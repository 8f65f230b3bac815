//
// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//


#include "algorithms/distributions.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "absl/random/distributions.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "algorithms/rand.h"
#include "algorithms/util.h"
#include "base/status_macros.h"

namespace privacy_release {
namespace internal {
namespace {

// The grid has at least 2^kGridBits points per unit of diversity. Together
// with kMinEpsilon this keeps every sample an exact multiple of the
// granularity.
constexpr int kGridBits = 40;

// Returns the smallest power of two that is at least diversity / 2^kGridBits.
double GranularityFor(double diversity) {
  int exponent;
  const double mantissa = std::frexp(diversity, &exponent);
  if (mantissa == 0.5) --exponent;
  return std::ldexp(1.0, exponent - kGridBits);
}

// Draws k >= 0 with probability proportional to exp(-lambda * k), by
// inverting an exponential variable. UniformDouble resolves values down to
// 2^-1022, so the tail is followed that far out.
int64_t SampleGeometric(double lambda, RandomSource& random) {
  double u;
  do {
    u = UniformDouble(random);
  } while (u == 0);
  const double steps = std::floor(-std::log(u) / lambda);
  constexpr double kMaxSteps = static_cast<double>(int64_t{1} << 62);
  return static_cast<int64_t>(std::min(steps, kMaxSteps));
}

}  // namespace

absl::StatusOr<LaplaceDistribution> LaplaceDistribution::Create(
    double epsilon, double sensitivity) {
  RETURN_IF_ERROR(ValidateIsFiniteAndPositive(epsilon, "Epsilon"));
  if (epsilon < kMinEpsilon) {
    return absl::InvalidArgumentError(
        absl::StrCat("Epsilon must be at least 2^-50, but is ", epsilon, "."));
  }
  RETURN_IF_ERROR(ValidateIsFiniteAndPositive(sensitivity, "Sensitivity"));
  return LaplaceDistribution(epsilon, sensitivity,
                             GranularityFor(sensitivity / epsilon));
}

LaplaceDistribution::LaplaceDistribution(double epsilon, double sensitivity,
                                         double granularity)
    : epsilon_(epsilon),
      sensitivity_(sensitivity),
      granularity_(granularity),
      // Snapping the input can move it by half a step in either direction, so
      // neighbouring inputs may land up to sensitivity + granularity apart.
      lambda_(granularity * epsilon / (sensitivity + granularity)) {}

double LaplaceDistribution::Sample(RandomSource& random) const {
  int64_t steps;
  bool positive;
  do {
    steps = SampleGeometric(lambda_, random);
    positive = absl::Bernoulli(random, 0.5);
    // Zero is reachable from both signs; keep only one of them.
  } while (steps == 0 && !positive);
  return (positive ? steps : -steps) * granularity_;
}

double LaplaceDistribution::Snap(double value) const {
  const double steps = value / granularity_;
  // From 2^52 on every double is an integer, and adding a half would round.
  if (std::abs(steps) >= 0x1p52) return value;
  return std::floor(steps + 0.5) * granularity_;
}

double LaplaceDistribution::Cdf(double x) const {
  const double tail = 0.5 * std::exp(-std::abs(x) / diversity());
  return x < 0 ? tail : 1 - tail;
}

double LaplaceDistribution::Quantile(double p) const {
  const double magnitude = -diversity() * std::log(2 * std::min(p, 1 - p));
  return p < 0.5 ? -magnitude : magnitude;
}

}  // namespace internal
}  // namespace privacy_release
