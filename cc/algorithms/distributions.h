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


#ifndef PRIVACY_RELEASE_ALGORITHMS_DISTRIBUTIONS_H_
#define PRIVACY_RELEASE_ALGORITHMS_DISTRIBUTIONS_H_

#include <cstdint>

#include "absl/status/statusor.h"
#include "algorithms/rand.h"

namespace privacy_release {
namespace internal {

// Laplace noise of scale sensitivity / epsilon, restricted to integer
// multiples of a power-of-two granularity. Samples are drawn as a two-sided
// geometric count of grid steps, so the low-order bits of a released value
// carry no information about the input (Mironov, "On Significance of the
// Least Significant Bits For Differential Privacy", 2012).
//
// Use LaplaceMechanism rather than this class directly: the mechanism also
// snaps the input onto the same grid, without which the guarantee is lost.
class LaplaceDistribution {
 public:
  // Smallest epsilon whose granularity is still a normal double.
  static constexpr double kMinEpsilon = 1.0 / (int64_t{1} << 50);

  // Fails with kInvalidArgument unless sensitivity is finite and positive and
  // epsilon is finite and at least kMinEpsilon.
  static absl::StatusOr<LaplaceDistribution> Create(double epsilon,
                                                    double sensitivity);

  // Returns a multiple of granularity(). Thread-safe if `random` is.
  double Sample(RandomSource& random) const;

  // Rounds `value` to the nearest multiple of granularity(), ties upwards.
  double Snap(double value) const;

  // Probability that a continuous Laplace variable of this scale is at most
  // x. The grid shifts the true value by less than granularity().
  double Cdf(double x) const;

  // Inverse of Cdf() for p in (0, 1).
  double Quantile(double p) const;

  double epsilon() const { return epsilon_; }
  double sensitivity() const { return sensitivity_; }
  double diversity() const { return sensitivity_ / epsilon_; }
  double granularity() const { return granularity_; }
  double variance() const { return 2 * diversity() * diversity(); }

 private:
  LaplaceDistribution(double epsilon, double sensitivity, double granularity);

  double epsilon_;
  double sensitivity_;
  double granularity_;
  // Decay per grid step of the two-sided geometric distribution.
  double lambda_;
};

}  // namespace internal
}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ALGORITHMS_DISTRIBUTIONS_H_
