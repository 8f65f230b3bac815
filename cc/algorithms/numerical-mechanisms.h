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


#ifndef PRIVACY_RELEASE_ALGORITHMS_NUMERICAL_MECHANISMS_H_
#define PRIVACY_RELEASE_ALGORITHMS_NUMERICAL_MECHANISMS_H_

#include <memory>
#include <optional>

#include "absl/memory/memory.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "algorithms/distributions.h"
#include "algorithms/rand.h"
#include "proto/confidence-interval.pb.h"
#include "proto/numerical-mechanism.pb.h"

// Mechanisms turn a true numeric answer into a differentially private one.
// They are configured with the privacy parameters (epsilon, sensitivity)
// rather than with the parameters of a noise distribution.
//
// Every noise-producing call takes the RandomSource to draw from. Mechanisms
// hold no randomness themselves and can be shared between threads.
namespace privacy_release {

class NumericalMechanism {
 public:
  explicit NumericalMechanism(double epsilon) : epsilon_(epsilon) {}

  virtual ~NumericalMechanism() = default;

  // Returns a noised version of `result`. Repeated calls draw independent
  // noise.
  virtual double AddNoise(double result, RandomSource& random) = 0;

  // Interval around `noised_result` that holds the true result with
  // probability `confidence_level`.
  virtual absl::StatusOr<ConfidenceInterval> NoiseConfidenceInterval(
      double confidence_level, double noised_result) const = 0;

  // Recorded in the privacy ledger next to each release.
  virtual absl::string_view Name() const { return "numerical"; }

  double epsilon() const { return epsilon_; }

 private:
  const double epsilon_;
};

class NumericalMechanismBuilder {
 public:
  virtual ~NumericalMechanismBuilder() = default;

  NumericalMechanismBuilder& SetEpsilon(double epsilon) {
    epsilon_ = epsilon;
    return *this;
  }

  NumericalMechanismBuilder& SetL1Sensitivity(double l1_sensitivity) {
    l1_sensitivity_ = l1_sensitivity;
    return *this;
  }

  virtual absl::StatusOr<std::unique_ptr<NumericalMechanism>> Build() = 0;

  virtual std::unique_ptr<NumericalMechanismBuilder> Clone() const = 0;

 protected:
  std::optional<double> GetEpsilon() const { return epsilon_; }
  std::optional<double> GetL1Sensitivity() const { return l1_sensitivity_; }

 private:
  std::optional<double> epsilon_;
  std::optional<double> l1_sensitivity_;
};

// Pure epsilon-DP release by Laplace noise of scale l1_sensitivity / epsilon.
// The input is snapped onto the noise grid before the sample is added.
class LaplaceMechanism : public NumericalMechanism {
 public:
  class Builder : public NumericalMechanismBuilder {
   public:
    absl::StatusOr<std::unique_ptr<NumericalMechanism>> Build() override;

    std::unique_ptr<NumericalMechanismBuilder> Clone() const override {
      return absl::make_unique<Builder>(*this);
    }
  };

  explicit LaplaceMechanism(internal::LaplaceDistribution distribution)
      : NumericalMechanism(distribution.epsilon()),
        distribution_(distribution) {}

  static absl::StatusOr<std::unique_ptr<NumericalMechanism>> Deserialize(
      const serialization::LaplaceMechanism& proto);

  serialization::LaplaceMechanism Serialize() const;

  double AddNoise(double result, RandomSource& random) override;

  // Symmetric: [noised_result - q, noised_result + q] where q is the
  // `confidence_level` quantile of the noise magnitude.
  absl::StatusOr<ConfidenceInterval> NoiseConfidenceInterval(
      double confidence_level, double noised_result) const override;

  absl::string_view Name() const override { return "laplace"; }

  double sensitivity() const { return distribution_.sensitivity(); }
  double diversity() const { return distribution_.diversity(); }
  double granularity() const { return distribution_.granularity(); }
  const internal::LaplaceDistribution& distribution() const {
    return distribution_;
  }

 private:
  const internal::LaplaceDistribution distribution_;
};

// Returns `true_answer` plus Laplace noise of scale sensitivity / epsilon
// drawn from `random`. Fails with kInvalidArgument unless both sensitivity and
// epsilon are finite and positive.
absl::StatusOr<double> AddLaplaceNoise(double true_answer, double sensitivity,
                                       double epsilon, RandomSource& random);

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ALGORITHMS_NUMERICAL_MECHANISMS_H_
