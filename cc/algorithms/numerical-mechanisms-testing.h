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

#ifndef PRIVACY_RELEASE_ALGORITHMS_NUMERICAL_MECHANISMS_TESTING_H_
#define PRIVACY_RELEASE_ALGORITHMS_NUMERICAL_MECHANISMS_TESTING_H_

#include <memory>

#include "gmock/gmock.h"
#include "absl/memory/memory.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "algorithms/numerical-mechanisms.h"
#include "algorithms/rand.h"
#include "proto/confidence-interval.pb.h"

namespace privacy_release {
namespace test_utils {

// A full mock for the NumericalMechanism class using gmock.
class MockNoiseMechanism : public NumericalMechanism {
 public:
  MockNoiseMechanism() : NumericalMechanism(/*epsilon=*/1.0) {}

  MOCK_METHOD(double, AddNoise, (double result, RandomSource& random),
              (override));
  MOCK_METHOD(absl::StatusOr<ConfidenceInterval>, NoiseConfidenceInterval,
              (double confidence_level, double noised_result),
              (override, const));
};

// A numerical mechanism that adds no noise to its input and does not perform
// snapping. Returns whatever is passed to it unmodified and never touches the
// random source. Use only for testing. Not differentially private.
class ZeroNoiseMechanism : public NumericalMechanism {
 public:
  class Builder : public NumericalMechanismBuilder {
   public:
    absl::StatusOr<std::unique_ptr<NumericalMechanism>> Build() override {
      return absl::StatusOr<std::unique_ptr<NumericalMechanism>>(
          absl::make_unique<ZeroNoiseMechanism>(GetEpsilon().value_or(1)));
    }

    std::unique_ptr<NumericalMechanismBuilder> Clone() const override {
      return absl::make_unique<Builder>(*this);
    }
  };

  explicit ZeroNoiseMechanism(double epsilon) : NumericalMechanism(epsilon) {}

  double AddNoise(double result, RandomSource& random) override {
    return result;
  }

  absl::string_view Name() const override { return "zero-noise"; }

  absl::StatusOr<ConfidenceInterval> NoiseConfidenceInterval(
      double confidence_level, double noised_result) const override {
    ConfidenceInterval confidence;
    confidence.set_lower_bound(noised_result);
    confidence.set_upper_bound(noised_result);
    confidence.set_confidence_level(confidence_level);
    return confidence;
  }
};

}  // namespace test_utils
}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ALGORITHMS_NUMERICAL_MECHANISMS_TESTING_H_
