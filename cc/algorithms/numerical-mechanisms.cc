//
// Copyright 2022 Google LLC
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


#include "algorithms/numerical-mechanisms.h"

#include <cmath>
#include <limits>
#include <memory>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "algorithms/distributions.h"
#include "algorithms/rand.h"
#include "algorithms/util.h"
#include "proto/confidence-interval.pb.h"
#include "proto/numerical-mechanism.pb.h"
#include "base/status_macros.h"

namespace privacy_release {
namespace {

// Above this diversity a sample overflows to infinity with probability of at
// least 2^-64.
const double kMaxDiversity =
    std::numeric_limits<double>::max() / (64 * std::log(2.0));

}  // namespace

absl::StatusOr<std::unique_ptr<NumericalMechanism>>
LaplaceMechanism::Builder::Build() {
  RETURN_IF_ERROR(ValidateEpsilon(GetEpsilon()));
  RETURN_IF_ERROR(
      ValidateIsFiniteAndPositive(GetL1Sensitivity(), "L1 sensitivity"));
  if (*GetL1Sensitivity() / *GetEpsilon() > kMaxDiversity) {
    return absl::InvalidArgumentError("Sensitivity is too high.");
  }
  ASSIGN_OR_RETURN(internal::LaplaceDistribution distribution,
                   internal::LaplaceDistribution::Create(
                       *GetEpsilon(), *GetL1Sensitivity()));
  return absl::StatusOr<std::unique_ptr<NumericalMechanism>>(
      absl::make_unique<LaplaceMechanism>(distribution));
}

absl::StatusOr<std::unique_ptr<NumericalMechanism>>
LaplaceMechanism::Deserialize(const serialization::LaplaceMechanism& proto) {
  Builder builder;
  if (proto.has_epsilon()) builder.SetEpsilon(proto.epsilon());
  if (proto.has_l1_sensitivity()) {
    builder.SetL1Sensitivity(proto.l1_sensitivity());
  }
  return builder.Build();
}

serialization::LaplaceMechanism LaplaceMechanism::Serialize() const {
  serialization::LaplaceMechanism proto;
  proto.set_epsilon(epsilon());
  proto.set_l1_sensitivity(sensitivity());
  return proto;
}

double LaplaceMechanism::AddNoise(double result, RandomSource& random) {
  return distribution_.Snap(result) + distribution_.Sample(random);
}

absl::StatusOr<ConfidenceInterval> LaplaceMechanism::NoiseConfidenceInterval(
    double confidence_level, double noised_result) const {
  RETURN_IF_ERROR(ValidateConfidenceLevel(confidence_level));
  // P(|noise| > q) = exp(-q / diversity).
  const double margin = -diversity() * std::log(1 - confidence_level);
  ConfidenceInterval interval;
  interval.set_lower_bound(noised_result - margin);
  interval.set_upper_bound(noised_result + margin);
  interval.set_confidence_level(confidence_level);
  return interval;
}

absl::StatusOr<double> AddLaplaceNoise(double true_answer, double sensitivity,
                                       double epsilon, RandomSource& random) {
  ASSIGN_OR_RETURN(std::unique_ptr<NumericalMechanism> mechanism,
                   LaplaceMechanism::Builder()
                       .SetEpsilon(epsilon)
                       .SetL1Sensitivity(sensitivity)
                       .Build());
  return mechanism->AddNoise(true_answer, random);
}

}  // namespace privacy_release
