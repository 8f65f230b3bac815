//
// Copyright 2026 Google LLC
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

#include "algorithms/private-query.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "accounting/privacy_accountant.h"
#include "algorithms/numerical-mechanisms.h"
#include "algorithms/sensitivity.h"
#include "algorithms/util.h"
#include "base/logging.h"
#include "base/status_macros.h"
#include "tabular/aggregates.h"

namespace privacy_release {

PrivateQuery::Builder::Builder()
    : mechanism_builder_(absl::make_unique<LaplaceMechanism::Builder>()) {}

PrivateQuery::Builder& PrivateQuery::Builder::SetQuery(QueryDescriptor query) {
  query_ = std::move(query);
  return *this;
}

PrivateQuery::Builder& PrivateQuery::Builder::SetEpsilon(double epsilon) {
  epsilon_ = epsilon;
  return *this;
}

PrivateQuery::Builder& PrivateQuery::Builder::SetNeighborModel(
    NeighborModel model) {
  model_ = model;
  return *this;
}

PrivateQuery::Builder& PrivateQuery::Builder::SetMechanismBuilder(
    const NumericalMechanismBuilder& builder) {
  mechanism_builder_ = builder.Clone();
  return *this;
}

absl::StatusOr<std::unique_ptr<PrivateQuery>> PrivateQuery::Builder::Build() {
  if (!query_.has_value()) {
    return absl::InvalidArgumentError("Query must be set.");
  }
  RETURN_IF_ERROR(ValidateEpsilon(epsilon_));
  ASSIGN_OR_RETURN(double sensitivity,
                   SensitivityAnalyzer(model_).SensitivityOf(*query_));

  std::unique_ptr<NumericalMechanismBuilder> builder =
      mechanism_builder_->Clone();
  builder->SetEpsilon(epsilon_.value()).SetL1Sensitivity(sensitivity);
  absl::StatusOr<std::unique_ptr<NumericalMechanism>> mechanism =
      builder->Build();
  if (!mechanism.ok()) {
    return absl::Status(
        mechanism.status().code(),
        absl::StrCat("Cannot build a mechanism for query \"",
                     query_->description(), "\" with sensitivity ",
                     sensitivity, ": ", mechanism.status().message()));
  }
  VLOG(1) << "Query \"" << query_->description() << "\" ("
          << QueryKindName(query_->kind()) << ", "
          << NeighborModelName(model_) << " neighbors) has sensitivity "
          << sensitivity;
  return absl::WrapUnique(new PrivateQuery(*query_, sensitivity,
                                           epsilon_.value(),
                                           std::move(mechanism).value()));
}

PrivateQuery::PrivateQuery(QueryDescriptor query, double sensitivity,
                           double epsilon,
                           std::unique_ptr<NumericalMechanism> mechanism)
    : query_(std::move(query)),
      sensitivity_(sensitivity),
      epsilon_(epsilon),
      mechanism_(std::move(mechanism)) {}

absl::StatusOr<MechanismInvocation> PrivateQuery::Run(
    double true_answer, accounting::PrivacyAccountant& accountant,
    RandomSource& random) {
  return accountant.Release(
      query_.description(), mechanism_->Name(), sensitivity_, epsilon_,
      [&] { return mechanism_->AddNoise(true_answer, random); });
}

absl::StatusOr<MechanismInvocation> PrivateCount(
    const Dataset& dataset, absl::FunctionRef<bool(const Row&)> predicate,
    double epsilon, accounting::PrivacyAccountant& accountant,
    RandomSource& random, absl::string_view description) {
  ASSIGN_OR_RETURN(
      std::unique_ptr<PrivateQuery> query,
      PrivateQuery::Builder()
          .SetQuery(QueryDescriptor::Count(std::string(description)))
          .SetEpsilon(epsilon)
          .Build());
  return query->Run(CountMatching(dataset, predicate), accountant, random);
}

absl::StatusOr<MechanismInvocation> PrivateBoundedSum(
    const Dataset& dataset, absl::string_view column, double lower,
    double upper, double epsilon, accounting::PrivacyAccountant& accountant,
    RandomSource& random, NeighborModel model) {
  ASSIGN_OR_RETURN(std::unique_ptr<PrivateQuery> query,
                   PrivateQuery::Builder()
                       .SetQuery(QueryDescriptor::BoundedSum(
                           absl::StrCat("sum of ", column), lower, upper))
                       .SetEpsilon(epsilon)
                       .SetNeighborModel(model)
                       .Build());
  ASSIGN_OR_RETURN(double true_sum, ClampedSum(dataset, column, lower, upper));
  return query->Run(true_sum, accountant, random);
}

}  // namespace privacy_release
