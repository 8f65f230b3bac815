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

#ifndef PRIVACY_RELEASE_ALGORITHMS_PRIVATE_QUERY_H_
#define PRIVACY_RELEASE_ALGORITHMS_PRIVATE_QUERY_H_

#include <memory>
#include <optional>
#include <string>

#include "absl/functional/function_ref.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "accounting/privacy_accountant.h"
#include "algorithms/numerical-mechanisms.h"
#include "algorithms/rand.h"
#include "algorithms/sensitivity.h"
#include "proto/privacy-ledger.pb.h"
#include "tabular/dataset.h"

namespace privacy_release {

// Releases the answer of one described query with differential privacy. The
// sensitivity comes from a SensitivityAnalyzer, never from the caller's
// guess, and every release is charged to a PrivacyAccountant before any noise
// is drawn.
//
// Example:
//   ASSIGN_OR_RETURN(std::unique_ptr<PrivateQuery> query,
//                    PrivateQuery::Builder()
//                        .SetQuery(QueryDescriptor::Count("adults"))
//                        .SetEpsilon(0.5)
//                        .Build());
//   ASSIGN_OR_RETURN(MechanismInvocation release,
//                    query->Run(true_count, *accountant, random));
class PrivateQuery {
 public:
  class Builder {
   public:
    Builder();

    Builder& SetQuery(QueryDescriptor query);

    Builder& SetEpsilon(double epsilon);

    // Defaults to NeighborModel::kUnbounded.
    Builder& SetNeighborModel(NeighborModel model);

    // The builder is cloned. Defaults to LaplaceMechanism::Builder.
    Builder& SetMechanismBuilder(const NumericalMechanismBuilder& builder);

    // Fails with kFailedPrecondition when the sensitivity of the query cannot
    // be determined, and with kInvalidArgument for invalid parameters.
    absl::StatusOr<std::unique_ptr<PrivateQuery>> Build();

   private:
    std::optional<QueryDescriptor> query_;
    std::optional<double> epsilon_;
    NeighborModel model_ = NeighborModel::kUnbounded;
    std::unique_ptr<NumericalMechanismBuilder> mechanism_builder_;
  };

  // Charges the query's epsilon and, if the charge is accepted, returns the
  // recorded release of `true_answer` plus noise. On kResourceExhausted no
  // noise was drawn and nothing is released.
  absl::StatusOr<MechanismInvocation> Run(
      double true_answer, accounting::PrivacyAccountant& accountant,
      RandomSource& random);

  const QueryDescriptor& query() const { return query_; }
  double sensitivity() const { return sensitivity_; }
  double epsilon() const { return epsilon_; }
  const NumericalMechanism& mechanism() const { return *mechanism_; }

 private:
  PrivateQuery(QueryDescriptor query, double sensitivity, double epsilon,
               std::unique_ptr<NumericalMechanism> mechanism);

  const QueryDescriptor query_;
  const double sensitivity_;
  const double epsilon_;
  std::unique_ptr<NumericalMechanism> mechanism_;
};

// Releases the number of rows matching `predicate` with the Laplace mechanism.
absl::StatusOr<MechanismInvocation> PrivateCount(
    const Dataset& dataset, absl::FunctionRef<bool(const Row&)> predicate,
    double epsilon, accounting::PrivacyAccountant& accountant,
    RandomSource& random, absl::string_view description = "count");

// Releases the sum of `column` clamped to [lower, upper] with the Laplace
// mechanism.
absl::StatusOr<MechanismInvocation> PrivateBoundedSum(
    const Dataset& dataset, absl::string_view column, double lower,
    double upper, double epsilon, accounting::PrivacyAccountant& accountant,
    RandomSource& random,
    NeighborModel model = NeighborModel::kUnbounded);

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ALGORITHMS_PRIVATE_QUERY_H_
