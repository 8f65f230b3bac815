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

#ifndef PRIVACY_RELEASE_ALGORITHMS_SENSITIVITY_H_
#define PRIVACY_RELEASE_ALGORITHMS_SENSITIVITY_H_

#include <optional>
#include <string>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace privacy_release {

enum class QueryKind {
  // Number of rows matching a predicate.
  kCount,
  // Sum of a numeric column with every value clamped to [lower, upper].
  kBoundedSum,
  // Any other aggregate. Its sensitivity must be declared by the caller.
  kCustom,
};

absl::string_view QueryKindName(QueryKind kind);

// How two neighboring datasets differ.
enum class NeighborModel {
  // One dataset has one more row than the other.
  kUnbounded,
  // Both datasets have the same size and differ in the contents of one row.
  kBounded,
};

absl::string_view NeighborModelName(NeighborModel model);

// Describes a query precisely enough to bound its sensitivity. The
// description is recorded in the privacy ledger.
class QueryDescriptor {
 public:
  static QueryDescriptor Count(std::string description);
  static QueryDescriptor BoundedSum(std::string description, double lower,
                                    double upper);
  static QueryDescriptor Custom(
      std::string description,
      std::optional<double> declared_sensitivity = std::nullopt);

  QueryKind kind() const { return kind_; }
  const std::string& description() const { return description_; }
  std::optional<double> lower() const { return lower_; }
  std::optional<double> upper() const { return upper_; }
  std::optional<double> declared_sensitivity() const {
    return declared_sensitivity_;
  }

 private:
  QueryDescriptor(QueryKind kind, std::string description)
      : kind_(kind), description_(std::move(description)) {}

  QueryKind kind_;
  std::string description_;
  std::optional<double> lower_;
  std::optional<double> upper_;
  std::optional<double> declared_sensitivity_;
};

// Bounds how much a query's true answer can change between neighboring
// datasets. The analyzer refuses to guess: a query whose sensitivity cannot be
// derived or was not declared fails with kFailedPrecondition rather than
// defaulting to 1.
//
// Stateless and safe for concurrent use.
class SensitivityAnalyzer {
 public:
  explicit SensitivityAnalyzer(NeighborModel model) : model_(model) {}

  NeighborModel model() const { return model_; }

  // Sensitivity of a query kind with no further declaration. Only counting
  // queries have a sensitivity known from their kind alone.
  absl::StatusOr<double> SensitivityOf(QueryKind kind) const;

  // Sensitivity of a described query. Counting queries have sensitivity 1.
  // Bounded sums derive it from their clamping bounds. Custom queries return
  // their declared sensitivity.
  absl::StatusOr<double> SensitivityOf(const QueryDescriptor& query) const;

 private:
  NeighborModel model_;
};

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ALGORITHMS_SENSITIVITY_H_
