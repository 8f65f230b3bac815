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

#include "algorithms/sensitivity.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "algorithms/util.h"
#include "base/status_macros.h"

namespace privacy_release {
namespace {

absl::Status UndeclaredSensitivityError(absl::string_view what) {
  return absl::FailedPreconditionError(
      absl::StrCat("Sensitivity of ", what,
                   " cannot be inferred and must be declared explicitly."));
}

}  // namespace

absl::string_view QueryKindName(QueryKind kind) {
  switch (kind) {
    case QueryKind::kCount:
      return "count";
    case QueryKind::kBoundedSum:
      return "bounded_sum";
    case QueryKind::kCustom:
      return "custom";
  }
  return "unknown";
}

absl::string_view NeighborModelName(NeighborModel model) {
  switch (model) {
    case NeighborModel::kUnbounded:
      return "unbounded";
    case NeighborModel::kBounded:
      return "bounded";
  }
  return "unknown";
}

QueryDescriptor QueryDescriptor::Count(std::string description) {
  return QueryDescriptor(QueryKind::kCount, std::move(description));
}

QueryDescriptor QueryDescriptor::BoundedSum(std::string description,
                                            double lower, double upper) {
  QueryDescriptor query(QueryKind::kBoundedSum, std::move(description));
  query.lower_ = lower;
  query.upper_ = upper;
  return query;
}

QueryDescriptor QueryDescriptor::Custom(
    std::string description, std::optional<double> declared_sensitivity) {
  QueryDescriptor query(QueryKind::kCustom, std::move(description));
  query.declared_sensitivity_ = declared_sensitivity;
  return query;
}

absl::StatusOr<double> SensitivityAnalyzer::SensitivityOf(
    QueryKind kind) const {
  if (kind == QueryKind::kCount) {
    // Adding, removing or replacing one row moves at most one row across the
    // predicate boundary.
    return 1.0;
  }
  return UndeclaredSensitivityError(
      absl::StrCat("query kind ", QueryKindName(kind)));
}

absl::StatusOr<double> SensitivityAnalyzer::SensitivityOf(
    const QueryDescriptor& query) const {
  switch (query.kind()) {
    case QueryKind::kCount:
      return SensitivityOf(QueryKind::kCount);
    case QueryKind::kBoundedSum: {
      const double lower = query.lower().value();
      const double upper = query.upper().value();
      RETURN_IF_ERROR(ValidateClampBounds(lower, upper));
      if (model_ == NeighborModel::kBounded) {
        return upper - lower;
      }
      return std::max(std::abs(lower), std::abs(upper));
    }
    case QueryKind::kCustom: {
      if (!query.declared_sensitivity().has_value()) {
        return UndeclaredSensitivityError(
            absl::StrCat("query '", query.description(), "'"));
      }
      RETURN_IF_ERROR(ValidateIsFiniteAndPositive(
          query.declared_sensitivity(), "Declared sensitivity"));
      return query.declared_sensitivity().value();
    }
  }
  return UndeclaredSensitivityError(
      absl::StrCat("query '", query.description(), "'"));
}

}  // namespace privacy_release
