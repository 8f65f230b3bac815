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

#include "tabular/aggregates.h"

#include <cmath>
#include <cstdint>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "algorithms/util.h"
#include "base/status_macros.h"

namespace privacy_release {

int64_t CountMatching(const Dataset& dataset,
                      absl::FunctionRef<bool(const Row&)> predicate) {
  int64_t count = 0;
  for (const Row& row : dataset.rows()) {
    if (predicate(row)) ++count;
  }
  return count;
}

absl::StatusOr<double> ClampedSum(const Dataset& dataset,
                                  absl::string_view column, double lower,
                                  double upper) {
  RETURN_IF_ERROR(ValidateClampBounds(lower, upper));
  ASSIGN_OR_RETURN(const int index, dataset.schema().IndexOf(column));
  if (dataset.schema().column(index).type != ValueType::kNumeric) {
    return absl::InvalidArgumentError(
        absl::StrCat("Column ", column, " is not numeric."));
  }
  double sum = 0;
  for (const Row& row : dataset.rows()) {
    const double x = row[index].numeric();
    if (std::isnan(x)) continue;
    sum += Clamp(lower, upper, x);
  }
  return sum;
}

}  // namespace privacy_release
