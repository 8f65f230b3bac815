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

#ifndef PRIVACY_RELEASE_TABULAR_AGGREGATES_H_
#define PRIVACY_RELEASE_TABULAR_AGGREGATES_H_

#include <cstdint>

#include "absl/functional/function_ref.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tabular/dataset.h"

namespace privacy_release {

// True (non-private) answers of the aggregate queries whose sensitivity is
// known. These must only leave the process after passing through a
// mechanism.

// Number of rows for which `predicate` holds.
int64_t CountMatching(const Dataset& dataset,
                      absl::FunctionRef<bool(const Row&)> predicate);

// Sum of a numeric column with every value clamped to [lower, upper]. NaN
// values contribute nothing.
absl::StatusOr<double> ClampedSum(const Dataset& dataset,
                                  absl::string_view column, double lower,
                                  double upper);

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_TABULAR_AGGREGATES_H_
