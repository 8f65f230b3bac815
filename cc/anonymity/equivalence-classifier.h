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

#ifndef PRIVACY_RELEASE_ANONYMITY_EQUIVALENCE_CLASSIFIER_H_
#define PRIVACY_RELEASE_ANONYMITY_EQUIVALENCE_CLASSIFIER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "tabular/dataset.h"
#include "tabular/value.h"

namespace privacy_release {

// The rows of a dataset sharing one projection onto the quasi-identifiers.
struct EquivalenceClass {
  std::vector<Value> key;
  // Indices into the classified dataset, in increasing order.
  std::vector<int64_t> rows;

  int64_t size() const { return static_cast<int64_t>(rows.size()); }
};

// Classes in order of first appearance of their key. Every row index of the
// classified dataset belongs to exactly one class.
using EquivalenceClasses = std::vector<EquivalenceClass>;

// Groups the rows of `dataset` by their projection onto `quasi_identifiers`
// in a single hashing pass. The quasi-identifier set must be non-empty, free
// of duplicates, and name existing columns.
absl::StatusOr<EquivalenceClasses> Classify(
    const Dataset& dataset, const std::vector<std::string>& quasi_identifiers);

// Size of the smallest class, or 0 if there are no classes.
int64_t MinGroupSize(const EquivalenceClasses& classes);

// Whether every class has at least `k` rows. k must be at least 1. The empty
// dataset is k-anonymous for every k.
absl::StatusOr<bool> IsKAnonymous(
    const Dataset& dataset, const std::vector<std::string>& quasi_identifiers,
    int64_t k);

// Returns the classes with fewer than `k` rows, in their original order.
EquivalenceClasses FindUndersizedClasses(const EquivalenceClasses& classes,
                                         int64_t k);

// Number of rows belonging to classes of size at least `k`.
int64_t CountRowsInClassesOfSizeAtLeast(const EquivalenceClasses& classes,
                                        int64_t k);

struct SuppressionResult {
  Dataset dataset;
  int64_t suppressed_rows = 0;
};

// Drops the rows of every class smaller than `k`. The remaining dataset is
// k-anonymous and keeps the original row order.
absl::StatusOr<SuppressionResult> SuppressUndersizedClasses(
    const Dataset& dataset, const std::vector<std::string>& quasi_identifiers,
    int64_t k);

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ANONYMITY_EQUIVALENCE_CLASSIFIER_H_
