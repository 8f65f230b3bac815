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

#include "anonymity/equivalence-classifier.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "algorithms/util.h"
#include "base/logging.h"
#include "base/status_macros.h"

namespace privacy_release {

absl::StatusOr<EquivalenceClasses> Classify(
    const Dataset& dataset, const std::vector<std::string>& quasi_identifiers) {
  ASSIGN_OR_RETURN(const std::vector<int> indices,
                   dataset.ColumnIndices(quasi_identifiers));

  EquivalenceClasses classes;
  absl::flat_hash_map<std::vector<Value>, size_t> class_of_key;
  for (int64_t i = 0; i < dataset.size(); ++i) {
    std::vector<Value> key = ProjectRow(dataset.row(i), indices);
    auto it = class_of_key.find(key);
    if (it == class_of_key.end()) {
      class_of_key.emplace(key, classes.size());
      classes.push_back(EquivalenceClass{std::move(key), {i}});
    } else {
      classes[it->second].rows.push_back(i);
    }
  }
  return classes;
}

int64_t MinGroupSize(const EquivalenceClasses& classes) {
  if (classes.empty()) return 0;
  int64_t min_size = classes.front().size();
  for (const EquivalenceClass& equivalence_class : classes) {
    min_size = std::min(min_size, equivalence_class.size());
  }
  return min_size;
}

absl::StatusOr<bool> IsKAnonymous(
    const Dataset& dataset, const std::vector<std::string>& quasi_identifiers,
    int64_t k) {
  RETURN_IF_ERROR(ValidateK(k));
  ASSIGN_OR_RETURN(const EquivalenceClasses classes,
                   Classify(dataset, quasi_identifiers));
  if (classes.empty()) return true;
  return MinGroupSize(classes) >= k;
}

EquivalenceClasses FindUndersizedClasses(const EquivalenceClasses& classes,
                                         int64_t k) {
  EquivalenceClasses undersized;
  for (const EquivalenceClass& equivalence_class : classes) {
    if (equivalence_class.size() < k) {
      undersized.push_back(equivalence_class);
    }
  }
  return undersized;
}

int64_t CountRowsInClassesOfSizeAtLeast(const EquivalenceClasses& classes,
                                        int64_t k) {
  int64_t rows = 0;
  for (const EquivalenceClass& equivalence_class : classes) {
    if (equivalence_class.size() >= k) {
      rows += equivalence_class.size();
    }
  }
  return rows;
}

absl::StatusOr<SuppressionResult> SuppressUndersizedClasses(
    const Dataset& dataset, const std::vector<std::string>& quasi_identifiers,
    int64_t k) {
  RETURN_IF_ERROR(ValidateK(k));
  ASSIGN_OR_RETURN(const EquivalenceClasses classes,
                   Classify(dataset, quasi_identifiers));

  std::vector<bool> keep(dataset.size(), true);
  int64_t suppressed = 0;
  for (const EquivalenceClass& equivalence_class :
       FindUndersizedClasses(classes, k)) {
    for (int64_t row : equivalence_class.rows) {
      keep[row] = false;
    }
    suppressed += equivalence_class.size();
  }

  std::vector<Row> rows;
  rows.reserve(dataset.size() - suppressed);
  for (int64_t i = 0; i < dataset.size(); ++i) {
    if (keep[i]) rows.push_back(dataset.row(i));
  }
  ASSIGN_OR_RETURN(Dataset suppressed_dataset,
                   Dataset::Create(dataset.schema(), std::move(rows)));
  VLOG(1) << "Suppressed " << suppressed << " of " << dataset.size()
          << " rows to reach k = " << k;
  return SuppressionResult{std::move(suppressed_dataset), suppressed};
}

}  // namespace privacy_release
