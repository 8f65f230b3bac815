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

#ifndef PRIVACY_RELEASE_ANONYMITY_GENERALIZATION_SEARCH_H_
#define PRIVACY_RELEASE_ANONYMITY_GENERALIZATION_SEARCH_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "anonymity/generalization.h"
#include "anonymity/generalizers.h"
#include "proto/generalization-report.pb.h"
#include "tabular/dataset.h"

namespace privacy_release {

// The candidate generalizations of one quasi-identifier: depths 0 through
// `max_depth` of `generalizer`.
struct ColumnHierarchy {
  std::string column;
  std::shared_ptr<const Generalizer> generalizer;
  int max_depth = 0;
};

struct GeneralizationSearchResult {
  // Set when a k-anonymous generalization was found.
  std::optional<GeneralizationSpec> spec;
  // The last generalization evaluated. Equal to `spec` when found, otherwise
  // every column at its maximum depth.
  GeneralizationSpec explored;
  int64_t rows = 0;
  int64_t min_group_size = 0;
  int64_t undersized_rows = 0;
  double information_loss = 0;
  int steps = 0;

  bool found() const { return spec.has_value(); }

  GeneralizationReport ToProto(int64_t k) const;
};

// Greedy search for a generalization of `quasi_identifiers` under which
// `dataset` is k-anonymous.
//
// The search starts with every hierarchy at depth 0. While the generalized
// dataset is not k-anonymous it deepens one column by one level, picking the
// column with the best ratio of progress gained to information loss added.
// Progress is the minimum group size plus the fraction of rows already in
// classes of size at least k. Ties go to the smaller loss increase, then to
// the earlier quasi-identifier. Quasi-identifiers without a hierarchy are
// never generalized.
//
// Not finding a generalization is a regular result with found() == false,
// reported once every column has reached its maximum depth. Errors are
// returned for k < 1, an invalid quasi-identifier set, hierarchies for
// columns outside it or listed twice, and maximum depths the generalizer
// cannot reach.
absl::StatusOr<GeneralizationSearchResult> SearchMinimalGeneralization(
    const Dataset& dataset, const std::vector<std::string>& quasi_identifiers,
    int64_t k, const std::vector<ColumnHierarchy>& hierarchies);

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ANONYMITY_GENERALIZATION_SEARCH_H_
