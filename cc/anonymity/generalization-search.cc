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

#include "anonymity/generalization-search.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "algorithms/util.h"
#include "anonymity/equivalence-classifier.h"
#include "base/logging.h"
#include "base/status_macros.h"

namespace privacy_release {
namespace {

// Loss increases below this are treated as free, so that their score stays
// finite.
constexpr double kMinLossIncrease = 1e-9;

struct Evaluation {
  int64_t min_group_size = 0;
  int64_t rows_in_large_classes = 0;
  double progress = 0;
  double information_loss = 0;
};

absl::StatusOr<Evaluation> Evaluate(
    const Dataset& dataset, const std::vector<std::string>& quasi_identifiers,
    int64_t k, const GeneralizationSpec& spec) {
  ASSIGN_OR_RETURN(const Dataset generalized, Generalize(dataset, spec));
  ASSIGN_OR_RETURN(const EquivalenceClasses classes,
                   Classify(generalized, quasi_identifiers));
  Evaluation evaluation;
  evaluation.min_group_size = MinGroupSize(classes);
  evaluation.rows_in_large_classes =
      CountRowsInClassesOfSizeAtLeast(classes, k);
  evaluation.progress = evaluation.min_group_size;
  if (!dataset.empty()) {
    evaluation.progress +=
        static_cast<double>(evaluation.rows_in_large_classes) / dataset.size();
  }
  ASSIGN_OR_RETURN(evaluation.information_loss,
                   InformationLoss(dataset, spec, quasi_identifiers));
  return evaluation;
}

absl::Status ValidateHierarchies(
    const std::vector<std::string>& quasi_identifiers,
    const std::vector<ColumnHierarchy>& hierarchies) {
  absl::flat_hash_map<std::string, int> seen;
  for (const ColumnHierarchy& hierarchy : hierarchies) {
    if (std::find(quasi_identifiers.begin(), quasi_identifiers.end(),
                  hierarchy.column) == quasi_identifiers.end()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Column ", hierarchy.column,
                       " has a hierarchy but is not a quasi-identifier."));
    }
    if (!seen.emplace(hierarchy.column, 0).second) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Column ", hierarchy.column, " has more than one hierarchy."));
    }
    if (hierarchy.generalizer == nullptr) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Hierarchy of column ", hierarchy.column, " has no generalizer."));
    }
    if (hierarchy.max_depth < 0 ||
        hierarchy.max_depth > hierarchy.generalizer->MaxDepth()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Maximum depth of column ", hierarchy.column, " must be in [0, ",
          hierarchy.generalizer->MaxDepth(), "], but is ",
          hierarchy.max_depth, "."));
    }
  }
  return absl::OkStatus();
}

}  // namespace

GeneralizationReport GeneralizationSearchResult::ToProto(int64_t k) const {
  GeneralizationReport report;
  report.set_k(k);
  report.set_found(found());
  for (ColumnGeneralization& column : explored.ToProto()) {
    *report.add_columns() = std::move(column);
  }
  report.set_rows(rows);
  report.set_min_group_size(min_group_size);
  report.set_undersized_rows(undersized_rows);
  report.set_information_loss(information_loss);
  report.set_steps(steps);
  return report;
}

absl::StatusOr<GeneralizationSearchResult> SearchMinimalGeneralization(
    const Dataset& dataset, const std::vector<std::string>& quasi_identifiers,
    int64_t k, const std::vector<ColumnHierarchy>& hierarchies) {
  RETURN_IF_ERROR(ValidateK(k));
  RETURN_IF_ERROR(dataset.ColumnIndices(quasi_identifiers).status());
  RETURN_IF_ERROR(ValidateHierarchies(quasi_identifiers, hierarchies));

  // Candidates are visited in quasi-identifier order, which breaks ties.
  std::vector<const ColumnHierarchy*> candidates;
  for (const std::string& column : quasi_identifiers) {
    for (const ColumnHierarchy& hierarchy : hierarchies) {
      if (hierarchy.column == column) candidates.push_back(&hierarchy);
    }
  }

  GeneralizationSpec spec;
  for (const ColumnHierarchy* hierarchy : candidates) {
    RETURN_IF_ERROR(spec.Set(hierarchy->column, hierarchy->generalizer, 0));
  }

  GeneralizationSearchResult result;
  result.rows = dataset.size();
  ASSIGN_OR_RETURN(Evaluation current,
                   Evaluate(dataset, quasi_identifiers, k, spec));
  while (true) {
    if (dataset.empty() || current.min_group_size >= k) {
      result.spec = spec;
      break;
    }

    const ColumnHierarchy* best = nullptr;
    double best_score = 0;
    double best_loss_increase = 0;
    Evaluation best_evaluation;
    for (const ColumnHierarchy* hierarchy : candidates) {
      if (spec.depth(hierarchy->column) >= hierarchy->max_depth) continue;
      GeneralizationSpec trial = spec;
      RETURN_IF_ERROR(trial.Deepen(hierarchy->column));
      ASSIGN_OR_RETURN(Evaluation evaluation,
                       Evaluate(dataset, quasi_identifiers, k, trial));
      const double gain = evaluation.progress - current.progress;
      const double loss_increase =
          evaluation.information_loss - current.information_loss;
      const double score = gain / std::max(loss_increase, kMinLossIncrease);
      if (best == nullptr || score > best_score ||
          (score == best_score && loss_increase < best_loss_increase)) {
        best = hierarchy;
        best_score = score;
        best_loss_increase = loss_increase;
        best_evaluation = evaluation;
      }
    }
    if (best == nullptr) break;

    RETURN_IF_ERROR(spec.Deepen(best->column));
    current = best_evaluation;
    ++result.steps;
    VLOG(1) << "Generalization step " << result.steps << ": deepened "
            << best->column << " to " << spec.depth(best->column)
            << ", min group size " << current.min_group_size
            << ", information loss " << current.information_loss
            << ", score " << best_score;
  }

  result.explored = spec;
  result.min_group_size = current.min_group_size;
  result.undersized_rows = dataset.size() - current.rows_in_large_classes;
  result.information_loss = current.information_loss;
  if (!result.found()) {
    VLOG(1) << "No " << k << "-anonymous generalization within "
            << spec.DebugString() << "; " << result.undersized_rows
            << " rows remain in undersized classes.";
  }
  return result;
}

}  // namespace privacy_release
