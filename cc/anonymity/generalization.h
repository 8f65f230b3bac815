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

#ifndef PRIVACY_RELEASE_ANONYMITY_GENERALIZATION_H_
#define PRIVACY_RELEASE_ANONYMITY_GENERALIZATION_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "anonymity/generalizers.h"
#include "proto/generalization-report.pb.h"
#include "tabular/dataset.h"

namespace privacy_release {

// Limits `value` to [lower, upper]. NaN stays NaN. The bounds must be finite
// with lower <= upper.
absl::StatusOr<double> ClipValue(double value, double lower, double upper);

// Returns a copy of `dataset` whose numeric column `column` is clipped to
// [lower, upper]. Clipping is never applied implicitly; callers use it to
// pull outliers in before searching for a generalization.
absl::StatusOr<Dataset> ClipColumn(const Dataset& dataset,
                                   absl::string_view column, double lower,
                                   double upper);

// Assignment of a generalizer and a depth to columns. Columns without an
// entry are left as they are.
class GeneralizationSpec {
 public:
  struct Entry {
    std::string column;
    std::shared_ptr<const Generalizer> generalizer;
    int depth = 0;
  };

  // Adds or replaces the entry of `column`. The depth must be non-negative;
  // it may exceed the generalizer's MaxDepth(), which only bounds Deepen().
  absl::Status Set(absl::string_view column,
                   std::shared_ptr<const Generalizer> generalizer, int depth);

  // Depth of `column`, 0 for columns without an entry.
  int depth(absl::string_view column) const;

  // Increases the depth of `column` by one, up to the generalizer's
  // MaxDepth().
  absl::Status Deepen(absl::string_view column);

  const Entry* Find(absl::string_view column) const;

  // Entries in the order in which their columns were first set.
  const std::vector<Entry>& entries() const { return entries_; }

  std::vector<ColumnGeneralization> ToProto() const;

  std::string DebugString() const;

 private:
  Entry* FindMutable(absl::string_view column);

  std::vector<Entry> entries_;
};

// Applies `spec` to every row of `dataset` and returns the result. Columns
// not named in the spec pass through, and the types of generalized columns
// follow their generalizers.
absl::StatusOr<Dataset> Generalize(const Dataset& dataset,
                                   const GeneralizationSpec& spec);

// Mean information loss of `spec` over `columns`, measured against the
// ranges of the ungeneralized `dataset`.
absl::StatusOr<double> InformationLoss(const Dataset& dataset,
                                       const GeneralizationSpec& spec,
                                       const std::vector<std::string>& columns);

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ANONYMITY_GENERALIZATION_H_
