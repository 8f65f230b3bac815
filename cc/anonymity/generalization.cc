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

#include "anonymity/generalization.h"

#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "algorithms/util.h"
#include "base/status_macros.h"

namespace privacy_release {

absl::StatusOr<double> ClipValue(double value, double lower, double upper) {
  RETURN_IF_ERROR(ValidateClampBounds(lower, upper));
  if (std::isnan(value)) return value;
  return Clamp(lower, upper, value);
}

absl::StatusOr<Dataset> ClipColumn(const Dataset& dataset,
                                   absl::string_view column, double lower,
                                   double upper) {
  RETURN_IF_ERROR(ValidateClampBounds(lower, upper));
  ASSIGN_OR_RETURN(const int index, dataset.schema().IndexOf(column));
  if (dataset.schema().column(index).type != ValueType::kNumeric) {
    return absl::InvalidArgumentError(
        absl::StrCat("Only numeric columns can be clipped, but ", column,
                     " is ", ValueTypeName(dataset.schema().column(index).type),
                     "."));
  }
  std::vector<Row> rows = dataset.rows();
  for (Row& row : rows) {
    ASSIGN_OR_RETURN(const double clipped,
                     ClipValue(row[index].numeric(), lower, upper));
    row[index] = Value::Numeric(clipped);
  }
  return Dataset::Create(dataset.schema(), std::move(rows));
}

absl::Status GeneralizationSpec::Set(
    absl::string_view column, std::shared_ptr<const Generalizer> generalizer,
    int depth) {
  if (column.empty()) {
    return absl::InvalidArgumentError("Column name must not be empty.");
  }
  if (generalizer == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Generalizer for column ", column, " must be set."));
  }
  if (depth < 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Depth for column ", column, " must be non-negative, but is ", depth,
        "."));
  }
  Entry* entry = FindMutable(column);
  if (entry == nullptr) {
    entries_.push_back(Entry{std::string(column), std::move(generalizer), depth});
  } else {
    entry->generalizer = std::move(generalizer);
    entry->depth = depth;
  }
  return absl::OkStatus();
}

int GeneralizationSpec::depth(absl::string_view column) const {
  const Entry* entry = Find(column);
  return entry == nullptr ? 0 : entry->depth;
}

absl::Status GeneralizationSpec::Deepen(absl::string_view column) {
  Entry* entry = FindMutable(column);
  if (entry == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Column ", column, " has no generalizer."));
  }
  if (entry->depth >= entry->generalizer->MaxDepth()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Column ", column, " is already at its maximum depth ",
        entry->depth, "."));
  }
  ++entry->depth;
  return absl::OkStatus();
}

const GeneralizationSpec::Entry* GeneralizationSpec::Find(
    absl::string_view column) const {
  for (const Entry& entry : entries_) {
    if (entry.column == column) return &entry;
  }
  return nullptr;
}

GeneralizationSpec::Entry* GeneralizationSpec::FindMutable(
    absl::string_view column) {
  for (Entry& entry : entries_) {
    if (entry.column == column) return &entry;
  }
  return nullptr;
}

std::vector<ColumnGeneralization> GeneralizationSpec::ToProto() const {
  std::vector<ColumnGeneralization> columns;
  columns.reserve(entries_.size());
  for (const Entry& entry : entries_) {
    ColumnGeneralization column;
    column.set_column(entry.column);
    column.set_generalizer(entry.generalizer->name());
    column.set_depth(entry.depth);
    column.set_max_depth(entry.generalizer->MaxDepth());
    columns.push_back(std::move(column));
  }
  return columns;
}

std::string GeneralizationSpec::DebugString() const {
  return absl::StrCat(
      "{",
      absl::StrJoin(entries_, ", ",
                    [](std::string* out, const Entry& entry) {
                      absl::StrAppend(out, entry.column, ": ", entry.depth);
                    }),
      "}");
}

absl::StatusOr<Dataset> Generalize(const Dataset& dataset,
                                   const GeneralizationSpec& spec) {
  Schema schema = dataset.schema();
  std::vector<Row> rows = dataset.rows();
  for (const GeneralizationSpec::Entry& entry : spec.entries()) {
    ASSIGN_OR_RETURN(const int index, schema.IndexOf(entry.column));
    if (entry.depth == 0) continue;
    for (Row& row : rows) {
      ASSIGN_OR_RETURN(row[index],
                       entry.generalizer->Generalize(row[index], entry.depth));
    }
    ASSIGN_OR_RETURN(
        schema,
        schema.WithColumnType(
            entry.column, entry.generalizer->OutputType(
                              schema.column(index).type, entry.depth)));
  }
  return Dataset::Create(std::move(schema), std::move(rows));
}

absl::StatusOr<double> InformationLoss(
    const Dataset& dataset, const GeneralizationSpec& spec,
    const std::vector<std::string>& columns) {
  if (columns.empty()) {
    return absl::InvalidArgumentError(
        "Information loss needs at least one column.");
  }
  double total = 0;
  for (const std::string& column : columns) {
    ASSIGN_OR_RETURN(const int index, dataset.schema().IndexOf(column));
    const GeneralizationSpec::Entry* entry = spec.Find(column);
    if (entry == nullptr || entry->depth == 0) continue;
    ValueRange range;
    if (dataset.schema().column(index).type != ValueType::kCategorical) {
      ASSIGN_OR_RETURN(range, dataset.NumericRange(column));
    }
    total += entry->generalizer->InformationLoss(entry->depth, range);
  }
  return total / columns.size();
}

}  // namespace privacy_release
