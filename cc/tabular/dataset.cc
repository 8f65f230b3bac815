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

#include "tabular/dataset.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "base/status_macros.h"

namespace privacy_release {

absl::Status Dataset::Builder::AddRow(Row row) {
  absl::Status status = schema_.ValidateRow(row);
  if (!status.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Row ", rows_.size(), ": ", status.message()));
  }
  rows_.push_back(std::move(row));
  return absl::OkStatus();
}

Dataset Dataset::Builder::Build() && {
  return Dataset(std::move(schema_), std::move(rows_));
}

absl::StatusOr<Dataset> Dataset::Create(Schema schema, std::vector<Row> rows) {
  Builder builder(std::move(schema));
  for (Row& row : rows) {
    RETURN_IF_ERROR(builder.AddRow(std::move(row)));
  }
  return std::move(builder).Build();
}

absl::StatusOr<ValueRange> Dataset::NumericRange(
    absl::string_view column) const {
  ASSIGN_OR_RETURN(const int index, schema_.IndexOf(column));
  const ValueType type = schema_.column(index).type;
  if (type == ValueType::kCategorical) {
    return absl::InvalidArgumentError(
        absl::StrCat("Column ", column, " is categorical."));
  }

  bool seen = false;
  ValueRange range;
  auto extend = [&seen, &range](double x) {
    if (!std::isfinite(x)) return;
    if (!seen) {
      range.min = x;
      range.max = x;
      seen = true;
      return;
    }
    range.min = std::min(range.min, x);
    range.max = std::max(range.max, x);
  };
  for (const Row& row : rows_) {
    const Value& value = row[index];
    if (value.is_numeric()) {
      extend(value.numeric());
    } else {
      extend(value.interval_lower());
      extend(value.interval_upper());
    }
  }
  return range;
}

absl::StatusOr<std::vector<int>> Dataset::ColumnIndices(
    const std::vector<std::string>& columns) const {
  if (columns.empty()) {
    return absl::InvalidArgumentError(
        "The quasi-identifier set must not be empty.");
  }
  absl::flat_hash_set<std::string> seen;
  std::vector<int> indices;
  indices.reserve(columns.size());
  for (const std::string& column : columns) {
    if (!seen.insert(column).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Column ", column, " appears more than once."));
    }
    ASSIGN_OR_RETURN(const int index, schema_.IndexOf(column));
    indices.push_back(index);
  }
  return indices;
}

std::vector<Value> ProjectRow(const Row& row,
                              const std::vector<int>& column_indices) {
  std::vector<Value> key;
  key.reserve(column_indices.size());
  for (int index : column_indices) {
    key.push_back(row[index]);
  }
  return key;
}

}  // namespace privacy_release
