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

#ifndef PRIVACY_RELEASE_TABULAR_DATASET_H_
#define PRIVACY_RELEASE_TABULAR_DATASET_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tabular/schema.h"
#include "tabular/value.h"

namespace privacy_release {

// Closed range [min, max] of the finite values observed in a column.
struct ValueRange {
  double min = 0;
  double max = 0;

  double width() const { return max - min; }
};

// An immutable, ordered collection of rows sharing one schema. Every
// transformation of a dataset produces a new Dataset.
//
// Example usage:
//   Dataset::Builder builder(schema);
//   RETURN_IF_ERROR(builder.AddRow({Value::Numeric(42),
//                                   Value::Categorical("4")}));
//   Dataset dataset = std::move(builder).Build();
class Dataset {
 public:
  class Builder {
   public:
    explicit Builder(Schema schema) : schema_(std::move(schema)) {}

    // Appends a row after checking it against the schema.
    absl::Status AddRow(Row row);

    int64_t size() const { return static_cast<int64_t>(rows_.size()); }

    Dataset Build() &&;

   private:
    Schema schema_;
    std::vector<Row> rows_;
  };

  static absl::StatusOr<Dataset> Create(Schema schema, std::vector<Row> rows);

  const Schema& schema() const { return schema_; }
  const std::vector<Row>& rows() const { return rows_; }
  const Row& row(int64_t index) const { return rows_[index]; }
  int64_t size() const { return static_cast<int64_t>(rows_.size()); }
  bool empty() const { return rows_.empty(); }

  const Value& value(int64_t row, int column) const {
    return rows_[row][column];
  }

  // Returns the range of a numeric or interval column. Interval values
  // contribute both of their bounds; NaNs are ignored. An empty dataset or a
  // column without finite values has the range [0, 0].
  absl::StatusOr<ValueRange> NumericRange(absl::string_view column) const;

  // Returns the indices of `columns`, which must be non-empty, unique and
  // present in the schema.
  absl::StatusOr<std::vector<int>> ColumnIndices(
      const std::vector<std::string>& columns) const;

 private:
  Dataset(Schema schema, std::vector<Row> rows)
      : schema_(std::move(schema)), rows_(std::move(rows)) {}

  Schema schema_;
  std::vector<Row> rows_;
};

// Returns the values of `row` at `column_indices`, in that order.
std::vector<Value> ProjectRow(const Row& row,
                              const std::vector<int>& column_indices);

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_TABULAR_DATASET_H_
