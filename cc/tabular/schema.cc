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

#include "tabular/schema.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace privacy_release {

Schema::Schema(std::vector<Column> columns) : columns_(std::move(columns)) {
  for (int i = 0; i < size(); ++i) {
    index_[columns_[i].name] = i;
  }
}

absl::StatusOr<Schema> Schema::Create(std::vector<Column> columns) {
  absl::flat_hash_map<std::string, int> seen;
  for (int i = 0; i < static_cast<int>(columns.size()); ++i) {
    const std::string& name = columns[i].name;
    if (name.empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Column ", i, " has an empty name."));
    }
    if (!seen.emplace(name, i).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate column name: ", name));
    }
  }
  return Schema(std::move(columns));
}

absl::StatusOr<int> Schema::IndexOf(absl::string_view name) const {
  auto it = index_.find(name);
  if (it == index_.end()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown column: ", name));
  }
  return it->second;
}

bool Schema::HasColumn(absl::string_view name) const {
  return index_.contains(name);
}

absl::StatusOr<Schema> Schema::WithColumnType(absl::string_view name,
                                              ValueType type) const {
  auto it = index_.find(name);
  if (it == index_.end()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown column: ", name));
  }
  std::vector<Column> columns = columns_;
  columns[it->second].type = type;
  return Schema(std::move(columns));
}

absl::Status Schema::ValidateRow(const Row& row) const {
  if (row.size() != columns_.size()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Row has ", row.size(), " values but the schema has ",
                     columns_.size(), " columns."));
  }
  for (int i = 0; i < size(); ++i) {
    if (row[i].type() != columns_[i].type) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Column ", columns_[i].name, " expects a ",
          ValueTypeName(columns_[i].type), " value but got ",
          ValueTypeName(row[i].type()), " ", row[i].DebugString()));
    }
  }
  return absl::OkStatus();
}

std::string Schema::DebugString() const {
  return absl::StrCat(
      "(",
      absl::StrJoin(columns_, ", ",
                    [](std::string* out, const Column& column) {
                      absl::StrAppend(out, column.name, ": ",
                                      ValueTypeName(column.type));
                    }),
      ")");
}

}  // namespace privacy_release
