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

#ifndef PRIVACY_RELEASE_TABULAR_SCHEMA_H_
#define PRIVACY_RELEASE_TABULAR_SCHEMA_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "tabular/value.h"

namespace privacy_release {

struct Column {
  std::string name;
  ValueType type;
};

// Ordered list of named, typed columns. Column names are unique and
// non-empty.
class Schema {
 public:
  static absl::StatusOr<Schema> Create(std::vector<Column> columns);

  int size() const { return static_cast<int>(columns_.size()); }
  const Column& column(int index) const { return columns_[index]; }
  const std::vector<Column>& columns() const { return columns_; }

  absl::StatusOr<int> IndexOf(absl::string_view name) const;
  bool HasColumn(absl::string_view name) const;

  // Returns a copy of this schema with the type of `name` replaced.
  absl::StatusOr<Schema> WithColumnType(absl::string_view name,
                                        ValueType type) const;

  // Checks that `row` has the schema's arity and that every value has the
  // type of its column.
  absl::Status ValidateRow(const Row& row) const;

  std::string DebugString() const;

 private:
  explicit Schema(std::vector<Column> columns);

  std::vector<Column> columns_;
  absl::flat_hash_map<std::string, int> index_;
};

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_TABULAR_SCHEMA_H_
