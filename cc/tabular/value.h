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

#ifndef PRIVACY_RELEASE_TABULAR_VALUE_H_
#define PRIVACY_RELEASE_TABULAR_VALUE_H_

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/hash/hash.h"
#include "absl/strings/string_view.h"

namespace privacy_release {

enum class ValueType { kNumeric, kCategorical, kInterval };

absl::string_view ValueTypeName(ValueType type);

// A single immutable field of a row. Numeric values are doubles, categorical
// values are labels, and interval values are half-open ranges [lower, upper)
// produced by generalization.
//
// Equality and hashing treat every NaN as the same value and do not
// distinguish 0.0 from -0.0, so that rows can be grouped by their projections.
class Value {
 public:
  static Value Numeric(double value);
  static Value Categorical(std::string label);
  static Value Interval(double lower, double upper);

  Value(const Value&) = default;
  Value(Value&&) = default;
  Value& operator=(const Value&) = default;
  Value& operator=(Value&&) = default;

  ValueType type() const { return type_; }
  bool is_numeric() const { return type_ == ValueType::kNumeric; }
  bool is_categorical() const { return type_ == ValueType::kCategorical; }
  bool is_interval() const { return type_ == ValueType::kInterval; }

  // Accessors must only be called for values of the matching type.
  double numeric() const;
  const std::string& categorical() const;
  double interval_lower() const;
  double interval_upper() const;

  std::string DebugString() const;

  friend bool operator==(const Value& lhs, const Value& rhs);
  friend bool operator!=(const Value& lhs, const Value& rhs) {
    return !(lhs == rhs);
  }

  template <typename H>
  friend H AbslHashValue(H h, const Value& value) {
    switch (value.type_) {
      case ValueType::kNumeric:
        return H::combine(std::move(h), value.type_, value.lower_);
      case ValueType::kCategorical:
        return H::combine(std::move(h), value.type_, value.label_);
      case ValueType::kInterval:
        return H::combine(std::move(h), value.type_, value.lower_,
                          value.upper_);
    }
    return h;
  }

 private:
  Value(ValueType type, double lower, double upper, std::string label);

  ValueType type_;
  // Holds the numeric value, or the lower bound of an interval.
  double lower_ = 0;
  double upper_ = 0;
  std::string label_;
};

std::ostream& operator<<(std::ostream& os, const Value& value);

// An ordered, fixed-arity tuple of values conforming to a Schema.
using Row = std::vector<Value>;

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_TABULAR_VALUE_H_
