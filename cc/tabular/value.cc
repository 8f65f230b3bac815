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

#include "tabular/value.h"

#include <cmath>
#include <limits>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "base/logging.h"

namespace privacy_release {
namespace {

// Collapses the NaN payloads and the sign of zero so that equal-looking
// numbers group together.
double Normalize(double value) {
  if (std::isnan(value)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (value == 0) {
    return 0.0;
  }
  return value;
}

bool SameNumber(double lhs, double rhs) {
  if (std::isnan(lhs) || std::isnan(rhs)) {
    return std::isnan(lhs) && std::isnan(rhs);
  }
  return lhs == rhs;
}

}  // namespace

absl::string_view ValueTypeName(ValueType type) {
  switch (type) {
    case ValueType::kNumeric:
      return "numeric";
    case ValueType::kCategorical:
      return "categorical";
    case ValueType::kInterval:
      return "interval";
  }
  return "unknown";
}

Value::Value(ValueType type, double lower, double upper, std::string label)
    : type_(type),
      lower_(Normalize(lower)),
      upper_(Normalize(upper)),
      label_(std::move(label)) {}

Value Value::Numeric(double value) {
  return Value(ValueType::kNumeric, value, 0, "");
}

Value Value::Categorical(std::string label) {
  return Value(ValueType::kCategorical, 0, 0, std::move(label));
}

Value Value::Interval(double lower, double upper) {
  return Value(ValueType::kInterval, lower, upper, "");
}

double Value::numeric() const {
  DCHECK(is_numeric()) << "Value is " << ValueTypeName(type_);
  return lower_;
}

const std::string& Value::categorical() const {
  DCHECK(is_categorical()) << "Value is " << ValueTypeName(type_);
  return label_;
}

double Value::interval_lower() const {
  DCHECK(is_interval()) << "Value is " << ValueTypeName(type_);
  return lower_;
}

double Value::interval_upper() const {
  DCHECK(is_interval()) << "Value is " << ValueTypeName(type_);
  return upper_;
}

std::string Value::DebugString() const {
  switch (type_) {
    case ValueType::kNumeric:
      return absl::StrCat(lower_);
    case ValueType::kCategorical:
      return absl::StrCat("\"", label_, "\"");
    case ValueType::kInterval:
      return absl::StrCat("[", lower_, ", ", upper_, ")");
  }
  return "";
}

bool operator==(const Value& lhs, const Value& rhs) {
  if (lhs.type_ != rhs.type_) return false;
  switch (lhs.type_) {
    case ValueType::kNumeric:
      return SameNumber(lhs.lower_, rhs.lower_);
    case ValueType::kCategorical:
      return lhs.label_ == rhs.label_;
    case ValueType::kInterval:
      return SameNumber(lhs.lower_, rhs.lower_) &&
             SameNumber(lhs.upper_, rhs.upper_);
  }
  return false;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
  return os << value.DebugString();
}

}  // namespace privacy_release
