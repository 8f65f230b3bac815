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

#include "anonymity/generalizers.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <string>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "base/status_macros.h"

namespace privacy_release {

namespace {

// Largest depth at which 10^depth is a double.
constexpr int kMaxExactDepth = 22;
// From this depth on 10^depth exceeds every finite double.
constexpr int kOverflowDepth = 309;

constexpr double kInfinity = std::numeric_limits<double>::infinity();

double ExactPowerOfTen(int depth) {
  double power = 1;
  for (int i = 0; i < depth; ++i) power *= 10;
  return power;
}

// a - b if the difference is a double (Knuth's TwoSum recovers the rounding
// error exactly).
std::optional<double> ExactDifference(double a, double b) {
  const double difference = a - b;
  const double b_part = difference - a;
  const double error = (a - (difference - b_part)) + (-b - b_part);
  if (error != 0) return std::nullopt;
  return difference;
}

// The half-open bucket [lower, upper) of width 10^depth holding a value.
struct Bucket {
  double lower;
  // Unset when lower + 10^depth is not a double.
  std::optional<double> upper;
};

absl::Status NotRepresentable(double x, int depth) {
  return absl::InvalidArgumentError(
      absl::StrCat("Rounding ", x, " down to a multiple of 10^", depth,
                   " does not give a double."));
}

absl::StatusOr<Bucket> BucketOf(double x, int depth) {
  if (x == kInfinity) {
    return absl::InvalidArgumentError(
        "Numeric rounding cannot generalize +infinity.");
  }
  if (x == -kInfinity) return Bucket{-kInfinity, 0.0};

  if (depth > kMaxExactDepth) {
    // Every nonzero multiple of 10^depth needs more than 53 significant
    // bits, so only the buckets next to zero can be reported.
    double power = kInfinity;
    if (depth < kOverflowDepth &&
        !absl::SimpleAtod(absl::StrCat("1e", depth), &power)) {
      return absl::InternalError(
          absl::StrCat("Cannot represent 10^", depth, "."));
    }
    // `power` is the double nearest 10^depth, so no double lies strictly
    // between the two and this comparison is exact except at `power` itself.
    if (std::abs(x) < power) {
      return x >= 0 ? Bucket{0.0, kInfinity} : Bucket{-kInfinity, 0.0};
    }
    return NotRepresentable(x, depth);
  }

  const double power = ExactPowerOfTen(depth);
  // fmod is exact and has the sign of x.
  const double remainder = std::fmod(x, power);
  if (remainder == 0) return Bucket{x, ExactDifference(x, -power)};
  std::optional<double> lower = ExactDifference(x, remainder);
  if (lower.has_value() && remainder < 0) {
    lower = ExactDifference(*lower, power);
  }
  if (!lower.has_value()) return NotRepresentable(x, depth);
  return Bucket{*lower, ExactDifference(*lower, -power)};
}

}  // namespace

absl::Status Generalizer::ValidateDepth(int depth) const {
  if (depth < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Depth for the ", name(),
                     " generalizer must be non-negative, but is ", depth,
                     "."));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<NumericRoundingGeneralizer>>
NumericRoundingGeneralizer::Builder::Build() {
  if (!max_depth_.has_value()) {
    return absl::InvalidArgumentError("Maximum depth must be set.");
  }
  if (max_depth_.value() < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Maximum depth must be non-negative, but is ",
                     max_depth_.value(), "."));
  }
  return absl::WrapUnique(
      new NumericRoundingGeneralizer(max_depth_.value(), interval_output_));
}

absl::StatusOr<Value> NumericRoundingGeneralizer::Generalize(
    const Value& value, int depth) const {
  RETURN_IF_ERROR(ValidateDepth(depth));
  double x;
  if (value.is_numeric()) {
    x = value.numeric();
  } else if (value.is_interval()) {
    x = value.interval_lower();
  } else {
    return absl::InvalidArgumentError(absl::StrCat(
        "Numeric rounding cannot generalize the categorical value ",
        value.DebugString(), "."));
  }
  if (depth == 0) return value;
  if (std::isnan(x)) {
    return interval_output_ ? Value::Interval(x, x) : Value::Numeric(x);
  }

  ASSIGN_OR_RETURN(const Bucket bucket, BucketOf(x, depth));
  if (!interval_output_) return Value::Numeric(bucket.lower);
  if (!bucket.upper.has_value()) {
    return absl::InvalidArgumentError(
        absl::StrCat("The upper end of the depth ", depth, " interval above ",
                     bucket.lower, " is not a double."));
  }
  return Value::Interval(bucket.lower, *bucket.upper);
}

ValueType NumericRoundingGeneralizer::OutputType(ValueType input_type,
                                                 int depth) const {
  if (depth == 0) return input_type;
  return interval_output_ ? ValueType::kInterval : ValueType::kNumeric;
}

double NumericRoundingGeneralizer::InformationLoss(
    int depth, const ValueRange& range) const {
  if (depth <= 0) return 0;
  return std::min(1.0, std::pow(10.0, depth) / std::max(range.width(), 1.0));
}

std::string NumericRoundingGeneralizer::name() const {
  return interval_output_ ? "numeric_rounding_interval" : "numeric_rounding";
}

absl::StatusOr<Value> TaxonomyGeneralizer::Generalize(const Value& value,
                                                      int depth) const {
  RETURN_IF_ERROR(ValidateDepth(depth));
  if (!value.is_categorical()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Taxonomy generalization needs a categorical value, but "
                     "got ",
                     value.DebugString(), "."));
  }
  ASSIGN_OR_RETURN(std::string ancestor,
                   taxonomy_.AncestorAtLevel(value.categorical(), depth));
  return Value::Categorical(std::move(ancestor));
}

double TaxonomyGeneralizer::InformationLoss(int depth,
                                            const ValueRange& range) const {
  if (depth <= 0 || taxonomy_.height() == 0) return 0;
  return std::min(1.0, static_cast<double>(depth) / taxonomy_.height());
}

}  // namespace privacy_release
