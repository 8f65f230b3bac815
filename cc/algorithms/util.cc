//
// Copyright 2019 Google LLC
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


#include "algorithms/util.h"

#include <cmath>
#include <cstdint>
#include <optional>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "base/status_macros.h"

namespace privacy_release {
namespace {

// The ranges an argument can be restricted to.
enum class Range { kFinite, kPositive, kNonNegative, kOpenUnitInterval };

bool InRange(double value, Range range) {
  switch (range) {
    case Range::kFinite:
      return std::isfinite(value);
    case Range::kPositive:
      return std::isfinite(value) && value > 0;
    case Range::kNonNegative:
      return std::isfinite(value) && value >= 0;
    case Range::kOpenUnitInterval:
      return value > 0 && value < 1;
  }
  return false;
}

absl::string_view Describe(Range range) {
  switch (range) {
    case Range::kFinite:
      return "finite";
    case Range::kPositive:
      return "finite and positive";
    case Range::kNonNegative:
      return "finite and non-negative";
    case Range::kOpenUnitInterval:
      return "strictly between 0 and 1";
  }
  return "";
}

absl::Status Validate(std::optional<double> value, absl::string_view name,
                      Range range) {
  if (!value.has_value()) {
    return absl::InvalidArgumentError(absl::StrCat(name, " must be set."));
  }
  if (!InRange(*value, range)) {
    return absl::InvalidArgumentError(absl::StrCat(
        name, " must be ", Describe(range), ", but is ", *value, "."));
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status ValidateIsFiniteAndPositive(std::optional<double> value,
                                         absl::string_view name) {
  return Validate(value, name, Range::kPositive);
}

absl::Status ValidateIsFiniteAndNonNegative(std::optional<double> value,
                                            absl::string_view name) {
  return Validate(value, name, Range::kNonNegative);
}

absl::Status ValidateEpsilon(std::optional<double> epsilon) {
  return Validate(epsilon, "Epsilon", Range::kPositive);
}

absl::Status ValidateConfidenceLevel(std::optional<double> confidence_level) {
  return Validate(confidence_level, "Confidence level",
                  Range::kOpenUnitInterval);
}

absl::Status ValidateK(int64_t k) {
  if (k < 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("k must be at least 1, but is ", k, "."));
  }
  return absl::OkStatus();
}

absl::Status ValidateClampBounds(double lower, double upper) {
  RETURN_IF_ERROR(Validate(lower, "Lower bound", Range::kFinite));
  RETURN_IF_ERROR(Validate(upper, "Upper bound", Range::kFinite));
  if (lower > upper) {
    return absl::InvalidArgumentError(
        absl::StrCat("Lower bound ", lower, " is above upper bound ", upper,
                     "."));
  }
  return absl::OkStatus();
}

}  // namespace privacy_release
