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


#ifndef PRIVACY_RELEASE_ALGORITHMS_UTIL_H_
#define PRIVACY_RELEASE_ALGORITHMS_UTIL_H_

#include <algorithm>
#include <cstdint>
#include <optional>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace privacy_release {

// Returns `value` limited to [lower, upper]. Requires lower <= upper.
inline double Clamp(double lower, double upper, double value) {
  return std::min(std::max(value, lower), upper);
}

// Argument checks shared by the builders and entry points. Each returns OK or
// an kInvalidArgument error whose message starts with `name`. An unset
// optional fails with "<name> must be set.".
absl::Status ValidateIsFiniteAndPositive(std::optional<double> value,
                                         absl::string_view name);
absl::Status ValidateIsFiniteAndNonNegative(std::optional<double> value,
                                            absl::string_view name);

absl::Status ValidateEpsilon(std::optional<double> epsilon);

// The level must lie strictly between 0 and 1.
absl::Status ValidateConfidenceLevel(std::optional<double> confidence_level);

// The anonymity parameter k must be at least 1.
absl::Status ValidateK(int64_t k);

// Clamping bounds must be finite with lower <= upper.
absl::Status ValidateClampBounds(double lower, double upper);

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ALGORITHMS_UTIL_H_
