//
// Copyright 2019 Google LLC
// Copyright 2018 ZetaSQL Authors
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

#ifndef PRIVACY_RELEASE_BASE_STATUS_MACROS_H_
#define PRIVACY_RELEASE_BASE_STATUS_MACROS_H_

// Helper macros and methods to return and propagate errors with
// `absl::Status`.

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

// Evaluates an expression that produces a `absl::Status`.
// If the status is not ok, returns it from the current function.
//
// For example:
//   absl::Status ReleaseAll() {
//     RETURN_IF_ERROR(accountant.Charge(epsilon));
//     RETURN_IF_ERROR(ValidateEpsilon(other_epsilon));
//     return absl::OkStatus();
//   }
#define RETURN_IF_ERROR(expr)                                              \
  STATUS_MACROS_IMPL_ELSE_BLOCKER_                                         \
  if (::privacy_release::base::status_macro_internal::                     \
          StatusAdaptorForMacros status_macro_internal_adaptor = {expr}) { \
  } else /* NOLINT */                                                      \
    return status_macro_internal_adaptor.Consume()

// Executes an expression `rexpr` that returns a `absl::StatusOr<T>`. On OK,
// extracts its value into the variable defined by `lhs`, otherwise returns
// from the current function. If there is an error, `lhs` is not evaluated.
//
//   ASSIGN_OR_RETURN(lhs, rexpr)
//
// WARNING: expands into multiple statements; it cannot be used in a single
// statement (e.g. as the body of an if statement without {})!
//
// Example:
//   ASSIGN_OR_RETURN(EquivalenceClasses classes, Classify(dataset, qis));
#define ASSIGN_OR_RETURN(lhs, rexpr)    \
  STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_( \
      STATUS_MACROS_IMPL_CONCAT_(_status_or_value, __LINE__), lhs, rexpr)

// =================================================================
// == Implementation details, do not rely on anything below here. ==
// =================================================================
#define STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                         \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                        \
    return statusor.status();                                      \
  }                                                                \
  lhs = std::move(statusor).value()

#define STATUS_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define STATUS_MACROS_IMPL_CONCAT_(x, y) STATUS_MACROS_IMPL_CONCAT_INNER_(x, y)

// The "switch (0) case 0:" idiom keeps a dangling else in
//   if (do_expr) RETURN_IF_ERROR(expr);
// from binding to the if inside the macro.
#define STATUS_MACROS_IMPL_ELSE_BLOCKER_ \
  switch (0)                             \
  case 0:                                \
  default:  // NOLINT

namespace privacy_release {
namespace base {
namespace status_macro_internal {

// Provides a conversion to bool so that it can be used inside an if statement
// that declares a variable.
class StatusAdaptorForMacros {
 public:
  StatusAdaptorForMacros(const absl::Status& status) : status_(status) {}

  StatusAdaptorForMacros(absl::Status&& status) : status_(std::move(status)) {}

  StatusAdaptorForMacros(const StatusAdaptorForMacros&) = delete;
  StatusAdaptorForMacros& operator=(const StatusAdaptorForMacros&) = delete;

  explicit operator bool() const { return ABSL_PREDICT_TRUE(status_.ok()); }

  absl::Status&& Consume() { return std::move(status_); }

 private:
  absl::Status status_;
};

}  // namespace status_macro_internal
}  // namespace base
}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_BASE_STATUS_MACROS_H_
