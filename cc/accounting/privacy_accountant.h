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

#ifndef PRIVACY_RELEASE_ACCOUNTING_PRIVACY_ACCOUNTANT_H_
#define PRIVACY_RELEASE_ACCOUNTING_PRIVACY_ACCOUNTANT_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "proto/privacy-ledger.pb.h"

namespace privacy_release {
namespace accounting {

// Tracks the epsilon spent against a budget under sequential composition: the
// privacy loss of n invocations charged to one accountant is the sum of their
// epsilons.
//
// Spend is recorded per scope. Within a scope the spent epsilon never
// decreases. NewScope() starts over with a fresh scope id while the history
// of earlier scopes stays in the ledger.
//
// All methods are thread-safe. Concurrent charges are serialized so that they
// can never jointly exceed the ceiling.
//
// Example:
//   ASSIGN_OR_RETURN(std::unique_ptr<PrivacyAccountant> accountant,
//                    PrivacyAccountant::Builder()
//                        .SetEpsilonCeiling(1.0)
//                        .SetScopeName("census-2026")
//                        .Build());
//   RETURN_IF_ERROR(accountant->Charge(0.25, "count of adults"));
class PrivacyAccountant {
 public:
  class Builder {
   public:
    // Leaving the ceiling unset gives an unlimited budget. That is only
    // acceptable for exploration; it provides no cumulative guarantee.
    Builder& SetEpsilonCeiling(double epsilon_ceiling);

    Builder& SetScopeName(std::string scope_name);

    absl::StatusOr<std::unique_ptr<PrivacyAccountant>> Build();

   private:
    std::optional<double> epsilon_ceiling_;
    std::string scope_name_ = "default";
  };

  PrivacyAccountant(const PrivacyAccountant&) = delete;
  PrivacyAccountant& operator=(const PrivacyAccountant&) = delete;

  // Records a spend of `epsilon` in the current scope. Fails with
  // kInvalidArgument unless epsilon is finite and positive, and with
  // kResourceExhausted when the charge would take the spent epsilon above the
  // ceiling. Totals within a relative 1e-9 of the ceiling are accepted, so
  // that charges summing to the ceiling in decimal are not lost to rounding.
  // A rejected charge leaves the accountant unchanged.
  absl::Status Charge(double epsilon, absl::string_view query = "")
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Charges `epsilon` and, only if the charge is accepted, calls
  // `noisy_answer` and records its result. The check, the charge, and the
  // record are one atomic step. `noisy_answer` must not call back into this
  // accountant.
  absl::StatusOr<MechanismInvocation> Release(
      absl::string_view query, absl::string_view mechanism,
      double sensitivity, double epsilon,
      absl::FunctionRef<double()> noisy_answer) ABSL_LOCKS_EXCLUDED(mutex_);

  // Opens a new scope with the given ceiling and returns its id. Charges made
  // afterwards count against the new scope only. An empty name keeps the name
  // of the current scope.
  absl::StatusOr<int64_t> NewScope(std::optional<double> epsilon_ceiling,
                                   absl::string_view name = "")
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Epsilon spent in the current scope.
  double SpentEpsilon() const ABSL_LOCKS_EXCLUDED(mutex_);

  // Budget left in the current scope, or nullopt when it has no ceiling.
  std::optional<double> RemainingEpsilon() const ABSL_LOCKS_EXCLUDED(mutex_);

  std::optional<double> ceiling() const ABSL_LOCKS_EXCLUDED(mutex_);

  int64_t scope_id() const ABSL_LOCKS_EXCLUDED(mutex_);

  // Copies of every recorded invocation across all scopes, oldest first.
  std::vector<MechanismInvocation> Ledger() const ABSL_LOCKS_EXCLUDED(mutex_);

  PrivacyLedger Serialize() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  explicit PrivacyAccountant(LedgerScope first_scope);

  LedgerScope& current_scope() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return scopes_.back();
  }
  const LedgerScope& current_scope() const
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return scopes_.back();
  }

  // Validates `epsilon` against the current scope and, if it fits, appends a
  // new invocation entry and adds the epsilon to the scope's spend.
  absl::StatusOr<MechanismInvocation*> ChargeLocked(double epsilon,
                                                    absl::string_view query)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  mutable absl::Mutex mutex_;
  // Never empty; the last entry is the current scope.
  std::vector<LedgerScope> scopes_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace accounting
}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ACCOUNTING_PRIVACY_ACCOUNTANT_H_
