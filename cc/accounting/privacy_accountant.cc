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

#include "accounting/privacy_accountant.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "algorithms/util.h"
#include "base/logging.h"
#include "base/status_macros.h"
#include "proto/privacy-ledger.pb.h"

namespace privacy_release {
namespace accounting {
namespace {

// Spends are plain sums of doubles, so charges that add up to the ceiling on
// paper can land a few ulps above it (0.1 + 0.1 + 0.1 > 0.3). A total within
// this fraction of the ceiling counts as reaching it, not exceeding it.
constexpr double kCeilingRelativeTolerance = 1e-9;

bool ExceedsCeiling(double total, double ceiling) {
  return total - ceiling > kCeilingRelativeTolerance * ceiling;
}

absl::Status ValidateCeiling(std::optional<double> epsilon_ceiling) {
  if (!epsilon_ceiling.has_value()) return absl::OkStatus();
  return ValidateIsFiniteAndNonNegative(epsilon_ceiling, "Epsilon ceiling");
}

LedgerScope MakeScope(int64_t scope_id, std::string name,
                      std::optional<double> epsilon_ceiling) {
  LOG_IF(WARNING, !epsilon_ceiling.has_value())
      << "Privacy scope " << scope_id << " (" << name
      << ") has no epsilon ceiling. Its spend is recorded but unlimited, "
         "which is unsafe for production releases.";
  LedgerScope scope;
  scope.set_scope_id(scope_id);
  scope.set_name(std::move(name));
  if (epsilon_ceiling.has_value()) {
    scope.set_epsilon_ceiling(*epsilon_ceiling);
  }
  scope.set_spent_epsilon(0);
  return scope;
}

}  // namespace

PrivacyAccountant::Builder& PrivacyAccountant::Builder::SetEpsilonCeiling(
    double epsilon_ceiling) {
  epsilon_ceiling_ = epsilon_ceiling;
  return *this;
}

PrivacyAccountant::Builder& PrivacyAccountant::Builder::SetScopeName(
    std::string scope_name) {
  scope_name_ = std::move(scope_name);
  return *this;
}

absl::StatusOr<std::unique_ptr<PrivacyAccountant>>
PrivacyAccountant::Builder::Build() {
  RETURN_IF_ERROR(ValidateCeiling(epsilon_ceiling_));
  if (scope_name_.empty()) {
    return absl::InvalidArgumentError("Scope name must not be empty.");
  }
  return absl::WrapUnique(new PrivacyAccountant(
      MakeScope(/*scope_id=*/0, scope_name_, epsilon_ceiling_)));
}

PrivacyAccountant::PrivacyAccountant(LedgerScope first_scope) {
  scopes_.push_back(std::move(first_scope));
}

absl::StatusOr<MechanismInvocation*> PrivacyAccountant::ChargeLocked(
    double epsilon, absl::string_view query) {
  RETURN_IF_ERROR(ValidateEpsilon(epsilon));
  LedgerScope& scope = current_scope();
  const double total = scope.spent_epsilon() + epsilon;
  if (scope.has_epsilon_ceiling() &&
      ExceedsCeiling(total, scope.epsilon_ceiling())) {
    return absl::ResourceExhaustedError(absl::StrCat(
        "Charging epsilon ", epsilon, " would bring the spend of scope ",
        scope.scope_id(), " (", scope.name(), ") to ", total,
        ", above its ceiling of ", scope.epsilon_ceiling(), "."));
  }
  scope.set_spent_epsilon(total);

  MechanismInvocation* entry = scope.add_invocations();
  entry->set_scope_id(scope.scope_id());
  entry->set_sequence_number(scope.invocations_size() - 1);
  entry->set_query(std::string(query));
  entry->set_epsilon(epsilon);
  entry->set_timestamp_micros(absl::ToUnixMicros(absl::Now()));
  VLOG(1) << "Charged epsilon " << epsilon << " to scope " << scope.scope_id()
          << "; spent " << total;
  return entry;
}

absl::Status PrivacyAccountant::Charge(double epsilon,
                                       absl::string_view query) {
  absl::MutexLock lock(&mutex_);
  return ChargeLocked(epsilon, query).status();
}

absl::StatusOr<MechanismInvocation> PrivacyAccountant::Release(
    absl::string_view query, absl::string_view mechanism, double sensitivity,
    double epsilon, absl::FunctionRef<double()> noisy_answer) {
  RETURN_IF_ERROR(ValidateIsFiniteAndPositive(sensitivity, "Sensitivity"));
  absl::MutexLock lock(&mutex_);
  ASSIGN_OR_RETURN(MechanismInvocation * entry, ChargeLocked(epsilon, query));
  entry->set_mechanism(std::string(mechanism));
  entry->set_sensitivity(sensitivity);
  entry->set_output(noisy_answer());
  return *entry;
}

absl::StatusOr<int64_t> PrivacyAccountant::NewScope(
    std::optional<double> epsilon_ceiling, absl::string_view name) {
  RETURN_IF_ERROR(ValidateCeiling(epsilon_ceiling));
  absl::MutexLock lock(&mutex_);
  const LedgerScope& previous = current_scope();
  const int64_t scope_id = previous.scope_id() + 1;
  std::string scope_name = name.empty() ? previous.name() : std::string(name);
  LOG(INFO) << "Closing privacy scope " << previous.scope_id() << " after "
            << previous.invocations_size() << " charges totalling epsilon "
            << previous.spent_epsilon() << "; opening scope " << scope_id;
  scopes_.push_back(MakeScope(scope_id, std::move(scope_name),
                              epsilon_ceiling));
  return scope_id;
}

double PrivacyAccountant::SpentEpsilon() const {
  absl::MutexLock lock(&mutex_);
  return current_scope().spent_epsilon();
}

std::optional<double> PrivacyAccountant::RemainingEpsilon() const {
  absl::MutexLock lock(&mutex_);
  const LedgerScope& scope = current_scope();
  if (!scope.has_epsilon_ceiling()) return std::nullopt;
  return std::max(0.0, scope.epsilon_ceiling() - scope.spent_epsilon());
}

std::optional<double> PrivacyAccountant::ceiling() const {
  absl::MutexLock lock(&mutex_);
  const LedgerScope& scope = current_scope();
  if (!scope.has_epsilon_ceiling()) return std::nullopt;
  return scope.epsilon_ceiling();
}

int64_t PrivacyAccountant::scope_id() const {
  absl::MutexLock lock(&mutex_);
  return current_scope().scope_id();
}

std::vector<MechanismInvocation> PrivacyAccountant::Ledger() const {
  absl::MutexLock lock(&mutex_);
  std::vector<MechanismInvocation> entries;
  for (const LedgerScope& scope : scopes_) {
    entries.insert(entries.end(), scope.invocations().begin(),
                   scope.invocations().end());
  }
  return entries;
}

PrivacyLedger PrivacyAccountant::Serialize() const {
  absl::MutexLock lock(&mutex_);
  PrivacyLedger ledger;
  for (const LedgerScope& scope : scopes_) {
    *ledger.add_scopes() = scope;
  }
  ledger.set_current_scope_id(current_scope().scope_id());
  return ledger;
}

}  // namespace accounting
}  // namespace privacy_release
