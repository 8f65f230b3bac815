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

#ifndef PRIVACY_RELEASE_EXAMPLE_PATIENT_REPORT_H_
#define PRIVACY_RELEASE_EXAMPLE_PATIENT_REPORT_H_

#include <cstdint>
#include <memory>
#include <optional>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "accounting/privacy_accountant.h"
#include "algorithms/rand.h"
#include "proto/generalization-report.pb.h"
#include "proto/privacy-ledger.pb.h"
#include "tabular/dataset.h"

namespace privacy_release {
namespace example {

// A small clinic's patient table with the columns age, ethnicity and bmi.
absl::StatusOr<Dataset> SamplePatients();

// The PatientReporter helps a clinic publish a patient table. Before the rows
// leave the clinic they are generalized until every combination of age and
// ethnicity is shared by at least k patients. Aggregates over the raw table
// are only ever released with differential privacy, charged to one privacy
// accountant shared by all queries.
class PatientReporter {
 public:
  PatientReporter(Dataset patients,
                  std::unique_ptr<accounting::PrivacyAccountant> accountant,
                  std::unique_ptr<RandomSource> random);

  // Reports on `patients`, capping the epsilon that can be spent on them at
  // `epsilon_ceiling`.
  static absl::StatusOr<std::unique_ptr<PatientReporter>> Create(
      Dataset patients, double epsilon_ceiling,
      std::unique_ptr<RandomSource> random);

  const Dataset& patients() const { return patients_; }

  // Whether each (age, ethnicity) combination occurs at least k times.
  absl::StatusOr<bool> IsKAnonymous(int64_t k) const;

  // Searches for the least lossy generalization of age (rounding to
  // 10^max_age_depth) and ethnicity (its taxonomy) that makes the table
  // k-anonymous. The table published afterwards is the generalized one.
  absl::StatusOr<GeneralizationReport> Anonymize(int64_t k,
                                                 int max_age_depth);

  // The table to publish. Equal to patients() until Anonymize() succeeds.
  const Dataset& published() const { return published_; }

  // True number of patients strictly older than `age`.
  int64_t CountOlderThan(double age) const;

  // True sum of BMI values, clamped to [kMinBmi, kMaxBmi].
  double BmiSum() const;

  // DP count of patients strictly older than `age`. Consumes `epsilon`.
  absl::StatusOr<MechanismInvocation> PrivateCountOlderThan(double epsilon,
                                                            double age);

  // DP sum of clamped BMI values. Consumes `epsilon`.
  absl::StatusOr<MechanismInvocation> PrivateBmiSum(double epsilon);

  std::optional<double> RemainingEpsilon() const {
    return accountant_->RemainingEpsilon();
  }

  PrivacyLedger Ledger() const { return accountant_->Serialize(); }

  static constexpr double kMinBmi = 10;
  static constexpr double kMaxBmi = 60;

 private:
  Dataset patients_;
  Dataset published_;
  std::unique_ptr<accounting::PrivacyAccountant> accountant_;
  std::unique_ptr<RandomSource> random_;
};

}  // namespace example
}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_EXAMPLE_PATIENT_REPORT_H_
