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

#include "patient_report.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "accounting/privacy_accountant.h"
#include "algorithms/private-query.h"
#include "anonymity/equivalence-classifier.h"
#include "anonymity/generalization-search.h"
#include "anonymity/generalization.h"
#include "anonymity/generalizers.h"
#include "anonymity/taxonomy.h"
#include "base/logging.h"
#include "base/status_macros.h"
#include "tabular/aggregates.h"
#include "tabular/schema.h"
#include "tabular/value.h"

namespace privacy_release {
namespace example {
namespace {

const std::vector<std::string>& QuasiIdentifiers() {
  static const auto* const kQuasiIdentifiers =
      new std::vector<std::string>{"age", "ethnicity"};
  return *kQuasiIdentifiers;
}

absl::StatusOr<Taxonomy> EthnicityTaxonomy() {
  return Taxonomy::Create({{"Mexican", "Hispanic"},
                           {"Cuban", "Hispanic"},
                           {"Puerto Rican", "Hispanic"},
                           {"Chinese", "Asian"},
                           {"Korean", "Asian"},
                           {"Vietnamese", "Asian"},
                           {"Nigerian", "African"},
                           {"Ethiopian", "African"},
                           {"Hispanic", "Any"},
                           {"Asian", "Any"},
                           {"African", "Any"},
                           {"Any", ""}});
}

}  // namespace

struct PatientRecord {
  double age;
  const char* ethnicity;
  double bmi;
};

absl::StatusOr<Dataset> SamplePatients() {
  static constexpr PatientRecord kPatients[] = {
      {23, "Mexican", 24.1},   {27, "Cuban", 22.8},
      {25, "Puerto Rican", 27.3}, {21, "Mexican", 31.0},
      {34, "Chinese", 21.5},   {36, "Korean", 23.9},
      {31, "Vietnamese", 20.2}, {38, "Chinese", 26.7},
      {42, "Nigerian", 29.4},  {47, "Ethiopian", 25.5},
      {45, "Nigerian", 33.8},  {41, "Ethiopian", 24.6},
      {52, "Cuban", 28.9},     {58, "Mexican", 30.3},
      {55, "Korean", 27.0},    {59, "Chinese", 25.8},
      {63, "Nigerian", 26.4},  {66, "Vietnamese", 22.1},
      {61, "Ethiopian", 31.7}, {68, "Puerto Rican", 69.9},
  };
  ASSIGN_OR_RETURN(Schema schema,
                   Schema::Create({{"age", ValueType::kNumeric},
                                   {"ethnicity", ValueType::kCategorical},
                                   {"bmi", ValueType::kNumeric}}));
  Dataset::Builder builder(std::move(schema));
  for (const PatientRecord& patient : kPatients) {
    RETURN_IF_ERROR(builder.AddRow({Value::Numeric(patient.age),
                                    Value::Categorical(patient.ethnicity),
                                    Value::Numeric(patient.bmi)}));
  }
  return std::move(builder).Build();
}

PatientReporter::PatientReporter(
    Dataset patients, std::unique_ptr<accounting::PrivacyAccountant> accountant,
    std::unique_ptr<RandomSource> random)
    : patients_(patients),
      published_(std::move(patients)),
      accountant_(std::move(accountant)),
      random_(std::move(random)) {}

absl::StatusOr<std::unique_ptr<PatientReporter>> PatientReporter::Create(
    Dataset patients, double epsilon_ceiling,
    std::unique_ptr<RandomSource> random) {
  ASSIGN_OR_RETURN(std::unique_ptr<accounting::PrivacyAccountant> accountant,
                   accounting::PrivacyAccountant::Builder()
                       .SetEpsilonCeiling(epsilon_ceiling)
                       .SetScopeName("patients")
                       .Build());
  return absl::make_unique<PatientReporter>(
      std::move(patients), std::move(accountant), std::move(random));
}

absl::StatusOr<bool> PatientReporter::IsKAnonymous(int64_t k) const {
  return privacy_release::IsKAnonymous(patients_, QuasiIdentifiers(), k);
}

absl::StatusOr<GeneralizationReport> PatientReporter::Anonymize(
    int64_t k, int max_age_depth) {
  ASSIGN_OR_RETURN(std::unique_ptr<NumericRoundingGeneralizer> rounding,
                   NumericRoundingGeneralizer::Builder()
                       .SetMaxDepth(max_age_depth)
                       .SetIntervalOutput(true)
                       .Build());
  ASSIGN_OR_RETURN(Taxonomy ethnicity, EthnicityTaxonomy());
  auto taxonomy = std::make_shared<TaxonomyGeneralizer>(std::move(ethnicity));
  const std::vector<ColumnHierarchy> hierarchies = {
      {"age", std::move(rounding), max_age_depth},
      {"ethnicity", taxonomy, taxonomy->MaxDepth()}};

  ASSIGN_OR_RETURN(
      GeneralizationSearchResult result,
      SearchMinimalGeneralization(patients_, QuasiIdentifiers(), k,
                                  hierarchies));
  if (result.found()) {
    ASSIGN_OR_RETURN(published_, Generalize(patients_, *result.spec));
    LOG(INFO) << "Publishing " << published_.size()
              << " patients generalized as " << result.spec->DebugString();
  } else {
    LOG(WARNING) << "No " << k << "-anonymous generalization within depth "
                 << max_age_depth << "; " << result.undersized_rows
                 << " patients remain in groups smaller than " << k;
  }
  return result.ToProto(k);
}

int64_t PatientReporter::CountOlderThan(double age) const {
  const int index = patients_.schema().IndexOf("age").value();
  return CountMatching(patients_, [index, age](const Row& row) {
    return row[index].numeric() > age;
  });
}

double PatientReporter::BmiSum() const {
  return ClampedSum(patients_, "bmi", kMinBmi, kMaxBmi).value();
}

absl::StatusOr<MechanismInvocation> PatientReporter::PrivateCountOlderThan(
    double epsilon, double age) {
  ASSIGN_OR_RETURN(const int index, patients_.schema().IndexOf("age"));
  return PrivateCount(
      patients_,
      [index, age](const Row& row) { return row[index].numeric() > age; },
      epsilon, *accountant_, *random_,
      absl::StrCat("patients older than ", age));
}

absl::StatusOr<MechanismInvocation> PatientReporter::PrivateBmiSum(
    double epsilon) {
  return PrivateBoundedSum(patients_, "bmi", kMinBmi, kMaxBmi, epsilon,
                           *accountant_, *random_);
}

}  // namespace example
}  // namespace privacy_release
