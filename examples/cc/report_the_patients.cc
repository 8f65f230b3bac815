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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "algorithms/rand.h"
#include "base/logging.h"
#include "patient_report.h"
#include "proto/generalization-report.pb.h"
#include "proto/privacy-ledger.pb.h"

using absl::PrintF;
using privacy_release::GeneralizationReport;
using privacy_release::MechanismInvocation;
using privacy_release::RandomSource;
using privacy_release::SecureRandomSource;
using privacy_release::SeededRandomSource;
using privacy_release::example::PatientReporter;
using ::absl::StatusOr;

ABSL_FLAG(double, epsilon_ceiling, 1.0,
          "Total epsilon that may be spent on the patient table.");
ABSL_FLAG(double, query_epsilon, 0.4,
          "Epsilon spent on each differentially private query.");
ABSL_FLAG(int64_t, k, 4,
          "Minimum number of patients that must share each combination of "
          "age and ethnicity in the published table.");
ABSL_FLAG(int, max_depth, 2,
          "Coarsest rounding of age, as a power of ten.");
ABSL_FLAG(int64_t, seed, -1,
          "Seed for reproducible noise. Negative values draw noise from the "
          "operating system's secure generator.");
ABSL_FLAG(std::string, log_directory, "",
          "Directory to write the log file to. Logs go to stderr when empty.");
ABSL_FLAG(int, vlog_level, 0, "Verbosity of VLOG statements.");

namespace {

void PrintRelease(const StatusOr<MechanismInvocation>& release) {
  if (!release.ok()) {
    PrintF("Refused: %s\n", release.status().message());
    return;
  }
  PrintF("DP answer: %.2f (epsilon %.2f, sensitivity %.0f)\n",
         release->output(), release->epsilon(), release->sensitivity());
}

void PrintBudget(const PatientReporter& reporter) {
  std::optional<double> remaining = reporter.RemainingEpsilon();
  if (remaining.has_value()) {
    PrintF("\nPrivacy budget remaining: %.2f\n", *remaining);
  } else {
    PrintF("\nPrivacy budget remaining: unlimited\n");
  }
}

}  // namespace

int main(int argc, char **argv) {
  absl::ParseCommandLine(argc, argv);
  const std::string log_directory = absl::GetFlag(FLAGS_log_directory);
  if (!log_directory.empty() &&
      !privacy_release::base::InitLogging(log_directory.c_str(), argv[0],
                                          absl::GetFlag(FLAGS_vlog_level))) {
    PrintF("Could not log to %s; logging to stderr.\n", log_directory);
  }
  privacy_release::base::set_vlog_level(absl::GetFlag(FLAGS_vlog_level));

  std::unique_ptr<RandomSource> random;
  if (absl::GetFlag(FLAGS_seed) >= 0) {
    random = absl::make_unique<SeededRandomSource>(
        static_cast<uint64_t>(absl::GetFlag(FLAGS_seed)));
  } else {
    random = absl::make_unique<SecureRandomSource>();
  }

  StatusOr<privacy_release::Dataset> patients =
      privacy_release::example::SamplePatients();
  if (!patients.ok()) {
    PrintF("Could not build the patients: %s\n", patients.status().message());
    return 1;
  }
  StatusOr<std::unique_ptr<PatientReporter>> reporter =
      PatientReporter::Create(std::move(patients).value(),
                              absl::GetFlag(FLAGS_epsilon_ceiling),
                              std::move(random));
  if (!reporter.ok()) {
    PrintF("Could not set up the report: %s\n", reporter.status().message());
    return 1;
  }
  const int64_t k = absl::GetFlag(FLAGS_k);
  const double query_epsilon = absl::GetFlag(FLAGS_query_epsilon);

  PrintF(
      "\nThe clinic wants to publish its table of %d patients. Age and "
      "ethnicity together could single out a patient, so first it checks "
      "whether every combination is shared by at least %d patients.\n",
      (*reporter)->patients().size(), k);
  StatusOr<bool> anonymous = (*reporter)->IsKAnonymous(k);
  if (!anonymous.ok()) {
    PrintF("Error: %s\n", anonymous.status().message());
    return 1;
  }
  PrintF("%d-anonymous as recorded: %s\n", k, *anonymous ? "yes" : "no");

  PrintF(
      "\nThe clinic coarsens age into ranges and ethnicity into broader "
      "groups, one step at a time, until the table is %d-anonymous.\n",
      k);
  StatusOr<GeneralizationReport> report =
      (*reporter)->Anonymize(k, absl::GetFlag(FLAGS_max_depth));
  if (!report.ok()) {
    PrintF("Error: %s\n", report.status().message());
    return 1;
  }
  PrintF("Generalization report:\n%s\n", report->DebugString());
  if (!report->found()) {
    PrintF(
        "Even the coarsest generalization leaves %d patients in groups "
        "smaller than %d. The table cannot be published as it is.\n",
        report->undersized_rows(), k);
  }

  PrintF(
      "\nA researcher asks how many patients are older than 40. The clinic "
      "answers with a differentially private count.\n");
  PrintBudget(**reporter);
  PrintF("True count: %d\n", (*reporter)->CountOlderThan(40));
  PrintRelease((*reporter)->PrivateCountOlderThan(query_epsilon, 40));

  PrintF(
      "\nThe researcher also asks for the total BMI, each value clamped to "
      "[%.0f, %.0f].\n",
      PatientReporter::kMinBmi, PatientReporter::kMaxBmi);
  PrintBudget(**reporter);
  PrintF("True sum: %.2f\n", (*reporter)->BmiSum());
  PrintRelease((*reporter)->PrivateBmiSum(query_epsilon));

  PrintF(
      "\nFinally the researcher asks how many patients are older than 60.\n");
  PrintBudget(**reporter);
  PrintRelease((*reporter)->PrivateCountOlderThan(query_epsilon, 60));

  PrintF("\nPrivacy ledger:\n%s\n", (*reporter)->Ledger().DebugString());
  return 0;
}
