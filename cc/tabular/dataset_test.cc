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

#include "tabular/dataset.h"

#include <limits>
#include <string>
#include <vector>

#include "base/testing/status_matchers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "tabular/aggregates.h"
#include "tabular/schema.h"

namespace privacy_release {
namespace {

using ::privacy_release::base::testing::IsOkAndHolds;
using ::privacy_release::base::testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

Schema PatientSchema() {
  return Schema::Create({{"age", ValueType::kNumeric},
                         {"race", ValueType::kCategorical},
                         {"bmi", ValueType::kNumeric}})
      .value();
}

Dataset PatientDataset() {
  return Dataset::Create(PatientSchema(),
                         {{Value::Numeric(42), Value::Categorical("4"),
                           Value::Numeric(25)},
                          {Value::Numeric(52), Value::Categorical("24"),
                           Value::Numeric(94)},
                          {Value::Numeric(36), Value::Categorical("31"),
                           Value::Numeric(57)}})
      .value();
}

TEST(SchemaTest, LooksUpColumnsByName) {
  Schema schema = PatientSchema();
  EXPECT_EQ(schema.size(), 3);
  EXPECT_THAT(schema.IndexOf("race"), IsOkAndHolds(1));
  EXPECT_TRUE(schema.HasColumn("bmi"));
  EXPECT_FALSE(schema.HasColumn("weight"));
  EXPECT_THAT(schema.IndexOf("weight"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Unknown column: weight")));
}

TEST(SchemaTest, RejectsDuplicateAndEmptyNames) {
  EXPECT_THAT(Schema::Create({{"age", ValueType::kNumeric},
                              {"age", ValueType::kCategorical}}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Duplicate column name")));
  EXPECT_THAT(Schema::Create({{"", ValueType::kNumeric}}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("empty name")));
}

TEST(SchemaTest, WithColumnTypeReturnsModifiedCopy) {
  Schema schema = PatientSchema();
  absl::StatusOr<Schema> changed =
      schema.WithColumnType("age", ValueType::kInterval);
  ASSERT_OK(changed);
  EXPECT_EQ(changed->column(0).type, ValueType::kInterval);
  EXPECT_EQ(schema.column(0).type, ValueType::kNumeric);
  EXPECT_EQ(changed->DebugString(),
            "(age: interval, race: categorical, bmi: numeric)");
}

TEST(DatasetTest, CreateValidatesArityAndTypes) {
  EXPECT_THAT(Dataset::Create(PatientSchema(), {{Value::Numeric(1)}}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Row 0: Row has 1 values")));
  EXPECT_THAT(
      Dataset::Create(PatientSchema(),
                      {{Value::Numeric(1), Value::Numeric(2),
                        Value::Numeric(3)}}),
      StatusIs(absl::StatusCode::kInvalidArgument,
               HasSubstr("Column race expects a categorical value")));
}

TEST(DatasetTest, BuilderKeepsRowOrder) {
  Dataset::Builder builder(PatientSchema());
  ASSERT_OK(builder.AddRow(
      {Value::Numeric(24), Value::Categorical("2"), Value::Numeric(62)}));
  ASSERT_OK(builder.AddRow(
      {Value::Numeric(73), Value::Categorical("3"), Value::Numeric(70)}));
  EXPECT_THAT(builder.AddRow({Value::Numeric(1)}),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_EQ(builder.size(), 2);

  Dataset dataset = std::move(builder).Build();
  ASSERT_EQ(dataset.size(), 2);
  EXPECT_EQ(dataset.value(0, 0), Value::Numeric(24));
  EXPECT_EQ(dataset.value(1, 1), Value::Categorical("3"));
}

TEST(DatasetTest, EmptyDataset) {
  Dataset dataset = Dataset::Create(PatientSchema(), {}).value();
  EXPECT_TRUE(dataset.empty());
  EXPECT_EQ(dataset.size(), 0);
  absl::StatusOr<ValueRange> range = dataset.NumericRange("age");
  ASSERT_OK(range);
  EXPECT_EQ(range->width(), 0);
}

TEST(DatasetTest, NumericRange) {
  Dataset dataset = PatientDataset();
  absl::StatusOr<ValueRange> range = dataset.NumericRange("age");
  ASSERT_OK(range);
  EXPECT_EQ(range->min, 36);
  EXPECT_EQ(range->max, 52);
  EXPECT_EQ(range->width(), 16);
  EXPECT_THAT(dataset.NumericRange("race"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("categorical")));
}

TEST(DatasetTest, NumericRangeOfIntervalsUsesBothBounds) {
  Schema schema = Schema::Create({{"age", ValueType::kInterval}}).value();
  Dataset dataset =
      Dataset::Create(schema, {{Value::Interval(30, 40)},
                               {Value::Interval(50, 60)}})
          .value();
  absl::StatusOr<ValueRange> range = dataset.NumericRange("age");
  ASSERT_OK(range);
  EXPECT_EQ(range->min, 30);
  EXPECT_EQ(range->max, 60);
}

TEST(DatasetTest, ColumnIndicesValidatesQuasiIdentifiers) {
  Dataset dataset = PatientDataset();
  EXPECT_THAT(dataset.ColumnIndices({"bmi", "age"}),
              IsOkAndHolds(ElementsAre(2, 0)));
  EXPECT_THAT(dataset.ColumnIndices({}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("must not be empty")));
  EXPECT_THAT(dataset.ColumnIndices({"age", "age"}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("more than once")));
  EXPECT_THAT(dataset.ColumnIndices({"zip"}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Unknown column")));
}

TEST(DatasetTest, ProjectRow) {
  Dataset dataset = PatientDataset();
  EXPECT_THAT(ProjectRow(dataset.row(1), {1, 0}),
              ElementsAre(Value::Categorical("24"), Value::Numeric(52)));
}

TEST(AggregatesTest, CountMatching) {
  Dataset dataset = PatientDataset();
  EXPECT_EQ(CountMatching(dataset,
                          [](const Row& row) {
                            return row[0].numeric() >= 40;
                          }),
            2);
  EXPECT_EQ(CountMatching(dataset, [](const Row&) { return false; }), 0);
}

TEST(AggregatesTest, ClampedSumClampsEveryValue) {
  Dataset dataset = PatientDataset();
  // 25 + 60 + 57
  EXPECT_THAT(ClampedSum(dataset, "bmi", 0, 60), IsOkAndHolds(142.0));
  // 40 + 40 + 36
  EXPECT_THAT(ClampedSum(dataset, "age", 0, 40), IsOkAndHolds(116.0));
}

TEST(AggregatesTest, ClampedSumSkipsNan) {
  Schema schema = Schema::Create({{"x", ValueType::kNumeric}}).value();
  Dataset dataset =
      Dataset::Create(schema,
                      {{Value::Numeric(1)},
                       {Value::Numeric(std::numeric_limits<double>::quiet_NaN())},
                       {Value::Numeric(2)}})
          .value();
  EXPECT_THAT(ClampedSum(dataset, "x", 0, 10), IsOkAndHolds(3.0));
}

TEST(AggregatesTest, ClampedSumRejectsInvalidArguments) {
  Dataset dataset = PatientDataset();
  EXPECT_THAT(ClampedSum(dataset, "bmi", 10, 0),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ClampedSum(dataset, "race", 0, 10),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not numeric")));
  EXPECT_THAT(ClampedSum(dataset, "weight", 0, 10),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace privacy_release
