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

#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "base/testing/status_matchers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "anonymity/taxonomy.h"

namespace privacy_release {
namespace {

using ::privacy_release::base::testing::IsOkAndHolds;
using ::privacy_release::base::testing::StatusIs;
using ::testing::DoubleEq;
using ::testing::HasSubstr;

constexpr double kInfinity = std::numeric_limits<double>::infinity();

std::unique_ptr<NumericRoundingGeneralizer> Rounding(int max_depth,
                                                     bool interval = false) {
  return NumericRoundingGeneralizer::Builder()
      .SetMaxDepth(max_depth)
      .SetIntervalOutput(interval)
      .Build()
      .value();
}

TaxonomyGeneralizer EthnicityGeneralizer() {
  return TaxonomyGeneralizer(Taxonomy::Create({{"Mexican", "Hispanic"},
                                               {"Cuban", "Hispanic"},
                                               {"Hispanic", "Any"},
                                               {"Asian", "Any"},
                                               {"Any", ""}})
                                 .value());
}

TEST(NumericRoundingGeneralizerTest, RoundsDownToPowersOfTen) {
  auto rounding = Rounding(3);
  EXPECT_THAT(rounding->Generalize(Value::Numeric(42), 0),
              IsOkAndHolds(Value::Numeric(42)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(42), 1),
              IsOkAndHolds(Value::Numeric(40)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(1234), 2),
              IsOkAndHolds(Value::Numeric(1200)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(-7), 1),
              IsOkAndHolds(Value::Numeric(-10)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(42.7), 0),
              IsOkAndHolds(Value::Numeric(42.7)));
}

TEST(NumericRoundingGeneralizerTest, IntervalOutput) {
  auto rounding = Rounding(2, /*interval=*/true);
  EXPECT_THAT(rounding->Generalize(Value::Numeric(42), 1),
              IsOkAndHolds(Value::Interval(40, 50)));
  EXPECT_THAT(rounding->Generalize(Value::Interval(40, 50), 2),
              IsOkAndHolds(Value::Interval(0, 100)));
  EXPECT_EQ(rounding->OutputType(ValueType::kNumeric, 0), ValueType::kNumeric);
  EXPECT_EQ(rounding->OutputType(ValueType::kNumeric, 1),
            ValueType::kInterval);
  EXPECT_EQ(rounding->name(), "numeric_rounding_interval");
}

TEST(NumericRoundingGeneralizerTest, IsMonotonicAndIdempotent) {
  const std::vector<double> values = {-1e20,
                                      -98765432109876543210.0,
                                      -1.2345678901234567e19,
                                      -9007199254740991.0,
                                      -123456789.5,
                                      -1234.0,
                                      -5.0,
                                      -1e-300,
                                      -0.0,
                                      0.0,
                                      7.0,
                                      42.7,
                                      99.0,
                                      100.0,
                                      98765.0,
                                      1e15 + 1,
                                      9007199254740991.0,
                                      9007199254740994.0,
                                      1.2345678901234567e19,
                                      98765432109876543210.0,
                                      1e20};
  std::vector<int> depths;
  for (int depth = 0; depth <= 25; ++depth) depths.push_back(depth);
  depths.insert(depths.end(), {308, 309, 400});

  for (bool interval : {false, true}) {
    auto rounding = Rounding(4, interval);
    for (double x : values) {
      for (int d1 : depths) {
        absl::StatusOr<Value> once =
            rounding->Generalize(Value::Numeric(x), d1);
        if (!once.ok()) {
          // Only a result that is not a double may be refused.
          EXPECT_THAT(once, StatusIs(absl::StatusCode::kInvalidArgument,
                                     HasSubstr("a double")))
              << x << " at depth " << d1;
          continue;
        }
        EXPECT_THAT(rounding->Generalize(*once, d1), IsOkAndHolds(*once))
            << x << " at depth " << d1;
        for (int d2 : depths) {
          if (d2 < d1) continue;
          absl::StatusOr<Value> direct =
              rounding->Generalize(Value::Numeric(x), d2);
          if (!direct.ok()) continue;
          EXPECT_THAT(rounding->Generalize(*once, d2), IsOkAndHolds(*direct))
              << x << " at depths " << d1 << ", " << d2;
        }
      }
    }
  }
}

TEST(NumericRoundingGeneralizerTest, RoundsAtAnyNonNegativeDepth) {
  // The configured maximum bounds the search, not Generalize.
  auto rounding = Rounding(2);
  EXPECT_THAT(rounding->Generalize(Value::Numeric(42), 3),
              IsOkAndHolds(Value::Numeric(0)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(42), 16),
              IsOkAndHolds(Value::Numeric(0)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(-5), 16),
              IsOkAndHolds(Value::Numeric(-1e16)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(3e16), 16),
              IsOkAndHolds(Value::Numeric(3e16)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(42), 22),
              IsOkAndHolds(Value::Numeric(0)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(-5), 22),
              IsOkAndHolds(Value::Numeric(-1e22)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(42), 400),
              IsOkAndHolds(Value::Numeric(0)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(1e300), 400),
              IsOkAndHolds(Value::Numeric(0)));
}

TEST(NumericRoundingGeneralizerTest, HugeDepthsUseSentinelBuckets) {
  auto rounding = Rounding(2);
  // 10^23 and above are not doubles, so -10^depth is reported as -infinity.
  EXPECT_THAT(rounding->Generalize(Value::Numeric(-5), 23),
              IsOkAndHolds(Value::Numeric(-kInfinity)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(-5), 400),
              IsOkAndHolds(Value::Numeric(-kInfinity)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(-kInfinity), 1),
              IsOkAndHolds(Value::Numeric(-kInfinity)));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(5e22), 23),
              IsOkAndHolds(Value::Numeric(0)));

  auto intervals = Rounding(2, /*interval=*/true);
  EXPECT_THAT(intervals->Generalize(Value::Numeric(7), 16),
              IsOkAndHolds(Value::Interval(0, 1e16)));
  EXPECT_THAT(intervals->Generalize(Value::Numeric(-7), 22),
              IsOkAndHolds(Value::Interval(-1e22, 0)));
  EXPECT_THAT(intervals->Generalize(Value::Numeric(7), 400),
              IsOkAndHolds(Value::Interval(0, kInfinity)));
  EXPECT_THAT(intervals->Generalize(Value::Numeric(-7), 400),
              IsOkAndHolds(Value::Interval(-kInfinity, 0)));
}

TEST(NumericRoundingGeneralizerTest, RefusesResultsThatAreNotDoubles) {
  auto rounding = Rounding(2);
  // Doubles near 1e20 are 16384 apart, so most multiples of 10^4 are missing.
  EXPECT_THAT(rounding->Generalize(Value::Numeric(98765432109876543210.0), 4),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("does not give a double")));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(98765432109876543210.0), 22),
              IsOkAndHolds(Value::Numeric(0)));
  // 1e20 is a multiple of 10 but 1e20 + 10 is not a double.
  EXPECT_THAT(rounding->Generalize(Value::Numeric(1e20), 1),
              IsOkAndHolds(Value::Numeric(1e20)));
  EXPECT_THAT(
      Rounding(2, /*interval=*/true)->Generalize(Value::Numeric(1e20), 1),
      StatusIs(absl::StatusCode::kInvalidArgument,
               HasSubstr("is not a double")));
  EXPECT_THAT(rounding->Generalize(Value::Numeric(kInfinity), 1),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("infinity")));
}

TEST(NumericRoundingGeneralizerTest, NanPassesThrough) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THAT(Rounding(2)->Generalize(Value::Numeric(nan), 1),
              IsOkAndHolds(Value::Numeric(nan)));
  EXPECT_THAT(
      Rounding(2, /*interval=*/true)->Generalize(Value::Numeric(nan), 1),
      IsOkAndHolds(Value::Interval(nan, nan)));
}

TEST(NumericRoundingGeneralizerTest, RejectsInvalidDepths) {
  auto rounding = Rounding(2);
  EXPECT_THAT(rounding->Generalize(Value::Numeric(42), -1),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("must be non-negative")));
  EXPECT_THAT(rounding->Generalize(Value::Categorical("42"), 1),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("categorical")));
}

TEST(NumericRoundingGeneralizerTest, BuilderValidatesMaxDepth) {
  EXPECT_THAT(NumericRoundingGeneralizer::Builder().Build(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("must be set")));
  EXPECT_THAT(NumericRoundingGeneralizer::Builder().SetMaxDepth(-1).Build(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("must be non-negative")));
  EXPECT_OK(NumericRoundingGeneralizer::Builder().SetMaxDepth(400).Build());
}

TEST(NumericRoundingGeneralizerTest, InformationLoss) {
  auto rounding = Rounding(3);
  ValueRange range{0, 1000};
  EXPECT_EQ(rounding->InformationLoss(0, range), 0);
  EXPECT_THAT(rounding->InformationLoss(1, range), DoubleEq(0.01));
  EXPECT_THAT(rounding->InformationLoss(2, range), DoubleEq(0.1));
  EXPECT_EQ(rounding->InformationLoss(3, range), 1);
  // Narrow ranges saturate.
  EXPECT_EQ(rounding->InformationLoss(2, ValueRange{0, 5}), 1);
}

TEST(TaxonomyGeneralizerTest, CollapsesTowardsTheRoot) {
  TaxonomyGeneralizer generalizer = EthnicityGeneralizer();
  EXPECT_EQ(generalizer.MaxDepth(), 2);
  EXPECT_THAT(generalizer.Generalize(Value::Categorical("Cuban"), 0),
              IsOkAndHolds(Value::Categorical("Cuban")));
  EXPECT_THAT(generalizer.Generalize(Value::Categorical("Cuban"), 1),
              IsOkAndHolds(Value::Categorical("Hispanic")));
  EXPECT_THAT(generalizer.Generalize(Value::Categorical("Asian"), 1),
              IsOkAndHolds(Value::Categorical("Any")));
  EXPECT_THAT(generalizer.Generalize(Value::Categorical("Mexican"), 2),
              IsOkAndHolds(Value::Categorical("Any")));
}

TEST(TaxonomyGeneralizerTest, IsMonotonicAndIdempotent) {
  TaxonomyGeneralizer generalizer = EthnicityGeneralizer();
  for (const std::string& label :
       {"Mexican", "Cuban", "Hispanic", "Asian", "Any"}) {
    for (int d1 = 0; d1 <= 2; ++d1) {
      Value once =
          generalizer.Generalize(Value::Categorical(label), d1).value();
      EXPECT_THAT(generalizer.Generalize(once, d1), IsOkAndHolds(once));
      for (int d2 = d1; d2 <= 2; ++d2) {
        EXPECT_THAT(
            generalizer.Generalize(once, d2),
            IsOkAndHolds(
                generalizer.Generalize(Value::Categorical(label), d2).value()))
            << label << " at depths " << d1 << ", " << d2;
      }
    }
  }
}

TEST(TaxonomyGeneralizerTest, RejectsInvalidInput) {
  TaxonomyGeneralizer generalizer = EthnicityGeneralizer();
  EXPECT_THAT(generalizer.Generalize(Value::Categorical("Cuban"), 3),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(generalizer.Generalize(Value::Categorical("Martian"), 1),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not in the taxonomy")));
  EXPECT_THAT(generalizer.Generalize(Value::Numeric(1), 1),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("categorical")));
}

TEST(TaxonomyGeneralizerTest, InformationLossIsFractionOfHeight) {
  TaxonomyGeneralizer generalizer = EthnicityGeneralizer();
  EXPECT_EQ(generalizer.InformationLoss(0, ValueRange()), 0);
  EXPECT_EQ(generalizer.InformationLoss(1, ValueRange()), 0.5);
  EXPECT_EQ(generalizer.InformationLoss(2, ValueRange()), 1);
}

}  // namespace
}  // namespace privacy_release
