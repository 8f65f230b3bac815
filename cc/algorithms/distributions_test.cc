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


#include "algorithms/distributions.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include "base/testing/status_matchers.h"
#include "boost/math/distributions/laplace.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "algorithms/rand.h"

namespace privacy_release {
namespace internal {
namespace {

using ::testing::HasSubstr;
using ::privacy_release::base::testing::StatusIs;

constexpr double kNan = std::numeric_limits<double>::quiet_NaN();
constexpr double kInfinity = std::numeric_limits<double>::infinity();

struct Moments {
  double mean;
  double variance;
  double kurtosis;
};

Moments MomentsOf(const std::vector<double>& samples) {
  const double n = samples.size();
  double mean = 0;
  for (double sample : samples) mean += sample / n;
  double m2 = 0;
  double m4 = 0;
  for (double sample : samples) {
    const double squared = (sample - mean) * (sample - mean);
    m2 += squared / n;
    m4 += squared * squared / n;
  }
  return {mean, m2, m4 / (m2 * m2)};
}

std::vector<double> Draw(const LaplaceDistribution& distribution,
                         RandomSource& random, int count) {
  std::vector<double> samples(count);
  for (double& sample : samples) sample = distribution.Sample(random);
  return samples;
}

TEST(LaplaceDistributionTest, RejectsInvalidParameters) {
  for (double invalid : {-1.0, 0.0, kNan, kInfinity}) {
    EXPECT_THAT(LaplaceDistribution::Create(invalid, 1),
                StatusIs(absl::StatusCode::kInvalidArgument,
                         HasSubstr("Epsilon must be finite and positive")));
    EXPECT_THAT(LaplaceDistribution::Create(1, invalid),
                StatusIs(absl::StatusCode::kInvalidArgument,
                         HasSubstr("Sensitivity must be finite and positive")));
  }
}

TEST(LaplaceDistributionTest, EpsilonHasAFloor) {
  EXPECT_THAT(LaplaceDistribution::Create(LaplaceDistribution::kMinEpsilon / 2,
                                          1),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Epsilon must be at least 2^-50")));
  EXPECT_OK(LaplaceDistribution::Create(LaplaceDistribution::kMinEpsilon, 1));
}

TEST(LaplaceDistributionTest, GranularityIsTheNextPowerOfTwoBelowDiversity) {
  // Diversity 2 is itself a power of two.
  LaplaceDistribution exact = LaplaceDistribution::Create(0.5, 1).value();
  EXPECT_EQ(exact.diversity(), 2);
  EXPECT_EQ(exact.granularity(), std::ldexp(1.0, -39));

  // Diversity 3 rounds up to 4.
  LaplaceDistribution rounded = LaplaceDistribution::Create(1, 3).value();
  EXPECT_EQ(rounded.granularity(), std::ldexp(1.0, -38));
  EXPECT_GT(rounded.granularity(), 0);
  EXPECT_LT(rounded.granularity(), rounded.diversity());
}

TEST(LaplaceDistributionTest, MomentsMatchTheLaplaceDistribution) {
  SeededRandomSource random(/*seed=*/7);
  for (double sensitivity : {1.0, 1.44269504089}) {
    LaplaceDistribution distribution =
        LaplaceDistribution::Create(1, sensitivity).value();
    const Moments moments = MomentsOf(Draw(distribution, random, 1000000));
    EXPECT_NEAR(moments.mean, 0, 0.01 * sensitivity);
    EXPECT_NEAR(moments.variance, distribution.variance(),
                0.05 * distribution.variance());
    // Excess kurtosis of the Laplace distribution is 3.
    EXPECT_NEAR(moments.kurtosis, 6, 0.3);
  }
}

TEST(LaplaceDistributionTest, SecureSourceGivesTheSameMoments) {
  SecureRandomSource random;
  LaplaceDistribution distribution = LaplaceDistribution::Create(1, 1).value();
  const Moments moments = MomentsOf(Draw(distribution, random, 200000));
  EXPECT_NEAR(moments.mean, 0, 0.03);
  EXPECT_NEAR(moments.variance, 2, 0.1);
}

TEST(LaplaceDistributionTest, SamplesAreMultiplesOfGranularity) {
  SeededRandomSource random(/*seed=*/11);
  LaplaceDistribution distribution =
      LaplaceDistribution::Create(0.5, 3).value();
  for (double sample : Draw(distribution, random, 1000)) {
    EXPECT_EQ(std::fmod(sample, distribution.granularity()), 0.0) << sample;
  }
}

TEST(LaplaceDistributionTest, SameSeedGivesSameSamples) {
  LaplaceDistribution distribution = LaplaceDistribution::Create(1, 1).value();
  SeededRandomSource first(3);
  SeededRandomSource second(3);
  EXPECT_EQ(Draw(distribution, first, 100), Draw(distribution, second, 100));
}

TEST(LaplaceDistributionTest, SnapRoundsToTheGrid) {
  LaplaceDistribution distribution = LaplaceDistribution::Create(1, 1).value();
  const double g = distribution.granularity();
  EXPECT_EQ(distribution.Snap(5 * g), 5 * g);
  EXPECT_EQ(distribution.Snap(5.4 * g), 5 * g);
  EXPECT_EQ(distribution.Snap(5.5 * g), 6 * g);
  EXPECT_EQ(distribution.Snap(-5.5 * g), -5 * g);
  EXPECT_EQ(distribution.Snap(-5.6 * g), -6 * g);
  EXPECT_EQ(distribution.Snap(1e300), 1e300);
}

TEST(LaplaceDistributionTest, CdfMatchesReferenceDistribution) {
  for (double sensitivity : {0.5, 1.0, 4.0}) {
    LaplaceDistribution distribution =
        LaplaceDistribution::Create(1, sensitivity).value();
    boost::math::laplace_distribution<double> reference(0, sensitivity);
    for (double x : {-10.0, -1.0, -0.1, 0.0, 0.3, 2.0, 12.0}) {
      EXPECT_NEAR(distribution.Cdf(x), boost::math::cdf(reference, x), 1e-12)
          << "diversity " << sensitivity << " at " << x;
    }
  }
}

TEST(LaplaceDistributionTest, EmpiricalCdfMatchesReferenceDistribution) {
  SeededRandomSource random(/*seed=*/13);
  LaplaceDistribution distribution =
      LaplaceDistribution::Create(0.5, 1).value();
  boost::math::laplace_distribution<double> reference(0, 2.0);
  constexpr int kNumSamples = 100000;
  std::vector<double> samples = Draw(distribution, random, kNumSamples);
  std::sort(samples.begin(), samples.end());
  for (double x : {-6.0, -2.0, -0.5, 0.5, 2.0, 6.0}) {
    const double empirical =
        static_cast<double>(
            std::upper_bound(samples.begin(), samples.end(), x) -
            samples.begin()) /
        kNumSamples;
    EXPECT_NEAR(empirical, boost::math::cdf(reference, x), 0.01) << x;
  }
}

TEST(LaplaceDistributionTest, QuantileInvertsCdf) {
  LaplaceDistribution distribution =
      LaplaceDistribution::Create(0.5, 1).value();
  for (double x : {-4.0, -0.5, 0.25, 3.0}) {
    EXPECT_NEAR(distribution.Quantile(distribution.Cdf(x)), x, 1e-9);
  }
  EXPECT_EQ(distribution.Quantile(0.5), 0.0);
}

}  // namespace
}  // namespace internal
}  // namespace privacy_release
