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

#include "anonymity/taxonomy.h"

#include <string>
#include <vector>

#include "base/testing/status_matchers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"

namespace privacy_release {
namespace {

using ::privacy_release::base::testing::IsOkAndHolds;
using ::privacy_release::base::testing::StatusIs;
using ::testing::HasSubstr;

// Any
// |- Hispanic
// |  |- Mexican
// |  |- Cuban
// |- Asian
std::vector<Taxonomy::Edge> EthnicityEdges() {
  return {{"Mexican", "Hispanic"},
          {"Cuban", "Hispanic"},
          {"Hispanic", "Any"},
          {"Asian", "Any"},
          {"Any", ""}};
}

TEST(TaxonomyTest, LevelsAreHeightsOfSubtrees) {
  absl::StatusOr<Taxonomy> taxonomy = Taxonomy::Create(EthnicityEdges());
  ASSERT_OK(taxonomy);
  EXPECT_EQ(taxonomy->root(), "Any");
  EXPECT_EQ(taxonomy->height(), 2);
  EXPECT_EQ(taxonomy->size(), 5);
  EXPECT_THAT(taxonomy->Level("Mexican"), IsOkAndHolds(0));
  EXPECT_THAT(taxonomy->Level("Asian"), IsOkAndHolds(0));
  EXPECT_THAT(taxonomy->Level("Hispanic"), IsOkAndHolds(1));
  EXPECT_THAT(taxonomy->Level("Any"), IsOkAndHolds(2));
  EXPECT_TRUE(taxonomy->Contains("Cuban"));
  EXPECT_FALSE(taxonomy->Contains("Martian"));
}

TEST(TaxonomyTest, AncestorAtLevel) {
  Taxonomy taxonomy = Taxonomy::Create(EthnicityEdges()).value();
  EXPECT_THAT(taxonomy.AncestorAtLevel("Cuban", 0), IsOkAndHolds("Cuban"));
  EXPECT_THAT(taxonomy.AncestorAtLevel("Cuban", 1), IsOkAndHolds("Hispanic"));
  EXPECT_THAT(taxonomy.AncestorAtLevel("Cuban", 2), IsOkAndHolds("Any"));
  // A shallow leaf skips straight to the first ancestor high enough.
  EXPECT_THAT(taxonomy.AncestorAtLevel("Asian", 1), IsOkAndHolds("Any"));
  EXPECT_THAT(taxonomy.AncestorAtLevel("Hispanic", 1),
              IsOkAndHolds("Hispanic"));
}

TEST(TaxonomyTest, AncestorAtLevelRejectsBadArguments) {
  Taxonomy taxonomy = Taxonomy::Create(EthnicityEdges()).value();
  EXPECT_THAT(taxonomy.AncestorAtLevel("Cuban", 3),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("must be in [0, 2]")));
  EXPECT_THAT(taxonomy.AncestorAtLevel("Cuban", -1),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(taxonomy.AncestorAtLevel("Martian", 1),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not in the taxonomy")));
}

TEST(TaxonomyTest, SingleNode) {
  absl::StatusOr<Taxonomy> taxonomy = Taxonomy::Create({{"Any", ""}});
  ASSERT_OK(taxonomy);
  EXPECT_EQ(taxonomy->height(), 0);
  EXPECT_THAT(taxonomy->AncestorAtLevel("Any", 0), IsOkAndHolds("Any"));
}

TEST(TaxonomyTest, RejectsMissingOrExtraRoots) {
  EXPECT_THAT(Taxonomy::Create({}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("exactly one root")));
  EXPECT_THAT(Taxonomy::Create({{"a", ""}, {"b", ""}}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("exactly one root, but has 2")));
}

TEST(TaxonomyTest, RejectsUnknownParent) {
  EXPECT_THAT(Taxonomy::Create({{"a", "b"}, {"root", ""}}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("unknown parent b")));
}

TEST(TaxonomyTest, RejectsCycles) {
  EXPECT_THAT(Taxonomy::Create({{"a", "b"}, {"b", "a"}, {"root", ""}}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("cycle")));
  EXPECT_THAT(Taxonomy::Create({{"a", "a"}, {"root", ""}}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("cycle")));
}

TEST(TaxonomyTest, RejectsDuplicateChildrenAndEmptyLabels) {
  EXPECT_THAT(
      Taxonomy::Create({{"a", "root"}, {"a", "root"}, {"root", ""}}),
      StatusIs(absl::StatusCode::kInvalidArgument,
               HasSubstr("more than one parent")));
  EXPECT_THAT(Taxonomy::Create({{"", "root"}, {"root", ""}}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("must not be empty")));
}

}  // namespace
}  // namespace privacy_release
