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

#ifndef PRIVACY_RELEASE_ANONYMITY_GENERALIZERS_H_
#define PRIVACY_RELEASE_ANONYMITY_GENERALIZERS_H_

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "anonymity/taxonomy.h"
#include "tabular/dataset.h"
#include "tabular/value.h"

namespace privacy_release {

// Coarsens the values of one column. Depth 0 is the identity, and every
// generalizer is monotonic and idempotent:
//   Generalize(Generalize(v, d1), d2) == Generalize(v, d2) for d2 >= d1
//   Generalize(Generalize(v, d), d) == Generalize(v, d)
class Generalizer {
 public:
  virtual ~Generalizer() = default;

  // Returns the value at `depth`. Negative depths are rejected.
  virtual absl::StatusOr<Value> Generalize(const Value& value,
                                           int depth) const = 0;

  // Deepest level a generalization search explores.
  virtual int MaxDepth() const = 0;

  // Type of the values produced at `depth` from inputs of `input_type`.
  virtual ValueType OutputType(ValueType input_type, int depth) const = 0;

  // Fraction in [0, 1] of the column's precision lost at `depth`, where
  // `range` is the range of the ungeneralized column. Zero at depth 0.
  virtual double InformationLoss(int depth, const ValueRange& range) const = 0;

  virtual std::string name() const = 0;

 protected:
  absl::Status ValidateDepth(int depth) const;
};

// Rounds numbers down to a multiple of 10^depth, for every depth >= 0. In
// interval mode the value at depth > 0 is the interval
// [floor, floor + 10^depth) instead. Interval inputs are generalized by their
// lower bound.
//
// Results are exact. Where the rounded value is not a double, Generalize
// fails with kInvalidArgument rather than return a nearby number; this
// happens only for inputs beyond 2^53 in magnitude. Above depth 22, where
// 10^depth itself is not a double, the two buckets around zero are reported
// as 0 and -infinity ([0, +inf) and [-inf, 0) in interval mode), and
// -infinity stays -infinity at every depth. NaN passes through unchanged.
class NumericRoundingGeneralizer : public Generalizer {
 public:
  class Builder {
   public:
    // Required. Bounds the search only; Generalize accepts deeper levels.
    Builder& SetMaxDepth(int max_depth) {
      max_depth_ = max_depth;
      return *this;
    }

    Builder& SetIntervalOutput(bool interval_output) {
      interval_output_ = interval_output;
      return *this;
    }

    absl::StatusOr<std::unique_ptr<NumericRoundingGeneralizer>> Build();

   private:
    std::optional<int> max_depth_;
    bool interval_output_ = false;
  };

  absl::StatusOr<Value> Generalize(const Value& value,
                                   int depth) const override;
  int MaxDepth() const override { return max_depth_; }
  ValueType OutputType(ValueType input_type, int depth) const override;
  double InformationLoss(int depth, const ValueRange& range) const override;
  std::string name() const override;

  bool interval_output() const { return interval_output_; }

 private:
  NumericRoundingGeneralizer(int max_depth, bool interval_output)
      : max_depth_(max_depth), interval_output_(interval_output) {}

  const int max_depth_;
  const bool interval_output_;
};

// Replaces a label with its nearest ancestor-or-self in a taxonomy whose
// level is at least the depth. The maximum depth is the height of the
// taxonomy, where every label collapses to the root.
class TaxonomyGeneralizer : public Generalizer {
 public:
  explicit TaxonomyGeneralizer(Taxonomy taxonomy)
      : taxonomy_(std::move(taxonomy)) {}

  absl::StatusOr<Value> Generalize(const Value& value,
                                   int depth) const override;
  int MaxDepth() const override { return taxonomy_.height(); }
  ValueType OutputType(ValueType input_type, int depth) const override {
    return ValueType::kCategorical;
  }
  double InformationLoss(int depth, const ValueRange& range) const override;
  std::string name() const override { return "taxonomy"; }

  const Taxonomy& taxonomy() const { return taxonomy_; }

 private:
  Taxonomy taxonomy_;
};

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ANONYMITY_GENERALIZERS_H_
