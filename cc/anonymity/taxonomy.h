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

#ifndef PRIVACY_RELEASE_ANONYMITY_TAXONOMY_H_
#define PRIVACY_RELEASE_ANONYMITY_TAXONOMY_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace privacy_release {

// A rooted tree of categorical labels used to coarsen a categorical column.
//
// The tree is described by child -> parent edges. The single root is the
// label whose parent is the empty string. The level of a node is 0 for a
// leaf and otherwise one more than the highest level among its children, so
// levels strictly increase towards the root and the root's level is the
// height of the tree.
//
// Example usage:
//   ASSIGN_OR_RETURN(Taxonomy taxonomy, Taxonomy::Create({
//       {"Mexican", "Hispanic"}, {"Cuban", "Hispanic"},
//       {"Hispanic", "Any"}, {"Asian", "Any"}, {"Any", ""}}));
//   taxonomy.AncestorAtLevel("Cuban", 1);  // "Hispanic"
//   taxonomy.AncestorAtLevel("Asian", 1);  // "Any"
class Taxonomy {
 public:
  using Edge = std::pair<std::string, std::string>;

  // Validates the edges: every child appears once, every parent is a known
  // label or the root marker, exactly one root exists, and there are no
  // cycles.
  static absl::StatusOr<Taxonomy> Create(const std::vector<Edge>& edges);

  int height() const { return height_; }
  const std::string& root() const { return root_; }
  int size() const { return static_cast<int>(nodes_.size()); }

  bool Contains(absl::string_view label) const;

  absl::StatusOr<int> Level(absl::string_view label) const;

  // Returns the nearest ancestor-or-self of `label` whose level is at least
  // `level`. `level` must be in [0, height()].
  absl::StatusOr<std::string> AncestorAtLevel(absl::string_view label,
                                              int level) const;

 private:
  struct Node {
    std::string parent;
    int level = 0;
  };

  Taxonomy(absl::flat_hash_map<std::string, Node> nodes, std::string root,
           int height)
      : nodes_(std::move(nodes)), root_(std::move(root)), height_(height) {}

  absl::flat_hash_map<std::string, Node> nodes_;
  std::string root_;
  int height_;
};

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ANONYMITY_TAXONOMY_H_
