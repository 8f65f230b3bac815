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

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace privacy_release {

absl::StatusOr<Taxonomy> Taxonomy::Create(const std::vector<Edge>& edges) {
  absl::flat_hash_map<std::string, Node> nodes;
  std::vector<std::string> roots;
  for (const Edge& edge : edges) {
    const std::string& child = edge.first;
    if (child.empty()) {
      return absl::InvalidArgumentError("Taxonomy labels must not be empty.");
    }
    if (!nodes.emplace(child, Node{edge.second, 0}).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Taxonomy label ", child, " has more than one parent."));
    }
    if (edge.second.empty()) roots.push_back(child);
  }
  if (roots.size() != 1) {
    return absl::InvalidArgumentError(absl::StrCat(
        "A taxonomy must have exactly one root, but has ", roots.size(),
        roots.empty() ? "." : absl::StrCat(": ", absl::StrJoin(roots, ", "))));
  }

  absl::flat_hash_set<std::string> has_children;
  for (const auto& [label, node] : nodes) {
    if (node.parent.empty()) continue;
    if (!nodes.contains(node.parent)) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Taxonomy label ", label, " has unknown parent ", node.parent, "."));
    }
    has_children.insert(node.parent);
  }

  // With a single root and no cycles every walk towards the root ends
  // within size() steps.
  const int max_steps = static_cast<int>(nodes.size());
  for (const auto& [label, node] : nodes) {
    const Node* current = &node;
    for (int steps = 0; !current->parent.empty(); ++steps) {
      if (steps >= max_steps) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Taxonomy contains a cycle through ", label, "."));
      }
      current = &nodes.at(current->parent);
    }
  }

  // The level of a node is its largest distance to a leaf below it.
  for (const auto& [label, node] : nodes) {
    if (has_children.contains(label)) continue;
    std::string parent = node.parent;
    for (int distance = 1; !parent.empty(); ++distance) {
      Node& ancestor = nodes.at(parent);
      ancestor.level = std::max(ancestor.level, distance);
      parent = ancestor.parent;
    }
  }

  const std::string root = roots.front();
  const int height = nodes.at(root).level;
  return Taxonomy(std::move(nodes), root, height);
}

bool Taxonomy::Contains(absl::string_view label) const {
  return nodes_.contains(label);
}

absl::StatusOr<int> Taxonomy::Level(absl::string_view label) const {
  auto it = nodes_.find(label);
  if (it == nodes_.end()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Label ", label, " is not in the taxonomy."));
  }
  return it->second.level;
}

absl::StatusOr<std::string> Taxonomy::AncestorAtLevel(absl::string_view label,
                                                      int level) const {
  if (level < 0 || level > height_) {
    return absl::InvalidArgumentError(
        absl::StrCat("Taxonomy level must be in [0, ", height_, "], but is ",
                     level, "."));
  }
  auto it = nodes_.find(label);
  if (it == nodes_.end()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Label ", label, " is not in the taxonomy."));
  }
  while (it->second.level < level) {
    it = nodes_.find(it->second.parent);
  }
  return it->first;
}

}  // namespace privacy_release
