#include "tree.h"

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <magic_enum/magic_enum.hpp>
#include <numeric>
#include <unordered_set>

namespace multisplit {

// ============================================================================
// Query Functions
// ============================================================================

bool is_empty(const Tree& tree) {
  return tree.nodes.empty();
}

const LeafNode* get_leaf(const Tree& tree, int index) {
  if (!tree.nodes.is_valid_index(index)) {
    return nullptr;
  }
  return std::get_if<LeafNode>(&tree.nodes[index]);
}

const SplitNode* get_split(const Tree& tree, int index) {
  if (!tree.nodes.is_valid_index(index)) {
    return nullptr;
  }
  return std::get_if<SplitNode>(&tree.nodes[index]);
}

std::optional<int> find_leaf(const Tree& tree, const PaneId& pane_id) {
  for (int i = 0; i < static_cast<int>(tree.nodes.size()); ++i) {
    const LeafNode* leaf = get_leaf(tree, i);
    if (leaf != nullptr && leaf->pane_id == pane_id) {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<int> find_split(const Tree& tree, const SplitId& split_id) {
  for (int i = 0; i < static_cast<int>(tree.nodes.size()); ++i) {
    const SplitNode* split = get_split(tree, i);
    if (split != nullptr && split->id == split_id) {
      return i;
    }
  }
  return std::nullopt;
}

bool has_pane(const Tree& tree, const PaneId& pane_id) {
  return find_leaf(tree, pane_id).has_value();
}

static void collect_leaves(const Tree& tree, int index, std::vector<int>& out) {
  if (get_leaf(tree, index) != nullptr) {
    out.push_back(index);
    return;
  }
  for (int child : tree.nodes.get_children(index)) {
    collect_leaves(tree, child, out);
  }
}

std::vector<int> get_leaf_indices(const Tree& tree) {
  std::vector<int> result;
  if (!is_empty(tree)) {
    collect_leaves(tree, kRootIndex, result);
  }
  return result;
}

std::vector<PaneId> get_pane_ids(const Tree& tree) {
  std::vector<PaneId> result;
  for (int index : get_leaf_indices(tree)) {
    result.push_back(get_leaf(tree, index)->pane_id);
  }
  return result;
}

size_t pane_count(const Tree& tree) {
  return get_leaf_indices(tree).size();
}

std::optional<int> first_leaf_under(const Tree& tree, int index) {
  while (tree.nodes.is_valid_index(index)) {
    if (get_leaf(tree, index) != nullptr) {
      return index;
    }
    const auto& children = tree.nodes.get_children(index);
    if (children.empty()) {
      return std::nullopt;
    }
    index = children.front();
  }
  return std::nullopt;
}

std::optional<PaneId> first_pane(const Tree& tree) {
  if (is_empty(tree)) {
    return std::nullopt;
  }
  auto index = first_leaf_under(tree, kRootIndex);
  if (!index.has_value()) {
    return std::nullopt;
  }
  return get_leaf(tree, *index)->pane_id;
}

std::optional<SplitId> parent_split_of(const Tree& tree, const PaneId& pane_id) {
  auto index = find_leaf(tree, pane_id);
  if (!index.has_value()) {
    return std::nullopt;
  }
  auto parent = tree.nodes.get_parent(*index);
  if (!parent.has_value()) {
    return std::nullopt;
  }
  const SplitNode* split = get_split(tree, *parent);
  if (split == nullptr) {
    return std::nullopt;
  }
  return split->id;
}

// ============================================================================
// Ratio Helpers
// ============================================================================

bool ratios_are_valid(const std::vector<double>& ratios, size_t expected_count) {
  if (ratios.size() != expected_count || ratios.empty()) {
    return false;
  }
  double sum = 0.0;
  for (double ratio : ratios) {
    if (!std::isfinite(ratio) || ratio <= 0.0) {
      return false;
    }
    sum += ratio;
  }
  return std::abs(sum - 1.0) <= kRatioTolerance;
}

std::vector<double> normalize_ratios(std::vector<double> ratios) {
  double sum = std::accumulate(ratios.begin(), ratios.end(), 0.0);
  if (sum <= 0.0) {
    return equal_ratios(ratios.size());
  }
  for (double& ratio : ratios) {
    ratio /= sum;
  }
  return ratios;
}

std::vector<double> equal_ratios(size_t count) {
  if (count == 0) {
    return {};
  }
  return std::vector<double>(count, 1.0 / static_cast<double>(count));
}

// ============================================================================
// Validation
// ============================================================================

std::vector<std::string> validate_tree(const Tree& tree) {
  std::vector<std::string> violations;

  if (is_empty(tree)) {
    if (tree.focused_pane_id.has_value()) {
      violations.push_back("empty tree has a focused pane");
    }
    if (tree.maximized_pane_id.has_value()) {
      violations.push_back("empty tree has a maximized pane");
    }
    return violations;
  }

  if (tree.nodes.get_parent(kRootIndex).has_value()) {
    violations.push_back("root node has a parent");
  }

  // Walk from the root: every node must be reached exactly once
  std::vector<int> visit_count(tree.nodes.size(), 0);
  std::unordered_set<PaneId> pane_ids;
  std::unordered_set<SplitId> split_ids;
  std::vector<int> stack{kRootIndex};

  while (!stack.empty()) {
    int index = stack.back();
    stack.pop_back();

    if (!tree.nodes.is_valid_index(index)) {
      violations.push_back(fmt::format("node index {} is out of range", index));
      continue;
    }
    if (++visit_count[static_cast<size_t>(index)] > 1) {
      violations.push_back(fmt::format("node {} is reachable more than once", index));
      continue;
    }

    const auto& children = tree.nodes.get_children(index);

    if (const LeafNode* leaf = get_leaf(tree, index)) {
      if (!children.empty()) {
        violations.push_back(fmt::format("leaf {} has children", leaf->pane_id.value));
      }
      if (leaf->pane_id.value.empty()) {
        violations.push_back(fmt::format("leaf at node {} has an empty pane id", index));
      }
      if (!pane_ids.insert(leaf->pane_id).second) {
        violations.push_back(fmt::format("duplicate pane id {}", leaf->pane_id.value));
      }
      continue;
    }

    const SplitNode& split = std::get<SplitNode>(tree.nodes[index]);
    if (!split_ids.insert(split.id).second) {
      violations.push_back(fmt::format("duplicate split id {}", split.id.value));
    }
    if (children.size() < 2) {
      violations.push_back(
          fmt::format("split {} has {} children, expected at least 2", split.id.value,
                      children.size()));
    }
    if (split.ratios.size() != children.size()) {
      violations.push_back(fmt::format("split {} has {} ratios for {} children", split.id.value,
                                       split.ratios.size(), children.size()));
    } else if (!ratios_are_valid(split.ratios, children.size())) {
      double sum = std::accumulate(split.ratios.begin(), split.ratios.end(), 0.0);
      violations.push_back(
          fmt::format("split {} has invalid ratios (sum {:.4f})", split.id.value, sum));
    }

    for (int child : children) {
      if (tree.nodes.get_parent(child) != std::optional<int>(index)) {
        violations.push_back(
            fmt::format("node {} is a child of {} but does not point back to it", child, index));
      }
      stack.push_back(child);
    }
  }

  for (size_t i = 0; i < visit_count.size(); ++i) {
    if (visit_count[i] == 0) {
      violations.push_back(fmt::format("node {} is not reachable from the root", i));
    }
  }

  if (tree.focused_pane_id.has_value() && pane_ids.count(*tree.focused_pane_id) == 0) {
    violations.push_back(
        fmt::format("focused pane {} does not exist", tree.focused_pane_id->value));
  }
  if (tree.maximized_pane_id.has_value() && pane_ids.count(*tree.maximized_pane_id) == 0) {
    violations.push_back(
        fmt::format("maximized pane {} does not exist", tree.maximized_pane_id->value));
  }

  return violations;
}

static bool subtree_equal(const Tree& a, int ia, const Tree& b, int ib) {
  const auto& da = a.nodes[ia];
  const auto& db = b.nodes[ib];
  if (da.index() != db.index()) {
    return false;
  }

  if (const auto* leaf_a = std::get_if<LeafNode>(&da)) {
    const auto& leaf_b = std::get<LeafNode>(db);
    return leaf_a->pane_id == leaf_b.pane_id && leaf_a->widget_id == leaf_b.widget_id &&
           leaf_a->constraints == leaf_b.constraints;
  }

  const auto& split_a = std::get<SplitNode>(da);
  const auto& split_b = std::get<SplitNode>(db);
  if (split_a.id != split_b.id || split_a.orientation != split_b.orientation ||
      split_a.ratios.size() != split_b.ratios.size()) {
    return false;
  }
  for (size_t i = 0; i < split_a.ratios.size(); ++i) {
    if (std::abs(split_a.ratios[i] - split_b.ratios[i]) > kRatioTolerance) {
      return false;
    }
  }

  const auto& children_a = a.nodes.get_children(ia);
  const auto& children_b = b.nodes.get_children(ib);
  if (children_a.size() != children_b.size()) {
    return false;
  }
  for (size_t i = 0; i < children_a.size(); ++i) {
    if (!subtree_equal(a, children_a[i], b, children_b[i])) {
      return false;
    }
  }
  return true;
}

bool structurally_equal(const Tree& a, const Tree& b) {
  if (a.focused_pane_id != b.focused_pane_id || a.maximized_pane_id != b.maximized_pane_id) {
    return false;
  }
  if (is_empty(a) || is_empty(b)) {
    return is_empty(a) && is_empty(b);
  }
  return subtree_equal(a, kRootIndex, b, kRootIndex);
}

void debug_print_tree(const Tree& tree) {
  spdlog::debug("===== Tree =====");
  spdlog::debug("nodes.size = {}", tree.nodes.size());
  spdlog::debug("focused = {}", tree.focused_pane_id ? tree.focused_pane_id->value : "null");
  spdlog::debug("maximized = {}", tree.maximized_pane_id ? tree.maximized_pane_id->value : "null");

  for (int i = 0; i < static_cast<int>(tree.nodes.size()); ++i) {
    const auto& node = tree.nodes.node(i);
    std::string parent_str = node.parent.has_value() ? std::to_string(*node.parent) : "null";

    if (const auto* leaf = std::get_if<LeafNode>(&node.data)) {
      spdlog::debug("  [{}] parent={}, leaf pane={}, widget={}", i, parent_str,
                    leaf->pane_id.value, leaf->widget_id);
    } else {
      const auto& split = std::get<SplitNode>(node.data);
      spdlog::debug("  [{}] parent={}, split {} {} children=[{}] ratios=[{:.3f}]", i, parent_str,
                    split.id.value, magic_enum::enum_name(split.orientation),
                    fmt::join(node.children, ", "), fmt::join(split.ratios, ", "));
    }
  }

  spdlog::debug("===== End Tree =====");
}

} // namespace multisplit
