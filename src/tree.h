#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "identity.h"
#include "node_arena.h"
#include "types.h"

namespace multisplit {

// Internal node: children are laid out along its orientation.
// ratios[i] is the share of children[i]; children live in the arena.
struct SplitNode {
  SplitId id;
  Orientation orientation = Orientation::Horizontal;
  std::vector<double> ratios;
};

// Terminal node holding one piece of content
struct LeafNode {
  PaneId pane_id;
  WidgetId widget_id;
  SizeConstraints constraints;
};

using NodeData = std::variant<SplitNode, LeafNode>;

// A layout tree value. Copyable, so it doubles as an undo snapshot.
struct Tree {
  NodeArena<NodeData> nodes; // Index 0 is the root whenever the tree is non-empty
  std::optional<PaneId> focused_pane_id;
  std::optional<PaneId> maximized_pane_id; // Runtime only, never persisted
};

constexpr int kRootIndex = 0;

// Allowed drift of a ratio sum away from 1.0
constexpr double kRatioTolerance = 1e-3;

// ============================================================================
// Query Functions
// ============================================================================

[[nodiscard]] bool is_empty(const Tree& tree);

// Returns nullptr if the index is invalid or the node has the other kind
[[nodiscard]] const LeafNode* get_leaf(const Tree& tree, int index);
[[nodiscard]] const SplitNode* get_split(const Tree& tree, int index);

[[nodiscard]] std::optional<int> find_leaf(const Tree& tree, const PaneId& pane_id);
[[nodiscard]] std::optional<int> find_split(const Tree& tree, const SplitId& split_id);
[[nodiscard]] bool has_pane(const Tree& tree, const PaneId& pane_id);

// Leaves in depth-first, left-to-right order
[[nodiscard]] std::vector<int> get_leaf_indices(const Tree& tree);
[[nodiscard]] std::vector<PaneId> get_pane_ids(const Tree& tree);
[[nodiscard]] size_t pane_count(const Tree& tree);

// First leaf (depth-first) of the subtree rooted at index
[[nodiscard]] std::optional<int> first_leaf_under(const Tree& tree, int index);
[[nodiscard]] std::optional<PaneId> first_pane(const Tree& tree);

// The split that directly contains the pane, if any
[[nodiscard]] std::optional<SplitId> parent_split_of(const Tree& tree, const PaneId& pane_id);

// ============================================================================
// Ratio Helpers
// ============================================================================

// Count matches, all positive, sum within kRatioTolerance of 1
[[nodiscard]] bool ratios_are_valid(const std::vector<double>& ratios, size_t expected_count);

// Scale ratios so they sum to exactly 1. All-zero input becomes equal shares.
[[nodiscard]] std::vector<double> normalize_ratios(std::vector<double> ratios);

[[nodiscard]] std::vector<double> equal_ratios(size_t count);

// ============================================================================
// Utilities
// ============================================================================

// Check every structural invariant. Returns one message per violation, empty if valid.
[[nodiscard]] std::vector<std::string> validate_tree(const Tree& tree);

// Same shape, ids, widgets, ratios (within tolerance), focus and maximize.
// Arena indices are not compared.
[[nodiscard]] bool structurally_equal(const Tree& a, const Tree& b);

// Debug: print the arena at debug level
void debug_print_tree(const Tree& tree);

} // namespace multisplit
