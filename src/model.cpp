#include "model.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace multisplit {

PaneModel::PaneModel(ModelOptions options)
    : options_(std::move(options)), pane_ids_(options_.pane_id_prefix),
      split_ids_(kSplitIdPrefix) {
}

// ============================================================================
// Internal Helpers
// ============================================================================

PaneId PaneModel::make_pane_id() {
  PaneId id{pane_ids_.next()};
  while (has_pane(tree_, id)) {
    id = PaneId{pane_ids_.next()};
  }
  return id;
}

SplitId PaneModel::make_split_id() {
  SplitId id{split_ids_.next()};
  while (find_split(tree_, id).has_value()) {
    id = SplitId{split_ids_.next()};
  }
  return id;
}

LayoutError PaneModel::reserve_pane_id(const std::optional<PaneId>& requested, PaneId& out) {
  if (!requested.has_value()) {
    out = make_pane_id();
    return LayoutError::None;
  }
  if (requested->value.empty() || has_pane(tree_, *requested)) {
    spdlog::error("Requested pane id '{}' is empty or already in use", requested->value);
    return LayoutError::InvalidStructure;
  }
  pane_ids_.observe(requested->value);
  out = *requested;
  return LayoutError::None;
}

LayoutError PaneModel::reserve_split_id(const std::optional<SplitId>& requested, SplitId& out) {
  if (!requested.has_value()) {
    out = make_split_id();
    return LayoutError::None;
  }
  if (requested->value.empty() || find_split(tree_, *requested).has_value()) {
    spdlog::error("Requested split id '{}' is empty or already in use", requested->value);
    return LayoutError::InvalidStructure;
  }
  split_ids_.observe(requested->value);
  out = *requested;
  return LayoutError::None;
}

void PaneModel::announce() {
  if (batch_depth_ > 0) {
    if (batch_announced_) {
      return;
    }
    batch_announced_ = true;
  }
  signals_.about_to_change.emit();
}

void PaneModel::publish(const ChangeSet& changes) {
  if (batch_depth_ > 0) {
    batch_dirty_ = true;
    return;
  }

  signals_.changed.emit();
  signals_.layout_changed.emit();
  if (changes.focus && tree_.focused_pane_id.has_value()) {
    signals_.node_changed.emit(*tree_.focused_pane_id);
  }
  if (changes.maximize) {
    signals_.maximize_changed.emit(tree_.maximized_pane_id);
  }
}

MutationResult PaneModel::finish_mutation(Tree before, std::string_view operation,
                                          const ChangeSet& changes, MutationResult result) {
  if (options_.validate_on_mutation) {
    auto violations = validate_tree(tree_);
    if (!violations.empty()) {
      for (const auto& violation : violations) {
        spdlog::error("[{}] invariant violated: {}", operation, violation);
      }
      tree_ = std::move(before);
      return MutationResult{false, LayoutError::InvalidStructure, std::nullopt};
    }
  }

  spdlog::trace("[{}] applied, {} nodes", operation, tree_.nodes.size());
  publish(changes);
  result.success = true;
  return result;
}

// ============================================================================
// Tree Lifecycle
// ============================================================================

MutationResult PaneModel::initialize(const WidgetId& widget_id) {
  if (!is_empty(tree_)) {
    spdlog::warn("initialize: tree already holds {} panes", pane_count(tree_));
    return MutationResult{false, LayoutError::InvalidStructure, std::nullopt};
  }

  Tree before = tree_;
  PaneId id = make_pane_id();

  announce();
  tree_.nodes.add_node(LeafNode{id, widget_id, {}});
  tree_.focused_pane_id = id;

  return finish_mutation(std::move(before), "initialize", ChangeSet{true, false},
                         MutationResult{true, LayoutError::None, id});
}

MutationResult PaneModel::load(Tree tree) {
  tree.maximized_pane_id.reset();
  if (is_empty(tree)) {
    tree.focused_pane_id.reset();
  } else if (!tree.focused_pane_id.has_value() || !has_pane(tree, *tree.focused_pane_id)) {
    tree.focused_pane_id = first_pane(tree);
  }

  auto violations = validate_tree(tree);
  if (!violations.empty()) {
    for (const auto& violation : violations) {
      spdlog::error("[load] rejected layout: {}", violation);
    }
    return MutationResult{false, LayoutError::InvalidStructure, std::nullopt};
  }

  for (int i = 0; i < static_cast<int>(tree.nodes.size()); ++i) {
    if (const LeafNode* leaf = get_leaf(tree, i)) {
      pane_ids_.observe(leaf->pane_id.value);
    } else if (const SplitNode* split = get_split(tree, i)) {
      split_ids_.observe(split->id.value);
    }
  }

  ChangeSet changes{true, tree_.maximized_pane_id.has_value()};
  Tree before = tree_;

  announce();
  tree_ = std::move(tree);

  return finish_mutation(std::move(before), "load", changes, MutationResult{true});
}

MutationResult PaneModel::restore(const Tree& snapshot) {
  auto violations = validate_tree(snapshot);
  if (!violations.empty()) {
    for (const auto& violation : violations) {
      spdlog::error("[restore] rejected snapshot: {}", violation);
    }
    return MutationResult{false, LayoutError::InvalidStructure, std::nullopt};
  }

  for (int i = 0; i < static_cast<int>(snapshot.nodes.size()); ++i) {
    if (const LeafNode* leaf = get_leaf(snapshot, i)) {
      pane_ids_.observe(leaf->pane_id.value);
    }
  }

  ChangeSet changes{tree_.focused_pane_id != snapshot.focused_pane_id,
                    tree_.maximized_pane_id != snapshot.maximized_pane_id};
  Tree before = tree_;

  announce();
  tree_ = snapshot;

  return finish_mutation(std::move(before), "restore", changes, MutationResult{true});
}

void PaneModel::clear() {
  if (is_empty(tree_)) {
    return;
  }

  ChangeSet changes{false, tree_.maximized_pane_id.has_value()};
  announce();
  tree_ = Tree{};
  publish(changes);
}

// ============================================================================
// Structural Mutations
// ============================================================================

LayoutError PaneModel::check_split(const PaneId& target, double ratio) const {
  if (!find_leaf(tree_, target).has_value()) {
    return LayoutError::PaneNotFound;
  }
  if (!std::isfinite(ratio) || ratio <= 0.0 || ratio >= 1.0) {
    return LayoutError::InvalidRatios;
  }
  return LayoutError::None;
}

MutationResult PaneModel::insert_split(const PaneId& target, Orientation orientation,
                                       const WidgetId& new_widget_id, double ratio,
                                       SplitPlacement placement,
                                       const std::optional<PaneId>& requested_id,
                                       const std::optional<SplitId>& requested_split_id) {
  LayoutError precondition = check_split(target, ratio);
  if (precondition != LayoutError::None) {
    spdlog::debug("insert_split on {} refused: {}", target.value, to_string(precondition));
    return MutationResult{false, precondition, std::nullopt};
  }

  PaneId new_id;
  if (LayoutError error = reserve_pane_id(requested_id, new_id); error != LayoutError::None) {
    return MutationResult{false, error, std::nullopt};
  }
  SplitId split_id;
  if (LayoutError error = reserve_split_id(requested_split_id, split_id);
      error != LayoutError::None) {
    return MutationResult{false, error, std::nullopt};
  }

  int index = *find_leaf(tree_, target);
  Tree before = tree_;
  ChangeSet changes;

  announce();

  // Splitting always leaves maximized mode
  if (tree_.maximized_pane_id.has_value()) {
    spdlog::debug("insert_split: restoring maximized pane {}", tree_.maximized_pane_id->value);
    tree_.maximized_pane_id.reset();
    changes.maximize = true;
  }

  // The target node becomes the split; the old leaf moves down as its child
  LeafNode old_leaf = std::get<LeafNode>(tree_.nodes[index]);
  tree_.nodes[index] = SplitNode{split_id, orientation, {}};

  int old_child = tree_.nodes.add_node(std::move(old_leaf), index);
  int new_child = tree_.nodes.add_node(LeafNode{new_id, new_widget_id, {}}, index);

  if (placement == SplitPlacement::Before) {
    tree_.nodes.set_children(index, {new_child, old_child});
    std::get<SplitNode>(tree_.nodes[index]).ratios = {ratio, 1.0 - ratio};
  } else {
    tree_.nodes.set_children(index, {old_child, new_child});
    std::get<SplitNode>(tree_.nodes[index]).ratios = {1.0 - ratio, ratio};
  }

  spdlog::debug("insert_split: {} -> {} ({}, ratio {:.2f})", target.value, new_id.value,
                to_string(orientation), ratio);
  return finish_mutation(std::move(before), "insert_split", changes,
                         MutationResult{true, LayoutError::None, new_id, split_id});
}

MutationResult PaneModel::insert_sibling(const PaneId& target, const WidgetId& new_widget_id,
                                         SplitPlacement placement,
                                         const std::optional<PaneId>& requested_id,
                                         const std::optional<SplitId>& requested_split_id) {
  auto index = find_leaf(tree_, target);
  if (!index.has_value()) {
    return MutationResult{false, LayoutError::PaneNotFound, std::nullopt};
  }

  auto parent = tree_.nodes.get_parent(*index);
  if (!parent.has_value()) {
    // A lone root leaf has no split to join yet
    return insert_split(target, Orientation::Horizontal, new_widget_id, 0.5, placement,
                        requested_id, requested_split_id);
  }

  PaneId new_id;
  if (LayoutError error = reserve_pane_id(requested_id, new_id); error != LayoutError::None) {
    return MutationResult{false, error, std::nullopt};
  }

  Tree before = tree_;
  ChangeSet changes;

  announce();

  if (tree_.maximized_pane_id.has_value()) {
    tree_.maximized_pane_id.reset();
    changes.maximize = true;
  }

  size_t position = tree_.nodes.index_in_parent(*index).value_or(0);
  if (placement == SplitPlacement::After) {
    ++position;
  }

  int new_child = tree_.nodes.add_node(LeafNode{new_id, new_widget_id, {}}, *parent);
  tree_.nodes.insert_child(*parent, position, new_child);
  std::get<SplitNode>(tree_.nodes[*parent]).ratios =
      equal_ratios(tree_.nodes.child_count(*parent));

  spdlog::debug("insert_sibling: {} next to {} at position {}", new_id.value, target.value,
                position);
  return finish_mutation(std::move(before), "insert_sibling", changes,
                         MutationResult{true, LayoutError::None, new_id});
}

MutationResult PaneModel::replace_leaf(const PaneId& target, const WidgetId& new_widget_id,
                                       const std::optional<PaneId>& requested_id) {
  auto index = find_leaf(tree_, target);
  if (!index.has_value()) {
    return MutationResult{false, LayoutError::PaneNotFound, std::nullopt};
  }

  PaneId new_id;
  if (LayoutError error = reserve_pane_id(requested_id, new_id); error != LayoutError::None) {
    return MutationResult{false, error, std::nullopt};
  }

  Tree before = tree_;
  ChangeSet changes;

  announce();

  tree_.nodes[*index] = LeafNode{new_id, new_widget_id, {}};

  if (tree_.focused_pane_id == target) {
    tree_.focused_pane_id = new_id;
    changes.focus = true;
  }

  if (tree_.maximized_pane_id == target) {
    tree_.maximized_pane_id.reset();
    changes.maximize = true;
  }

  spdlog::debug("replace_leaf: {} -> {} ({})", target.value, new_id.value, new_widget_id);
  return finish_mutation(std::move(before), "replace_leaf", changes,
                         MutationResult{true, LayoutError::None, new_id});
}

MutationResult PaneModel::remove_leaf(const PaneId& pane_id) {
  auto index = find_leaf(tree_, pane_id);
  if (!index.has_value()) {
    return MutationResult{false, LayoutError::PaneNotFound, std::nullopt};
  }

  auto parent = tree_.nodes.get_parent(*index);
  if (!parent.has_value()) {
    spdlog::debug("remove_leaf: {} is the last pane", pane_id.value);
    return MutationResult{false, LayoutError::LastPane, std::nullopt};
  }

  Tree before = tree_;
  ChangeSet changes;

  announce();

  size_t position = tree_.nodes.index_in_parent(*index).value_or(0);
  tree_.nodes.detach_child(*parent, *index);
  {
    auto& ratios = std::get<SplitNode>(tree_.nodes[*parent]).ratios;
    if (position < ratios.size()) {
      ratios.erase(ratios.begin() + static_cast<std::ptrdiff_t>(position));
    }
  }

  std::vector<int> indices_to_remove = {*index};
  int successor = *parent;

  const std::vector<int> remaining = tree_.nodes.get_children(*parent);
  if (remaining.size() == 1) {
    // Collapse: the sole remaining child takes the split's place
    int only = remaining.front();
    tree_.nodes[*parent] = tree_.nodes[only];
    std::vector<int> grandchildren = tree_.nodes.get_children(only);
    tree_.nodes.set_children(*parent, std::move(grandchildren));
    indices_to_remove.push_back(only);
  } else {
    auto& ratios = std::get<SplitNode>(tree_.nodes[*parent]).ratios;
    ratios = normalize_ratios(ratios);
    successor = remaining[std::min(position, remaining.size() - 1)];
  }

  if (tree_.focused_pane_id == pane_id) {
    auto leaf_index = first_leaf_under(tree_, successor);
    if (leaf_index.has_value()) {
      tree_.focused_pane_id = get_leaf(tree_, *leaf_index)->pane_id;
    } else {
      tree_.focused_pane_id.reset();
    }
    changes.focus = true;
  }

  if (tree_.maximized_pane_id == pane_id) {
    tree_.maximized_pane_id.reset();
    changes.maximize = true;
  }

  [[maybe_unused]] auto remap = tree_.nodes.remove(indices_to_remove);

  spdlog::debug("remove_leaf: removed {}, {} panes left", pane_id.value, pane_count(tree_));
  return finish_mutation(std::move(before), "remove_leaf", changes, MutationResult{true});
}

MutationResult PaneModel::set_ratios(const SplitId& split_id, const std::vector<double>& ratios) {
  auto index = find_split(tree_, split_id);
  if (!index.has_value()) {
    return MutationResult{false, LayoutError::SplitNotFound, std::nullopt};
  }

  if (!ratios_are_valid(ratios, tree_.nodes.child_count(*index))) {
    spdlog::debug("set_ratios on {} refused: {} ratios for {} children", split_id.value,
                  ratios.size(), tree_.nodes.child_count(*index));
    return MutationResult{false, LayoutError::InvalidRatios, std::nullopt};
  }

  Tree before = tree_;

  announce();
  std::get<SplitNode>(tree_.nodes[*index]).ratios = ratios;

  return finish_mutation(std::move(before), "set_ratios", ChangeSet{}, MutationResult{true});
}

MutationResult PaneModel::set_constraints(const PaneId& pane_id,
                                          const SizeConstraints& constraints) {
  auto index = find_leaf(tree_, pane_id);
  if (!index.has_value()) {
    return MutationResult{false, LayoutError::PaneNotFound, std::nullopt};
  }

  SizeConstraints clamped{std::max(0, constraints.min_width), std::max(0, constraints.min_height)};
  if (std::get<LeafNode>(tree_.nodes[*index]).constraints == clamped) {
    return MutationResult{true};
  }

  Tree before = tree_;

  announce();
  std::get<LeafNode>(tree_.nodes[*index]).constraints = clamped;

  return finish_mutation(std::move(before), "set_constraints", ChangeSet{}, MutationResult{true});
}

// ============================================================================
// Focus & Maximize
// ============================================================================

MutationResult PaneModel::set_focus(const PaneId& pane_id) {
  if (!has_pane(tree_, pane_id)) {
    return MutationResult{false, LayoutError::PaneNotFound, std::nullopt};
  }
  if (tree_.focused_pane_id == pane_id) {
    return MutationResult{true};
  }

  ChangeSet changes{true, false};
  if (tree_.maximized_pane_id.has_value() && *tree_.maximized_pane_id != pane_id) {
    if (options_.focus_policy == FocusPolicy::LockToMaximized) {
      spdlog::debug("set_focus: focus is locked to maximized pane {}",
                    tree_.maximized_pane_id->value);
      return MutationResult{false, LayoutError::FocusLocked, std::nullopt};
    }
    changes.maximize = true;
  }

  Tree before = tree_;

  announce();
  if (changes.maximize) {
    tree_.maximized_pane_id.reset();
  }
  tree_.focused_pane_id = pane_id;

  return finish_mutation(std::move(before), "set_focus", changes, MutationResult{true});
}

MutationResult PaneModel::toggle_maximize(const PaneId& pane_id) {
  if (!has_pane(tree_, pane_id)) {
    return MutationResult{false, LayoutError::PaneNotFound, std::nullopt};
  }

  if (tree_.maximized_pane_id.has_value() && *tree_.maximized_pane_id != pane_id) {
    spdlog::debug("toggle_maximize: {} requested while {} is maximized", pane_id.value,
                  tree_.maximized_pane_id->value);
    return MutationResult{false, LayoutError::InvalidTransition, std::nullopt};
  }

  ChangeSet changes{false, true};
  Tree before = tree_;

  announce();
  if (tree_.maximized_pane_id.has_value()) {
    tree_.maximized_pane_id.reset();
  } else {
    tree_.maximized_pane_id = pane_id;
    if (tree_.focused_pane_id != pane_id) {
      tree_.focused_pane_id = pane_id;
      changes.focus = true;
    }
  }

  return finish_mutation(std::move(before), "toggle_maximize", changes, MutationResult{true});
}

MutationResult PaneModel::set_maximized(const std::optional<PaneId>& pane_id) {
  if (pane_id.has_value() && !has_pane(tree_, *pane_id)) {
    return MutationResult{false, LayoutError::PaneNotFound, std::nullopt};
  }
  if (tree_.maximized_pane_id == pane_id) {
    return MutationResult{true};
  }

  ChangeSet changes{false, true};
  Tree before = tree_;

  announce();
  tree_.maximized_pane_id = pane_id;
  if (pane_id.has_value() && tree_.focused_pane_id != pane_id) {
    tree_.focused_pane_id = pane_id;
    changes.focus = true;
  }

  return finish_mutation(std::move(before), "set_maximized", changes, MutationResult{true});
}

MutationResult PaneModel::set_focus_state(const std::optional<PaneId>& focused,
                                          const std::optional<PaneId>& maximized) {
  if ((focused.has_value() && !has_pane(tree_, *focused)) ||
      (maximized.has_value() && !has_pane(tree_, *maximized))) {
    return MutationResult{false, LayoutError::PaneNotFound, std::nullopt};
  }

  ChangeSet changes{tree_.focused_pane_id != focused, tree_.maximized_pane_id != maximized};
  if (!changes.focus && !changes.maximize) {
    return MutationResult{true};
  }

  Tree before = tree_;

  announce();
  tree_.focused_pane_id = focused;
  tree_.maximized_pane_id = maximized;

  return finish_mutation(std::move(before), "set_focus_state", changes, MutationResult{true});
}

// ============================================================================
// Emission Batching
// ============================================================================

void PaneModel::begin_batch() {
  if (batch_depth_++ == 0) {
    batch_announced_ = false;
    batch_dirty_ = false;
    batch_start_focus_ = tree_.focused_pane_id;
    batch_start_maximized_ = tree_.maximized_pane_id;
  }
}

void PaneModel::end_batch(bool commit) {
  if (batch_depth_ == 0) {
    spdlog::warn("end_batch called without a matching begin_batch");
    return;
  }
  if (--batch_depth_ > 0) {
    return;
  }

  bool dirty = batch_dirty_;
  batch_dirty_ = false;
  batch_announced_ = false;

  if (!commit || !dirty) {
    return;
  }

  publish(ChangeSet{tree_.focused_pane_id != batch_start_focus_,
                    tree_.maximized_pane_id != batch_start_maximized_});
}

// ============================================================================
// Queries
// ============================================================================

std::vector<std::string> PaneModel::validate() const {
  return validate_tree(tree_);
}

} // namespace multisplit
