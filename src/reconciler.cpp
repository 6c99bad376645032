#include "reconciler.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "utility.h"

namespace multisplit {

namespace {

struct LeafEntry {
  PaneId pane_id;
  WidgetId widget_id;
};

std::vector<LeafEntry> collect_leaves(const Tree& tree) {
  std::vector<LeafEntry> leaves;
  for (int index : get_leaf_indices(tree)) {
    const LeafNode* leaf = get_leaf(tree, index);
    leaves.push_back(LeafEntry{leaf->pane_id, leaf->widget_id});
  }
  return leaves;
}

// Positions (into `sequence`) of one longest strictly increasing subsequence
std::vector<size_t> longest_increasing_run(const std::vector<size_t>& sequence) {
  std::vector<size_t> tails;       // tails[k]: position of the smallest tail of a run of length k+1
  std::vector<size_t> previous(sequence.size(), sequence.size());

  for (size_t i = 0; i < sequence.size(); ++i) {
    auto it = std::lower_bound(tails.begin(), tails.end(), sequence[i],
                               [&](size_t position, size_t value) {
                                 return sequence[position] < value;
                               });
    if (it != tails.begin()) {
      previous[i] = *(it - 1);
    }
    if (it == tails.end()) {
      tails.push_back(i);
    } else {
      *it = i;
    }
  }

  std::vector<size_t> run;
  if (tails.empty()) {
    return run;
  }
  for (size_t i = tails.back(); i != sequence.size(); i = previous[i]) {
    run.push_back(i);
  }
  std::reverse(run.begin(), run.end());
  return run;
}

} // namespace

// ============================================================================
// Reconciliation
// ============================================================================

std::vector<Operation> reconcile(const Tree& old_tree, const Tree& new_tree) {
  std::vector<LeafEntry> old_leaves = collect_leaves(old_tree);
  std::vector<LeafEntry> new_leaves = collect_leaves(new_tree);

  std::unordered_map<PaneId, size_t> old_positions;
  for (size_t i = 0; i < old_leaves.size(); ++i) {
    old_positions.emplace(old_leaves[i].pane_id, i);
  }
  std::unordered_set<PaneId> new_ids;
  for (const auto& leaf : new_leaves) {
    new_ids.insert(leaf.pane_id);
  }

  std::vector<Operation> operations;

  for (const auto& leaf : old_leaves) {
    if (!new_ids.contains(leaf.pane_id)) {
      operations.emplace_back(DestroyOp{leaf.pane_id});
    }
  }

  // Survivors in new order, with their old positions
  std::vector<PaneId> survivors;
  std::vector<size_t> survivor_old_positions;
  for (const auto& leaf : new_leaves) {
    auto it = old_positions.find(leaf.pane_id);
    if (it == old_positions.end()) {
      operations.emplace_back(CreateOp{leaf.pane_id, leaf.widget_id});
      continue;
    }
    if (old_leaves[it->second].widget_id != leaf.widget_id) {
      spdlog::warn("Pane {} changed widget '{}' -> '{}', keeping the existing widget",
                   leaf.pane_id.value, old_leaves[it->second].widget_id, leaf.widget_id);
    }
    survivors.push_back(leaf.pane_id);
    survivor_old_positions.push_back(it->second);
  }

  std::vector<size_t> kept = longest_increasing_run(survivor_old_positions);
  std::vector<bool> in_order(survivors.size(), false);
  for (size_t position : kept) {
    in_order[position] = true;
  }
  for (size_t i = 0; i < survivors.size(); ++i) {
    if (!in_order[i]) {
      operations.emplace_back(MoveOp{survivors[i]});
    }
  }

  return operations;
}

std::vector<Operation> reconcile(const Tree& old_tree, const Rect& old_bounds,
                                 const Tree& new_tree, const Rect& new_bounds,
                                 const GeometryOptions& options) {
  std::vector<Operation> operations = reconcile(old_tree, new_tree);

  Layout old_layout = compute_display_layout(old_tree, old_bounds, options);
  Layout new_layout = compute_display_layout(new_tree, new_bounds, options);

  std::unordered_map<PaneId, const PaneRect*> old_rects;
  for (const auto& pane : old_layout.panes) {
    old_rects.emplace(pane.pane_id, &pane);
  }

  for (const auto& pane : new_layout.panes) {
    auto it = old_rects.find(pane.pane_id);
    if (it == old_rects.end() || it->second->rect != pane.rect ||
        it->second->visible != pane.visible) {
      operations.emplace_back(UpdateRectOp{pane.pane_id, pane.rect});
    }
  }

  spdlog::debug("Reconciled {} -> {} panes: {} operations", old_layout.panes.size(),
                new_layout.panes.size(), operations.size());
  return operations;
}

// ============================================================================
// Application
// ============================================================================

void apply_operations(const std::vector<Operation>& operations, ReconcilerSink& sink) {
  for (const auto& operation : operations) {
    spdlog::trace("[reconcile] {}", describe_operation(operation));
    std::visit(overloaded{
                   [&](const CreateOp& op) { sink.create_pane(op.pane_id, op.widget_id); },
                   [&](const DestroyOp& op) { sink.destroy_pane(op.pane_id); },
                   [&](const MoveOp& op) { sink.move_pane(op.pane_id); },
                   [&](const UpdateRectOp& op) { sink.update_pane_rect(op.pane_id, op.rect); },
               },
               operation);
  }
}

std::string describe_operation(const Operation& operation) {
  return std::visit(
      overloaded{
          [](const CreateOp& op) {
            return fmt::format("create {} ({})", op.pane_id.value, op.widget_id);
          },
          [](const DestroyOp& op) { return fmt::format("destroy {}", op.pane_id.value); },
          [](const MoveOp& op) { return fmt::format("move {}", op.pane_id.value); },
          [](const UpdateRectOp& op) {
            return fmt::format("rect {} {},{} {}x{}", op.pane_id.value, op.rect.x, op.rect.y,
                               op.rect.width, op.rect.height);
          },
      },
      operation);
}

} // namespace multisplit
