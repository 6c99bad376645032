#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "identity.h"
#include "signals.h"
#include "tree.h"
#include "types.h"

namespace multisplit {

constexpr const char* kDefaultPaneIdPrefix = "pane-";
constexpr const char* kSplitIdPrefix = "split-";

struct ModelOptions {
  bool validate_on_mutation = true;
  std::string pane_id_prefix = kDefaultPaneIdPrefix;
  FocusPolicy focus_policy = FocusPolicy::AutoRestore;
};

// Outcome of a model mutation. On failure the tree is untouched and no signal was emitted.
struct MutationResult {
  bool success = false;
  LayoutError error = LayoutError::None;
  std::optional<PaneId> new_pane_id;   // Set by operations that create a leaf
  std::optional<SplitId> new_split_id; // Set by operations that create a split
};

// Owns the live layout tree and publishes its changes.
// Every structural mutation is checked against the tree invariants and rolled back
// (with LayoutError::InvalidStructure) if it would break one.
class PaneModel {
public:
  explicit PaneModel(ModelOptions options = {});

  PaneModel(const PaneModel&) = delete;
  PaneModel& operator=(const PaneModel&) = delete;

  // ==========================================================================
  // Tree Lifecycle
  // ==========================================================================

  // Create a single-leaf tree. Fails with InvalidStructure if the tree is not empty.
  MutationResult initialize(const WidgetId& widget_id);

  // Replace the whole tree with a loaded one. Maximize is always cleared and an
  // invalid or missing focus falls back to the first pane.
  MutationResult load(Tree tree);

  // Replace the whole tree with a snapshot, keeping its focus and maximize state
  MutationResult restore(const Tree& snapshot);

  // Explicit teardown. The only way to get an empty tree from a non-empty one.
  void clear();

  // ==========================================================================
  // Structural Mutations
  // ==========================================================================

  // Replace the target leaf with a split holding it and a new leaf.
  // The new leaf gets `ratio`, the old one 1 - ratio. Leaves maximized mode.
  // The requested ids let redo recreate exactly the panes and splits it made before.
  MutationResult insert_split(const PaneId& target, Orientation orientation,
                              const WidgetId& new_widget_id, double ratio = 0.5,
                              SplitPlacement placement = SplitPlacement::After,
                              const std::optional<PaneId>& requested_id = std::nullopt,
                              const std::optional<SplitId>& requested_split_id = std::nullopt);

  // Add a new leaf next to the target inside its parent split; all shares become equal
  MutationResult insert_sibling(const PaneId& target, const WidgetId& new_widget_id,
                                SplitPlacement placement = SplitPlacement::After,
                                const std::optional<PaneId>& requested_id = std::nullopt,
                                const std::optional<SplitId>& requested_split_id = std::nullopt);

  // Swap the target leaf for a new leaf in the same position. The new pane inherits
  // focus from the target; replacing the maximized pane leaves maximized mode.
  MutationResult replace_leaf(const PaneId& target, const WidgetId& new_widget_id,
                              const std::optional<PaneId>& requested_id = std::nullopt);

  // Remove a leaf, collapsing a split that is left with one child
  MutationResult remove_leaf(const PaneId& pane_id);

  // Fails with SplitNotFound (the split-addressed form of PaneNotFound) for an unknown id,
  // InvalidRatios for a wrong count, a non-positive share or a sum away from 1
  MutationResult set_ratios(const SplitId& split_id, const std::vector<double>& ratios);

  MutationResult set_constraints(const PaneId& pane_id, const SizeConstraints& constraints);

  // ==========================================================================
  // Focus & Maximize
  // ==========================================================================

  // Applies the focus policy when a pane is maximized
  MutationResult set_focus(const PaneId& pane_id);

  // Normal -> Maximized(p) -> Normal. Toggling a pane other than the maximized one fails.
  MutationResult toggle_maximize(const PaneId& pane_id);

  // Maximize a pane directly (focusing it), or leave maximized mode with nullopt
  MutationResult set_maximized(const std::optional<PaneId>& pane_id);

  // Set both at once without policy checks. Used to undo focus and maximize changes.
  MutationResult set_focus_state(const std::optional<PaneId>& focused,
                                 const std::optional<PaneId>& maximized);

  // ==========================================================================
  // Emission Batching
  // ==========================================================================

  // Collapse the emissions of several mutations into one round.
  // Batches nest; only the outermost end_batch() emits, and only when commit is true.
  void begin_batch();
  void end_batch(bool commit);

  [[nodiscard]] bool in_batch() const {
    return batch_depth_ > 0;
  }

  // ==========================================================================
  // Queries
  // ==========================================================================

  [[nodiscard]] const Tree& tree() const {
    return tree_;
  }

  [[nodiscard]] bool is_maximized() const {
    return tree_.maximized_pane_id.has_value();
  }

  [[nodiscard]] std::optional<PaneId> focused_pane() const {
    return tree_.focused_pane_id;
  }

  // Precondition check for insert_split without mutating anything
  [[nodiscard]] LayoutError check_split(const PaneId& target, double ratio) const;

  [[nodiscard]] std::vector<std::string> validate() const;

  [[nodiscard]] LayoutSignals& signals() {
    return signals_;
  }

  [[nodiscard]] const ModelOptions& options() const {
    return options_;
  }

  void set_focus_policy(FocusPolicy policy) {
    options_.focus_policy = policy;
  }

  void set_validate_on_mutation(bool enabled) {
    options_.validate_on_mutation = enabled;
  }

private:
  // What a mutation touched, to pick the extra signals
  struct ChangeSet {
    bool focus = false;
    bool maximize = false;
  };

  [[nodiscard]] PaneId make_pane_id();
  [[nodiscard]] SplitId make_split_id();
  [[nodiscard]] LayoutError reserve_pane_id(const std::optional<PaneId>& requested, PaneId& out);
  [[nodiscard]] LayoutError reserve_split_id(const std::optional<SplitId>& requested,
                                             SplitId& out);

  void announce();
  void publish(const ChangeSet& changes);
  MutationResult finish_mutation(Tree before, std::string_view operation,
                                 const ChangeSet& changes, MutationResult result);

  Tree tree_;
  LayoutSignals signals_;
  ModelOptions options_;
  IdGenerator pane_ids_;
  IdGenerator split_ids_;

  int batch_depth_ = 0;
  bool batch_announced_ = false;
  bool batch_dirty_ = false;
  std::optional<PaneId> batch_start_focus_;
  std::optional<PaneId> batch_start_maximized_;
};

} // namespace multisplit
