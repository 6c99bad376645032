#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "controller.h"
#include "geometry.h"
#include "layout_io.h"
#include "model.h"
#include "options.h"
#include "reconciler.h"

namespace multisplit {

// User-level layout actions, e.g. bound to keys by a host application
enum class LayoutAction {
  FocusLeft,
  FocusRight,
  FocusUp,
  FocusDown,
  FocusNext,
  FocusPrevious,
  SplitHorizontal,
  SplitVertical,
  ClosePane,
  ToggleMaximize,
  GrowPane,
  ShrinkPane,
  EqualizeSplit,
  Undo,
  Redo
};

// Ratio change applied by GrowPane / ShrinkPane
constexpr double kRatioStep = 0.05;

// No child is resized below this share by GrowPane / ShrinkPane
constexpr double kMinRatio = 0.05;

constexpr int kDefaultBoundsWidth = 1280;
constexpr int kDefaultBoundsHeight = 720;

constexpr const char* kDefaultWidgetId = "default";

// Result of processing an action
struct ActionResult {
  bool success = false;
  bool focus_changed = false;
  std::optional<PaneId> new_pane_id; // Set when the action created a pane
  LayoutError error = LayoutError::None;
};

// Owns a model and its undo history and exposes focus-relative operations.
// All members are public for easy access
struct LayoutEngine {
  GlobalOptions options;
  PaneModel model;
  PaneController controller;
  Rect bounds;

  explicit LayoutEngine(GlobalOptions initial_options = get_default_global_options(),
                        Rect initial_bounds = Rect{0, 0, kDefaultBoundsWidth,
                                                   kDefaultBoundsHeight});

  LayoutEngine(const LayoutEngine&) = delete;
  LayoutEngine& operator=(const LayoutEngine&) = delete;

  // Create the first pane. Not recorded in the undo history.
  ActionResult initialize(const WidgetId& widget_id = kDefaultWidgetId);

  // ==========================================================================
  // Structure
  // ==========================================================================

  // Split the focused pane; the new pane receives focus
  ActionResult split_focused(Orientation orientation, const WidgetId& widget_id,
                             double ratio = 0.5);

  ActionResult close_focused();

  // Swap the focused pane for a new one holding `widget_id`; the new pane keeps focus
  ActionResult replace_focused(const WidgetId& widget_id);

  ActionResult close(const PaneId& pane_id);

  ActionResult toggle_maximize();

  // ==========================================================================
  // Focus
  // ==========================================================================

  // Focus moves are not recorded in the undo history
  ActionResult focus(const PaneId& pane_id);
  ActionResult navigate(Direction direction);
  ActionResult focus_next();
  ActionResult focus_previous();

  // ==========================================================================
  // Ratios
  // ==========================================================================

  // Start a divider drag. Resizes passing the returned id merge into one undo entry.
  [[nodiscard]] uint64_t begin_divider_drag();

  ActionResult resize_split(const SplitId& split_id, const std::vector<double>& ratios,
                            std::optional<uint64_t> interaction_id = std::nullopt);

  // Grow (positive delta) or shrink the focused pane inside its parent split, taking the
  // space from its next sibling (previous for the last child)
  ActionResult adjust_focused_ratio(double delta);

  ActionResult equalize_focused_split();

  // ==========================================================================
  // Actions & Output
  // ==========================================================================

  // Process an action. Split actions create panes holding `new_widget_id`.
  [[nodiscard]] ActionResult process_action(LayoutAction action,
                                            const WidgetId& new_widget_id = kDefaultWidgetId);

  [[nodiscard]] Layout compute_layout() const;

  // Operations that bring a view showing `previous` (at previous_bounds) up to date
  [[nodiscard]] std::vector<Operation> reconcile_from(const Tree& previous,
                                                      const Rect& previous_bounds) const;

  // Apply reloaded options. The pane id prefix only applies to a new engine.
  void apply_options(const GlobalOptions& new_options);

  LayoutWriteResult save_layout(const std::filesystem::path& filepath) const;

  // Replace the tree with a saved layout and clear the undo history
  LayoutReadResult load_layout(const std::filesystem::path& filepath);

  uint64_t next_interaction_id = 1;
};

} // namespace multisplit
