#include "engine.h"

#include <algorithm>
#include <cmath>
#include <magic_enum/magic_enum.hpp>
#include <unordered_set>

#include "focus.h"
#include "spdlog/spdlog.h"
#include "utility.h"

namespace multisplit {

namespace {

ActionResult run_command(PaneController& controller, std::unique_ptr<Command> command) {
  auto result = controller.execute(std::move(command));
  return ActionResult{result.success, false, std::nullopt, result.error};
}

// The pane that exists in `tree` but not in `before`
std::optional<PaneId> find_new_pane(const Tree& tree, const std::vector<PaneId>& before) {
  std::unordered_set<PaneId> known(before.begin(), before.end());
  for (auto& id : get_pane_ids(tree)) {
    if (!known.contains(id)) {
      return id;
    }
  }
  return std::nullopt;
}

struct ParentSplitInfo {
  SplitId split_id;
  std::vector<double> ratios;
  size_t position = 0;
};

std::optional<ParentSplitInfo> focused_parent_split(const Tree& tree) {
  if (!tree.focused_pane_id.has_value()) {
    return std::nullopt;
  }
  auto leaf = find_leaf(tree, *tree.focused_pane_id);
  if (!leaf.has_value()) {
    return std::nullopt;
  }
  auto parent = tree.nodes.get_parent(*leaf);
  auto position = tree.nodes.index_in_parent(*leaf);
  if (!parent.has_value() || !position.has_value()) {
    return std::nullopt;
  }
  const SplitNode* split = get_split(tree, *parent);
  if (split == nullptr) {
    return std::nullopt;
  }
  return ParentSplitInfo{split->id, split->ratios, *position};
}

} // namespace

LayoutEngine::LayoutEngine(GlobalOptions initial_options, Rect initial_bounds)
    : options(std::move(initial_options)), model(options.model),
      controller(model, options.history.max_undo_levels), bounds(initial_bounds) {
}

ActionResult LayoutEngine::initialize(const WidgetId& widget_id) {
  auto result = model.initialize(widget_id);
  if (!result.success) {
    return ActionResult{false, false, std::nullopt, result.error};
  }
  controller.clear_history();
  return ActionResult{true, true, result.new_pane_id, LayoutError::None};
}

// ============================================================================
// Structure
// ============================================================================

ActionResult LayoutEngine::split_focused(Orientation orientation, const WidgetId& widget_id,
                                         double ratio) {
  auto target = model.focused_pane();
  if (!target.has_value()) {
    return ActionResult{false, false, std::nullopt, LayoutError::PaneNotFound};
  }

  std::vector<PaneId> before = get_pane_ids(model.tree());

  // One emission round for the split and the focus move
  model.begin_batch();
  ActionResult result =
      run_command(controller, std::make_unique<SplitCommand>(*target, orientation, widget_id,
                                                             ratio, SplitPlacement::After));
  if (result.success) {
    result.new_pane_id = find_new_pane(model.tree(), before);
    if (result.new_pane_id.has_value() && model.set_focus(*result.new_pane_id).success) {
      result.focus_changed = true;
    }
  }
  model.end_batch(true);
  return result;
}

ActionResult LayoutEngine::close_focused() {
  auto target = model.focused_pane();
  if (!target.has_value()) {
    return ActionResult{false, false, std::nullopt, LayoutError::PaneNotFound};
  }
  return close(*target);
}

ActionResult LayoutEngine::close(const PaneId& pane_id) {
  auto focus_before = model.focused_pane();
  ActionResult result = run_command(controller, std::make_unique<RemoveCommand>(pane_id));
  result.focus_changed = result.success && model.focused_pane() != focus_before;
  return result;
}

ActionResult LayoutEngine::replace_focused(const WidgetId& widget_id) {
  auto target = model.focused_pane();
  if (!target.has_value()) {
    return ActionResult{false, false, std::nullopt, LayoutError::PaneNotFound};
  }

  ActionResult result =
      run_command(controller, std::make_unique<ReplaceCommand>(*target, widget_id));
  if (result.success) {
    // Focus moved from the replaced pane to its successor
    result.new_pane_id = model.focused_pane();
    result.focus_changed = true;
  }
  return result;
}

ActionResult LayoutEngine::toggle_maximize() {
  auto target = model.focused_pane();
  if (!target.has_value()) {
    return ActionResult{false, false, std::nullopt, LayoutError::PaneNotFound};
  }
  return run_command(controller, std::make_unique<ToggleMaximizeCommand>(*target));
}

// ============================================================================
// Focus
// ============================================================================

ActionResult LayoutEngine::focus(const PaneId& pane_id) {
  auto focus_before = model.focused_pane();
  auto result = model.set_focus(pane_id);
  if (!result.success) {
    return ActionResult{false, false, std::nullopt, result.error};
  }
  return ActionResult{true, model.focused_pane() != focus_before, std::nullopt, LayoutError::None};
}

ActionResult LayoutEngine::navigate(Direction direction) {
  auto current = model.focused_pane();
  if (!current.has_value()) {
    return ActionResult{false, false, std::nullopt, LayoutError::PaneNotFound};
  }

  auto target = find_neighbor(compute_layout(), *current, direction);
  if (!target.has_value()) {
    spdlog::debug("No pane {} of {}", magic_enum::enum_name(direction), current->value);
    return ActionResult{false, false, std::nullopt, LayoutError::None};
  }
  return focus(*target);
}

ActionResult LayoutEngine::focus_next() {
  auto target = next_pane(model.tree(), model.focused_pane());
  if (!target.has_value()) {
    return ActionResult{false, false, std::nullopt, LayoutError::PaneNotFound};
  }
  return focus(*target);
}

ActionResult LayoutEngine::focus_previous() {
  auto target = previous_pane(model.tree(), model.focused_pane());
  if (!target.has_value()) {
    return ActionResult{false, false, std::nullopt, LayoutError::PaneNotFound};
  }
  return focus(*target);
}

// ============================================================================
// Ratios
// ============================================================================

uint64_t LayoutEngine::begin_divider_drag() {
  return next_interaction_id++;
}

ActionResult LayoutEngine::resize_split(const SplitId& split_id, const std::vector<double>& ratios,
                                        std::optional<uint64_t> interaction_id) {
  return run_command(controller,
                     std::make_unique<SetRatiosCommand>(split_id, ratios, interaction_id));
}

ActionResult LayoutEngine::adjust_focused_ratio(double delta) {
  auto parent = focused_parent_split(model.tree());
  if (!parent.has_value()) {
    return ActionResult{false, false, std::nullopt, LayoutError::SplitNotFound};
  }

  auto& ratios = parent->ratios;
  size_t position = parent->position;
  size_t other = position + 1 < ratios.size() ? position + 1 : position - 1;

  double clamped = delta > 0 ? std::min(delta, ratios[other] - kMinRatio)
                             : std::max(delta, kMinRatio - ratios[position]);
  // A loaded layout may already hold shares below kMinRatio; clamping must not reverse
  if (clamped * delta <= 0.0 || std::abs(clamped) < kRatioTolerance) {
    spdlog::debug("Pane ratio already at its limit in {}", parent->split_id.value);
    return ActionResult{false, false, std::nullopt, LayoutError::InvalidRatios};
  }

  ratios[position] += clamped;
  ratios[other] -= clamped;
  return resize_split(parent->split_id, ratios);
}

ActionResult LayoutEngine::equalize_focused_split() {
  auto parent = focused_parent_split(model.tree());
  if (!parent.has_value()) {
    return ActionResult{false, false, std::nullopt, LayoutError::SplitNotFound};
  }
  return resize_split(parent->split_id, equal_ratios(parent->ratios.size()));
}

// ============================================================================
// Actions & Output
// ============================================================================

ActionResult LayoutEngine::process_action(LayoutAction action, const WidgetId& new_widget_id) {
  spdlog::info("{}", magic_enum::enum_name(action));
  ActionResult result;

  switch (action) {
  case LayoutAction::FocusLeft:
    result = navigate(Direction::Left);
    break;

  case LayoutAction::FocusRight:
    result = navigate(Direction::Right);
    break;

  case LayoutAction::FocusUp:
    result = navigate(Direction::Up);
    break;

  case LayoutAction::FocusDown:
    result = navigate(Direction::Down);
    break;

  case LayoutAction::FocusNext:
    result = focus_next();
    break;

  case LayoutAction::FocusPrevious:
    result = focus_previous();
    break;

  case LayoutAction::SplitHorizontal:
    result = split_focused(Orientation::Horizontal, new_widget_id);
    break;

  case LayoutAction::SplitVertical:
    result = split_focused(Orientation::Vertical, new_widget_id);
    break;

  case LayoutAction::ClosePane:
    result = close_focused();
    break;

  case LayoutAction::ToggleMaximize:
    result = toggle_maximize();
    break;

  case LayoutAction::GrowPane:
    result = adjust_focused_ratio(kRatioStep);
    break;

  case LayoutAction::ShrinkPane:
    result = adjust_focused_ratio(-kRatioStep);
    break;

  case LayoutAction::EqualizeSplit:
    result = equalize_focused_split();
    break;

  case LayoutAction::Undo: {
    auto focus_before = model.focused_pane();
    result.success = controller.undo();
    result.focus_changed = model.focused_pane() != focus_before;
    break;
  }

  case LayoutAction::Redo: {
    auto focus_before = model.focused_pane();
    result.success = controller.redo();
    result.focus_changed = model.focused_pane() != focus_before;
    break;
  }
  }

  if (!result.success && result.error != LayoutError::None) {
    spdlog::debug("{} failed: {}", magic_enum::enum_name(action), to_string(result.error));
  }
  return result;
}

Layout LayoutEngine::compute_layout() const {
  return timed("compute_layout",
               [&]() { return compute_display_layout(model.tree(), bounds, options.geometry); });
}

std::vector<Operation> LayoutEngine::reconcile_from(const Tree& previous,
                                                    const Rect& previous_bounds) const {
  return reconcile(previous, previous_bounds, model.tree(), bounds, options.geometry);
}

void LayoutEngine::apply_options(const GlobalOptions& new_options) {
  if (new_options.model.pane_id_prefix != options.model.pane_id_prefix) {
    spdlog::warn("pane_id_prefix change to '{}' applies after restart",
                 new_options.model.pane_id_prefix);
  }

  std::string prefix = options.model.pane_id_prefix;
  options = new_options;
  options.model.pane_id_prefix = prefix;

  model.set_focus_policy(options.model.focus_policy);
  model.set_validate_on_mutation(options.model.validate_on_mutation);
  controller.set_max_undo_levels(options.history.max_undo_levels);
}

LayoutWriteResult LayoutEngine::save_layout(const std::filesystem::path& filepath) const {
  return multisplit::save_layout(model.tree(), filepath);
}

LayoutReadResult LayoutEngine::load_layout(const std::filesystem::path& filepath) {
  auto result = multisplit::load_layout(filepath);
  if (!result.success) {
    spdlog::error("Failed to load layout: {}", result.error);
    return result;
  }

  auto loaded = model.load(result.tree);
  if (!loaded.success) {
    return LayoutReadResult{false, std::string("Layout rejected: ") +
                                       std::string(to_string(loaded.error)),
                            {}};
  }
  controller.clear_history();
  return result;
}

} // namespace multisplit
