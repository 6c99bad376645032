#include "commands.h"

#include <spdlog/spdlog.h>

#include <magic_enum/magic_enum.hpp>

namespace multisplit {

bool Command::can_merge(const Command& /*other*/) const {
  return false;
}

void Command::merge(const Command& /*other*/) {
}

bool Command::record(const MutationResult& result) {
  error_ = result.error;
  return result.success;
}

// ============================================================================
// Structural Commands
// ============================================================================

SplitCommand::SplitCommand(PaneId target, Orientation orientation, WidgetId new_widget_id,
                           double ratio, SplitPlacement placement)
    : target_(std::move(target)), orientation_(orientation),
      new_widget_id_(std::move(new_widget_id)), ratio_(ratio), placement_(placement) {
}

bool SplitCommand::execute(PaneModel& model) {
  // On redo the recorded ids come back, so later commands addressing them still apply
  Tree snapshot = model.tree();
  auto result = model.insert_split(target_, orientation_, new_widget_id_, ratio_, placement_,
                                   new_pane_id_, new_split_id_);
  if (!record(result)) {
    return false;
  }
  new_pane_id_ = result.new_pane_id;
  new_split_id_ = result.new_split_id;
  before_ = std::move(snapshot);
  return true;
}

bool SplitCommand::undo(PaneModel& model) {
  if (!before_.has_value()) {
    return false;
  }
  return record(model.restore(*before_));
}

std::string SplitCommand::description() const {
  return fmt::format("Split {} {}", target_.value, to_string(orientation_));
}

InsertSiblingCommand::InsertSiblingCommand(PaneId target, WidgetId new_widget_id,
                                           SplitPlacement placement)
    : target_(std::move(target)), new_widget_id_(std::move(new_widget_id)),
      placement_(placement) {
}

bool InsertSiblingCommand::execute(PaneModel& model) {
  Tree snapshot = model.tree();
  auto result =
      model.insert_sibling(target_, new_widget_id_, placement_, new_pane_id_, new_split_id_);
  if (!record(result)) {
    return false;
  }
  new_pane_id_ = result.new_pane_id;
  new_split_id_ = result.new_split_id;
  before_ = std::move(snapshot);
  return true;
}

bool InsertSiblingCommand::undo(PaneModel& model) {
  if (!before_.has_value()) {
    return false;
  }
  return record(model.restore(*before_));
}

std::string InsertSiblingCommand::description() const {
  return fmt::format("Insert pane {} {}", magic_enum::enum_name(placement_), target_.value);
}

ReplaceCommand::ReplaceCommand(PaneId target, WidgetId new_widget_id)
    : target_(std::move(target)), new_widget_id_(std::move(new_widget_id)) {
}

bool ReplaceCommand::execute(PaneModel& model) {
  Tree snapshot = model.tree();
  auto result = model.replace_leaf(target_, new_widget_id_, new_pane_id_);
  if (!record(result)) {
    return false;
  }
  new_pane_id_ = result.new_pane_id;
  before_ = std::move(snapshot);
  return true;
}

bool ReplaceCommand::undo(PaneModel& model) {
  if (!before_.has_value()) {
    return false;
  }
  return record(model.restore(*before_));
}

std::string ReplaceCommand::description() const {
  return fmt::format("Replace {} with {}", target_.value, new_widget_id_);
}

RemoveCommand::RemoveCommand(PaneId pane_id) : pane_id_(std::move(pane_id)) {
}

bool RemoveCommand::execute(PaneModel& model) {
  Tree snapshot = model.tree();
  if (!record(model.remove_leaf(pane_id_))) {
    return false;
  }
  before_ = std::move(snapshot);
  return true;
}

bool RemoveCommand::undo(PaneModel& model) {
  if (!before_.has_value()) {
    return false;
  }
  return record(model.restore(*before_));
}

std::string RemoveCommand::description() const {
  return fmt::format("Remove {}", pane_id_.value);
}

// ============================================================================
// Ratio & Constraint Commands
// ============================================================================

SetRatiosCommand::SetRatiosCommand(SplitId split_id, std::vector<double> ratios,
                                   std::optional<uint64_t> interaction_id)
    : split_id_(std::move(split_id)), new_ratios_(std::move(ratios)),
      interaction_id_(interaction_id) {
}

bool SetRatiosCommand::execute(PaneModel& model) {
  auto index = find_split(model.tree(), split_id_);
  if (!index.has_value()) {
    error_ = LayoutError::SplitNotFound;
    return false;
  }
  std::vector<double> previous = get_split(model.tree(), *index)->ratios;

  if (!record(model.set_ratios(split_id_, new_ratios_))) {
    return false;
  }
  old_ratios_ = std::move(previous);
  return true;
}

bool SetRatiosCommand::undo(PaneModel& model) {
  return record(model.set_ratios(split_id_, old_ratios_));
}

bool SetRatiosCommand::can_merge(const Command& other) const {
  const auto* next = dynamic_cast<const SetRatiosCommand*>(&other);
  if (next == nullptr || !interaction_id_.has_value()) {
    return false;
  }
  return next->split_id_ == split_id_ && next->interaction_id_ == interaction_id_;
}

void SetRatiosCommand::merge(const Command& other) {
  const auto* next = dynamic_cast<const SetRatiosCommand*>(&other);
  if (next != nullptr) {
    // Keep our "before" ratios so one undo returns to where the drag started
    new_ratios_ = next->new_ratios_;
  }
}

std::string SetRatiosCommand::description() const {
  return fmt::format("Resize {}", split_id_.value);
}

SetConstraintsCommand::SetConstraintsCommand(PaneId pane_id, SizeConstraints constraints)
    : pane_id_(std::move(pane_id)), constraints_(constraints) {
}

bool SetConstraintsCommand::execute(PaneModel& model) {
  auto index = find_leaf(model.tree(), pane_id_);
  if (!index.has_value()) {
    error_ = LayoutError::PaneNotFound;
    return false;
  }
  SizeConstraints previous = get_leaf(model.tree(), *index)->constraints;

  if (!record(model.set_constraints(pane_id_, constraints_))) {
    return false;
  }
  old_constraints_ = previous;
  return true;
}

bool SetConstraintsCommand::undo(PaneModel& model) {
  return record(model.set_constraints(pane_id_, old_constraints_));
}

std::string SetConstraintsCommand::description() const {
  return fmt::format("Set constraints of {}", pane_id_.value);
}

// ============================================================================
// Focus & Maximize Commands
// ============================================================================

SetFocusCommand::SetFocusCommand(PaneId pane_id) : pane_id_(std::move(pane_id)) {
}

bool SetFocusCommand::execute(PaneModel& model) {
  auto focus = model.tree().focused_pane_id;
  auto maximized = model.tree().maximized_pane_id;

  if (!record(model.set_focus(pane_id_))) {
    return false;
  }
  old_focus_ = std::move(focus);
  old_maximized_ = std::move(maximized);
  return true;
}

bool SetFocusCommand::undo(PaneModel& model) {
  return record(model.set_focus_state(old_focus_, old_maximized_));
}

std::string SetFocusCommand::description() const {
  return fmt::format("Focus {}", pane_id_.value);
}

ToggleMaximizeCommand::ToggleMaximizeCommand(PaneId pane_id) : pane_id_(std::move(pane_id)) {
}

bool ToggleMaximizeCommand::execute(PaneModel& model) {
  auto focus = model.tree().focused_pane_id;
  auto maximized = model.tree().maximized_pane_id;

  if (!record(model.toggle_maximize(pane_id_))) {
    return false;
  }
  old_focus_ = std::move(focus);
  old_maximized_ = std::move(maximized);
  return true;
}

bool ToggleMaximizeCommand::undo(PaneModel& model) {
  return record(model.set_focus_state(old_focus_, old_maximized_));
}

std::string ToggleMaximizeCommand::description() const {
  return fmt::format("Toggle maximize {}", pane_id_.value);
}

// ============================================================================
// Composite
// ============================================================================

CompositeCommand::CompositeCommand(std::string description,
                                   std::vector<std::unique_ptr<Command>> commands)
    : description_(std::move(description)), commands_(std::move(commands)) {
}

bool CompositeCommand::execute(PaneModel& model) {
  model.begin_batch();

  for (size_t i = 0; i < commands_.size(); ++i) {
    if (commands_[i]->execute(model)) {
      continue;
    }

    error_ = commands_[i]->error();
    spdlog::debug("{}: step '{}' failed ({}), undoing {} steps", description_,
                  commands_[i]->description(), to_string(error_), i);
    for (size_t j = i; j-- > 0;) {
      if (!commands_[j]->undo(model)) {
        spdlog::error("{}: failed to undo step '{}'", description_, commands_[j]->description());
      }
    }
    model.end_batch(false);
    return false;
  }

  error_ = LayoutError::None;
  model.end_batch(true);
  return true;
}

bool CompositeCommand::undo(PaneModel& model) {
  model.begin_batch();

  bool ok = true;
  for (auto it = commands_.rbegin(); it != commands_.rend(); ++it) {
    if (!(*it)->undo(model)) {
      spdlog::error("{}: failed to undo step '{}'", description_, (*it)->description());
      error_ = (*it)->error();
      ok = false;
      break;
    }
  }

  // Steps undone before a failure still changed the tree, so always publish
  model.end_batch(true);
  return ok;
}

std::string CompositeCommand::description() const {
  return description_;
}

} // namespace multisplit
