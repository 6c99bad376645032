#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "model.h"

namespace multisplit {

// A reversible mutation of the pane model.
// execute() returning false means nothing changed and no signal was emitted;
// error() then tells why.
class Command {
public:
  virtual ~Command() = default;

  [[nodiscard]] virtual bool execute(PaneModel& model) = 0;
  [[nodiscard]] virtual bool undo(PaneModel& model) = 0;

  // Whether `other`, executed right after this command, can be folded into it
  [[nodiscard]] virtual bool can_merge(const Command& other) const;
  virtual void merge(const Command& other);

  [[nodiscard]] virtual std::string description() const = 0;

  [[nodiscard]] LayoutError error() const {
    return error_;
  }

protected:
  // Store the outcome of a model call and return its success flag
  bool record(const MutationResult& result);

  LayoutError error_ = LayoutError::None;
};

// ============================================================================
// Structural Commands
// ============================================================================

class SplitCommand : public Command {
public:
  SplitCommand(PaneId target, Orientation orientation, WidgetId new_widget_id, double ratio = 0.5,
               SplitPlacement placement = SplitPlacement::After);

  [[nodiscard]] bool execute(PaneModel& model) override;
  [[nodiscard]] bool undo(PaneModel& model) override;
  [[nodiscard]] std::string description() const override;

  // Set after the first successful execute; reused on redo
  [[nodiscard]] const std::optional<PaneId>& new_pane_id() const {
    return new_pane_id_;
  }

private:
  PaneId target_;
  Orientation orientation_;
  WidgetId new_widget_id_;
  double ratio_;
  SplitPlacement placement_;
  std::optional<PaneId> new_pane_id_;
  std::optional<SplitId> new_split_id_;
  std::optional<Tree> before_;
};

class InsertSiblingCommand : public Command {
public:
  InsertSiblingCommand(PaneId target, WidgetId new_widget_id,
                       SplitPlacement placement = SplitPlacement::After);

  [[nodiscard]] bool execute(PaneModel& model) override;
  [[nodiscard]] bool undo(PaneModel& model) override;
  [[nodiscard]] std::string description() const override;

  [[nodiscard]] const std::optional<PaneId>& new_pane_id() const {
    return new_pane_id_;
  }

private:
  PaneId target_;
  WidgetId new_widget_id_;
  SplitPlacement placement_;
  std::optional<PaneId> new_pane_id_;
  std::optional<SplitId> new_split_id_; // Only when the target was a lone root leaf
  std::optional<Tree> before_;
};

// Swap a leaf for a new one holding another widget, in the same place in the tree
class ReplaceCommand : public Command {
public:
  ReplaceCommand(PaneId target, WidgetId new_widget_id);

  [[nodiscard]] bool execute(PaneModel& model) override;
  [[nodiscard]] bool undo(PaneModel& model) override;
  [[nodiscard]] std::string description() const override;

  [[nodiscard]] const std::optional<PaneId>& new_pane_id() const {
    return new_pane_id_;
  }

private:
  PaneId target_;
  WidgetId new_widget_id_;
  std::optional<PaneId> new_pane_id_;
  std::optional<Tree> before_;
};

class RemoveCommand : public Command {
public:
  explicit RemoveCommand(PaneId pane_id);

  [[nodiscard]] bool execute(PaneModel& model) override;
  [[nodiscard]] bool undo(PaneModel& model) override;
  [[nodiscard]] std::string description() const override;

private:
  PaneId pane_id_;
  std::optional<Tree> before_;
};

// ============================================================================
// Ratio & Constraint Commands
// ============================================================================

class SetRatiosCommand : public Command {
public:
  // Commands sharing an interaction id (one divider drag) on the same split merge into one
  SetRatiosCommand(SplitId split_id, std::vector<double> ratios,
                   std::optional<uint64_t> interaction_id = std::nullopt);

  [[nodiscard]] bool execute(PaneModel& model) override;
  [[nodiscard]] bool undo(PaneModel& model) override;
  [[nodiscard]] bool can_merge(const Command& other) const override;
  void merge(const Command& other) override;
  [[nodiscard]] std::string description() const override;

  [[nodiscard]] const std::vector<double>& ratios() const {
    return new_ratios_;
  }

private:
  SplitId split_id_;
  std::vector<double> new_ratios_;
  std::vector<double> old_ratios_;
  std::optional<uint64_t> interaction_id_;
};

class SetConstraintsCommand : public Command {
public:
  SetConstraintsCommand(PaneId pane_id, SizeConstraints constraints);

  [[nodiscard]] bool execute(PaneModel& model) override;
  [[nodiscard]] bool undo(PaneModel& model) override;
  [[nodiscard]] std::string description() const override;

private:
  PaneId pane_id_;
  SizeConstraints constraints_;
  SizeConstraints old_constraints_;
};

// ============================================================================
// Focus & Maximize Commands
// ============================================================================

class SetFocusCommand : public Command {
public:
  explicit SetFocusCommand(PaneId pane_id);

  [[nodiscard]] bool execute(PaneModel& model) override;
  [[nodiscard]] bool undo(PaneModel& model) override;
  [[nodiscard]] std::string description() const override;

private:
  PaneId pane_id_;
  std::optional<PaneId> old_focus_;
  std::optional<PaneId> old_maximized_;
};

class ToggleMaximizeCommand : public Command {
public:
  explicit ToggleMaximizeCommand(PaneId pane_id);

  [[nodiscard]] bool execute(PaneModel& model) override;
  [[nodiscard]] bool undo(PaneModel& model) override;
  [[nodiscard]] std::string description() const override;

private:
  PaneId pane_id_;
  std::optional<PaneId> old_focus_;
  std::optional<PaneId> old_maximized_;
};

// ============================================================================
// Composite
// ============================================================================

// Already-executed commands grouped into one undo entry (a committed transaction)
class CompositeCommand : public Command {
public:
  CompositeCommand(std::string description, std::vector<std::unique_ptr<Command>> commands);

  // Runs every child in order; on failure the executed ones are undone in reverse
  [[nodiscard]] bool execute(PaneModel& model) override;
  [[nodiscard]] bool undo(PaneModel& model) override;
  [[nodiscard]] std::string description() const override;

  [[nodiscard]] size_t size() const {
    return commands_.size();
  }

private:
  std::string description_;
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace multisplit
