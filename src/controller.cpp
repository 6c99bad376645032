#include "controller.h"

#include <spdlog/spdlog.h>

namespace multisplit {

PaneController::PaneController(PaneModel& model, size_t max_undo_levels)
    : model_(model), max_undo_levels_(max_undo_levels) {
}

// ============================================================================
// Command Execution
// ============================================================================

CommandResult PaneController::execute(std::unique_ptr<Command> command) {
  if (!command) {
    return CommandResult{false, LayoutError::InvalidStructure};
  }

  if (transaction_.has_value()) {
    if (!command->execute(model_)) {
      LayoutError error = command->error();
      spdlog::debug("[transaction] '{}' failed at '{}' ({}), rolling back",
                    transaction_->description, command->description(), to_string(error));
      rollback_transaction();
      return CommandResult{false, error};
    }
    spdlog::trace("[transaction] {}", command->description());
    transaction_->commands.push_back(std::move(command));
    return CommandResult{true, LayoutError::None};
  }

  if (!command->execute(model_)) {
    spdlog::debug("Command '{}' failed: {}", command->description(), to_string(command->error()));
    return CommandResult{false, command->error()};
  }

  spdlog::debug("Executed: {}", command->description());
  redo_stack_.clear();

  if (!undo_stack_.empty() && undo_stack_.back()->can_merge(*command)) {
    undo_stack_.back()->merge(*command);
    return CommandResult{true, LayoutError::None};
  }

  push_undo(std::move(command));
  return CommandResult{true, LayoutError::None};
}

void PaneController::push_undo(std::unique_ptr<Command> command) {
  undo_stack_.push_back(std::move(command));
  while (undo_stack_.size() > max_undo_levels_) {
    undo_stack_.pop_front();
  }
}

bool PaneController::undo() {
  if (transaction_.has_value()) {
    spdlog::warn("undo ignored while transaction '{}' is open", transaction_->description);
    return false;
  }
  if (undo_stack_.empty()) {
    return false;
  }

  std::unique_ptr<Command> command = std::move(undo_stack_.back());
  undo_stack_.pop_back();

  if (!command->undo(model_)) {
    spdlog::error("Failed to undo '{}': {}", command->description(), to_string(command->error()));
    // Keep it so the history still describes the current tree
    undo_stack_.push_back(std::move(command));
    return false;
  }

  spdlog::debug("Undone: {}", command->description());
  redo_stack_.push_back(std::move(command));
  return true;
}

bool PaneController::redo() {
  if (transaction_.has_value()) {
    spdlog::warn("redo ignored while transaction '{}' is open", transaction_->description);
    return false;
  }
  if (redo_stack_.empty()) {
    return false;
  }

  std::unique_ptr<Command> command = std::move(redo_stack_.back());
  redo_stack_.pop_back();

  if (!command->execute(model_)) {
    spdlog::error("Failed to redo '{}': {}", command->description(), to_string(command->error()));
    redo_stack_.clear();
    return false;
  }

  spdlog::debug("Redone: {}", command->description());
  push_undo(std::move(command));
  return true;
}

bool PaneController::can_undo() const {
  return !transaction_.has_value() && !undo_stack_.empty();
}

bool PaneController::can_redo() const {
  return !transaction_.has_value() && !redo_stack_.empty();
}

std::optional<std::string> PaneController::undo_description() const {
  if (undo_stack_.empty()) {
    return std::nullopt;
  }
  return undo_stack_.back()->description();
}

std::optional<std::string> PaneController::redo_description() const {
  if (redo_stack_.empty()) {
    return std::nullopt;
  }
  return redo_stack_.back()->description();
}

void PaneController::clear_history() {
  undo_stack_.clear();
  redo_stack_.clear();
}

void PaneController::set_max_undo_levels(size_t levels) {
  max_undo_levels_ = levels;
  while (undo_stack_.size() > max_undo_levels_) {
    undo_stack_.pop_front();
  }
}

// ============================================================================
// Transactions
// ============================================================================

CommandResult PaneController::begin_transaction(std::string description) {
  if (transaction_.has_value()) {
    spdlog::error("Cannot begin '{}': transaction '{}' is already open", description,
                  transaction_->description);
    return CommandResult{false, LayoutError::TransactionOpen};
  }

  transaction_ = OpenTransaction{std::move(description), {}, model_.tree()};
  model_.begin_batch();
  spdlog::trace("[transaction] begin '{}'", transaction_->description);
  return CommandResult{true, LayoutError::None};
}

CommandResult PaneController::commit_transaction() {
  if (!transaction_.has_value()) {
    return CommandResult{false, LayoutError::NoTransaction};
  }

  OpenTransaction transaction = std::move(*transaction_);
  transaction_.reset();

  if (!transaction.commands.empty()) {
    spdlog::debug("[transaction] commit '{}' ({} commands)", transaction.description,
                  transaction.commands.size());
    redo_stack_.clear();
    push_undo(std::make_unique<CompositeCommand>(std::move(transaction.description),
                                                 std::move(transaction.commands)));
  }

  model_.end_batch(true);
  return CommandResult{true, LayoutError::None};
}

void PaneController::rollback_transaction() {
  if (!transaction_.has_value()) {
    return;
  }

  OpenTransaction transaction = std::move(*transaction_);
  transaction_.reset();

  for (auto it = transaction.commands.rbegin(); it != transaction.commands.rend(); ++it) {
    if (!(*it)->undo(model_)) {
      spdlog::error("[transaction] failed to undo '{}' during rollback", (*it)->description());
    }
  }

  // Verify the rollback landed exactly on the pre-transaction state
  if (!structurally_equal(model_.tree(), transaction.snapshot)) {
    spdlog::error("[transaction] rollback of '{}' diverged, restoring snapshot",
                  transaction.description);
    if (!model_.restore(transaction.snapshot).success) {
      spdlog::error("[transaction] snapshot restore failed");
    }
  }
  for (const auto& violation : model_.validate()) {
    spdlog::error("[transaction] invalid tree after rollback: {}", violation);
  }

  model_.end_batch(false);
  spdlog::debug("[transaction] rolled back '{}'", transaction.description);
}

// ============================================================================
// TransactionContext
// ============================================================================

TransactionContext::TransactionContext(PaneController& controller, std::string description)
    : controller_(controller) {
  auto result = controller_.begin_transaction(std::move(description));
  active_ = result.success;
  error_ = result.error;
}

TransactionContext::~TransactionContext() {
  if (active_) {
    controller_.rollback_transaction();
  }
}

CommandResult TransactionContext::execute(std::unique_ptr<Command> command) {
  if (!active_) {
    return CommandResult{false,
                         error_ != LayoutError::None ? error_ : LayoutError::NoTransaction};
  }

  auto result = controller_.execute(std::move(command));
  if (!result.success) {
    // The controller already rolled the transaction back
    active_ = false;
    error_ = result.error;
  }
  return result;
}

CommandResult TransactionContext::commit() {
  if (!active_) {
    return CommandResult{false,
                         error_ != LayoutError::None ? error_ : LayoutError::NoTransaction};
  }

  active_ = false;
  return controller_.commit_transaction();
}

} // namespace multisplit
