#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "commands.h"
#include "model.h"

namespace multisplit {

constexpr size_t kDefaultMaxUndoLevels = 100;

// Result of running a command through the controller
struct CommandResult {
  bool success = false;
  LayoutError error = LayoutError::None;
};

// Runs commands against a model and keeps the undo/redo history.
// A transaction groups commands into one atomic step: one emission round on commit,
// one undo entry, and a full rollback (with no `changed` emission) if any command fails.
class PaneController {
public:
  explicit PaneController(PaneModel& model, size_t max_undo_levels = kDefaultMaxUndoLevels);

  PaneController(const PaneController&) = delete;
  PaneController& operator=(const PaneController&) = delete;

  // ==========================================================================
  // Command Execution
  // ==========================================================================

  // Execute a command. Outside a transaction a successful command lands on the undo
  // stack (merged into the previous entry when possible) and clears the redo stack.
  // Inside a transaction a failure rolls the whole transaction back.
  CommandResult execute(std::unique_ptr<Command> command);

  // A command that fails to undo stays on the undo stack. A command that fails to redo
  // drops the rest of the redo stack, which no longer matches the tree.
  [[nodiscard]] bool undo();
  [[nodiscard]] bool redo();

  [[nodiscard]] bool can_undo() const;
  [[nodiscard]] bool can_redo() const;

  [[nodiscard]] size_t undo_count() const {
    return undo_stack_.size();
  }

  [[nodiscard]] size_t redo_count() const {
    return redo_stack_.size();
  }

  [[nodiscard]] std::optional<std::string> undo_description() const;
  [[nodiscard]] std::optional<std::string> redo_description() const;

  void clear_history();

  // Older entries are dropped once the limit is reached
  void set_max_undo_levels(size_t levels);

  [[nodiscard]] size_t max_undo_levels() const {
    return max_undo_levels_;
  }

  // ==========================================================================
  // Transactions
  // ==========================================================================

  // Fails with TransactionOpen if a transaction is already open (no nesting)
  CommandResult begin_transaction(std::string description = "Transaction");

  // Emit one change round and push one undo entry. Fails with NoTransaction if none is open.
  CommandResult commit_transaction();

  // Undo every command of the open transaction in reverse order
  void rollback_transaction();

  [[nodiscard]] bool in_transaction() const {
    return transaction_.has_value();
  }

  [[nodiscard]] PaneModel& model() {
    return model_;
  }

private:
  struct OpenTransaction {
    std::string description;
    std::vector<std::unique_ptr<Command>> commands;
    Tree snapshot;
  };

  void push_undo(std::unique_ptr<Command> command);

  PaneModel& model_;
  size_t max_undo_levels_;
  std::deque<std::unique_ptr<Command>> undo_stack_;
  std::vector<std::unique_ptr<Command>> redo_stack_;
  std::optional<OpenTransaction> transaction_;
};

// RAII transaction: begins on construction and rolls back on destruction unless committed
class TransactionContext {
public:
  explicit TransactionContext(PaneController& controller,
                              std::string description = "Transaction");
  ~TransactionContext();

  TransactionContext(const TransactionContext&) = delete;
  TransactionContext& operator=(const TransactionContext&) = delete;

  CommandResult execute(std::unique_ptr<Command> command);
  CommandResult commit();

  // False once committed, rolled back, or if the transaction could not begin
  [[nodiscard]] bool active() const {
    return active_;
  }

  // Why the transaction is no longer active, if it failed
  [[nodiscard]] LayoutError error() const {
    return error_;
  }

private:
  PaneController& controller_;
  bool active_ = false;
  LayoutError error_ = LayoutError::None;
};

} // namespace multisplit
