#pragma once

#include <string>
#include <variant>
#include <vector>

#include "geometry.h"
#include "identity.h"
#include "tree.h"
#include "types.h"

namespace multisplit {

// ============================================================================
// Operations
// ============================================================================

struct CreateOp {
  PaneId pane_id;
  WidgetId widget_id;

  bool operator==(const CreateOp&) const = default;
};

struct DestroyOp {
  PaneId pane_id;

  bool operator==(const DestroyOp&) const = default;
};

// The pane survived but its position among its siblings changed
struct MoveOp {
  PaneId pane_id;

  bool operator==(const MoveOp&) const = default;
};

struct UpdateRectOp {
  PaneId pane_id;
  Rect rect;

  bool operator==(const UpdateRectOp&) const = default;
};

using Operation = std::variant<CreateOp, DestroyOp, MoveOp, UpdateRectOp>;

// Receives operations from apply_operations; implemented by the view layer
class ReconcilerSink {
public:
  virtual ~ReconcilerSink() = default;

  virtual void create_pane(const PaneId& pane_id, const WidgetId& widget_id) = 0;
  virtual void destroy_pane(const PaneId& pane_id) = 0;
  virtual void move_pane(const PaneId& pane_id) = 0;
  virtual void update_pane_rect(const PaneId& pane_id, const Rect& rect) = 0;
};

// ============================================================================
// Reconciliation
// ============================================================================

// Diff two trees by PaneId. Emits every DestroyOp (old order), then every CreateOp
// (new order), then MoveOps for survivors that changed relative order.
// A surviving pane never produces Create or Destroy.
[[nodiscard]] std::vector<Operation> reconcile(const Tree& old_tree, const Tree& new_tree);

// As above, followed by UpdateRectOps (new order) for created panes and for survivors whose
// display rectangle changed
[[nodiscard]] std::vector<Operation> reconcile(const Tree& old_tree, const Rect& old_bounds,
                                               const Tree& new_tree, const Rect& new_bounds,
                                               const GeometryOptions& options = {});

void apply_operations(const std::vector<Operation>& operations, ReconcilerSink& sink);

[[nodiscard]] std::string describe_operation(const Operation& operation);

} // namespace multisplit
