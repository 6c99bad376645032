#pragma once

#include <optional>

#include "geometry.h"
#include "identity.h"
#include "tree.h"
#include "types.h"

namespace multisplit {

// ============================================================================
// Sequential Navigation
// ============================================================================

// Next pane in depth-first order, wrapping around.
// With no current pane (or an unknown one) returns the first pane.
[[nodiscard]] std::optional<PaneId> next_pane(const Tree& tree, const std::optional<PaneId>& current);
[[nodiscard]] std::optional<PaneId> previous_pane(const Tree& tree,
                                                  const std::optional<PaneId>& current);

// ============================================================================
// Directional Navigation
// ============================================================================

// True if `to` lies entirely on the `direction` side of `from`
[[nodiscard]] bool is_in_direction(const Rect& from, const Rect& to, Direction direction);

// Lower is closer. Candidates sharing the perpendicular span with `from` always beat
// those that don't.
[[nodiscard]] float directional_distance(const Rect& from, const Rect& to, Direction direction);

// The closest visible pane in the given direction, or nullopt at the layout edge
[[nodiscard]] std::optional<PaneId> find_neighbor(const Layout& layout, const PaneId& from,
                                                  Direction direction);

} // namespace multisplit
