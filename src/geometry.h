#pragma once

#include <optional>
#include <vector>

#include "identity.h"
#include "tree.h"
#include "types.h"

namespace multisplit {

constexpr int kDefaultDividerWidth = 0;
constexpr int kDefaultMinPaneWidth = 50;
constexpr int kDefaultMinPaneHeight = 50;

struct GeometryOptions {
  int divider_width = kDefaultDividerWidth; // Space reserved between siblings
  int min_pane_width = kDefaultMinPaneWidth;
  int min_pane_height = kDefaultMinPaneHeight;
};

struct PaneRect {
  PaneId pane_id;
  Rect rect;
  bool visible = true; // False for panes hidden behind a maximized pane
};

// The gap between children[index] and children[index + 1] of a split
struct DividerRect {
  SplitId split_id;
  size_t index = 0;
  Orientation orientation = Orientation::Horizontal;
  Rect rect;
};

struct Layout {
  std::vector<PaneRect> panes; // Leaf order (depth-first, left to right)
  std::vector<DividerRect> dividers;
  bool overflow = false; // Minimum sizes did not fit; panes extend past the bounds
};

// Compute rectangles for every leaf, ignoring maximize.
// Along a split axis of extent E every child but the last gets round(ratio * E) and the
// last takes the remainder, so with no dividers the leaves exactly tile `bounds`.
[[nodiscard]] Layout compute_layout(const Tree& tree, const Rect& bounds,
                                    const GeometryOptions& options = {});

// compute_layout, then apply maximize: the maximized pane covers `bounds` and every
// other pane is hidden
[[nodiscard]] Layout compute_display_layout(const Tree& tree, const Rect& bounds,
                                            const GeometryOptions& options = {});

[[nodiscard]] std::optional<Rect> find_pane_rect(const Layout& layout, const PaneId& pane_id);

// Minimum size of the subtree rooted at index
[[nodiscard]] Size minimum_size(const Tree& tree, int index, const GeometryOptions& options);

// Split `extent` between children by ratio, honoring per-child minimums.
// Children pushed below their minimum are pinned to it and the rest is shared among the
// others by ratio. If the minimums alone exceed `extent`, every child gets its minimum and
// `overflow` is set.
[[nodiscard]] std::vector<int> distribute_extent(int extent, const std::vector<double>& ratios,
                                                 const std::vector<int>& minimums,
                                                 bool& overflow);

} // namespace multisplit
