#include "geometry.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace multisplit {

// ============================================================================
// Minimum Sizes
// ============================================================================

Size minimum_size(const Tree& tree, int index, const GeometryOptions& options) {
  if (const LeafNode* leaf = get_leaf(tree, index)) {
    return Size{std::max(options.min_pane_width, leaf->constraints.min_width),
                std::max(options.min_pane_height, leaf->constraints.min_height)};
  }

  const SplitNode* split = get_split(tree, index);
  if (split == nullptr) {
    return Size{};
  }

  const auto& children = tree.nodes.get_children(index);
  Size result;
  for (int child : children) {
    Size child_min = minimum_size(tree, child, options);
    if (split->orientation == Orientation::Horizontal) {
      result.width += child_min.width;
      result.height = std::max(result.height, child_min.height);
    } else {
      result.width = std::max(result.width, child_min.width);
      result.height += child_min.height;
    }
  }

  int dividers = children.empty() ? 0 : options.divider_width * static_cast<int>(children.size() - 1);
  if (split->orientation == Orientation::Horizontal) {
    result.width += dividers;
  } else {
    result.height += dividers;
  }
  return result;
}

// ============================================================================
// Extent Distribution
// ============================================================================

std::vector<int> distribute_extent(int extent, const std::vector<double>& ratios,
                                   const std::vector<int>& minimums, bool& overflow) {
  const size_t count = ratios.size();
  if (count == 0) {
    return {};
  }

  int total_minimum = std::accumulate(minimums.begin(), minimums.end(), 0);
  if (total_minimum >= extent) {
    if (total_minimum > extent) {
      overflow = true;
    }
    return minimums;
  }

  // Pin children whose share falls below their minimum until no new child is pinned
  std::vector<bool> pinned(count, false);
  bool any_pinned = false;
  double free_ratio = 0.0;
  double free_extent = 0.0;

  auto recompute_free = [&]() {
    free_ratio = 0.0;
    free_extent = static_cast<double>(extent);
    for (size_t i = 0; i < count; ++i) {
      if (pinned[i]) {
        free_extent -= minimums[i];
      } else {
        free_ratio += ratios[i];
      }
    }
  };

  auto share_of = [&](size_t i) {
    if (!any_pinned) {
      return ratios[i] * extent;
    }
    return free_ratio > 0.0 ? ratios[i] / free_ratio * free_extent : 0.0;
  };

  bool changed = true;
  while (changed) {
    changed = false;
    recompute_free();
    for (size_t i = 0; i < count; ++i) {
      if (!pinned[i] && share_of(i) < minimums[i]) {
        pinned[i] = true;
        any_pinned = true;
        changed = true;
      }
    }
  }
  recompute_free();

  // Round every child but the last; the last takes the remainder
  std::vector<int> sizes(count, 0);
  int used = 0;
  for (size_t i = 0; i + 1 < count; ++i) {
    sizes[i] = pinned[i] ? minimums[i] : static_cast<int>(std::lround(share_of(i)));
    used += sizes[i];
  }
  sizes[count - 1] = extent - used;

  // Rounding can leave a child a pixel or two short of its minimum
  for (size_t i = 0; i < count; ++i) {
    while (sizes[i] < minimums[i]) {
      size_t donor = count;
      int best_surplus = 0;
      for (size_t j = 0; j < count; ++j) {
        int surplus = sizes[j] - minimums[j];
        if (j != i && surplus > best_surplus) {
          best_surplus = surplus;
          donor = j;
        }
      }
      if (donor == count) {
        overflow = true;
        break;
      }
      int amount = std::min(minimums[i] - sizes[i], best_surplus);
      sizes[donor] -= amount;
      sizes[i] += amount;
    }
  }

  return sizes;
}

// ============================================================================
// Layout
// ============================================================================

static void layout_node(const Tree& tree, int index, const Rect& rect,
                        const GeometryOptions& options, Layout& layout) {
  if (const LeafNode* leaf = get_leaf(tree, index)) {
    Size minimum = minimum_size(tree, index, options);
    if (rect.width < minimum.width || rect.height < minimum.height) {
      layout.overflow = true;
    }
    layout.panes.push_back(PaneRect{leaf->pane_id, rect, true});
    return;
  }

  const SplitNode* split = get_split(tree, index);
  if (split == nullptr) {
    return;
  }

  const auto& children = tree.nodes.get_children(index);
  if (children.empty()) {
    return;
  }

  const bool horizontal = split->orientation == Orientation::Horizontal;
  const int extent = horizontal ? rect.width : rect.height;
  const int divider_total = options.divider_width * static_cast<int>(children.size() - 1);
  int available = extent - divider_total;
  if (available < 0) {
    layout.overflow = true;
    available = 0;
  }

  std::vector<int> minimums;
  minimums.reserve(children.size());
  for (int child : children) {
    Size minimum = minimum_size(tree, child, options);
    minimums.push_back(horizontal ? minimum.width : minimum.height);
  }

  std::vector<double> ratios = split->ratios;
  if (ratios.size() != children.size()) {
    spdlog::warn("Split {} has {} ratios for {} children, using equal shares", split->id.value,
                 ratios.size(), children.size());
    ratios = equal_ratios(children.size());
  }

  std::vector<int> sizes = distribute_extent(available, ratios, minimums, layout.overflow);

  int cursor = horizontal ? rect.x : rect.y;
  for (size_t i = 0; i < children.size(); ++i) {
    Rect child_rect = horizontal ? Rect{cursor, rect.y, sizes[i], rect.height}
                                 : Rect{rect.x, cursor, rect.width, sizes[i]};
    layout_node(tree, children[i], child_rect, options, layout);
    cursor += sizes[i];

    if (i + 1 < children.size()) {
      Rect divider = horizontal ? Rect{cursor, rect.y, options.divider_width, rect.height}
                                : Rect{rect.x, cursor, rect.width, options.divider_width};
      layout.dividers.push_back(DividerRect{split->id, i, split->orientation, divider});
      cursor += options.divider_width;
    }
  }
}

Layout compute_layout(const Tree& tree, const Rect& bounds, const GeometryOptions& options) {
  Layout layout;
  if (is_empty(tree)) {
    return layout;
  }

  layout_node(tree, kRootIndex, bounds, options, layout);
  if (layout.overflow) {
    spdlog::debug("Layout overflow: minimum sizes exceed {}x{}", bounds.width, bounds.height);
  }
  return layout;
}

Layout compute_display_layout(const Tree& tree, const Rect& bounds,
                              const GeometryOptions& options) {
  Layout layout = compute_layout(tree, bounds, options);
  if (!tree.maximized_pane_id.has_value()) {
    return layout;
  }

  auto index = find_leaf(tree, *tree.maximized_pane_id);
  if (!index.has_value()) {
    return layout;
  }

  for (auto& pane : layout.panes) {
    if (pane.pane_id == *tree.maximized_pane_id) {
      pane.rect = bounds;
    } else {
      pane.visible = false;
    }
  }
  layout.dividers.clear();

  Size minimum = minimum_size(tree, *index, options);
  layout.overflow = bounds.width < minimum.width || bounds.height < minimum.height;
  return layout;
}

std::optional<Rect> find_pane_rect(const Layout& layout, const PaneId& pane_id) {
  for (const auto& pane : layout.panes) {
    if (pane.pane_id == pane_id) {
      return pane.rect;
    }
  }
  return std::nullopt;
}

} // namespace multisplit
