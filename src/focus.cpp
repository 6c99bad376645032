#include "focus.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace multisplit {

// ============================================================================
// Sequential Navigation
// ============================================================================

static std::optional<PaneId> step_pane(const Tree& tree, const std::optional<PaneId>& current,
                                       int step) {
  std::vector<PaneId> panes = get_pane_ids(tree);
  if (panes.empty()) {
    return std::nullopt;
  }

  if (!current.has_value()) {
    return panes.front();
  }

  auto it = std::find(panes.begin(), panes.end(), *current);
  if (it == panes.end()) {
    return panes.front();
  }

  auto count = static_cast<int>(panes.size());
  int position = static_cast<int>(it - panes.begin());
  return panes[static_cast<size_t>(((position + step) % count + count) % count)];
}

std::optional<PaneId> next_pane(const Tree& tree, const std::optional<PaneId>& current) {
  return step_pane(tree, current, 1);
}

std::optional<PaneId> previous_pane(const Tree& tree, const std::optional<PaneId>& current) {
  return step_pane(tree, current, -1);
}

// ============================================================================
// Directional Navigation
// ============================================================================

bool is_in_direction(const Rect& from, const Rect& to, Direction direction) {
  switch (direction) {
  case Direction::Left:
    return to.x + to.width <= from.x;
  case Direction::Right:
    return to.x >= from.x + from.width;
  case Direction::Up:
    return to.y + to.height <= from.y;
  case Direction::Down:
    return to.y >= from.y + from.height;
  default:
    return false;
  }
}

float directional_distance(const Rect& from, const Rect& to, Direction direction) {
  float dx_center = (to.x + to.width * 0.5f) - (from.x + from.width * 0.5f);
  float dy_center = (to.y + to.height * 0.5f) - (from.y + from.height * 0.5f);

  bool has_vertical_overlap = (to.y < from.y + from.height) && (to.y + to.height > from.y);
  bool has_horizontal_overlap = (to.x < from.x + from.width) && (to.x + to.width > from.x);

  switch (direction) {
  case Direction::Left:
  case Direction::Right: {
    float primary = (direction == Direction::Left) ? -dx_center : dx_center;
    if (has_vertical_overlap) {
      return primary;
    }
    float gap = static_cast<float>(
        std::min(std::abs(to.y - (from.y + from.height)), std::abs(from.y - (to.y + to.height))));
    return primary + 10000.0f + gap;
  }
  case Direction::Up:
  case Direction::Down: {
    float primary = (direction == Direction::Up) ? -dy_center : dy_center;
    if (has_horizontal_overlap) {
      return primary;
    }
    float gap = static_cast<float>(
        std::min(std::abs(to.x - (from.x + from.width)), std::abs(from.x - (to.x + to.width))));
    return primary + 10000.0f + gap;
  }
  default:
    return std::numeric_limits<float>::max();
  }
}

std::optional<PaneId> find_neighbor(const Layout& layout, const PaneId& from,
                                    Direction direction) {
  const PaneRect* current = nullptr;
  for (const auto& pane : layout.panes) {
    if (pane.pane_id == from) {
      current = &pane;
      break;
    }
  }
  if (current == nullptr || !current->visible) {
    return std::nullopt;
  }

  std::optional<PaneId> best;
  float best_score = std::numeric_limits<float>::max();

  for (const auto& candidate : layout.panes) {
    if (!candidate.visible || candidate.pane_id == from) {
      continue;
    }

    if (!is_in_direction(current->rect, candidate.rect, direction)) {
      continue;
    }

    float score = directional_distance(current->rect, candidate.rect, direction);
    if (score < best_score) {
      best_score = score;
      best = candidate.pane_id;
    }
  }

  return best;
}

} // namespace multisplit
