#pragma once

#include <string_view>

namespace multisplit {

// Horizontal lays children out left to right (partitions width),
// Vertical stacks them top to bottom (partitions height)
enum class Orientation { Horizontal, Vertical };

// Navigation direction
enum class Direction { Left, Right, Up, Down };

// Where a new leaf goes relative to the target leaf
enum class SplitPlacement { After, Before };

// How focus changes interact with a maximized pane
enum class FocusPolicy {
  AutoRestore,    // Focusing another pane leaves maximized mode
  LockToMaximized // Focus cannot leave the maximized pane
};

// Integer pixel rectangle
struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  bool operator==(const Rect&) const = default;
};

struct Size {
  int width = 0;
  int height = 0;

  bool operator==(const Size&) const = default;
};

// Per-pane minimum size. Zero means "use the global minimum"
struct SizeConstraints {
  int min_width = 0;
  int min_height = 0;

  bool operator==(const SizeConstraints&) const = default;
};

// Typed failure reasons for tree operations
enum class LayoutError {
  None,
  PaneNotFound,
  SplitNotFound,
  InvalidRatios,
  LastPane,
  InvalidStructure,
  FocusLocked,
  InvalidTransition,
  TransactionOpen,
  NoTransaction
};

[[nodiscard]] std::string_view to_string(LayoutError error);
[[nodiscard]] std::string_view to_string(Orientation orientation);

} // namespace multisplit
