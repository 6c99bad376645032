#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace multisplit {

// Identifier of a leaf pane. Assigned when the leaf is created, never reassigned,
// and kept across resizes, reorders and moves
struct PaneId {
  std::string value;

  auto operator<=>(const PaneId&) const = default;
};

// Identifier of a split node, used to address it for ratio changes
struct SplitId {
  std::string value;

  auto operator<=>(const SplitId&) const = default;
};

// Opaque content key. Only the widget provider interprets it
using WidgetId = std::string;

// Produces "<prefix><n>" identifiers with a strictly increasing counter
class IdGenerator {
public:
  explicit IdGenerator(std::string prefix);

  [[nodiscard]] std::string next();

  // Advance the counter past an identifier that was created elsewhere (e.g. loaded from disk)
  void observe(const std::string& id);

  [[nodiscard]] const std::string& prefix() const {
    return prefix_;
  }

  [[nodiscard]] uint64_t peek() const {
    return next_;
  }

private:
  std::string prefix_;
  uint64_t next_ = 1;
};

} // namespace multisplit

namespace std {

template <>
struct hash<multisplit::PaneId> {
  size_t operator()(const multisplit::PaneId& id) const noexcept {
    return hash<string>{}(id.value);
  }
};

template <>
struct hash<multisplit::SplitId> {
  size_t operator()(const multisplit::SplitId& id) const noexcept {
    return hash<string>{}(id.value);
  }
};

} // namespace std
