#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "tree.h"
#include "version.h"

namespace multisplit {

struct LayoutWriteResult {
  bool success;
  std::string error; // Set if success == false
};

struct LayoutReadResult {
  bool success;
  std::string error; // Set if success == false
  Tree tree;         // Valid if success == true
};

// Serialize the tree structure and focus. Maximize is runtime state and is never written.
[[nodiscard]] nlohmann::json tree_to_json(const Tree& tree);

// Parse and validate a layout document. Splits without a node_id get a fresh one and an
// unknown focus falls back to the first pane.
[[nodiscard]] LayoutReadResult tree_from_json(const nlohmann::json& document);

[[nodiscard]] std::string layout_to_string(const Tree& tree, int indent = 2);
[[nodiscard]] LayoutReadResult layout_from_string(const std::string& text);

LayoutWriteResult save_layout(const Tree& tree, const std::filesystem::path& filepath);
[[nodiscard]] LayoutReadResult load_layout(const std::filesystem::path& filepath);

} // namespace multisplit
