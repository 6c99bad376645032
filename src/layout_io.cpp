#include "layout_io.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <unordered_set>

#include "model.h"

namespace multisplit {

namespace {

using nlohmann::json;

json node_to_json(const Tree& tree, int index) {
  json node;
  if (const LeafNode* leaf = get_leaf(tree, index)) {
    node["type"] = "leaf";
    node["pane_id"] = leaf->pane_id.value;
    node["widget_id"] = leaf->widget_id;
    node["constraints"] = {{"min_width", leaf->constraints.min_width},
                           {"min_height", leaf->constraints.min_height}};
    return node;
  }

  const SplitNode* split = get_split(tree, index);
  node["type"] = "split";
  node["node_id"] = split->id.value;
  node["orientation"] = std::string(to_string(split->orientation));
  node["ratios"] = split->ratios;

  json children = json::array();
  for (int child : tree.nodes.get_children(index)) {
    children.push_back(node_to_json(tree, child));
  }
  node["children"] = children;
  return node;
}

// Recursive reader. Throws std::runtime_error with a message naming the bad node.
class NodeReader {
public:
  explicit NodeReader(Tree& tree) : tree_(tree) {
  }

  void read(const json& node, std::optional<int> parent) {
    if (!node.is_object()) {
      throw std::runtime_error("node is not an object");
    }

    std::string type = node.value("type", "");
    if (type == "leaf") {
      read_leaf(node, parent);
    } else if (type == "split") {
      read_split(node, parent);
    } else {
      throw std::runtime_error("unknown node type '" + type + "'");
    }
  }

  // Give splits that had no node_id an id unused anywhere in the document
  void assign_missing_split_ids() {
    IdGenerator generator(kSplitIdPrefix);
    for (const auto& id : split_ids_) {
      generator.observe(id);
    }
    for (int index : unnamed_splits_) {
      SplitId id{generator.next()};
      while (split_ids_.contains(id.value)) {
        id = SplitId{generator.next()};
      }
      split_ids_.insert(id.value);
      std::get<SplitNode>(tree_.nodes[index]).id = std::move(id);
    }
  }

private:
  int attach(NodeData data, std::optional<int> parent) {
    int index = tree_.nodes.add_node(std::move(data), parent);
    if (parent.has_value()) {
      tree_.nodes.insert_child(*parent, tree_.nodes.child_count(*parent), index);
    }
    return index;
  }

  void read_leaf(const json& node, std::optional<int> parent) {
    LeafNode leaf;
    leaf.pane_id = PaneId{node.at("pane_id").get<std::string>()};
    leaf.widget_id = node.at("widget_id").get<std::string>();
    if (leaf.pane_id.value.empty()) {
      throw std::runtime_error("leaf with empty pane_id");
    }
    if (node.contains("constraints")) {
      const json& constraints = node["constraints"];
      leaf.constraints.min_width = std::max(0, constraints.value("min_width", 0));
      leaf.constraints.min_height = std::max(0, constraints.value("min_height", 0));
    }
    attach(std::move(leaf), parent);
  }

  void read_split(const json& node, std::optional<int> parent) {
    SplitNode split;
    std::string orientation = node.at("orientation").get<std::string>();
    if (orientation == "horizontal") {
      split.orientation = Orientation::Horizontal;
    } else if (orientation == "vertical") {
      split.orientation = Orientation::Vertical;
    } else {
      throw std::runtime_error("unknown orientation '" + orientation + "'");
    }
    split.ratios = node.at("ratios").get<std::vector<double>>();

    bool named = node.contains("node_id") && node["node_id"].is_string() &&
                 !node["node_id"].get<std::string>().empty();
    if (named) {
      split.id = SplitId{node["node_id"].get<std::string>()};
      split_ids_.insert(split.id.value);
    }

    const json& children = node.at("children");
    if (!children.is_array()) {
      throw std::runtime_error("split children is not an array");
    }

    int index = attach(std::move(split), parent);
    if (!named) {
      unnamed_splits_.push_back(index);
    }
    for (const auto& child : children) {
      read(child, index);
    }
  }

  Tree& tree_;
  std::unordered_set<std::string> split_ids_;
  std::vector<int> unnamed_splits_;
};

} // anonymous namespace

// ============================================================================
// JSON Conversion
// ============================================================================

json tree_to_json(const Tree& tree) {
  json document;
  document["version"] = kLayoutFormatVersion;
  document["root"] = is_empty(tree) ? json(nullptr) : node_to_json(tree, kRootIndex);
  document["focused_pane_id"] =
      tree.focused_pane_id.has_value() ? json(tree.focused_pane_id->value) : json(nullptr);
  return document;
}

LayoutReadResult tree_from_json(const json& document) {
  try {
    if (!document.is_object()) {
      return LayoutReadResult{false, "Layout document is not an object", {}};
    }

    std::string version = document.value("version", kLayoutFormatVersion);
    if (!is_compatible_layout_version(version)) {
      return LayoutReadResult{false, "Incompatible layout version: " + version, {}};
    }

    Tree tree;
    if (document.contains("root") && !document["root"].is_null()) {
      NodeReader reader(tree);
      reader.read(document["root"], std::nullopt);
      reader.assign_missing_split_ids();
    }

    if (document.contains("focused_pane_id") && document["focused_pane_id"].is_string()) {
      PaneId focus{document["focused_pane_id"].get<std::string>()};
      if (has_pane(tree, focus)) {
        tree.focused_pane_id = std::move(focus);
      } else {
        spdlog::warn("Saved focus '{}' is not in the layout, using the first pane", focus.value);
      }
    }
    if (!tree.focused_pane_id.has_value()) {
      tree.focused_pane_id = first_pane(tree);
    }

    auto violations = validate_tree(tree);
    if (!violations.empty()) {
      for (const auto& violation : violations) {
        spdlog::error("[layout] {}", violation);
      }
      return LayoutReadResult{false, "Invalid layout: " + violations.front(), {}};
    }

    return LayoutReadResult{true, "", std::move(tree)};
  } catch (const json::exception& e) {
    return LayoutReadResult{false, std::string("Malformed layout: ") + e.what(), {}};
  } catch (const std::runtime_error& e) {
    return LayoutReadResult{false, std::string("Malformed layout: ") + e.what(), {}};
  }
}

std::string layout_to_string(const Tree& tree, int indent) {
  return tree_to_json(tree).dump(indent);
}

LayoutReadResult layout_from_string(const std::string& text) {
  json document = json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    return LayoutReadResult{false, "Layout is not valid JSON", {}};
  }
  return tree_from_json(document);
}

// ============================================================================
// File I/O
// ============================================================================

LayoutWriteResult save_layout(const Tree& tree, const std::filesystem::path& filepath) {
  std::ofstream file(filepath);
  if (!file) {
    return LayoutWriteResult{false, "Failed to open file for writing: " + filepath.string()};
  }
  file << layout_to_string(tree);
  if (!file) {
    return LayoutWriteResult{false, "Failed to write layout: " + filepath.string()};
  }
  spdlog::debug("Saved layout ({} panes) to {}", pane_count(tree), filepath.string());
  return LayoutWriteResult{true, ""};
}

LayoutReadResult load_layout(const std::filesystem::path& filepath) {
  std::ifstream file(filepath);
  if (!file) {
    return LayoutReadResult{false, "Failed to open file for reading: " + filepath.string(), {}};
  }

  json document = json::parse(file, nullptr, false);
  if (document.is_discarded()) {
    return LayoutReadResult{false, "Layout is not valid JSON: " + filepath.string(), {}};
  }
  return tree_from_json(document);
}

} // namespace multisplit
