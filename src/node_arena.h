#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace multisplit {

// Index-based n-ary tree. Nodes live in one vector and refer to each other by index.
template <typename T, typename Allocator = std::allocator<T>>
class NodeArena {
public:
  struct Node {
    T data;
    std::optional<int> parent;
    std::vector<int> children;
  };

  using allocator_type = Allocator;
  using NodeAllocator = typename std::allocator_traits<Allocator>::template rebind_alloc<Node>;

  // Constructors

  NodeArena() = default;

  explicit NodeArena(const Allocator& alloc) : nodes_(NodeAllocator(alloc)) {
  }

  // Core Operations

  int add_node(T data, std::optional<int> parent_index = std::nullopt) {
    Node node{std::move(data), parent_index, {}};
    nodes_.push_back(std::move(node));
    return static_cast<int>(nodes_.size() - 1);
  }

  [[nodiscard]] bool is_leaf(int index) const {
    if (!is_valid_index(index)) {
      return false;
    }
    return nodes_[static_cast<size_t>(index)].children.empty();
  }

  [[nodiscard]] bool is_valid_index(int index) const {
    return index >= 0 && static_cast<size_t>(index) < nodes_.size();
  }

  // Traversal

  [[nodiscard]] std::optional<int> get_parent(int index) const {
    if (!is_valid_index(index)) {
      return std::nullopt;
    }
    return nodes_[static_cast<size_t>(index)].parent;
  }

  [[nodiscard]] const std::vector<int>& get_children(int index) const {
    return nodes_[static_cast<size_t>(index)].children;
  }

  [[nodiscard]] size_t child_count(int index) const {
    if (!is_valid_index(index)) {
      return 0;
    }
    return nodes_[static_cast<size_t>(index)].children.size();
  }

  // Position of a node within its parent's child list
  [[nodiscard]] std::optional<size_t> index_in_parent(int index) const {
    auto parent = get_parent(index);
    if (!parent.has_value() || !is_valid_index(*parent)) {
      return std::nullopt;
    }
    const auto& siblings = nodes_[static_cast<size_t>(*parent)].children;
    auto it = std::find(siblings.begin(), siblings.end(), index);
    if (it == siblings.end()) {
      return std::nullopt;
    }
    return static_cast<size_t>(it - siblings.begin());
  }

  // Structure Modification

  void set_children(int parent_index, std::vector<int> children) {
    if (!is_valid_index(parent_index)) {
      return;
    }

    // Update children's parent pointers
    for (int child : children) {
      if (is_valid_index(child)) {
        nodes_[static_cast<size_t>(child)].parent = parent_index;
      }
    }
    nodes_[static_cast<size_t>(parent_index)].children = std::move(children);
  }

  void insert_child(int parent_index, size_t position, int child_index) {
    if (!is_valid_index(parent_index) || !is_valid_index(child_index)) {
      return;
    }

    auto& children = nodes_[static_cast<size_t>(parent_index)].children;
    position = std::min(position, children.size());
    children.insert(children.begin() + static_cast<std::ptrdiff_t>(position), child_index);
    nodes_[static_cast<size_t>(child_index)].parent = parent_index;
  }

  // Unlink a child from its parent. The node itself stays in the arena until remove().
  void detach_child(int parent_index, int child_index) {
    if (!is_valid_index(parent_index)) {
      return;
    }

    auto& children = nodes_[static_cast<size_t>(parent_index)].children;
    children.erase(std::remove(children.begin(), children.end(), child_index), children.end());
    if (is_valid_index(child_index)) {
      nodes_[static_cast<size_t>(child_index)].parent = std::nullopt;
    }
  }

  // Removal
  // Removes nodes at specified indices and remaps all indices.
  // Returns: vector where remap[old_index] = new_index, or -1 if removed.
  [[nodiscard]] std::vector<int> remove(const std::vector<int>& indices_to_remove) {
    if (nodes_.empty()) {
      return {};
    }

    std::set<int> to_remove(indices_to_remove.begin(), indices_to_remove.end());

    // Build remap: old_index -> new_index
    std::vector<int> remap(nodes_.size(), -1);
    int new_index = 0;

    for (size_t i = 0; i < nodes_.size(); ++i) {
      if (to_remove.find(static_cast<int>(i)) == to_remove.end()) {
        remap[i] = new_index++;
      }
    }

    auto remap_index = [&remap](int old_index) -> int {
      if (old_index < 0 || static_cast<size_t>(old_index) >= remap.size()) {
        return -1;
      }
      return remap[static_cast<size_t>(old_index)];
    };

    std::vector<Node, NodeAllocator> new_nodes(nodes_.get_allocator());
    new_nodes.reserve(static_cast<size_t>(new_index));

    for (size_t i = 0; i < nodes_.size(); ++i) {
      if (to_remove.find(static_cast<int>(i)) != to_remove.end()) {
        continue;
      }

      Node node = std::move(nodes_[i]);

      if (node.parent.has_value()) {
        int new_parent = remap_index(*node.parent);
        node.parent = (new_parent >= 0) ? std::optional<int>(new_parent) : std::nullopt;
      }

      // Children that were removed drop out of the list
      std::vector<int> children;
      children.reserve(node.children.size());
      for (int child : node.children) {
        int new_child = remap_index(child);
        if (new_child >= 0) {
          children.push_back(new_child);
        }
      }
      node.children = std::move(children);

      new_nodes.push_back(std::move(node));
    }

    nodes_ = std::move(new_nodes);
    return remap;
  }

  // Accessors

  T& operator[](int index) {
    return nodes_[static_cast<size_t>(index)].data;
  }

  const T& operator[](int index) const {
    return nodes_[static_cast<size_t>(index)].data;
  }

  Node& node(int index) {
    return nodes_[static_cast<size_t>(index)];
  }

  const Node& node(int index) const {
    return nodes_[static_cast<size_t>(index)];
  }

  [[nodiscard]] size_t size() const {
    return nodes_.size();
  }

  [[nodiscard]] bool empty() const {
    return nodes_.empty();
  }

  void clear() {
    nodes_.clear();
  }

  void reserve(size_t capacity) {
    nodes_.reserve(capacity);
  }

  [[nodiscard]] allocator_type get_allocator() const {
    return allocator_type(nodes_.get_allocator());
  }

private:
  std::vector<Node, NodeAllocator> nodes_;
};

} // namespace multisplit
