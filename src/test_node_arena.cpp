#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include <memory>
#include <string>

#include "node_arena.h"

using namespace multisplit;

// Simple test data type
struct TestData {
  int value = 0;
};

// Tracking allocator for custom allocator tests
// Must be defined outside test cases because local classes can't have template members
namespace {
int g_tracking_allocation_count = 0;

template <typename T>
struct TrackingAllocator {
  using value_type = T;

  TrackingAllocator() = default;

  template <typename U>
  TrackingAllocator(const TrackingAllocator<U>&) {
  }

  T* allocate(std::size_t n) {
    g_tracking_allocation_count++;
    return std::allocator<T>{}.allocate(n);
  }

  void deallocate(T* p, std::size_t n) {
    std::allocator<T>{}.deallocate(p, n);
  }

  bool operator==(const TrackingAllocator&) const {
    return true;
  }
  bool operator!=(const TrackingAllocator&) const {
    return false;
  }
};

// root(0) -> [a(1), b(2), c(3)]
NodeArena<TestData> make_three_children() {
  NodeArena<TestData> arena;
  int root = arena.add_node(TestData{0});
  int a = arena.add_node(TestData{1}, root);
  int b = arena.add_node(TestData{2}, root);
  int c = arena.add_node(TestData{3}, root);
  arena.set_children(root, {a, b, c});
  return arena;
}
} // namespace

TEST_SUITE("NodeArena") {
  TEST_CASE("empty arena") {
    NodeArena<TestData> arena;

    CHECK(arena.empty());
    CHECK(arena.size() == 0);
  }

  TEST_CASE("add nodes and check size") {
    NodeArena<TestData> arena;

    int idx0 = arena.add_node(TestData{10});
    CHECK(arena.size() == 1);
    CHECK(idx0 == 0);
    CHECK(arena[0].value == 10);

    int idx1 = arena.add_node(TestData{20});
    CHECK(arena.size() == 2);
    CHECK(idx1 == 1);
    CHECK(arena[1].value == 20);
  }

  TEST_CASE("is_valid_index") {
    NodeArena<TestData> arena;
    arena.add_node(TestData{1});

    CHECK(arena.is_valid_index(0));
    CHECK_FALSE(arena.is_valid_index(-1));
    CHECK_FALSE(arena.is_valid_index(1));
  }

  TEST_CASE("set_children links any number of children") {
    auto arena = make_three_children();

    CHECK_FALSE(arena.is_leaf(0));
    CHECK(arena.child_count(0) == 3);
    CHECK(arena.get_children(0)[0] == 1);
    CHECK(arena.get_children(0)[2] == 3);
    for (int child = 1; child <= 3; ++child) {
      CHECK(arena.is_leaf(child));
      CHECK(arena.get_parent(child) == 0);
    }
  }

  TEST_CASE("get_parent for root returns nullopt") {
    NodeArena<TestData> arena;

    int root = arena.add_node(TestData{0});
    CHECK_FALSE(arena.get_parent(root).has_value());
  }

  TEST_CASE("index_in_parent") {
    auto arena = make_three_children();

    CHECK(arena.index_in_parent(2) == 1u);
    CHECK(arena.index_in_parent(3) == 2u);
    CHECK_FALSE(arena.index_in_parent(0).has_value());
  }

  TEST_CASE("insert_child places child at position") {
    auto arena = make_three_children();
    int d = arena.add_node(TestData{4}, 0);

    arena.insert_child(0, 1, d);

    REQUIRE(arena.child_count(0) == 4);
    CHECK(arena.get_children(0)[1] == d);
    CHECK(arena.get_children(0)[2] == 2);
    CHECK(arena.get_parent(d) == 0);
  }

  TEST_CASE("insert_child past the end appends") {
    auto arena = make_three_children();
    int d = arena.add_node(TestData{4}, 0);

    arena.insert_child(0, 99, d);

    CHECK(arena.get_children(0)[3] == d);
  }

  TEST_CASE("detach_child unlinks both directions") {
    auto arena = make_three_children();

    arena.detach_child(0, 2);

    CHECK(arena.child_count(0) == 2);
    CHECK(arena.get_children(0)[1] == 3);
    CHECK_FALSE(arena.get_parent(2).has_value());
    CHECK(arena.size() == 4);
  }

  TEST_CASE("remove remaps parent-child pointers correctly") {
    auto arena = make_three_children();
    arena.detach_child(0, 1);

    auto remap = arena.remove({1});

    REQUIRE(remap.size() == 4);
    CHECK(remap[0] == 0);
    CHECK(remap[1] == -1);
    CHECK(remap[2] == 1);
    CHECK(remap[3] == 2);

    CHECK(arena.size() == 3);
    REQUIRE(arena.child_count(0) == 2);
    CHECK(arena.get_children(0)[0] == 1);
    CHECK(arena.get_children(0)[1] == 2);
    CHECK(arena[1].value == 2);
    CHECK(arena[2].value == 3);
    CHECK(arena.get_parent(1) == 0);
    CHECK(arena.get_parent(2) == 0);
  }

  TEST_CASE("remove drops removed nodes from child lists") {
    auto arena = make_three_children();

    // Not detached first: the removed index must still disappear from the list
    auto remap = arena.remove({2});

    CHECK(remap[2] == -1);
    REQUIRE(arena.child_count(0) == 2);
    CHECK(arena[arena.get_children(0)[0]].value == 1);
    CHECK(arena[arena.get_children(0)[1]].value == 3);
  }

  TEST_CASE("remove with empty indices keeps everything") {
    auto arena = make_three_children();

    auto remap = arena.remove({});

    CHECK(arena.size() == 4);
    CHECK(remap[3] == 3);
  }

  TEST_CASE("remove on empty arena") {
    NodeArena<TestData> arena;

    auto remap = arena.remove({0});

    CHECK(remap.empty());
    CHECK(arena.empty());
  }

  TEST_CASE("copies are independent") {
    auto arena = make_three_children();
    auto copy = arena;

    copy[1].value = 100;
    copy.detach_child(0, 3);

    CHECK(arena[1].value == 1);
    CHECK(arena.child_count(0) == 3);
    CHECK(copy.child_count(0) == 2);
  }

  TEST_CASE("node accessor provides full node access") {
    auto arena = make_three_children();

    const auto& node = arena.node(0);
    CHECK(node.data.value == 0);
    CHECK_FALSE(node.parent.has_value());
    CHECK(node.children.size() == 3);
  }

  TEST_CASE("clear removes all nodes") {
    auto arena = make_three_children();

    arena.clear();

    CHECK(arena.empty());
  }

  TEST_CASE("arena with different data type") {
    NodeArena<std::string> arena;

    int idx = arena.add_node("hello");
    CHECK(arena[idx] == "hello");
  }

  TEST_CASE("custom allocator is used") {
    g_tracking_allocation_count = 0;

    TrackingAllocator<TestData> alloc;
    NodeArena<TestData, TrackingAllocator<TestData>> arena(alloc);

    arena.add_node(TestData{1});
    arena.add_node(TestData{2});

    CHECK(g_tracking_allocation_count > 0);
  }
}

#endif
