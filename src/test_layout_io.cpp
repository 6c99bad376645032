#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include <chrono>
#include <filesystem>
#include <fstream>

#include "layout_io.h"
#include "model.h"

using namespace multisplit;
using nlohmann::json;

namespace {

std::filesystem::path create_temp_layout_path() {
  auto temp_dir = std::filesystem::temp_directory_path();
  auto filename = "multisplit-layout-" +
                  std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                  ".json";
  return temp_dir / filename;
}

struct TempFileGuard {
  std::filesystem::path path;
  explicit TempFileGuard(const std::filesystem::path& p) : path(p) {
  }
  ~TempFileGuard() {
    if (std::filesystem::exists(path)) {
      std::filesystem::remove(path);
    }
  }
};

// pane-1 | (pane-2 / pane-3), focus on pane-3
Tree make_nested() {
  PaneModel model;
  REQUIRE(model.initialize("editor").success);
  REQUIRE(model.insert_split(PaneId{"pane-1"}, Orientation::Horizontal, "terminal", 0.4).success);
  REQUIRE(model.insert_split(PaneId{"pane-2"}, Orientation::Vertical, "logs").success);
  REQUIRE(model.set_constraints(PaneId{"pane-3"}, SizeConstraints{0, 120}).success);
  REQUIRE(model.set_focus(PaneId{"pane-3"}).success);
  return model.tree();
}

const char* kTwoPaneDocument = R"({
  "version": "1.0.0",
  "root": {
    "type": "split",
    "node_id": "split-1",
    "orientation": "vertical",
    "ratios": [0.25, 0.75],
    "children": [
      {"type": "leaf", "pane_id": "top", "widget_id": "browser"},
      {"type": "leaf", "pane_id": "bottom", "widget_id": "console"}
    ]
  },
  "focused_pane_id": "bottom"
})";

} // namespace

// ============================================================================
// JSON Shape Tests
// ============================================================================

TEST_SUITE("Layout JSON") {
  TEST_CASE("tree_to_json writes version, root and focus") {
    json document = tree_to_json(make_nested());

    CHECK(document["version"] == kLayoutFormatVersion);
    CHECK(document["focused_pane_id"] == "pane-3");

    const json& root = document["root"];
    CHECK(root["type"] == "split");
    CHECK(root["node_id"] == "split-1");
    CHECK(root["orientation"] == "horizontal");
    REQUIRE(root["children"].size() == 2);
    CHECK(root["children"][0]["pane_id"] == "pane-1");
    CHECK(root["children"][0]["widget_id"] == "editor");
    CHECK(root["children"][1]["orientation"] == "vertical");
    CHECK(root["children"][1]["children"][1]["constraints"]["min_height"] == 120);
  }

  TEST_CASE("maximize is never written") {
    Tree tree = make_nested();
    tree.maximized_pane_id = PaneId{"pane-1"};

    json document = tree_to_json(tree);

    CHECK_FALSE(document.contains("maximized_pane_id"));
  }

  TEST_CASE("empty tree serializes with a null root") {
    json document = tree_to_json(Tree{});

    CHECK(document["root"].is_null());
    CHECK(document["focused_pane_id"].is_null());

    auto read = tree_from_json(document);
    REQUIRE(read.success);
    CHECK(is_empty(read.tree));
  }

  TEST_CASE("serialized tree reads back structurally equal") {
    Tree tree = make_nested();

    auto read = layout_from_string(layout_to_string(tree));

    REQUIRE(read.success);
    CHECK(structurally_equal(read.tree, tree));
  }

  TEST_CASE("handwritten document") {
    auto read = layout_from_string(kTwoPaneDocument);

    REQUIRE(read.success);
    CHECK(pane_count(read.tree) == 2);
    CHECK(read.tree.focused_pane_id == PaneId{"bottom"});
    const SplitNode* root = get_split(read.tree, kRootIndex);
    REQUIRE(root != nullptr);
    CHECK(root->orientation == Orientation::Vertical);
    CHECK(root->ratios[0] == doctest::Approx(0.25));
    CHECK_FALSE(read.tree.maximized_pane_id.has_value());
  }
}

// ============================================================================
// Lenient Reading Tests
// ============================================================================

TEST_SUITE("Layout JSON leniency") {
  TEST_CASE("missing version is read as the current format") {
    json document = json::parse(kTwoPaneDocument);
    document.erase("version");

    CHECK(tree_from_json(document).success);
  }

  TEST_CASE("minor version bumps are accepted") {
    json document = json::parse(kTwoPaneDocument);
    document["version"] = "1.4.2";

    CHECK(tree_from_json(document).success);
  }

  TEST_CASE("unknown focus falls back to the first pane") {
    json document = json::parse(kTwoPaneDocument);
    document["focused_pane_id"] = "gone";

    auto read = tree_from_json(document);

    REQUIRE(read.success);
    CHECK(read.tree.focused_pane_id == PaneId{"top"});
  }

  TEST_CASE("missing focus falls back to the first pane") {
    json document = json::parse(kTwoPaneDocument);
    document.erase("focused_pane_id");

    auto read = tree_from_json(document);

    REQUIRE(read.success);
    CHECK(read.tree.focused_pane_id == PaneId{"top"});
  }

  TEST_CASE("splits without node_id get fresh ids") {
    json document = json::parse(kTwoPaneDocument);
    document["root"]["node_id"] = "split-3";
    document["root"]["children"][0] = {
        {"type", "split"},
        {"orientation", "horizontal"},
        {"ratios", {0.5, 0.5}},
        {"children",
         {{{"type", "leaf"}, {"pane_id", "a"}, {"widget_id", "w"}},
          {{"type", "leaf"}, {"pane_id", "b"}, {"widget_id", "w"}}}}};

    auto read = tree_from_json(document);

    REQUIRE(read.success);
    CHECK(parent_split_of(read.tree, PaneId{"a"}) == SplitId{"split-4"});
    CHECK(read.tree.focused_pane_id == PaneId{"bottom"});
  }

  TEST_CASE("negative constraints are clamped") {
    json document = json::parse(kTwoPaneDocument);
    document["root"]["children"][0]["constraints"] = {{"min_width", -10}, {"min_height", 30}};

    auto read = tree_from_json(document);

    REQUIRE(read.success);
    auto top = find_leaf(read.tree, PaneId{"top"});
    CHECK(get_leaf(read.tree, *top)->constraints == SizeConstraints{0, 30});
  }
}

// ============================================================================
// Rejection Tests
// ============================================================================

TEST_SUITE("Layout JSON rejection") {
  TEST_CASE("not JSON") {
    auto read = layout_from_string("{ this is not json");

    CHECK_FALSE(read.success);
    CHECK_FALSE(read.error.empty());
  }

  TEST_CASE("incompatible major version") {
    json document = json::parse(kTwoPaneDocument);
    document["version"] = "2.0.0";

    auto read = tree_from_json(document);

    CHECK_FALSE(read.success);
    CHECK(read.error.find("version") != std::string::npos);
  }

  TEST_CASE("unknown node type") {
    json document = json::parse(kTwoPaneDocument);
    document["root"]["children"][1]["type"] = "tab";

    CHECK_FALSE(tree_from_json(document).success);
  }

  TEST_CASE("unknown orientation") {
    json document = json::parse(kTwoPaneDocument);
    document["root"]["orientation"] = "diagonal";

    CHECK_FALSE(tree_from_json(document).success);
  }

  TEST_CASE("leaf without widget") {
    json document = json::parse(kTwoPaneDocument);
    document["root"]["children"][0].erase("widget_id");

    CHECK_FALSE(tree_from_json(document).success);
  }

  TEST_CASE("ratios that do not sum to one") {
    json document = json::parse(kTwoPaneDocument);
    document["root"]["ratios"] = {0.5, 0.6};

    auto read = tree_from_json(document);

    CHECK_FALSE(read.success);
    CHECK(read.error.find("Invalid layout") == 0);
  }

  TEST_CASE("duplicate pane ids") {
    json document = json::parse(kTwoPaneDocument);
    document["root"]["children"][1]["pane_id"] = "top";

    CHECK_FALSE(tree_from_json(document).success);
  }

  TEST_CASE("split with a single child") {
    json document = json::parse(kTwoPaneDocument);
    document["root"]["children"].erase(1);
    document["root"]["ratios"] = {1.0};

    CHECK_FALSE(tree_from_json(document).success);
  }

  TEST_CASE("document that is not an object") {
    CHECK_FALSE(tree_from_json(json::array()).success);
  }
}

// ============================================================================
// File Tests
// ============================================================================

TEST_SUITE("Layout files") {
  TEST_CASE("save then load") {
    auto path = create_temp_layout_path();
    TempFileGuard guard(path);
    Tree tree = make_nested();

    auto written = save_layout(tree, path);
    REQUIRE(written.success);

    auto read = load_layout(path);
    REQUIRE(read.success);
    CHECK(structurally_equal(read.tree, tree));
  }

  TEST_CASE("load of a missing file fails") {
    auto read = load_layout(create_temp_layout_path());

    CHECK_FALSE(read.success);
    CHECK(read.error.find("Failed to open") == 0);
  }

  TEST_CASE("load of a corrupt file fails") {
    auto path = create_temp_layout_path();
    TempFileGuard guard(path);
    {
      std::ofstream file(path);
      file << "[1, 2,";
    }

    CHECK_FALSE(load_layout(path).success);
  }

  TEST_CASE("save into a missing directory fails") {
    auto path = create_temp_layout_path() / "nested" / "layout.json";

    CHECK_FALSE(save_layout(make_nested(), path).success);
  }
}

#endif
