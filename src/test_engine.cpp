#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include <chrono>
#include <filesystem>

#include "engine.h"

using namespace multisplit;

namespace {

const Rect kTestBounds{0, 0, 1000, 600};

// Give an engine its first pane (pane-1)
void init_single_pane(LayoutEngine& engine) {
  REQUIRE(engine.initialize("editor").success);
}

// Helper to split the focused pane and check it worked
void split(LayoutEngine& engine, Orientation orientation, const WidgetId& widget = "w") {
  REQUIRE(engine.split_focused(orientation, widget).success);
}

double ratio_of(const LayoutEngine& engine, const std::string& split_id, size_t index) {
  auto split = find_split(engine.model.tree(), SplitId{split_id});
  REQUIRE(split.has_value());
  return get_split(engine.model.tree(), *split)->ratios[index];
}

std::filesystem::path create_temp_layout_path() {
  auto temp_dir = std::filesystem::temp_directory_path();
  auto filename = "multisplit-engine-" +
                  std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                  ".json";
  return temp_dir / filename;
}

} // namespace

// ============================================================================
// Structure Tests
// ============================================================================

TEST_SUITE("LayoutEngine structure") {
  TEST_CASE("initialize creates one focused pane without history") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);

    CHECK(pane_count(engine.model.tree()) == 1);
    CHECK(engine.model.focused_pane() == PaneId{"pane-1"});
    CHECK_FALSE(engine.controller.can_undo());
  }

  TEST_CASE("split focuses the new pane") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);

    auto result = engine.split_focused(Orientation::Horizontal, "terminal");

    REQUIRE(result.success);
    CHECK(result.new_pane_id == PaneId{"pane-2"});
    CHECK(result.focus_changed);
    CHECK(engine.model.focused_pane() == PaneId{"pane-2"});
    CHECK(engine.controller.undo_count() == 1);
  }

  TEST_CASE("split emits a single change round") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    int changed_count = 0;
    int node_changed_count = 0;
    auto changed = engine.model.signals().changed.register_listener([&]() { ++changed_count; });
    auto node = engine.model.signals().node_changed.register_listener(
        [&](const PaneId&) { ++node_changed_count; });

    split(engine, Orientation::Vertical);

    CHECK(changed_count == 1);
    CHECK(node_changed_count == 1);
  }

  TEST_CASE("undo of a split restores the original focus") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);

    auto result = engine.process_action(LayoutAction::Undo);

    REQUIRE(result.success);
    CHECK(result.focus_changed);
    CHECK(pane_count(engine.model.tree()) == 1);
    CHECK(engine.model.focused_pane() == PaneId{"pane-1"});
  }

  TEST_CASE("split with an invalid ratio fails") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);

    auto result = engine.split_focused(Orientation::Horizontal, "w", 1.5);

    CHECK_FALSE(result.success);
    CHECK(result.error == LayoutError::InvalidRatios);
    CHECK_FALSE(engine.controller.can_undo());
  }

  TEST_CASE("close_focused moves focus to the survivor") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);

    auto result = engine.close_focused();

    REQUIRE(result.success);
    CHECK(result.focus_changed);
    CHECK(engine.model.focused_pane() == PaneId{"pane-1"});
  }

  TEST_CASE("closing the last pane fails") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);

    auto result = engine.process_action(LayoutAction::ClosePane);

    CHECK_FALSE(result.success);
    CHECK(result.error == LayoutError::LastPane);
  }

  TEST_CASE("close of an unfocused pane keeps focus") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);
    split(engine, Orientation::Vertical);

    auto result = engine.close(PaneId{"pane-1"});

    REQUIRE(result.success);
    CHECK_FALSE(result.focus_changed);
    CHECK(engine.model.focused_pane() == PaneId{"pane-3"});
  }

  TEST_CASE("replace the focused pane") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);

    auto result = engine.replace_focused("browser");

    REQUIRE(result.success);
    CHECK(result.new_pane_id == PaneId{"pane-3"});
    CHECK(result.focus_changed);
    CHECK(engine.model.focused_pane() == PaneId{"pane-3"});
    CHECK(engine.controller.undo_description() == "Replace pane-2 with browser");

    REQUIRE(engine.process_action(LayoutAction::Undo).success);
    CHECK(engine.model.focused_pane() == PaneId{"pane-2"});
    CHECK(has_pane(engine.model.tree(), PaneId{"pane-2"}));
  }

  TEST_CASE("toggle maximize is undoable") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);

    REQUIRE(engine.process_action(LayoutAction::ToggleMaximize).success);
    CHECK(engine.model.tree().maximized_pane_id == PaneId{"pane-2"});

    Layout layout = engine.compute_layout();
    CHECK(find_pane_rect(layout, PaneId{"pane-2"}) == kTestBounds);

    REQUIRE(engine.process_action(LayoutAction::Undo).success);
    CHECK_FALSE(engine.model.is_maximized());
  }
}

// ============================================================================
// Focus Tests
// ============================================================================

TEST_SUITE("LayoutEngine focus") {
  TEST_CASE("directional focus follows the geometry") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);
    split(engine, Orientation::Vertical);
    // pane-1 | (pane-2 / pane-3), focus on pane-3

    auto up = engine.process_action(LayoutAction::FocusUp);
    REQUIRE(up.success);
    CHECK(engine.model.focused_pane() == PaneId{"pane-2"});

    auto left = engine.process_action(LayoutAction::FocusLeft);
    REQUIRE(left.success);
    CHECK(engine.model.focused_pane() == PaneId{"pane-1"});

    auto right = engine.process_action(LayoutAction::FocusRight);
    REQUIRE(right.success);
    CHECK(engine.model.focused_pane() == PaneId{"pane-2"});
  }

  TEST_CASE("directional focus at the edge does nothing") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);

    auto result = engine.navigate(Direction::Right);

    CHECK_FALSE(result.success);
    CHECK(result.error == LayoutError::None);
    CHECK(engine.model.focused_pane() == PaneId{"pane-2"});
  }

  TEST_CASE("next and previous cycle through panes") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);
    split(engine, Orientation::Horizontal);
    // pane-1 | pane-2 | pane-3 order, focus on pane-3

    REQUIRE(engine.process_action(LayoutAction::FocusNext).success);
    CHECK(engine.model.focused_pane() == PaneId{"pane-1"});

    REQUIRE(engine.process_action(LayoutAction::FocusPrevious).success);
    CHECK(engine.model.focused_pane() == PaneId{"pane-3"});
  }

  TEST_CASE("focus changes are not recorded in history") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);

    REQUIRE(engine.focus(PaneId{"pane-1"}).success);

    CHECK(engine.controller.undo_count() == 1);
  }

  TEST_CASE("focus of an unknown pane fails") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);

    auto result = engine.focus(PaneId{"pane-7"});

    CHECK_FALSE(result.success);
    CHECK(result.error == LayoutError::PaneNotFound);
  }

  TEST_CASE("focus under the lock policy") {
    GlobalOptions options = get_default_global_options();
    options.model.focus_policy = FocusPolicy::LockToMaximized;
    LayoutEngine engine(options, kTestBounds);
    REQUIRE(engine.initialize().success);
    split(engine, Orientation::Horizontal);
    REQUIRE(engine.toggle_maximize().success);

    auto result = engine.focus(PaneId{"pane-1"});

    CHECK(result.error == LayoutError::FocusLocked);
    CHECK(engine.model.focused_pane() == PaneId{"pane-2"});
  }
}

// ============================================================================
// Ratio Tests
// ============================================================================

TEST_SUITE("LayoutEngine ratios") {
  TEST_CASE("grow and shrink the focused pane") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);
    // focus on pane-2, the last child: space comes from pane-1

    REQUIRE(engine.process_action(LayoutAction::GrowPane).success);
    CHECK(ratio_of(engine, "split-1", 1) == doctest::Approx(0.55));
    CHECK(ratio_of(engine, "split-1", 0) == doctest::Approx(0.45));

    REQUIRE(engine.process_action(LayoutAction::ShrinkPane).success);
    REQUIRE(engine.process_action(LayoutAction::ShrinkPane).success);
    CHECK(ratio_of(engine, "split-1", 1) == doctest::Approx(0.45));
  }

  TEST_CASE("grow stops at the minimum share of the sibling") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);
    REQUIRE(engine.resize_split(SplitId{"split-1"}, {kMinRatio, 1.0 - kMinRatio}).success);

    auto result = engine.adjust_focused_ratio(kRatioStep);

    CHECK_FALSE(result.success);
    CHECK(result.error == LayoutError::InvalidRatios);
  }

  TEST_CASE("grow never shrinks a pane whose sibling is already below the minimum") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);
    // A loaded layout may carry shares below kMinRatio
    REQUIRE(engine.resize_split(SplitId{"split-1"}, {0.02, 0.98}).success);

    auto result = engine.process_action(LayoutAction::GrowPane);

    CHECK_FALSE(result.success);
    CHECK(result.error == LayoutError::InvalidRatios);
    CHECK(ratio_of(engine, "split-1", 1) == doctest::Approx(0.98));
  }

  TEST_CASE("grow on a lone pane fails") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);

    auto result = engine.process_action(LayoutAction::GrowPane);

    CHECK(result.error == LayoutError::SplitNotFound);
  }

  TEST_CASE("equalize the focused split") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);
    REQUIRE(engine.resize_split(SplitId{"split-1"}, {0.2, 0.8}).success);

    REQUIRE(engine.process_action(LayoutAction::EqualizeSplit).success);

    CHECK(ratio_of(engine, "split-1", 0) == doctest::Approx(0.5));
  }

  TEST_CASE("a divider drag is one undo step") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);

    uint64_t drag = engine.begin_divider_drag();
    for (double first : {0.45, 0.4, 0.35, 0.3}) {
      REQUIRE(engine.resize_split(SplitId{"split-1"}, {first, 1.0 - first}, drag).success);
    }
    CHECK(engine.controller.undo_count() == 2);

    REQUIRE(engine.process_action(LayoutAction::Undo).success);
    CHECK(ratio_of(engine, "split-1", 0) == doctest::Approx(0.5));

    REQUIRE(engine.process_action(LayoutAction::Redo).success);
    CHECK(ratio_of(engine, "split-1", 0) == doctest::Approx(0.3));
  }

  TEST_CASE("separate drags get separate ids") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);

    uint64_t first = engine.begin_divider_drag();
    uint64_t second = engine.begin_divider_drag();

    CHECK(first != second);
  }
}

// ============================================================================
// Output & Persistence Tests
// ============================================================================

TEST_SUITE("LayoutEngine output") {
  TEST_CASE("compute_layout uses the engine bounds and options") {
    GlobalOptions options = get_default_global_options();
    options.geometry.divider_width = 10;
    LayoutEngine engine(options, Rect{0, 0, 1010, 600});
    REQUIRE(engine.initialize().success);
    split(engine, Orientation::Horizontal);

    Layout layout = engine.compute_layout();

    REQUIRE(layout.panes.size() == 2);
    CHECK(layout.panes[0].rect == Rect{0, 0, 500, 600});
    CHECK(layout.panes[1].rect == Rect{510, 0, 500, 600});
    CHECK(layout.dividers.size() == 1);
  }

  TEST_CASE("reconcile_from a previous snapshot") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    Tree previous = engine.model.tree();

    split(engine, Orientation::Horizontal, "terminal");
    auto operations = engine.reconcile_from(previous, engine.bounds);

    REQUIRE(operations.size() == 3);
    CHECK(operations[0] == Operation{CreateOp{PaneId{"pane-2"}, "terminal"}});
    CHECK(std::holds_alternative<UpdateRectOp>(operations[1]));
    CHECK(std::holds_alternative<UpdateRectOp>(operations[2]));
  }

  TEST_CASE("apply_options keeps the pane id prefix") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    GlobalOptions options = get_default_global_options();
    options.model.pane_id_prefix = "view-";
    options.model.focus_policy = FocusPolicy::LockToMaximized;
    options.history.max_undo_levels = 7;

    engine.apply_options(options);

    CHECK(engine.options.model.pane_id_prefix == kDefaultPaneIdPrefix);
    CHECK(engine.model.options().focus_policy == FocusPolicy::LockToMaximized);
    CHECK(engine.controller.max_undo_levels() == 7);

    split(engine, Orientation::Horizontal);
    CHECK(has_pane(engine.model.tree(), PaneId{"pane-2"}));
  }

  TEST_CASE("save and load a layout") {
    auto path = create_temp_layout_path();
    LayoutEngine source(get_default_global_options(), kTestBounds);
    init_single_pane(source);
    split(source, Orientation::Horizontal);
    split(source, Orientation::Vertical);
    REQUIRE(source.save_layout(path).success);

    LayoutEngine target(get_default_global_options(), kTestBounds);
    init_single_pane(target);
    split(target, Orientation::Horizontal);
    auto loaded = target.load_layout(path);
    std::filesystem::remove(path);

    REQUIRE(loaded.success);
    CHECK(structurally_equal(target.model.tree(), source.model.tree()));
    CHECK_FALSE(target.controller.can_undo());

    // Loaded ids are never handed out again
    split(target, Orientation::Horizontal);
    CHECK(target.model.focused_pane() == PaneId{"pane-4"});
  }

  TEST_CASE("load of a missing layout keeps the current tree") {
    LayoutEngine engine(get_default_global_options(), kTestBounds);
    init_single_pane(engine);
    split(engine, Orientation::Horizontal);

    auto loaded = engine.load_layout(create_temp_layout_path());

    CHECK_FALSE(loaded.success);
    CHECK(pane_count(engine.model.tree()) == 2);
    CHECK(engine.controller.can_undo());
  }
}

#endif
