// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "drag_state_tracker.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace qdeck;

namespace {

class TrackerFixture {
  public:
    TrackerFixture() {
        tracker.set_layout(GridLayout{4, 6, 96, 8, 0, 0});
        tracker.set_hover_changed_callback(
            [this](const std::optional<CellAddress>& cell) { hover_events.push_back(cell); });
    }

    GridRect container() const {
        return tracker.layout().bounds();
    }

    DragStateTracker tracker;
    std::vector<std::optional<CellAddress>> hover_events;
};

} // namespace

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: starts Idle", "[drag_state][phase]") {
    CHECK(tracker.phase() == DragPhase::Idle);
    CHECK_FALSE(tracker.hover_cell().has_value());
    CHECK(tracker.outstanding_batches() == 0);
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: enter resolves the hover cell",
                 "[drag_state][phase]") {
    REQUIRE(tracker.on_drag_enter({100, 50}));
    CHECK(tracker.phase() == DragPhase::Entered);
    REQUIRE(tracker.hover_cell().has_value());
    CHECK(*tracker.hover_cell() == CellAddress{0, 0});
    REQUIRE(tracker.state().last_pointer.has_value());
    CHECK(tracker.state().last_pointer->x == 100);
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: over moves to HoveringCell",
                 "[drag_state][phase]") {
    tracker.on_drag_enter({10, 10});
    REQUIRE(tracker.on_drag_over({2 * 104 + 10, 104 + 10}));
    CHECK(tracker.phase() == DragPhase::HoveringCell);
    CHECK(tracker.hover_cell() == CellAddress{1, 2});
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: over without enter is ignored",
                 "[drag_state][phase]") {
    CHECK_FALSE(tracker.on_drag_over({10, 10}));
    CHECK(tracker.phase() == DragPhase::Idle);
    CHECK(hover_events.empty());
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: hover callback fires only on change",
                 "[drag_state][hover]") {
    tracker.on_drag_enter({10, 10});
    tracker.on_drag_over({20, 20});
    tracker.on_drag_over({30, 30});
    tracker.on_drag_over({110, 30});
    tracker.on_drag_over({120, 40});

    REQUIRE(hover_events.size() == 2);
    CHECK(hover_events[0] == CellAddress{0, 0});
    CHECK(hover_events[1] == CellAddress{0, 1});
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: pointer over the margin clears hover",
                 "[drag_state][hover]") {
    tracker.on_drag_enter({10, 10});
    tracker.on_drag_over({5000, 10});
    CHECK(tracker.phase() == DragPhase::HoveringCell);
    CHECK_FALSE(tracker.hover_cell().has_value());
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: leave across a child boundary keeps hover",
                 "[drag_state][leave]") {
    tracker.on_drag_enter({10, 10});
    tracker.on_drag_over({2 * 104 + 10, 10});
    auto events_before = hover_events.size();

    // Leave raised while the pointer is still inside the container
    CHECK_FALSE(tracker.on_drag_leave({2 * 104 + 12, 12}, container()));
    CHECK(tracker.phase() == DragPhase::HoveringCell);
    CHECK(tracker.hover_cell() == CellAddress{0, 2});
    CHECK(hover_events.size() == events_before);
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: leave outside the container resets",
                 "[drag_state][leave]") {
    tracker.on_drag_enter({10, 10});
    tracker.on_drag_over({110, 10});
    REQUIRE(tracker.on_drag_leave({-5, 10}, container()));
    CHECK(tracker.phase() == DragPhase::Idle);
    CHECK_FALSE(tracker.hover_cell().has_value());
    CHECK_FALSE(tracker.state().last_pointer.has_value());
    REQUIRE_FALSE(hover_events.empty());
    CHECK_FALSE(hover_events.back().has_value());
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: drop snapshots hover and pointer",
                 "[drag_state][drop]") {
    tracker.on_drag_enter({10, 10});
    tracker.on_drag_over({110, 120});

    auto snapshot = tracker.on_drop();
    REQUIRE(snapshot.has_value());
    CHECK(snapshot->hover_cell == CellAddress{1, 1});
    REQUIRE(snapshot->last_pointer.has_value());
    CHECK(snapshot->last_pointer->x == 110);
    CHECK(snapshot->last_pointer->y == 120);

    CHECK(tracker.phase() == DragPhase::Processing);
    CHECK_FALSE(tracker.hover_cell().has_value());
    CHECK(tracker.outstanding_batches() == 1);
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: drop coordinates update the snapshot",
                 "[drag_state][drop]") {
    tracker.on_drag_enter({10, 10});
    auto snapshot = tracker.on_drop(GridPoint{3 * 104 + 1, 2 * 104 + 1});
    REQUIRE(snapshot.has_value());
    CHECK(snapshot->hover_cell == CellAddress{2, 3});
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: drop while Idle is ignored",
                 "[drag_state][drop]") {
    CHECK_FALSE(tracker.on_drop(GridPoint{10, 10}).has_value());
    CHECK(tracker.phase() == DragPhase::Idle);
    CHECK(tracker.outstanding_batches() == 0);
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: settling returns to Idle",
                 "[drag_state][drop]") {
    tracker.on_drag_enter({10, 10});
    tracker.on_drop();
    tracker.on_batch_settled();
    CHECK(tracker.phase() == DragPhase::Idle);
    CHECK(tracker.outstanding_batches() == 0);
    CHECK_FALSE(tracker.state().last_pointer.has_value());
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: second drop while Processing is counted",
                 "[drag_state][drop]") {
    tracker.on_drag_enter({10, 10});
    tracker.on_drop();

    // A new drag cannot enter while a batch is outstanding, but its drop lands
    CHECK_FALSE(tracker.on_drag_enter({110, 10}));
    auto second = tracker.on_drop(GridPoint{110, 10});
    REQUIRE(second.has_value());
    CHECK(second->hover_cell == CellAddress{0, 1});
    CHECK(tracker.outstanding_batches() == 2);

    tracker.on_batch_settled();
    CHECK(tracker.phase() == DragPhase::Processing);
    tracker.on_batch_settled();
    CHECK(tracker.phase() == DragPhase::Idle);
}

TEST_CASE_METHOD(TrackerFixture, "DragStateTracker: cancel and reset", "[drag_state][phase]") {
    CHECK_FALSE(tracker.cancel());

    tracker.on_drag_enter({10, 10});
    CHECK(tracker.cancel());
    CHECK(tracker.phase() == DragPhase::Idle);
    CHECK_FALSE(tracker.hover_cell().has_value());

    tracker.on_drag_enter({10, 10});
    tracker.on_drop();
    CHECK_FALSE(tracker.cancel());
    tracker.reset();
    CHECK(tracker.phase() == DragPhase::Idle);
    CHECK(tracker.outstanding_batches() == 0);
}
