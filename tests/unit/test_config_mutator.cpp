// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_config_mutator.cpp
 * @brief Placement application, move/swap/remove and drop undo history
 */

#include "config_mutator.h"
#include "dropped_file.h"

#include <catch2/catch_test_macros.hpp>

using namespace qdeck;

namespace {

ButtonPlacement placement(int row, int col, const std::string& label) {
    ButtonPlacement p;
    p.position = {row, col};
    p.action_type = ACTION_OPEN;
    p.label = label;
    p.icon = "?";
    p.config = {{"target", "/tmp/" + label}, {"verb", "open"}};
    return p;
}

ActionButtonRecord record(int row, int col, const std::string& label) {
    return ConfigMutator::to_record(placement(row, col, label));
}

Page page_with(std::vector<ActionButtonRecord> buttons, int rows = 4, int cols = 6) {
    Page page;
    page.name = "Main";
    page.rows = rows;
    page.cols = cols;
    page.buttons = std::move(buttons);
    return page;
}

} // namespace

// ============================================================================
// apply
// ============================================================================

TEST_CASE("ConfigMutator: apply adds buttons without touching the input",
          "[config_mutator][apply]") {
    Page before = page_with({record(0, 0, "keep")});
    auto result = ConfigMutator::apply({placement(1, 1, "new")}, before);

    REQUIRE(result.ok());
    CHECK(result.error.empty());
    CHECK(result.page->buttons.size() == 2);
    REQUIRE(result.page->find_button({1, 1}) != nullptr);
    CHECK(result.page->find_button({1, 1})->label == "new");
    CHECK(result.page->find_button({0, 0})->label == "keep");

    CHECK(before.buttons.size() == 1);
}

TEST_CASE("ConfigMutator: placement replaces the button at its position",
          "[config_mutator][apply]") {
    Page before = page_with({record(0, 0, "old")});
    auto result = ConfigMutator::apply({placement(0, 0, "new")}, before);

    REQUIRE(result.ok());
    REQUIRE(result.page->buttons.size() == 1);
    CHECK(result.page->buttons[0].label == "new");
}

TEST_CASE("ConfigMutator: duplicate positions fail the whole batch", "[config_mutator][apply]") {
    Page before = page_with({});
    auto result = ConfigMutator::apply(
        {placement(0, 0, "a"), placement(0, 1, "b"), placement(0, 0, "c")}, before);

    CHECK_FALSE(result.ok());
    CHECK_FALSE(result.error.empty());
    REQUIRE(result.conflicts.size() == 1);
    CHECK(result.conflicts[0] == CellAddress{0, 0});
}

TEST_CASE("ConfigMutator: out-of-bounds placement fails the whole batch",
          "[config_mutator][apply]") {
    Page before = page_with({}, 2, 2);
    auto result = ConfigMutator::apply({placement(0, 0, "a"), placement(2, 0, "oob")}, before);
    CHECK_FALSE(result.ok());
    REQUIRE(result.conflicts.size() == 1);
    CHECK(result.conflicts[0] == CellAddress{2, 0});
}

TEST_CASE("ConfigMutator: re-applying the same batch is idempotent", "[config_mutator][apply]") {
    Page before = page_with({record(3, 5, "other")});
    std::vector<ButtonPlacement> batch{placement(0, 0, "a"), placement(1, 2, "b")};

    auto once = ConfigMutator::apply(batch, before);
    REQUIRE(once.ok());
    auto twice = ConfigMutator::apply(batch, *once.page);
    REQUIRE(twice.ok());

    CHECK(twice.page->buttons.size() == once.page->buttons.size());
    for (const auto& b : once.page->buttons) {
        const auto* match = twice.page->find_button(b.position);
        REQUIRE(match != nullptr);
        CHECK(*match == b);
    }
}

TEST_CASE("ConfigMutator: empty batch returns an identical page", "[config_mutator][apply]") {
    Page before = page_with({record(0, 0, "a")});
    auto result = ConfigMutator::apply({}, before);
    REQUIRE(result.ok());
    CHECK(result.page->buttons == before.buttons);
}

// ============================================================================
// move / remove
// ============================================================================

TEST_CASE("ConfigMutator: move into an empty cell", "[config_mutator][move]") {
    Page before = page_with({record(0, 0, "a")});
    auto moved = ConfigMutator::move_button(before, {0, 0}, {2, 3});
    REQUIRE(moved.has_value());
    CHECK(moved->find_button({0, 0}) == nullptr);
    REQUIRE(moved->find_button({2, 3}) != nullptr);
    CHECK(moved->find_button({2, 3})->label == "a");
}

TEST_CASE("ConfigMutator: move onto a button swaps them", "[config_mutator][move]") {
    Page before = page_with({record(0, 0, "a"), record(1, 1, "b")});
    auto moved = ConfigMutator::move_button(before, {0, 0}, {1, 1});
    REQUIRE(moved.has_value());
    CHECK(moved->find_button({0, 0})->label == "b");
    CHECK(moved->find_button({1, 1})->label == "a");
    CHECK(moved->buttons.size() == 2);
}

TEST_CASE("ConfigMutator: moves that change nothing", "[config_mutator][move]") {
    Page before = page_with({record(0, 0, "a")});
    CHECK_FALSE(ConfigMutator::move_button(before, {0, 0}, {0, 0}).has_value());
    CHECK_FALSE(ConfigMutator::move_button(before, {1, 1}, {2, 2}).has_value());
    CHECK_FALSE(ConfigMutator::move_button(before, {0, 0}, {4, 0}).has_value());
}

TEST_CASE("ConfigMutator: remove", "[config_mutator][remove]") {
    Page before = page_with({record(0, 0, "a"), record(0, 1, "b")});
    auto removed = ConfigMutator::remove_button(before, {0, 0});
    REQUIRE(removed.has_value());
    CHECK(removed->buttons.size() == 1);
    CHECK(removed->find_button({0, 0}) == nullptr);
    CHECK_FALSE(ConfigMutator::remove_button(before, {3, 3}).has_value());
}

// ============================================================================
// DropUndoHistory
// ============================================================================

TEST_CASE("DropUndoHistory: undo restores replaced and empty cells", "[config_mutator][undo]") {
    Page before = page_with({record(0, 0, "old"), record(2, 2, "untouched")});
    std::vector<ButtonPlacement> batch{placement(0, 0, "new"), placement(0, 1, "added")};

    DropUndoHistory history;
    history.record(before, batch);
    auto after = ConfigMutator::apply(batch, before);
    REQUIRE(after.ok());

    // Edits outside the batch survive the undo
    Page edited = *after.page;
    edited.buttons.push_back(record(3, 3, "later"));

    auto undone = history.undo_last(edited);
    REQUIRE(undone.has_value());
    CHECK(undone->find_button({0, 0})->label == "old");
    CHECK(undone->find_button({0, 1}) == nullptr);
    CHECK(undone->find_button({2, 2})->label == "untouched");
    CHECK(undone->find_button({3, 3})->label == "later");
    CHECK(history.size() == 0);
    CHECK_FALSE(history.undo_last(*undone).has_value());
}

TEST_CASE("DropUndoHistory: bounded depth drops the oldest", "[config_mutator][undo]") {
    DropUndoHistory history(2);
    Page page = page_with({});
    history.record(page, {placement(0, 0, "a")});
    history.record(page, {placement(0, 1, "b")});
    history.record(page, {placement(0, 2, "c")});
    CHECK(history.size() == 2);
    CHECK(history.max_depth() == 2);

    history.record(page, {});
    CHECK(history.size() == 2);

    history.clear();
    CHECK(history.size() == 0);
}

TEST_CASE("DropUndoHistory: default depth is 50", "[config_mutator][undo]") {
    DropUndoHistory history;
    CHECK(history.max_depth() == 50);
}
