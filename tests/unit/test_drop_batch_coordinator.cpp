// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_drop_batch_coordinator.cpp
 * @brief Sequential drop batches: queueing, commit, undo and tracker settling
 */

#include "config.h"
#include "drop_batch_coordinator.h"
#include "dropped_file.h"
#include "page_store.h"
#include "ui_update_queue.h"

#include "mocks/mock_icon_extractor.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

using namespace qdeck;
using qdeck::ui::UpdateQueue;
namespace fs = std::filesystem;

namespace {

constexpr int CELL = 96;
constexpr int GAP = 8;
constexpr int PITCH = CELL + GAP;

class CoordinatorFixture {
  public:
    CoordinatorFixture() {
        UpdateQueue::instance().drain();
        std::random_device rd;
        dir = fs::temp_directory_path() / ("qdeck_batches_" + std::to_string(rd()));
        fs::create_directories(dir);
        config_path = (dir / "qdeckconfig.json").string();
    }
    ~CoordinatorFixture() {
        UpdateQueue::instance().drain();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    /// Load the store and size the tracker to its page
    void load() {
        store.load();
        const Page& page = *store.current_page();
        tracker.set_layout(GridLayout{page.rows, page.cols, CELL, GAP, 0, 0});
    }

    static GridPoint point_in(int row, int col) {
        return GridPoint{col * PITCH + 10, row * PITCH + 10};
    }

    /// One native drop: enter and hover if possible, then drop and submit
    void drop(const std::vector<std::string>& paths, int row, int col) {
        GridPoint p = point_in(row, col);
        if (tracker.on_drag_enter(p)) {
            tracker.on_drag_over(p);
        }
        auto snapshot = tracker.on_drop(p);
        REQUIRE(snapshot.has_value());

        std::vector<FileRef> files;
        for (const auto& path : paths) {
            files.push_back(FileRef{path});
        }
        coordinator.submit(std::move(files), *snapshot);
    }

    const ActionButtonRecord* button_at(int row, int col) const {
        return store.current_page()->find_button({row, col});
    }

    fs::path dir;
    std::string config_path;
    Config config;
    PageStore store{config};
    DragStateTracker tracker;
    MockIconExtractor extractor;
    DropBatchCoordinator coordinator{store, tracker, &extractor};
    std::vector<std::string> statuses;
};

} // namespace

TEST_CASE_METHOD(CoordinatorFixture, "DropBatchCoordinator: document drop commits at once",
                 "[drop_batches]") {
    REQUIRE(config.init(config_path));
    load();

    drop({"/docs/readme.txt"}, 1, 2);

    CHECK_FALSE(coordinator.batch_in_flight());
    REQUIRE(button_at(1, 2) != nullptr);
    CHECK(button_at(1, 2)->action_type == ACTION_OPEN);
    CHECK(tracker.phase() == DragPhase::Idle);
    CHECK(coordinator.undo_history().size() == 1);
}

TEST_CASE_METHOD(CoordinatorFixture,
                 "DropBatchCoordinator: drop during extraction lands after the first commit",
                 "[drop_batches][queue]") {
    REQUIRE(config.init(config_path));
    load();

    int commits = 0;
    store.add_observer([&commits](const std::shared_ptr<const Page>&) { ++commits; });

    drop({"/apps/a.exe", "/apps/b.exe"}, 0, 0);
    REQUIRE(coordinator.batch_in_flight());
    REQUIRE(extractor.pending_count() == 2);
    CHECK(tracker.phase() == DragPhase::Processing);

    // Last cell: the second and third files wrap around to row 0
    drop({"/docs/c.txt", "/docs/d.txt", "/docs/e.txt"}, 3, 5);
    CHECK(coordinator.queued_drops() == 1);
    CHECK(tracker.outstanding_batches() == 2);
    CHECK(commits == 0);
    CHECK(store.current_page()->buttons.empty());

    extractor.succeed("/apps/b.exe", "/icons/b.png");
    extractor.fail("/apps/a.exe", "no icon");
    UpdateQueue::instance().drain();

    CHECK(commits == 2);
    CHECK(coordinator.queued_drops() == 0);
    CHECK_FALSE(coordinator.batch_in_flight());
    CHECK(tracker.phase() == DragPhase::Idle);
    CHECK(tracker.outstanding_batches() == 0);

    const Page& page = *store.current_page();
    REQUIRE(page.buttons.size() == 5);
    REQUIRE(button_at(0, 0) != nullptr);
    CHECK(button_at(0, 0)->action_type == ACTION_LAUNCH_APP);
    REQUIRE(button_at(0, 1) != nullptr);
    CHECK(button_at(0, 1)->icon == "/icons/b.png");
    REQUIRE(button_at(3, 5) != nullptr);
    REQUIRE(button_at(0, 2) != nullptr);
    REQUIRE(button_at(0, 3) != nullptr);
    CHECK(button_at(0, 2)->action_type == ACTION_OPEN);
    CHECK(button_at(0, 3)->action_type == ACTION_OPEN);

    CHECK(coordinator.undo_history().size() == 2);
}

TEST_CASE_METHOD(CoordinatorFixture, "DropBatchCoordinator: undo reverts the latest batch only",
                 "[drop_batches][undo]") {
    REQUIRE(config.init(config_path));
    load();

    drop({"/docs/one.txt"}, 0, 0);
    drop({"/docs/two.txt"}, 2, 2);
    REQUIRE(store.current_page()->buttons.size() == 2);

    REQUIRE(coordinator.undo_last());
    CHECK(button_at(0, 0) != nullptr);
    CHECK(button_at(2, 2) == nullptr);

    REQUIRE(coordinator.undo_last());
    CHECK(store.current_page()->buttons.empty());
    CHECK_FALSE(coordinator.undo_last());
}

TEST_CASE_METHOD(CoordinatorFixture, "DropBatchCoordinator: move_button commits a swap",
                 "[drop_batches]") {
    REQUIRE(config.init(config_path));
    load();

    drop({"/docs/left.txt"}, 0, 0);
    drop({"/docs/right.txt"}, 0, 1);
    std::string left = button_at(0, 0)->label;
    std::string right = button_at(0, 1)->label;

    REQUIRE(coordinator.move_button({0, 0}, {0, 1}));
    CHECK(button_at(0, 0)->label == right);
    CHECK(button_at(0, 1)->label == left);
    CHECK_FALSE(coordinator.move_button({3, 3}, {3, 4}));
}

TEST_CASE_METHOD(CoordinatorFixture, "DropBatchCoordinator: full grid reports skipped files",
                 "[drop_batches]") {
    REQUIRE(config.init(config_path));
    json profiles = json::array();
    profiles.push_back(
        {{"name", "Tiny"}, {"pages", {{{"name", "One"}, {"rows", 1}, {"cols", 2}}}}});
    config.set<json>("/profiles", profiles);
    load();
    coordinator.set_status_callback([this](const std::string& text) { statuses.push_back(text); });

    drop({"/docs/a.txt", "/docs/b.txt", "/docs/c.txt"}, 0, 0);

    CHECK(store.current_page()->buttons.size() == 2);
    REQUIRE(statuses.size() == 1);
    CHECK(statuses[0] == "1 file could not be placed (grid full)");
    CHECK(tracker.phase() == DragPhase::Idle);
}

TEST_CASE_METHOD(CoordinatorFixture,
                 "DropBatchCoordinator: unsaved commit is still published and undoable",
                 "[drop_batches][undo]") {
    // A regular file where the config directory should be makes every save fail
    fs::path blocker = dir / "blocker";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    CHECK_FALSE(config.init((blocker / "qdeckconfig.json").string()));
    load();
    coordinator.set_status_callback([this](const std::string& text) { statuses.push_back(text); });

    drop({"/docs/report.txt"}, 1, 1);

    REQUIRE(button_at(1, 1) != nullptr);
    REQUIRE(statuses.size() == 1);
    CHECK(statuses[0] == "Could not save launcher configuration");
    CHECK(coordinator.undo_history().size() == 1);
    CHECK(tracker.phase() == DragPhase::Idle);

    REQUIRE(coordinator.undo_last());
    CHECK(button_at(1, 1) == nullptr);
}

TEST_CASE_METHOD(CoordinatorFixture, "DropBatchCoordinator: queued drops without a page settle",
                 "[drop_batches][queue]") {
    // store.load() never ran: there is no page to land on
    tracker.set_layout(GridLayout{4, 6, CELL, GAP, 0, 0});

    drop({"/docs/a.txt"}, 0, 0);
    drop({"/docs/b.txt"}, 0, 1);

    CHECK(coordinator.queued_drops() == 0);
    CHECK_FALSE(coordinator.batch_in_flight());
    CHECK(tracker.phase() == DragPhase::Idle);
    CHECK(tracker.outstanding_batches() == 0);
    CHECK(coordinator.undo_history().size() == 0);
}

TEST_CASE_METHOD(CoordinatorFixture, "DropBatchCoordinator: cancel discards queued work",
                 "[drop_batches][queue]") {
    REQUIRE(config.init(config_path));
    load();

    drop({"/apps/game.exe"}, 0, 0);
    drop({"/docs/notes.txt"}, 1, 0);
    REQUIRE(coordinator.queued_drops() == 1);

    coordinator.cancel();
    CHECK(coordinator.queued_drops() == 0);
    CHECK_FALSE(coordinator.batch_in_flight());
    CHECK(tracker.phase() == DragPhase::Idle);

    extractor.succeed("/apps/game.exe", "/icons/game.png");
    UpdateQueue::instance().drain();
    CHECK(store.current_page()->buttons.empty());
    CHECK(coordinator.undo_history().size() == 0);
}
