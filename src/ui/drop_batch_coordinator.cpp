// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "drop_batch_coordinator.h"

#include "page_store.h"

#include <spdlog/spdlog.h>

namespace qdeck {

DropBatchCoordinator::DropBatchCoordinator(PageStore& store, DragStateTracker& tracker,
                                           IconExtractor* extractor, size_t undo_depth)
    : store_(store), tracker_(tracker), pipeline_(extractor), undo_(undo_depth) {}

void DropBatchCoordinator::submit(std::vector<FileRef> files, const DropSnapshot& snapshot) {
    if (batch_in_flight_) {
        spdlog::info("[DropBatchCoordinator] Batch in flight, queueing {} file(s)", files.size());
    }
    queued_.push_back(PendingDrop{std::move(files), snapshot});
    start_next();
}

void DropBatchCoordinator::start_next() {
    while (!batch_in_flight_ && !queued_.empty()) {
        PendingDrop drop = std::move(queued_.front());
        queued_.pop_front();

        auto page = store_.current_page();
        if (!page) {
            spdlog::error("[DropBatchCoordinator] No active page, dropping {} file(s)",
                          drop.files.size());
            tracker_.on_batch_settled();
            continue;
        }

        batch_in_flight_ = true;
        // May complete before returning when no file needs an extracted icon
        pipeline_.ingest(drop.files, drop.snapshot, tracker_.layout(), *page,
                         [this](const IngestResult& result) { on_batch_complete(result); });
    }
}

void DropBatchCoordinator::on_batch_complete(const IngestResult& result) {
    auto page = store_.current_page();
    if (page && !result.placements.empty()) {
        MutationResult mutation = ConfigMutator::apply(result.placements, *page);
        if (mutation.ok()) {
            bool saved = store_.commit_page(std::move(*mutation.page));
            if (store_.current_page() != page) {
                undo_.record(*page, result.placements);
            }
            if (!saved) {
                status("Could not save launcher configuration");
            }
        } else {
            status("Drop failed: " + mutation.error);
        }
    }
    report_skipped(result);

    batch_in_flight_ = false;
    tracker_.on_batch_settled();
    start_next();
}

void DropBatchCoordinator::report_skipped(const IngestResult& result) {
    size_t skipped = result.skipped_count();
    if (skipped == 0) {
        return;
    }
    spdlog::info("[DropBatchCoordinator] Batch {}: {} file(s) skipped, grid full",
                 result.batch_id, skipped);
    status(skipped == 1 ? std::string("1 file could not be placed (grid full)")
                        : std::to_string(skipped) + " files could not be placed (grid full)");
}

bool DropBatchCoordinator::undo_last() {
    auto page = store_.current_page();
    if (!page) {
        return false;
    }
    auto reverted = undo_.undo_last(*page);
    if (!reverted) {
        return false;
    }
    if (!store_.commit_page(std::move(*reverted))) {
        status("Could not save launcher configuration");
    }
    return true;
}

bool DropBatchCoordinator::move_button(const CellAddress& from, const CellAddress& to) {
    auto page = store_.current_page();
    if (!page) {
        return false;
    }
    auto moved = ConfigMutator::move_button(*page, from, to);
    if (!moved) {
        return false;
    }
    return store_.commit_page(std::move(*moved));
}

void DropBatchCoordinator::cancel() {
    if (batch_in_flight_ || !queued_.empty()) {
        spdlog::debug("[DropBatchCoordinator] Cancelling ({} queued)", queued_.size());
    }
    pipeline_.cancel();
    queued_.clear();
    batch_in_flight_ = false;
    tracker_.reset();
}

void DropBatchCoordinator::status(const std::string& text) {
    if (status_cb_) {
        status_cb_(text);
    }
}

} // namespace qdeck
