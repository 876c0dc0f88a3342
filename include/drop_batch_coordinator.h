// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "config_mutator.h"
#include "drag_state_tracker.h"
#include "file_ingestion_pipeline.h"

#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace qdeck {

class IconExtractor;
class PageStore;

/**
 * @brief Runs completed drops through ingestion, mutation and commit
 *
 * Batches run one at a time. A drop submitted while another batch is still
 * extracting icons is queued and ingested against the page the earlier batch
 * committed, so its cells never collide with buttons that batch placed.
 * Every batch handed over settles the tracker exactly once, whether it was
 * applied, rejected or had no page to land on.
 *
 * Undo history only remembers batches whose page was published.
 *
 * Main thread only. Destruction discards queued and in-flight batches.
 */
class DropBatchCoordinator {
  public:
    using StatusCallback = std::function<void(const std::string&)>;

    /// `extractor` is not owned and may be null
    DropBatchCoordinator(PageStore& store, DragStateTracker& tracker, IconExtractor* extractor,
                         size_t undo_depth = DropUndoHistory::DEFAULT_DEPTH);

    DropBatchCoordinator(const DropBatchCoordinator&) = delete;
    DropBatchCoordinator& operator=(const DropBatchCoordinator&) = delete;

    /// User-facing messages (save failures, skipped files)
    void set_status_callback(StatusCallback cb) {
        status_cb_ = std::move(cb);
    }

    /**
     * @brief Hand over the files of one drop
     *
     * `snapshot` is what DragStateTracker::on_drop() returned for this drop.
     * Cells are resolved against the tracker's layout when the batch starts.
     */
    void submit(std::vector<FileRef> files, const DropSnapshot& snapshot);

    /// Revert the most recent applied batch. False when there is nothing to undo.
    bool undo_last();

    /// Move or swap a button on the current page
    bool move_button(const CellAddress& from, const CellAddress& to);

    /// Drop queued and in-flight batches and return the tracker to Idle
    void cancel();

    size_t queued_drops() const {
        return queued_.size();
    }
    bool batch_in_flight() const {
        return batch_in_flight_;
    }
    const DropUndoHistory& undo_history() const {
        return undo_;
    }

  private:
    struct PendingDrop {
        std::vector<FileRef> files;
        DropSnapshot snapshot;
    };

    void start_next();
    void on_batch_complete(const IngestResult& result);
    void report_skipped(const IngestResult& result);
    void status(const std::string& text);

    PageStore& store_;
    DragStateTracker& tracker_;
    FileIngestionPipeline pipeline_;
    DropUndoHistory undo_;
    StatusCallback status_cb_;

    std::deque<PendingDrop> queued_;
    bool batch_in_flight_ = false;
};

} // namespace qdeck
