// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "drop_batch_coordinator.h"

#include <SDL.h>
#include <lvgl.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qdeck {
class IconExtractor;
class PageStore;
} // namespace qdeck

namespace qdeck::ui {

class LauncherGridView;

struct DropSettings {
    uint32_t pointer_poll_ms = 16;
    size_t undo_depth = DropUndoHistory::DEFAULT_DEPTH;
};

/**
 * @brief Connects native SDL2 file drops to the launcher grid
 *
 * SDL2 reports a drop as DROPBEGIN, one DROPFILE per file and DROPCOMPLETE,
 * without any drag-over motion. While a drag is being tracked the controller
 * polls the global pointer to drive hover highlighting; leaving the window
 * counts as a drag leave.
 *
 * Completed drops go to a DropBatchCoordinator, which runs them one at a
 * time. Ctrl+Z undoes the last applied batch, Escape cancels a drag in
 * progress.
 *
 * SDL events are marshalled through ui::queue_update(); everything else runs
 * on the LVGL thread. Destruction cancels all work in flight.
 */
class FileDropController {
  public:
    FileDropController(LauncherGridView& view, PageStore& store, IconExtractor* extractor,
                       const DropSettings& settings);
    ~FileDropController();

    FileDropController(const FileDropController&) = delete;
    FileDropController& operator=(const FileDropController&) = delete;

    /// Start listening to `window`. Returns false if already attached.
    bool attach(SDL_Window* window);
    void detach();

    void handle_drop_begin();
    void handle_drop_file(const std::string& path);
    void handle_drop_complete();

    /// Revert the most recently applied drop batch
    bool undo_last();

    /// Move or swap a button on the current page
    bool move_button(const CellAddress& from, const CellAddress& to);

    const DragStateTracker& tracker() const {
        return tracker_;
    }

    size_t queued_drops() const {
        return batches_.queued_drops();
    }

  private:
    std::optional<GridPoint> pointer_in_window() const;
    bool pointer_outside_window(const GridPoint& p) const;
    void poll_pointer();

    static int sdl_event_watch(void* userdata, SDL_Event* event);
    static void on_poll_timer(lv_timer_t* t);

    LauncherGridView& view_;
    DropSettings settings_;

    DragStateTracker tracker_;
    DropBatchCoordinator batches_;

    SDL_Window* window_ = nullptr;
    lv_timer_t* poll_timer_ = nullptr;

    std::vector<FileRef> collecting_;

    // Async callback safety guard
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace qdeck::ui
