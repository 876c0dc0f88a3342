// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_file_drop_controller.h"

#include "ui_launcher_grid.h"
#include "ui_update_queue.h"

#include <spdlog/spdlog.h>

#include <functional>

namespace qdeck::ui {

FileDropController::FileDropController(LauncherGridView& view, PageStore& store,
                                       IconExtractor* extractor, const DropSettings& settings)
    : view_(view), settings_(settings), batches_(store, tracker_, extractor, settings.undo_depth) {
    batches_.set_status_callback([this](const std::string& text) { view_.show_status(text); });
    tracker_.set_hover_changed_callback(
        [this](const std::optional<CellAddress>& cell) { view_.set_hover_cell(cell); });
    view_.set_move_callback(
        [this](const CellAddress& from, const CellAddress& to) { move_button(from, to); });
}

FileDropController::~FileDropController() {
    detach();
    if (alive_) {
        *alive_ = false;
    }
    batches_.cancel();
    view_.set_move_callback(nullptr);
    spdlog::debug("[FileDropController] Destroyed");
}

bool FileDropController::attach(SDL_Window* window) {
    if (window_) {
        spdlog::warn("[FileDropController] attach() called while already attached");
        return false;
    }
    window_ = window;
    SDL_EventState(SDL_DROPFILE, SDL_ENABLE);
    SDL_EventState(SDL_DROPBEGIN, SDL_ENABLE);
    SDL_EventState(SDL_DROPCOMPLETE, SDL_ENABLE);
    SDL_AddEventWatch(sdl_event_watch, this);

    poll_timer_ = lv_timer_create(on_poll_timer, settings_.pointer_poll_ms, this);
    spdlog::info("[FileDropController] Attached (pointer poll {}ms)", settings_.pointer_poll_ms);
    return true;
}

void FileDropController::detach() {
    if (!window_) {
        return;
    }
    SDL_DelEventWatch(sdl_event_watch, this);
    if (poll_timer_) {
        lv_timer_delete(poll_timer_);
        poll_timer_ = nullptr;
    }
    window_ = nullptr;
    spdlog::debug("[FileDropController] Detached");
}

// ---------------------------------------------------------------------------
// SDL plumbing
// ---------------------------------------------------------------------------

int FileDropController::sdl_event_watch(void* userdata, SDL_Event* event) {
    auto* self = static_cast<FileDropController*>(userdata);
    std::weak_ptr<bool> weak_alive = self->alive_;

    auto post = [self, weak_alive](std::function<void(FileDropController&)> fn) {
        queue_update([self, weak_alive, fn]() {
            auto alive = weak_alive.lock();
            if (!alive || !*alive)
                return;
            fn(*self);
        });
    };

    switch (event->type) {
    case SDL_DROPBEGIN:
        post([](FileDropController& c) { c.handle_drop_begin(); });
        break;
    case SDL_DROPFILE:
        if (event->drop.file) {
            std::string path(event->drop.file);
            // The queued copy of this event is not read by anyone else
            SDL_free(event->drop.file);
            event->drop.file = nullptr;
            post([path](FileDropController& c) { c.handle_drop_file(path); });
        }
        break;
    case SDL_DROPCOMPLETE:
        post([](FileDropController& c) { c.handle_drop_complete(); });
        break;
    case SDL_KEYDOWN:
        if (event->key.keysym.sym == SDLK_z && (event->key.keysym.mod & KMOD_CTRL)) {
            post([](FileDropController& c) { c.undo_last(); });
        } else if (event->key.keysym.sym == SDLK_ESCAPE) {
            post([](FileDropController& c) {
                if (c.tracker_.cancel()) {
                    c.collecting_.clear();
                }
            });
        }
        break;
    default:
        break;
    }
    return 0;
}

std::optional<GridPoint> FileDropController::pointer_in_window() const {
    if (!window_) {
        return std::nullopt;
    }
    int gx = 0;
    int gy = 0;
    int wx = 0;
    int wy = 0;
    SDL_GetGlobalMouseState(&gx, &gy);
    SDL_GetWindowPosition(window_, &wx, &wy);
    return GridPoint{gx - wx, gy - wy};
}

bool FileDropController::pointer_outside_window(const GridPoint& p) const {
    int w = 0;
    int h = 0;
    SDL_GetWindowSize(window_, &w, &h);
    return p.x < 0 || p.y < 0 || p.x >= w || p.y >= h;
}

void FileDropController::on_poll_timer(lv_timer_t* t) {
    auto* self = static_cast<FileDropController*>(lv_timer_get_user_data(t));
    if (self) {
        self->poll_pointer();
    }
}

void FileDropController::poll_pointer() {
    DragPhase phase = tracker_.phase();
    if (phase != DragPhase::Entered && phase != DragPhase::HoveringCell) {
        return;
    }
    auto p = pointer_in_window();
    if (!p) {
        return;
    }
    if (pointer_outside_window(*p)) {
        if (tracker_.on_drag_leave(*p, view_.bounds())) {
            collecting_.clear();
        }
        return;
    }
    tracker_.on_drag_over(*p);
}

// ---------------------------------------------------------------------------
// Drop lifecycle
// ---------------------------------------------------------------------------

void FileDropController::handle_drop_begin() {
    tracker_.set_layout(view_.layout());
    collecting_.clear();
    auto p = pointer_in_window();
    if (p) {
        tracker_.on_drag_enter(*p);
    }
}

void FileDropController::handle_drop_file(const std::string& path) {
    spdlog::debug("[FileDropController] File: {}", path);
    collecting_.push_back(FileRef{path});
}

void FileDropController::handle_drop_complete() {
    std::vector<FileRef> files;
    files.swap(collecting_);
    if (files.empty()) {
        tracker_.cancel();
        return;
    }

    auto p = pointer_in_window();
    if (tracker_.phase() == DragPhase::Idle) {
        // DROPBEGIN missing or the drag was lost to a window leave
        tracker_.set_layout(view_.layout());
        if (p) {
            tracker_.on_drag_enter(*p);
        }
    }

    auto snapshot = tracker_.on_drop(p);
    if (!snapshot) {
        // No pointer at all: fall back to row-major placement
        snapshot = DropSnapshot{};
        spdlog::debug("[FileDropController] Drop without pointer position");
    }

    batches_.submit(std::move(files), *snapshot);
}

bool FileDropController::undo_last() {
    if (!batches_.undo_last()) {
        view_.show_status("Nothing to undo", 1500);
        return false;
    }
    return true;
}

bool FileDropController::move_button(const CellAddress& from, const CellAddress& to) {
    return batches_.move_button(from, to);
}

} // namespace qdeck::ui
