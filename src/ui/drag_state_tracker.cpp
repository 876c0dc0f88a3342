// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "drag_state_tracker.h"

#include <spdlog/spdlog.h>

namespace qdeck {

const char* drag_phase_name(DragPhase phase) {
    switch (phase) {
    case DragPhase::Idle:
        return "Idle";
    case DragPhase::Entered:
        return "Entered";
    case DragPhase::HoveringCell:
        return "HoveringCell";
    case DragPhase::Processing:
        return "Processing";
    }
    return "?";
}

void DragStateTracker::set_phase(DragPhase phase) {
    if (state_.phase != phase) {
        spdlog::trace("[DragStateTracker] {} -> {}", drag_phase_name(state_.phase),
                      drag_phase_name(phase));
        state_.phase = phase;
    }
}

void DragStateTracker::set_hover(const std::optional<CellAddress>& cell) {
    if (state_.hover_cell == cell) {
        return; // Unchanged: no redundant re-render
    }
    state_.hover_cell = cell;
    if (hover_cb_) {
        hover_cb_(state_.hover_cell);
    }
}

bool DragStateTracker::on_drag_enter(const GridPoint& pointer) {
    if (state_.phase != DragPhase::Idle) {
        spdlog::debug("[DragStateTracker] Ignoring enter in phase {}", drag_phase_name(state_.phase));
        return false;
    }
    state_.last_pointer = pointer;
    set_phase(DragPhase::Entered);
    set_hover(resolve_cell(pointer, layout_));
    spdlog::debug("[DragStateTracker] Drag entered at ({},{})", pointer.x, pointer.y);
    return true;
}

bool DragStateTracker::on_drag_over(const GridPoint& pointer) {
    if (!is_tracking()) {
        return false;
    }
    state_.last_pointer = pointer;
    set_phase(DragPhase::HoveringCell);
    set_hover(resolve_cell(pointer, layout_));
    return true;
}

bool DragStateTracker::on_drag_leave(const GridPoint& pointer, const GridRect& container) {
    if (!is_tracking()) {
        return false;
    }
    if (container.contains(pointer)) {
        // Child element boundary crossing, still over the grid
        return false;
    }
    state_.last_pointer.reset();
    set_hover(std::nullopt);
    set_phase(DragPhase::Idle);
    spdlog::debug("[DragStateTracker] Drag left container at ({},{})", pointer.x, pointer.y);
    return true;
}

std::optional<DropSnapshot> DragStateTracker::on_drop(const std::optional<GridPoint>& pointer) {
    if (state_.phase == DragPhase::Idle) {
        spdlog::debug("[DragStateTracker] Ignoring drop while Idle");
        return std::nullopt;
    }

    if (pointer) {
        state_.last_pointer = *pointer;
        if (is_tracking()) {
            set_hover(resolve_cell(*pointer, layout_));
        }
    }

    DropSnapshot snapshot;
    snapshot.last_pointer = state_.last_pointer;
    if (is_tracking()) {
        snapshot.hover_cell = state_.hover_cell;
    } else if (pointer) {
        snapshot.hover_cell = resolve_cell(*pointer, layout_);
    }

    ++outstanding_batches_;
    set_hover(std::nullopt);
    set_phase(DragPhase::Processing);

    if (snapshot.hover_cell) {
        spdlog::debug("[DragStateTracker] Drop on cell ({},{}), {} batch(es) outstanding",
                      snapshot.hover_cell->row, snapshot.hover_cell->col, outstanding_batches_);
    } else {
        spdlog::debug("[DragStateTracker] Drop without hover cell, {} batch(es) outstanding",
                      outstanding_batches_);
    }
    return snapshot;
}

void DragStateTracker::on_batch_settled() {
    if (state_.phase != DragPhase::Processing) {
        spdlog::debug("[DragStateTracker] Batch settled outside Processing (phase {})",
                      drag_phase_name(state_.phase));
        return;
    }
    if (outstanding_batches_ > 0) {
        --outstanding_batches_;
    }
    if (outstanding_batches_ == 0) {
        state_.last_pointer.reset();
        set_phase(DragPhase::Idle);
    }
}

bool DragStateTracker::cancel() {
    if (!is_tracking()) {
        return false;
    }
    state_.last_pointer.reset();
    set_hover(std::nullopt);
    set_phase(DragPhase::Idle);
    spdlog::debug("[DragStateTracker] Drag cancelled");
    return true;
}

void DragStateTracker::reset() {
    outstanding_batches_ = 0;
    state_.last_pointer.reset();
    set_hover(std::nullopt);
    set_phase(DragPhase::Idle);
}

} // namespace qdeck
