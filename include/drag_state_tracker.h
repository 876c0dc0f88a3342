// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_layout.h"

#include <functional>
#include <optional>
#include <utility>

namespace qdeck {

enum class DragPhase { Idle, Entered, HoveringCell, Processing };

const char* drag_phase_name(DragPhase phase);

/// Transient state of one in-progress file drag over the grid
struct DragGestureState {
    DragPhase phase = DragPhase::Idle;
    std::optional<CellAddress> hover_cell;
    std::optional<GridPoint> last_pointer;
};

/// What the tracker hands to the ingestion pipeline when a drop fires
struct DropSnapshot {
    std::optional<CellAddress> hover_cell;
    std::optional<GridPoint> last_pointer;
};

/**
 * @brief State machine for a native file drag over the launcher grid
 *
 * Mirrors the enter/over/leave/drop signals of the host drag-and-drop surface:
 *
 *   Idle --enter--> Entered --over--> HoveringCell --drop--> Processing
 *     ^                 |                  |                      |
 *     +------leave------+------leave-------+   on_batch_settled --+
 *
 * The last pointer position is kept because some platforms deliver the final
 * drop without coordinates. Leave events are verified against the container
 * bounds: crossing a child element's boundary also raises a leave, and must
 * not clear the hover highlight.
 *
 * One instance per overlay session. Main LVGL thread only.
 */
class DragStateTracker {
  public:
    using HoverChangedCallback = std::function<void(const std::optional<CellAddress>&)>;

    DragStateTracker() = default;

    DragStateTracker(const DragStateTracker&) = delete;
    DragStateTracker& operator=(const DragStateTracker&) = delete;

    /// Geometry used to resolve pointer positions. Set once per render pass.
    void set_layout(const GridLayout& layout) {
        layout_ = layout;
    }

    const GridLayout& layout() const {
        return layout_;
    }

    void set_hover_changed_callback(HoverChangedCallback cb) {
        hover_cb_ = std::move(cb);
    }

    /// Idle -> Entered. Returns false if not Idle.
    bool on_drag_enter(const GridPoint& pointer);

    /// Entered/HoveringCell -> HoveringCell. Returns false in other phases.
    bool on_drag_over(const GridPoint& pointer);

    /// Entered/HoveringCell -> Idle, only if `pointer` is outside `container`.
    /// Returns true if the drag was considered to have left.
    bool on_drag_leave(const GridPoint& pointer, const GridRect& container);

    /// Any non-Idle phase -> Processing. Returns the snapshot to ingest,
    /// or std::nullopt when Idle.
    std::optional<DropSnapshot> on_drop(const std::optional<GridPoint>& pointer = std::nullopt);

    /// A batch handed off by on_drop() has finished, successfully or not.
    /// Returns to Idle when no batch remains outstanding.
    void on_batch_settled();

    /// Native drag cancelled (Entered/HoveringCell -> Idle)
    bool cancel();

    /// Force Idle and forget outstanding batches (overlay dismissed)
    void reset();

    const DragGestureState& state() const {
        return state_;
    }

    DragPhase phase() const {
        return state_.phase;
    }

    const std::optional<CellAddress>& hover_cell() const {
        return state_.hover_cell;
    }

    int outstanding_batches() const {
        return outstanding_batches_;
    }

  private:
    bool is_tracking() const {
        return state_.phase == DragPhase::Entered || state_.phase == DragPhase::HoveringCell;
    }

    void set_hover(const std::optional<CellAddress>& cell);
    void set_phase(DragPhase phase);

    DragGestureState state_;
    GridLayout layout_;
    HoverChangedCallback hover_cb_;
    int outstanding_batches_ = 0;
};

} // namespace qdeck
