// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_layout.h"
#include "launcher_config.h"

#include <lvgl.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qdeck::ui {

/**
 * @brief LVGL view of one launcher page
 *
 * Cells are laid out at fixed pixel positions so the on-screen geometry is
 * exactly the GridLayout handed to the drag tracker. Buttons are drawn from
 * the page snapshot passed to render(); the view keeps that snapshot alive
 * until the next render.
 *
 * Long-press on a button and release over another cell requests a move.
 */
class LauncherGridView {
  public:
    using MoveCallback = std::function<void(const CellAddress& from, const CellAddress& to)>;

    LauncherGridView(lv_obj_t* parent, int cell_size_px, int gap_px);
    ~LauncherGridView();

    LauncherGridView(const LauncherGridView&) = delete;
    LauncherGridView& operator=(const LauncherGridView&) = delete;
    LauncherGridView(LauncherGridView&&) = delete;
    LauncherGridView& operator=(LauncherGridView&&) = delete;

    void render(const std::shared_ptr<const Page>& page);

    /// Highlight `cell`, clearing the previous highlight. nullopt clears.
    void set_hover_cell(const std::optional<CellAddress>& cell);

    /// Geometry in screen coordinates of the current render
    GridLayout layout() const;

    /// Container bounds in screen coordinates
    GridRect bounds() const;

    /// Transient status line, hidden after `duration_ms`
    void show_status(const std::string& text, uint32_t duration_ms = 3000);

    void set_move_callback(MoveCallback cb) {
        move_cb_ = std::move(cb);
    }

    lv_obj_t* container() const {
        return container_;
    }

  private:
    lv_obj_t* create_cell(const CellAddress& cell);
    void fill_button(lv_obj_t* cell_obj, const ActionButtonRecord& button);
    void style_cell(lv_obj_t* cell_obj, bool hovered);
    lv_obj_t* cell_object(const CellAddress& cell) const;
    std::optional<CellAddress> cell_at_pointer() const;

    void handle_long_press();
    void handle_released();

    static void on_container_event(lv_event_t* e);
    static void on_status_timer(lv_timer_t* t);

    lv_obj_t* parent_;
    lv_obj_t* container_ = nullptr;
    lv_obj_t* status_label_ = nullptr;
    lv_timer_t* status_timer_ = nullptr;

    int cell_size_px_;
    int gap_px_;
    int rows_ = 0;
    int cols_ = 0;

    std::shared_ptr<const Page> page_;
    std::vector<lv_obj_t*> cells_; ///< row-major
    std::optional<CellAddress> hover_;
    std::optional<CellAddress> move_from_;
    MoveCallback move_cb_;
};

} // namespace qdeck::ui
