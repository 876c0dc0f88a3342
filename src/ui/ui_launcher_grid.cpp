// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_launcher_grid.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace qdeck::ui {

namespace {

constexpr uint32_t EMPTY_CELL_COLOR = 0x2A2A2A;
constexpr uint32_t HOVER_BORDER_COLOR = 0x00B0FF;
constexpr uint32_t DEFAULT_BUTTON_COLOR = 0x757575;
constexpr uint32_t DEFAULT_TEXT_COLOR = 0xFFFFFF;
constexpr int CELL_RADIUS = 10;
constexpr int HOVER_BORDER_WIDTH = 3;

/// LVGL stdio filesystem drive used for absolute image paths
constexpr const char* IMAGE_DRIVE_PREFIX = "A:";

uint32_t style_color(const nlohmann::json& style, const char* key, uint32_t fallback) {
    if (!style.is_object() || !style.contains(key) || !style[key].is_string()) {
        return fallback;
    }
    return parse_hex_color(style[key].get<std::string>()).value_or(fallback);
}

} // namespace

LauncherGridView::LauncherGridView(lv_obj_t* parent, int cell_size_px, int gap_px)
    : parent_(parent), cell_size_px_(cell_size_px), gap_px_(gap_px) {
    container_ = lv_obj_create(parent_);
    lv_obj_remove_flag(container_, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_set_style_pad_all(container_, 0, 0);
    lv_obj_set_style_border_width(container_, 0, 0);
    lv_obj_set_style_bg_opa(container_, LV_OPA_TRANSP, 0);
    lv_obj_align(container_, LV_ALIGN_TOP_MID, 0, gap_px_);

    lv_obj_add_event_cb(container_, on_container_event, LV_EVENT_LONG_PRESSED, this);
    lv_obj_add_event_cb(container_, on_container_event, LV_EVENT_RELEASED, this);

    status_label_ = lv_label_create(parent_);
    lv_obj_align(status_label_, LV_ALIGN_BOTTOM_MID, 0, -gap_px_);
    lv_obj_add_flag(status_label_, LV_OBJ_FLAG_HIDDEN);
}

LauncherGridView::~LauncherGridView() {
    if (status_timer_) {
        lv_timer_delete(status_timer_);
        status_timer_ = nullptr;
    }
    if (lv_is_initialized()) {
        if (status_label_) {
            lv_obj_delete(status_label_);
        }
        if (container_) {
            lv_obj_delete(container_);
        }
    }
    status_label_ = nullptr;
    container_ = nullptr;
    cells_.clear();
}

void LauncherGridView::render(const std::shared_ptr<const Page>& page) {
    if (!page) {
        return;
    }
    page_ = page;
    rows_ = std::clamp(page->rows, 0, MAX_GRID_ROWS);
    cols_ = std::clamp(page->cols, 0, MAX_GRID_COLS);

    lv_obj_clean(container_);
    cells_.assign(static_cast<size_t>(rows_) * static_cast<size_t>(cols_), nullptr);

    GridLayout geometry{rows_, cols_, cell_size_px_, gap_px_, 0, 0};
    lv_obj_set_size(container_, geometry.width(), geometry.height());

    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            cells_[static_cast<size_t>(r) * static_cast<size_t>(cols_) + static_cast<size_t>(c)] =
                create_cell({r, c});
        }
    }
    for (const auto& button : page->buttons) {
        if (lv_obj_t* cell = cell_object(button.position)) {
            fill_button(cell, button);
        }
    }

    // Re-apply the highlight to the new cell objects
    auto hover = hover_;
    hover_.reset();
    set_hover_cell(hover);

    spdlog::debug("[LauncherGrid] Rendered page '{}' ({}x{}, {} buttons)", page->name, rows_,
                  cols_, page->buttons.size());
}

lv_obj_t* LauncherGridView::create_cell(const CellAddress& cell) {
    lv_obj_t* obj = lv_obj_create(container_);
    lv_obj_set_size(obj, cell_size_px_, cell_size_px_);
    lv_obj_set_pos(obj, cell.col * (cell_size_px_ + gap_px_), cell.row * (cell_size_px_ + gap_px_));
    lv_obj_remove_flag(obj, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_remove_flag(obj, LV_OBJ_FLAG_CLICKABLE);
    lv_obj_set_style_pad_all(obj, 4, 0);
    lv_obj_set_style_radius(obj, CELL_RADIUS, 0);
    lv_obj_set_style_bg_color(obj, lv_color_hex(EMPTY_CELL_COLOR), 0);
    lv_obj_set_style_bg_opa(obj, LV_OPA_COVER, 0);
    lv_obj_set_style_border_color(obj, lv_color_hex(HOVER_BORDER_COLOR), 0);
    lv_obj_set_style_border_width(obj, 0, 0);
    return obj;
}

void LauncherGridView::fill_button(lv_obj_t* cell_obj, const ActionButtonRecord& button) {
    uint32_t text_color = style_color(button.style, "text_color", DEFAULT_TEXT_COLOR);
    lv_obj_set_style_bg_color(
        cell_obj, lv_color_hex(style_color(button.style, "background_color", DEFAULT_BUTTON_COLOR)),
        0);

    if (!button.icon.empty() && button.icon.front() == '/') {
        lv_obj_t* img = lv_image_create(cell_obj);
        std::string src = std::string(IMAGE_DRIVE_PREFIX) + button.icon;
        lv_image_set_src(img, src.c_str());
        lv_obj_set_size(img, cell_size_px_ / 2, cell_size_px_ / 2);
        lv_image_set_inner_align(img, LV_IMAGE_ALIGN_CONTAIN);
        lv_obj_align(img, LV_ALIGN_TOP_MID, 0, 0);
    } else {
        lv_obj_t* glyph = lv_label_create(cell_obj);
        lv_label_set_text(glyph, button.icon.c_str());
        lv_obj_set_style_text_color(glyph, lv_color_hex(text_color), 0);
        lv_obj_align(glyph, LV_ALIGN_TOP_MID, 0, 0);
    }

    lv_obj_t* label = lv_label_create(cell_obj);
    lv_label_set_text(label, button.label.c_str());
    lv_label_set_long_mode(label, LV_LABEL_LONG_DOT);
    lv_obj_set_width(label, cell_size_px_ - 8);
    lv_obj_set_style_text_align(label, LV_TEXT_ALIGN_CENTER, 0);
    lv_obj_set_style_text_color(label, lv_color_hex(text_color), 0);
    lv_obj_align(label, LV_ALIGN_BOTTOM_MID, 0, 0);
}

lv_obj_t* LauncherGridView::cell_object(const CellAddress& cell) const {
    if (cell.row < 0 || cell.col < 0 || cell.row >= rows_ || cell.col >= cols_) {
        return nullptr;
    }
    size_t idx = static_cast<size_t>(cell.row) * static_cast<size_t>(cols_) +
                 static_cast<size_t>(cell.col);
    return idx < cells_.size() ? cells_[idx] : nullptr;
}

void LauncherGridView::style_cell(lv_obj_t* cell_obj, bool hovered) {
    lv_obj_set_style_border_width(cell_obj, hovered ? HOVER_BORDER_WIDTH : 0, 0);
}

void LauncherGridView::set_hover_cell(const std::optional<CellAddress>& cell) {
    if (hover_ == cell) {
        return;
    }
    if (hover_) {
        if (lv_obj_t* prev = cell_object(*hover_)) {
            style_cell(prev, false);
        }
    }
    hover_ = cell;
    if (hover_) {
        if (lv_obj_t* next = cell_object(*hover_)) {
            style_cell(next, true);
        }
    }
}

GridLayout LauncherGridView::layout() const {
    lv_obj_update_layout(container_);
    lv_area_t area;
    lv_obj_get_content_coords(container_, &area);
    return GridLayout{rows_, cols_, cell_size_px_, gap_px_, area.x1, area.y1};
}

GridRect LauncherGridView::bounds() const {
    lv_obj_update_layout(container_);
    lv_area_t area;
    lv_obj_get_coords(container_, &area);
    return GridRect{area.x1, area.y1, area.x2, area.y2};
}

void LauncherGridView::show_status(const std::string& text, uint32_t duration_ms) {
    lv_label_set_text(status_label_, text.c_str());
    lv_obj_remove_flag(status_label_, LV_OBJ_FLAG_HIDDEN);

    if (status_timer_) {
        lv_timer_reset(status_timer_);
        lv_timer_set_period(status_timer_, duration_ms);
        return;
    }
    status_timer_ = lv_timer_create(on_status_timer, duration_ms, this);
    lv_timer_set_repeat_count(status_timer_, 1);
}

void LauncherGridView::on_status_timer(lv_timer_t* t) {
    auto* self = static_cast<LauncherGridView*>(lv_timer_get_user_data(t));
    if (!self) {
        return;
    }
    // repeat_count 1: LVGL deletes the timer after this callback
    self->status_timer_ = nullptr;
    lv_obj_add_flag(self->status_label_, LV_OBJ_FLAG_HIDDEN);
}

// ---------------------------------------------------------------------------
// Button move gesture
// ---------------------------------------------------------------------------

std::optional<CellAddress> LauncherGridView::cell_at_pointer() const {
    lv_indev_t* indev = lv_indev_active();
    if (!indev) {
        return std::nullopt;
    }
    lv_point_t point;
    lv_indev_get_point(indev, &point);
    return resolve_cell(GridPoint{point.x, point.y}, layout());
}

void LauncherGridView::handle_long_press() {
    auto cell = cell_at_pointer();
    if (!cell || !page_ || !page_->find_button(*cell)) {
        return;
    }
    move_from_ = cell;
    set_hover_cell(cell);
    spdlog::debug("[LauncherGrid] Move started at ({},{})", cell->row, cell->col);
}

void LauncherGridView::handle_released() {
    if (!move_from_) {
        return;
    }
    CellAddress from = *move_from_;
    move_from_.reset();
    set_hover_cell(std::nullopt);

    auto to = cell_at_pointer();
    if (!to || *to == from) {
        return;
    }
    if (move_cb_) {
        move_cb_(from, *to);
    }
}

void LauncherGridView::on_container_event(lv_event_t* e) {
    auto* self = static_cast<LauncherGridView*>(lv_event_get_user_data(e));
    if (!self) {
        return;
    }
    switch (lv_event_get_code(e)) {
    case LV_EVENT_LONG_PRESSED:
        self->handle_long_press();
        break;
    case LV_EVENT_RELEASED:
        self->handle_released();
        break;
    default:
        break;
    }
}

} // namespace qdeck::ui
