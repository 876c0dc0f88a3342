// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_layout.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace qdeck {

// ---------------------------------------------------------------------------
// GridLayout
// ---------------------------------------------------------------------------

int32_t GridLayout::width() const {
    if (cols <= 0)
        return 0;
    return cols * cell_size_px + (cols - 1) * gap_px;
}

int32_t GridLayout::height() const {
    if (rows <= 0)
        return 0;
    return rows * cell_size_px + (rows - 1) * gap_px;
}

bool GridLayout::is_valid() const {
    return rows > 0 && cols > 0 && cell_size_px > 0 && gap_px >= 0;
}

GridPoint GridLayout::cell_origin(const CellAddress& cell) const {
    return {origin_x + cell.col * pitch(), origin_y + cell.row * pitch()};
}

GridRect GridLayout::bounds() const {
    return {origin_x, origin_y, origin_x + width() - 1, origin_y + height() - 1};
}

std::optional<CellAddress> resolve_cell(const GridPoint& pointer, const GridLayout& layout) {
    if (!layout.is_valid()) {
        return std::nullopt;
    }

    int32_t lx = pointer.x - layout.origin_x;
    int32_t ly = pointer.y - layout.origin_y;

    // Half-open box: the far edge belongs to the outside
    if (lx < 0 || ly < 0 || lx >= layout.width() || ly >= layout.height()) {
        return std::nullopt;
    }

    // lx, ly >= 0 here, so integer division is floor
    int col = std::clamp(static_cast<int>(lx / layout.pitch()), 0, layout.cols - 1);
    int row = std::clamp(static_cast<int>(ly / layout.pitch()), 0, layout.rows - 1);
    return CellAddress{row, col};
}

// ---------------------------------------------------------------------------
// GridOccupancy
// ---------------------------------------------------------------------------

GridOccupancy::GridOccupancy(int rows, int cols)
    : rows_(std::clamp(rows, 0, MAX_GRID_ROWS)), cols_(std::clamp(cols, 0, MAX_GRID_COLS)) {}

bool GridOccupancy::occupy(const CellAddress& cell) {
    if (cell.row < 0 || cell.col < 0 || cell.row >= rows_ || cell.col >= cols_) {
        spdlog::debug("[GridOccupancy] cannot occupy ({},{}) in {}x{} grid", cell.row, cell.col,
                      rows_, cols_);
        return false;
    }
    return occupied_.insert(cell).second;
}

bool GridOccupancy::release(const CellAddress& cell) {
    return occupied_.erase(cell) > 0;
}

bool GridOccupancy::is_occupied(const CellAddress& cell) const {
    return occupied_.count(cell) > 0;
}

bool GridOccupancy::is_full() const {
    return occupied_.size() >= static_cast<size_t>(rows_) * static_cast<size_t>(cols_);
}

std::optional<CellAddress> GridOccupancy::find_available() const {
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            if (!is_occupied({r, c})) {
                return CellAddress{r, c};
            }
        }
    }
    return std::nullopt;
}

std::optional<CellAddress> GridOccupancy::find_available_after(const CellAddress& cell) const {
    int total = rows_ * cols_;
    if (total == 0) {
        return std::nullopt;
    }
    int start = std::clamp(cell.row, 0, rows_ - 1) * cols_ + std::clamp(cell.col, 0, cols_ - 1);

    for (int step = 1; step <= total; ++step) {
        int idx = (start + step) % total;
        CellAddress candidate{idx / cols_, idx % cols_};
        if (!is_occupied(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace qdeck
