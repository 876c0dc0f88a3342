// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <utility>

namespace qdeck {

/// Largest grid either dimension may have
constexpr int MAX_GRID_ROWS = 64;
constexpr int MAX_GRID_COLS = 64;

/// A cell slot in the launcher grid (0-based)
struct CellAddress {
    int row;
    int col;

    bool operator==(const CellAddress& o) const {
        return row == o.row && col == o.col;
    }
    bool operator!=(const CellAddress& o) const {
        return !(*this == o);
    }
    bool operator<(const CellAddress& o) const {
        return row != o.row ? row < o.row : col < o.col;
    }
};

/// A pointer coordinate in viewport pixels
struct GridPoint {
    int32_t x;
    int32_t y;
};

/// Inclusive pixel rectangle, same convention as lv_area_t
struct GridRect {
    int32_t x1;
    int32_t y1;
    int32_t x2;
    int32_t y2;

    bool contains(const GridPoint& p) const {
        return p.x >= x1 && p.x <= x2 && p.y >= y1 && p.y <= y2;
    }
};

/// Launcher grid geometry for one render pass.
/// Cells are square, `cell_size_px` wide, separated by `gap_px` on both axes.
struct GridLayout {
    int rows = 0;
    int cols = 0;
    int cell_size_px = 0;
    int gap_px = 0;
    int32_t origin_x = 0;
    int32_t origin_y = 0;

    /// Distance from one cell origin to the next
    int pitch() const {
        return cell_size_px + gap_px;
    }

    /// Pixel extent from the first cell's near edge to the last cell's far edge
    int32_t width() const;
    int32_t height() const;

    /// True if rows, cols and cell size are all positive
    bool is_valid() const;

    /// Check if a cell address is within rows x cols
    bool contains(const CellAddress& cell) const {
        return cell.row >= 0 && cell.row < rows && cell.col >= 0 && cell.col < cols;
    }

    /// Top-left viewport pixel of a cell
    GridPoint cell_origin(const CellAddress& cell) const;

    /// Bounding box of the whole grid in viewport pixels
    GridRect bounds() const;
};

/// Map a viewport pointer coordinate to the cell under it.
///
/// Returns std::nullopt when the pointer is left of / above the grid origin or
/// at or beyond the last cell's far edge. A pointer in the gap between two
/// cells resolves to the cell whose origin-side boundary it has crossed
/// (floor semantics), so the grid has no dead zones.
std::optional<CellAddress> resolve_cell(const GridPoint& pointer, const GridLayout& layout);

/// Occupied-cell bookkeeping for one page.
/// Scans are row-major: top-to-bottom, left-to-right.
class GridOccupancy {
  public:
    /// Dimensions are clamped to [0, MAX_GRID_ROWS] x [0, MAX_GRID_COLS]
    GridOccupancy(int rows, int cols);

    int rows() const {
        return rows_;
    }
    int cols() const {
        return cols_;
    }

    /// Mark a cell occupied. Returns false if out of bounds or already occupied.
    bool occupy(const CellAddress& cell);

    /// Mark a cell free. Returns true if it was occupied.
    bool release(const CellAddress& cell);

    bool is_occupied(const CellAddress& cell) const;

    /// True when every in-bounds cell is occupied
    bool is_full() const;

    size_t occupied_count() const {
        return occupied_.size();
    }

    /// First free cell in row-major order
    std::optional<CellAddress> find_available() const;

    /// Next free cell in row-major order strictly after `cell`, wrapping to (0,0).
    /// `cell` itself is checked last.
    std::optional<CellAddress> find_available_after(const CellAddress& cell) const;

  private:
    int rows_;
    int cols_;
    std::set<CellAddress> occupied_;
};

} // namespace qdeck
