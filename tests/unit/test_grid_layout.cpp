// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_grid_layout.cpp
 * @brief Unit tests for pointer-to-cell resolution and grid occupancy
 */

#include "grid_layout.h"

#include <catch2/catch_test_macros.hpp>

using namespace qdeck;

namespace {

// 4x6 launcher page, 96px cells, 8px gaps
GridLayout default_layout(int32_t ox = 0, int32_t oy = 0) {
    return GridLayout{4, 6, 96, 8, ox, oy};
}

} // namespace

// =============================================================================
// GridLayout geometry
// =============================================================================

TEST_CASE("GridLayout: size includes gaps between cells only", "[grid_layout][geometry]") {
    auto layout = default_layout();
    CHECK(layout.pitch() == 104);
    CHECK(layout.width() == 6 * 96 + 5 * 8);
    CHECK(layout.height() == 4 * 96 + 3 * 8);

    auto b = layout.bounds();
    CHECK(b.x1 == 0);
    CHECK(b.y1 == 0);
    CHECK(b.x2 == layout.width() - 1);
    CHECK(b.y2 == layout.height() - 1);
}

TEST_CASE("GridLayout: cell_origin follows the pitch", "[grid_layout][geometry]") {
    auto layout = default_layout(10, 20);
    auto p = layout.cell_origin({2, 3});
    CHECK(p.x == 10 + 3 * 104);
    CHECK(p.y == 20 + 2 * 104);
}

TEST_CASE("GridLayout: invalid layouts", "[grid_layout][geometry]") {
    CHECK_FALSE(GridLayout{0, 6, 96, 8, 0, 0}.is_valid());
    CHECK_FALSE(GridLayout{4, 0, 96, 8, 0, 0}.is_valid());
    CHECK_FALSE(GridLayout{4, 6, 0, 8, 0, 0}.is_valid());
    CHECK_FALSE(GridLayout{4, 6, 96, -1, 0, 0}.is_valid());
    CHECK(GridLayout{1, 1, 1, 0, 0, 0}.is_valid());
}

// =============================================================================
// resolve_cell
// =============================================================================

TEST_CASE("resolve_cell: pointer (100,50) lands in the first cell", "[grid_layout][resolve]") {
    auto cell = resolve_cell({100, 50}, default_layout());
    REQUIRE(cell.has_value());
    CHECK(*cell == CellAddress{0, 0});
}

TEST_CASE("resolve_cell: points inside cells", "[grid_layout][resolve]") {
    auto layout = default_layout();
    CHECK(resolve_cell({0, 0}, layout) == CellAddress{0, 0});
    CHECK(resolve_cell({104, 0}, layout) == CellAddress{0, 1});
    CHECK(resolve_cell({5 * 104 + 50, 3 * 104 + 50}, layout) == CellAddress{3, 5});
    CHECK(resolve_cell({2 * 104 + 95, 104 + 95}, layout) == CellAddress{1, 2});
}

TEST_CASE("resolve_cell: gap pixels belong to the preceding cell", "[grid_layout][resolve]") {
    auto layout = default_layout();
    CHECK(resolve_cell({96, 10}, layout) == CellAddress{0, 0});
    CHECK(resolve_cell({103, 10}, layout) == CellAddress{0, 0});
    CHECK(resolve_cell({10, 100}, layout) == CellAddress{0, 0});
}

TEST_CASE("resolve_cell: origin offset is honored", "[grid_layout][resolve]") {
    auto layout = default_layout(200, 100);
    CHECK_FALSE(resolve_cell({100, 50}, layout).has_value());
    CHECK(resolve_cell({300, 150}, layout) == CellAddress{0, 0});
    CHECK(resolve_cell({200 + 104, 100 + 104}, layout) == CellAddress{1, 1});
}

TEST_CASE("resolve_cell: outside the grid or on the far edge", "[grid_layout][resolve]") {
    auto layout = default_layout();
    CHECK_FALSE(resolve_cell({-1, 10}, layout).has_value());
    CHECK_FALSE(resolve_cell({10, -1}, layout).has_value());
    CHECK_FALSE(resolve_cell({layout.width(), 10}, layout).has_value());
    CHECK_FALSE(resolve_cell({10, layout.height()}, layout).has_value());
    CHECK(resolve_cell({layout.width() - 1, layout.height() - 1}, layout) == CellAddress{3, 5});
}

TEST_CASE("resolve_cell: invalid layout resolves nothing", "[grid_layout][resolve]") {
    CHECK_FALSE(resolve_cell({10, 10}, GridLayout{}).has_value());
}

TEST_CASE("resolve_cell: every resolved cell is within bounds", "[grid_layout][resolve]") {
    auto layout = GridLayout{3, 5, 40, 6, -17, 33};
    for (int32_t y = -20; y < layout.height() + 60; y += 7) {
        for (int32_t x = -40; x < layout.width() + 60; x += 5) {
            auto cell = resolve_cell({x, y}, layout);
            if (cell) {
                CHECK(layout.contains(*cell));
            }
        }
    }
}

// =============================================================================
// GridOccupancy
// =============================================================================

TEST_CASE("GridOccupancy: occupy and release", "[grid_layout][occupancy]") {
    GridOccupancy occ(2, 3);
    CHECK(occ.occupy({0, 1}));
    CHECK_FALSE(occ.occupy({0, 1}));
    CHECK_FALSE(occ.occupy({2, 0}));
    CHECK_FALSE(occ.occupy({0, -1}));
    CHECK(occ.is_occupied({0, 1}));
    CHECK(occ.occupied_count() == 1);

    CHECK(occ.release({0, 1}));
    CHECK_FALSE(occ.release({0, 1}));
    CHECK(occ.occupied_count() == 0);
}

TEST_CASE("GridOccupancy: find_available scans row-major", "[grid_layout][occupancy]") {
    GridOccupancy occ(2, 2);
    CHECK(occ.find_available() == CellAddress{0, 0});
    occ.occupy({0, 0});
    CHECK(occ.find_available() == CellAddress{0, 1});
    occ.occupy({0, 1});
    CHECK(occ.find_available() == CellAddress{1, 0});
    occ.occupy({1, 0});
    occ.occupy({1, 1});
    CHECK(occ.is_full());
    CHECK_FALSE(occ.find_available().has_value());
}

TEST_CASE("GridOccupancy: find_available_after wraps around", "[grid_layout][occupancy]") {
    GridOccupancy occ(2, 3);
    occ.occupy({0, 2});
    occ.occupy({1, 0});
    CHECK(occ.find_available_after({0, 1}) == CellAddress{1, 1});
    CHECK(occ.find_available_after({1, 2}) == CellAddress{0, 0});

    occ.occupy({1, 1});
    occ.occupy({1, 2});
    occ.occupy({0, 0});
    // Only the starting cell itself is left
    CHECK(occ.find_available_after({0, 1}) == CellAddress{0, 1});

    occ.occupy({0, 1});
    CHECK_FALSE(occ.find_available_after({0, 1}).has_value());
}

TEST_CASE("GridOccupancy: empty grid has nothing available", "[grid_layout][occupancy]") {
    GridOccupancy occ(0, 0);
    CHECK(occ.is_full());
    CHECK_FALSE(occ.find_available().has_value());
    CHECK_FALSE(occ.find_available_after({0, 0}).has_value());
}

TEST_CASE("GridOccupancy: dimensions are capped", "[grid_layout][occupancy]") {
    GridOccupancy occ(1 << 20, 1 << 20);
    CHECK(occ.rows() == MAX_GRID_ROWS);
    CHECK(occ.cols() == MAX_GRID_COLS);
    CHECK(occ.find_available_after({MAX_GRID_ROWS - 1, MAX_GRID_COLS - 1}) == CellAddress{0, 0});
    CHECK_FALSE(occ.occupy({MAX_GRID_ROWS, 0}));
}
