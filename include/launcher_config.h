// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_layout.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qdeck {

/// Page dimensions used when a stored page has none (or nonsense)
constexpr int DEFAULT_PAGE_ROWS = 4;
constexpr int DEFAULT_PAGE_COLS = 6;

/// A button as stored in the configuration tree.
/// `action_type` is an opaque tag ("LaunchApp", "Open", "Terminal", ...)
/// interpreted only by the action backend.
struct ActionButtonRecord {
    CellAddress position{0, 0};
    std::string action_type;
    std::string label;
    std::string icon;
    nlohmann::json config = nlohmann::json::object();
    nlohmann::json style; ///< null when unstyled

    bool operator==(const ActionButtonRecord& o) const {
        return position == o.position && action_type == o.action_type && label == o.label &&
               icon == o.icon && config == o.config && style == o.style;
    }
};

/// A named rows x cols grid of buttons, at most one per position
struct Page {
    std::string name;
    int rows = DEFAULT_PAGE_ROWS;
    int cols = DEFAULT_PAGE_COLS;
    std::vector<ActionButtonRecord> buttons;

    const ActionButtonRecord* find_button(const CellAddress& cell) const;

    /// Occupancy of this page's buttons
    GridOccupancy occupancy() const;
};

struct Profile {
    std::string name;
    std::string hotkey; ///< empty when none
    std::vector<Page> pages;
};

struct LauncherConfig {
    std::vector<Profile> profiles;

    /// One profile "Default" with one empty page "Main"
    static LauncherConfig make_default();
};

// JSON conversion. Parsing is lenient: malformed entries are skipped with a
// debug log instead of failing the whole document.
nlohmann::json button_to_json(const ActionButtonRecord& button);
std::optional<ActionButtonRecord> button_from_json(const nlohmann::json& item);

nlohmann::json page_to_json(const Page& page);
Page page_from_json(const nlohmann::json& item);

nlohmann::json profile_to_json(const Profile& profile);
Profile profile_from_json(const nlohmann::json& item);

nlohmann::json profiles_to_json(const LauncherConfig& config);

/// Parse the `/profiles` array. Returns the default config when the array is
/// missing, empty, or yields no usable profile.
LauncherConfig profiles_from_json(const nlohmann::json& profiles);

/// "#RRGGBB" or "RRGGBB" -> 0xRRGGBB
std::optional<uint32_t> parse_hex_color(const std::string& text);

} // namespace qdeck
