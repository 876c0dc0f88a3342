// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "launcher_config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace qdeck {

using json = nlohmann::json;

const ActionButtonRecord* Page::find_button(const CellAddress& cell) const {
    auto it = std::find_if(buttons.begin(), buttons.end(),
                           [&cell](const ActionButtonRecord& b) { return b.position == cell; });
    return it != buttons.end() ? &*it : nullptr;
}

GridOccupancy Page::occupancy() const {
    GridOccupancy occ(rows, cols);
    for (const auto& b : buttons) {
        occ.occupy(b.position);
    }
    return occ;
}

LauncherConfig LauncherConfig::make_default() {
    Page page;
    page.name = "Main";
    Profile profile;
    profile.name = "Default";
    profile.pages.push_back(std::move(page));
    LauncherConfig config;
    config.profiles.push_back(std::move(profile));
    return config;
}

// ---------------------------------------------------------------------------
// Buttons
// ---------------------------------------------------------------------------

json button_to_json(const ActionButtonRecord& button) {
    json item = {{"position", {{"row", button.position.row}, {"col", button.position.col}}},
                 {"action_type", button.action_type},
                 {"label", button.label},
                 {"config", button.config.is_object() ? button.config : json::object()}};
    if (!button.icon.empty()) {
        item["icon"] = button.icon;
    }
    if (button.style.is_object() && !button.style.empty()) {
        item["style"] = button.style;
    }
    return item;
}

std::optional<ActionButtonRecord> button_from_json(const json& item) {
    if (!item.is_object() || !item.contains("position") || !item.contains("action_type")) {
        return std::nullopt;
    }
    const auto& pos = item["position"];
    if (!pos.is_object() || !pos.contains("row") || !pos.contains("col") ||
        !pos["row"].is_number_integer() || !pos["col"].is_number_integer() ||
        !item["action_type"].is_string()) {
        return std::nullopt;
    }

    ActionButtonRecord button;
    button.position = {pos["row"].get<int>(), pos["col"].get<int>()};
    button.action_type = item["action_type"].get<std::string>();
    if (item.contains("label") && item["label"].is_string()) {
        button.label = item["label"].get<std::string>();
    }
    if (item.contains("icon") && item["icon"].is_string()) {
        button.icon = item["icon"].get<std::string>();
    }
    if (item.contains("config") && item["config"].is_object()) {
        button.config = item["config"];
    }
    if (item.contains("style") && item["style"].is_object()) {
        button.style = item["style"];
    }
    return button;
}

// ---------------------------------------------------------------------------
// Pages
// ---------------------------------------------------------------------------

json page_to_json(const Page& page) {
    json buttons = json::array();
    for (const auto& b : page.buttons) {
        buttons.push_back(button_to_json(b));
    }
    return {{"name", page.name}, {"rows", page.rows}, {"cols", page.cols}, {"buttons", buttons}};
}

Page page_from_json(const json& item) {
    Page page;
    if (!item.is_object()) {
        return page;
    }
    page.name = item.value("name", std::string());

    int64_t rows = item.contains("rows") && item["rows"].is_number_integer()
                       ? item["rows"].get<int64_t>()
                       : 0;
    int64_t cols = item.contains("cols") && item["cols"].is_number_integer()
                       ? item["cols"].get<int64_t>()
                       : 0;
    if (rows <= 0 || cols <= 0 || rows > MAX_GRID_ROWS || cols > MAX_GRID_COLS) {
        spdlog::warn("[LauncherConfig] Page '{}' has invalid size {}x{}, using {}x{}", page.name,
                     rows, cols, DEFAULT_PAGE_ROWS, DEFAULT_PAGE_COLS);
        rows = DEFAULT_PAGE_ROWS;
        cols = DEFAULT_PAGE_COLS;
    }
    page.rows = static_cast<int>(rows);
    page.cols = static_cast<int>(cols);

    if (!item.contains("buttons") || !item["buttons"].is_array()) {
        return page;
    }

    std::set<CellAddress> seen;
    for (const auto& entry : item["buttons"]) {
        auto button = button_from_json(entry);
        if (!button) {
            spdlog::debug("[LauncherConfig] Skipping malformed button on page '{}'", page.name);
            continue;
        }
        CellAddress pos = button->position;
        if (pos.row < 0 || pos.col < 0 || pos.row >= page.rows || pos.col >= page.cols) {
            spdlog::debug("[LauncherConfig] Dropping out-of-bounds button '{}' at ({},{})",
                          button->label, pos.row, pos.col);
            continue;
        }
        if (!seen.insert(pos).second) {
            spdlog::debug("[LauncherConfig] Dropping duplicate button '{}' at ({},{})",
                          button->label, pos.row, pos.col);
            continue;
        }
        page.buttons.push_back(std::move(*button));
    }
    return page;
}

// ---------------------------------------------------------------------------
// Profiles
// ---------------------------------------------------------------------------

json profile_to_json(const Profile& profile) {
    json pages = json::array();
    for (const auto& p : profile.pages) {
        pages.push_back(page_to_json(p));
    }
    json item = {{"name", profile.name}, {"pages", pages}};
    if (!profile.hotkey.empty()) {
        item["hotkey"] = profile.hotkey;
    }
    return item;
}

Profile profile_from_json(const json& item) {
    Profile profile;
    if (!item.is_object()) {
        return profile;
    }
    profile.name = item.value("name", std::string());
    if (item.contains("hotkey") && item["hotkey"].is_string()) {
        profile.hotkey = item["hotkey"].get<std::string>();
    }
    if (item.contains("pages") && item["pages"].is_array()) {
        for (const auto& p : item["pages"]) {
            if (!p.is_object()) {
                continue;
            }
            profile.pages.push_back(page_from_json(p));
        }
    }
    return profile;
}

json profiles_to_json(const LauncherConfig& config) {
    json profiles = json::array();
    for (const auto& p : config.profiles) {
        profiles.push_back(profile_to_json(p));
    }
    return profiles;
}

LauncherConfig profiles_from_json(const json& profiles) {
    LauncherConfig config;
    if (profiles.is_array()) {
        for (const auto& item : profiles) {
            Profile profile = profile_from_json(item);
            if (profile.pages.empty()) {
                spdlog::debug("[LauncherConfig] Skipping profile '{}' without pages", profile.name);
                continue;
            }
            config.profiles.push_back(std::move(profile));
        }
    }
    if (config.profiles.empty()) {
        spdlog::info("[LauncherConfig] No usable profiles, using defaults");
        return LauncherConfig::make_default();
    }
    return config;
}

std::optional<uint32_t> parse_hex_color(const std::string& text) {
    std::string hex = (!text.empty() && text[0] == '#') ? text.substr(1) : text;
    if (hex.size() != 6) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (char ch : hex) {
        value <<= 4;
        if (ch >= '0' && ch <= '9') {
            value |= static_cast<uint32_t>(ch - '0');
        } else if (ch >= 'a' && ch <= 'f') {
            value |= static_cast<uint32_t>(ch - 'a' + 10);
        } else if (ch >= 'A' && ch <= 'F') {
            value |= static_cast<uint32_t>(ch - 'A' + 10);
        } else {
            return std::nullopt;
        }
    }
    return value;
}

} // namespace qdeck
