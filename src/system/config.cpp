// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "launcher_config.h"

#include <filesystem>
#include <fstream>

namespace qdeck {

namespace fs = std::filesystem;

static Config g_config;

Config::Config() : data(json::object()) {}

Config* Config::get_instance() {
    return &g_config;
}

json Config::default_document() {
    return {
        {"version", "1.0"},
        {"window",
         {{"width_px", 800},
          {"height_px", 480},
          {"cell_size_px", 96},
          {"gap_px", 8}}},
        {"drop", {{"undo_depth", 50}, {"pointer_poll_ms", 16}}},
        {"icons", {{"theme", "hicolor"}, {"search_paths", json::array()}}},
        {"log", {{"level", "info"}, {"file", ""}}},
        {"profiles", profiles_to_json(LauncherConfig::make_default())},
    };
}

bool Config::init(const std::string& path) {
    path_ = path;

    std::ifstream in(path);
    if (in.is_open()) {
        try {
            data = json::parse(in);
            if (data.is_object()) {
                spdlog::info("[Config] Loaded {}", path);
                return true;
            }
            spdlog::warn("[Config] {} is not a JSON object, using defaults", path);
        } catch (const std::exception& e) {
            spdlog::warn("[Config] Failed to parse {}: {}", path, e.what());
        }
    } else {
        spdlog::info("[Config] {} not found, creating defaults", path);
    }

    data = default_document();
    return save();
}

json& Config::get_json(const std::string& ptr) {
    if (ptr.empty()) {
        return data;
    }
    return data[json::json_pointer(ptr)];
}

bool Config::save() {
    if (path_.empty()) {
        spdlog::debug("[Config] No path set, skipping save");
        return false;
    }

    std::error_code ec;
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    // Dropped file names may carry bytes that are not UTF-8; write those as
    // U+FFFD instead of failing the whole document
    std::string text;
    try {
        text = data.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception& e) {
        spdlog::error("[Config] Cannot serialize {}: {}", path_, e.what());
        return false;
    }

    // Write to a sibling temp file and rename so a crash never leaves a
    // truncated config behind
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("[Config] Cannot open {} for writing", tmp);
            return false;
        }
        out << text << '\n';
        if (!out.good()) {
            spdlog::error("[Config] Write to {} failed", tmp);
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        spdlog::error("[Config] Cannot replace {}: {}", path_, ec.message());
        return false;
    }
    spdlog::debug("[Config] Saved {}", path_);
    return true;
}

} // namespace qdeck
