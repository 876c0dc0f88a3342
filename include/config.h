// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace qdeck {

using json = nlohmann::json;

/**
 * @brief Application configuration backed by a JSON file (qdeckconfig.json)
 *
 * Values are addressed by JSON pointer ("/window/cell_size_px"). Missing keys
 * and type mismatches fall back to the supplied default. Writes go to the
 * in-memory document; call save() to persist.
 *
 * Thread safety: main thread only.
 */
class Config {
  public:
    Config();

    static Config* get_instance();

    /// Load from `path`. A missing or unparsable file is replaced by defaults
    /// and written back. Returns false only if the defaults could not be saved.
    bool init(const std::string& path);

    /// Built-in document used for a fresh install
    static json default_document();

    template <typename T> T get(const std::string& ptr, const T& default_value) const {
        try {
            json::json_pointer jp(ptr);
            if (!data.contains(jp)) {
                return default_value;
            }
            return data.at(jp).get<T>();
        } catch (const std::exception& e) {
            spdlog::debug("[Config] get('{}') failed: {}", ptr, e.what());
            return default_value;
        }
    }

    template <typename T> void set(const std::string& ptr, const T& value) {
        try {
            data[json::json_pointer(ptr)] = value;
        } catch (const std::exception& e) {
            spdlog::warn("[Config] set('{}') failed: {}", ptr, e.what());
        }
    }

    /// Direct access to a subtree (created as null if missing). "" is the root.
    json& get_json(const std::string& ptr);

    /// Write the document to the file given to init(). Returns false on I/O error.
    bool save();

    const std::string& path() const {
        return path_;
    }

  private:
    json data;
    std::string path_;

    friend class PageStoreFixture;
    friend class ConfigFixture;
};

} // namespace qdeck
