// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace qdeck {

enum class DroppedFileType {
    Executable,
    Script,
    DesktopEntry,
    Document,
    Image,
    Video,
    Audio,
    Archive,
    Directory,
    Unknown,
};

const char* dropped_file_type_name(DroppedFileType type);

/// Action tags produced by file drops
constexpr const char* ACTION_LAUNCH_APP = "LaunchApp";
constexpr const char* ACTION_OPEN = "Open";

/// A dropped path after inspection
struct DroppedFile {
    std::string path; ///< absolute
    std::string name; ///< file name with extension
    DroppedFileType type = DroppedFileType::Unknown;
    uint64_t size_bytes = 0;
    bool is_directory = false;
};

/// Inspect a dropped path. Relative paths are resolved against the current
/// directory. A path that does not exist is still classified from its name.
DroppedFile analyze_dropped_file(const std::string& path);

/// Classify by extension only (no filesystem access)
DroppedFileType classify_extension(const std::string& name);

/// True for types whose icon comes from the icon extractor
bool wants_extracted_icon(DroppedFileType type);

/// "LaunchApp" for executables, scripts and desktop entries, "Open" otherwise
const char* action_type_for(DroppedFileType type);

/// Button label from a file name: stem, '_' and '-' as spaces, words
/// capitalized, truncated to 17 chars + "..." past 20.
std::string make_button_label(const std::string& file_name);

/// Action config seeded from the file (path/workdir/args or target/verb)
nlohmann::json make_action_config(const DroppedFile& file);

/// Icon used when nothing better is available for this type.
/// Images are their own icon.
std::string default_icon_for(const DroppedFile& file);

/// Background/text colours per type
nlohmann::json default_style_for(DroppedFileType type);

} // namespace qdeck
