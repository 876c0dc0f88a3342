// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dropped_file.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace qdeck {

namespace fs = std::filesystem;

// Type-derived default icons (UTF-8 emoji)
static constexpr const char* ICON_ROCKET = "\xF0\x9F\x9A\x80";   // U+1F680
static constexpr const char* ICON_SCROLL = "\xF0\x9F\x93\x9C";   // U+1F4DC
static constexpr const char* ICON_PAGE = "\xF0\x9F\x93\x84";     // U+1F4C4
static constexpr const char* ICON_CLAPPER = "\xF0\x9F\x8E\xAC";  // U+1F3AC
static constexpr const char* ICON_NOTE = "\xF0\x9F\x8E\xB5";     // U+1F3B5
static constexpr const char* ICON_PACKAGE = "\xF0\x9F\x93\xA6";  // U+1F4E6
static constexpr const char* ICON_FOLDER = "\xF0\x9F\x93\x81";   // U+1F4C1
static constexpr const char* ICON_QUESTION = "\xE2\x9D\x93";     // U+2753

static constexpr size_t LABEL_MAX_LEN = 20;
static constexpr size_t LABEL_TRUNCATED_LEN = 17;

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string extension_of(const std::string& name) {
    std::string ext = fs::path(name).extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    return to_lower(ext);
}

const char* dropped_file_type_name(DroppedFileType type) {
    switch (type) {
    case DroppedFileType::Executable:
        return "Executable";
    case DroppedFileType::Script:
        return "Script";
    case DroppedFileType::DesktopEntry:
        return "DesktopEntry";
    case DroppedFileType::Document:
        return "Document";
    case DroppedFileType::Image:
        return "Image";
    case DroppedFileType::Video:
        return "Video";
    case DroppedFileType::Audio:
        return "Audio";
    case DroppedFileType::Archive:
        return "Archive";
    case DroppedFileType::Directory:
        return "Directory";
    case DroppedFileType::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

DroppedFileType classify_extension(const std::string& name) {
    static const std::unordered_map<std::string, DroppedFileType> EXTENSIONS = {
        {"exe", DroppedFileType::Executable},  {"msi", DroppedFileType::Executable},
        {"bat", DroppedFileType::Executable},  {"cmd", DroppedFileType::Executable},
        {"com", DroppedFileType::Executable},  {"scr", DroppedFileType::Executable},
        {"appimage", DroppedFileType::Executable}, {"run", DroppedFileType::Executable},
        {"bin", DroppedFileType::Executable},

        {"ps1", DroppedFileType::Script},      {"py", DroppedFileType::Script},
        {"js", DroppedFileType::Script},       {"ts", DroppedFileType::Script},
        {"sh", DroppedFileType::Script},       {"vbs", DroppedFileType::Script},
        {"wsf", DroppedFileType::Script},

        {"desktop", DroppedFileType::DesktopEntry},

        {"txt", DroppedFileType::Document},    {"doc", DroppedFileType::Document},
        {"docx", DroppedFileType::Document},   {"pdf", DroppedFileType::Document},
        {"rtf", DroppedFileType::Document},    {"odt", DroppedFileType::Document},
        {"md", DroppedFileType::Document},     {"html", DroppedFileType::Document},
        {"htm", DroppedFileType::Document},

        {"png", DroppedFileType::Image},       {"jpg", DroppedFileType::Image},
        {"jpeg", DroppedFileType::Image},      {"gif", DroppedFileType::Image},
        {"bmp", DroppedFileType::Image},       {"ico", DroppedFileType::Image},
        {"svg", DroppedFileType::Image},       {"webp", DroppedFileType::Image},
        {"tiff", DroppedFileType::Image},

        {"mp4", DroppedFileType::Video},       {"avi", DroppedFileType::Video},
        {"mkv", DroppedFileType::Video},       {"mov", DroppedFileType::Video},
        {"wmv", DroppedFileType::Video},       {"flv", DroppedFileType::Video},
        {"webm", DroppedFileType::Video},      {"m4v", DroppedFileType::Video},

        {"mp3", DroppedFileType::Audio},       {"wav", DroppedFileType::Audio},
        {"flac", DroppedFileType::Audio},      {"aac", DroppedFileType::Audio},
        {"ogg", DroppedFileType::Audio},       {"wma", DroppedFileType::Audio},
        {"m4a", DroppedFileType::Audio},

        {"zip", DroppedFileType::Archive},     {"rar", DroppedFileType::Archive},
        {"7z", DroppedFileType::Archive},      {"tar", DroppedFileType::Archive},
        {"gz", DroppedFileType::Archive},      {"bz2", DroppedFileType::Archive},
        {"xz", DroppedFileType::Archive},      {"cab", DroppedFileType::Archive},
    };

    auto it = EXTENSIONS.find(extension_of(name));
    return it != EXTENSIONS.end() ? it->second : DroppedFileType::Unknown;
}

DroppedFile analyze_dropped_file(const std::string& path) {
    DroppedFile file;

    std::error_code ec;
    fs::path p(path);
    if (p.is_relative()) {
        fs::path abs = fs::absolute(p, ec);
        if (!ec) {
            p = abs;
        }
    }
    p = p.lexically_normal();
    file.path = p.string();
    file.name = p.filename().string();
    if (file.name.empty()) {
        // Trailing separator on a directory path
        file.name = p.parent_path().filename().string();
    }

    auto status = fs::status(p, ec);
    if (ec || !fs::exists(status)) {
        file.type = classify_extension(file.name);
        spdlog::debug("[DroppedFile] '{}' not found, classified by name as {}", file.path,
                      dropped_file_type_name(file.type));
        return file;
    }

    if (fs::is_directory(status)) {
        file.is_directory = true;
        file.type = DroppedFileType::Directory;
        return file;
    }

    auto size = fs::file_size(p, ec);
    file.size_bytes = ec ? 0 : static_cast<uint64_t>(size);
    file.type = classify_extension(file.name);

    // Extension-less binaries: trust the execute bit
    if (file.type == DroppedFileType::Unknown && fs::is_regular_file(status)) {
        auto perms = status.permissions();
        if ((perms & (fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec)) !=
            fs::perms::none) {
            file.type = DroppedFileType::Executable;
        }
    }

    spdlog::debug("[DroppedFile] '{}' -> {} ({} bytes)", file.path,
                  dropped_file_type_name(file.type), file.size_bytes);
    return file;
}

bool wants_extracted_icon(DroppedFileType type) {
    return type == DroppedFileType::Executable || type == DroppedFileType::Script ||
           type == DroppedFileType::DesktopEntry;
}

const char* action_type_for(DroppedFileType type) {
    return wants_extracted_icon(type) ? ACTION_LAUNCH_APP : ACTION_OPEN;
}

std::string make_button_label(const std::string& file_name) {
    std::string stem = fs::path(file_name).stem().string();
    if (stem.empty()) {
        stem = file_name;
    }

    std::string label;
    label.reserve(stem.size());
    bool at_word_start = true;
    for (char ch : stem) {
        if (ch == '_' || ch == '-' || ch == ' ') {
            // Collapse runs of separators into one space
            if (!label.empty() && label.back() != ' ') {
                label.push_back(' ');
            }
            at_word_start = true;
            continue;
        }
        if (at_word_start) {
            label.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
            at_word_start = false;
        } else {
            label.push_back(ch);
        }
    }
    while (!label.empty() && label.back() == ' ') {
        label.pop_back();
    }

    if (label.size() > LABEL_MAX_LEN) {
        size_t cut = LABEL_TRUNCATED_LEN;
        // Don't split a UTF-8 sequence
        while (cut > 0 && (static_cast<unsigned char>(label[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        label = label.substr(0, cut) + "...";
    }
    return label;
}

nlohmann::json make_action_config(const DroppedFile& file) {
    nlohmann::json config = nlohmann::json::object();
    std::string workdir = fs::path(file.path).parent_path().string();

    switch (file.type) {
    case DroppedFileType::Executable:
        config["path"] = file.path;
        config["workdir"] = workdir;
        break;
    case DroppedFileType::DesktopEntry:
        config["path"] = file.path;
        config["workdir"] = workdir;
        config["desktop_entry"] = true;
        break;
    case DroppedFileType::Script: {
        config["workdir"] = workdir;
        std::string ext = extension_of(file.name);
        if (ext == "py") {
            config["path"] = "python3";
            config["args"] = {file.path};
        } else if (ext == "js") {
            config["path"] = "node";
            config["args"] = {file.path};
        } else if (ext == "sh") {
            config["path"] = "sh";
            config["args"] = {file.path};
        } else if (ext == "ps1") {
            config["path"] = "pwsh";
            config["args"] = {"-ExecutionPolicy", "Bypass", "-File", file.path};
        } else {
            config["path"] = file.path;
        }
        break;
    }
    default:
        config["target"] = file.path;
        config["verb"] = "open";
        break;
    }
    return config;
}

std::string default_icon_for(const DroppedFile& file) {
    switch (file.type) {
    case DroppedFileType::Executable:
    case DroppedFileType::DesktopEntry:
        return ICON_ROCKET;
    case DroppedFileType::Script:
        return ICON_SCROLL;
    case DroppedFileType::Document:
        return ICON_PAGE;
    case DroppedFileType::Image:
        return file.path;
    case DroppedFileType::Video:
        return ICON_CLAPPER;
    case DroppedFileType::Audio:
        return ICON_NOTE;
    case DroppedFileType::Archive:
        return ICON_PACKAGE;
    case DroppedFileType::Directory:
        return ICON_FOLDER;
    case DroppedFileType::Unknown:
        break;
    }
    return ICON_QUESTION;
}

nlohmann::json default_style_for(DroppedFileType type) {
    const char* background = "#757575"; // Grey
    switch (type) {
    case DroppedFileType::Executable:
    case DroppedFileType::DesktopEntry:
        background = "#4CAF50"; // Green
        break;
    case DroppedFileType::Script:
        background = "#009688"; // Teal
        break;
    case DroppedFileType::Document:
        background = "#FF9800"; // Orange
        break;
    case DroppedFileType::Image:
        background = "#E91E63"; // Pink
        break;
    case DroppedFileType::Video:
        background = "#9C27B0"; // Purple
        break;
    case DroppedFileType::Audio:
        background = "#607D8B"; // Blue grey
        break;
    case DroppedFileType::Archive:
        background = "#795548"; // Brown
        break;
    case DroppedFileType::Directory:
        background = "#2196F3"; // Blue
        break;
    case DroppedFileType::Unknown:
        break;
    }
    return {{"background_color", background}, {"text_color", "#FFFFFF"}};
}

} // namespace qdeck
