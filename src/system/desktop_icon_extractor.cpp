// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "desktop_icon_extractor.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace qdeck {

namespace fs = std::filesystem;

namespace {

constexpr const char* kSizes[] = {"256x256", "128x128", "96x96", "64x64", "48x48", "scalable"};
constexpr const char* kExtensions[] = {"png", "svg", "xpm"};

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_regular_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

// Strip an image extension from Icon= values like "foo.png"
std::string strip_icon_extension(const std::string& name) {
    fs::path p(name);
    std::string ext = to_lower(p.extension().string());
    for (const char* known : kExtensions) {
        if (ext == std::string(".") + known) {
            return p.stem().string();
        }
    }
    return name;
}

void split_paths(const std::string& value, std::vector<std::string>& out) {
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ':')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
}

} // namespace

DesktopIconExtractor::DesktopIconExtractor(IconSearchConfig config)
    : roots_(config.search_roots.empty() ? default_search_roots() : std::move(config.search_roots)),
      theme_(config.theme.empty() ? "hicolor" : std::move(config.theme)) {
    spdlog::debug("[DesktopIconExtractor] Theme '{}', {} search root(s)", theme_, roots_.size());
}

DesktopIconExtractor::~DesktopIconExtractor() {
    stop();
}

std::vector<std::string> DesktopIconExtractor::default_search_roots() {
    std::vector<std::string> roots;

    const char* data_home = std::getenv("XDG_DATA_HOME");
    if (data_home && *data_home) {
        roots.emplace_back(data_home);
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        roots.push_back(std::string(home) + "/.local/share");
    }

    const char* data_dirs = std::getenv("XDG_DATA_DIRS");
    split_paths((data_dirs && *data_dirs) ? data_dirs : "/usr/local/share:/usr/share", roots);
    return roots;
}

std::optional<std::string> DesktopIconExtractor::read_desktop_icon_key(
    const std::string& desktop_path) {
    std::ifstream in(desktop_path);
    if (!in.is_open()) {
        return std::nullopt;
    }

    bool in_entry_group = false;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.front() == '[') {
            in_entry_group = (line == "[Desktop Entry]");
            continue;
        }
        if (!in_entry_group) {
            continue;
        }
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (trim(line.substr(0, eq)) == "Icon") {
            std::string value = trim(line.substr(eq + 1));
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

std::optional<std::string> DesktopIconExtractor::find_theme_icon(const std::string& icon_name) const {
    if (icon_name.empty()) {
        return std::nullopt;
    }
    std::string name = strip_icon_extension(icon_name);

    std::vector<std::string> themes{theme_};
    if (theme_ != "hicolor") {
        themes.emplace_back("hicolor");
    }

    for (const auto& root : roots_) {
        for (const auto& theme : themes) {
            for (const char* size : kSizes) {
                fs::path dir = fs::path(root) / "icons" / theme / size / "apps";
                for (const char* ext : kExtensions) {
                    fs::path candidate = dir / (name + "." + ext);
                    if (qdeck::is_regular_file(candidate)) {
                        return candidate.string();
                    }
                }
            }
        }
        for (const char* ext : kExtensions) {
            fs::path candidate = fs::path(root) / "pixmaps" / (name + "." + ext);
            if (qdeck::is_regular_file(candidate)) {
                return candidate.string();
            }
        }
    }
    return std::nullopt;
}

std::optional<IconInfo> DesktopIconExtractor::resolve_uncached(const std::string& abs_path) const {
    fs::path p(abs_path);

    if (to_lower(p.extension().string()) == ".desktop") {
        auto icon = read_desktop_icon_key(abs_path);
        if (!icon) {
            spdlog::debug("[DesktopIconExtractor] {} has no Icon= key", abs_path);
            return std::nullopt;
        }
        if (fs::path(*icon).is_absolute()) {
            if (is_regular_file(*icon)) {
                return IconInfo{*icon, IconSourceKind::Extracted};
            }
            spdlog::debug("[DesktopIconExtractor] Icon path {} does not exist", *icon);
            return std::nullopt;
        }
        if (auto found = find_theme_icon(*icon)) {
            return IconInfo{*found, IconSourceKind::Theme};
        }
        return std::nullopt;
    }

    if (auto found = find_theme_icon(to_lower(p.stem().string()))) {
        return IconInfo{*found, IconSourceKind::Theme};
    }
    return std::nullopt;
}

std::optional<IconInfo> DesktopIconExtractor::resolve(const std::string& file_path) {
    std::error_code ec;
    std::string abs_path = fs::absolute(file_path, ec).lexically_normal().string();
    if (ec) {
        abs_path = file_path;
    }

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(abs_path);
        if (it != cache_.end()) {
            ++hits_;
            return it->second;
        }
        ++misses_;
    }

    auto info = resolve_uncached(abs_path);
    if (info) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_[abs_path] = *info;
    }
    return info;
}

DesktopIconExtractor::CacheStats DesktopIconExtractor::cache_stats() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return CacheStats{cache_.size(), hits_, misses_};
}

void DesktopIconExtractor::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    spdlog::debug("[DesktopIconExtractor] Clearing {} cached icon(s)", cache_.size());
    cache_.clear();
    hits_ = 0;
    misses_ = 0;
}

// ---------------------------------------------------------------------------
// Worker
// ---------------------------------------------------------------------------

void DesktopIconExtractor::start() {
    if (running_.load()) {
        spdlog::warn("[DesktopIconExtractor] start() called while already running");
        return;
    }
    running_.store(true);
    thread_ = std::thread(&DesktopIconExtractor::worker_loop, this);
    spdlog::info("[DesktopIconExtractor] Started");
}

void DesktopIconExtractor::stop() {
    if (!running_.load()) {
        return;
    }

    spdlog::info("[DesktopIconExtractor] Stopping...");
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_.store(false);
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    std::deque<Request> orphaned;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        orphaned.swap(queue_);
    }
    for (auto& req : orphaned) {
        if (req.on_error) {
            req.on_error("extractor stopped");
        }
    }
    spdlog::info("[DesktopIconExtractor] Stopped ({} pending request(s) failed)", orphaned.size());
}

bool DesktopIconExtractor::is_running() const {
    return running_.load();
}

void DesktopIconExtractor::extract_icon(const std::string& file_path, SuccessCallback on_success,
                                        ErrorCallback on_error) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (running_.load()) {
            queue_.push_back(Request{file_path, std::move(on_success), std::move(on_error)});
            cv_.notify_one();
            return;
        }
    }
    spdlog::debug("[DesktopIconExtractor] Request for {} while stopped", file_path);
    if (on_error) {
        on_error("extractor stopped");
    }
}

void DesktopIconExtractor::worker_loop() {
    spdlog::debug("[DesktopIconExtractor] Worker started");

    while (true) {
        Request req;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this]() { return !queue_.empty() || !running_.load(); });
            if (!running_.load()) {
                break;
            }
            req = std::move(queue_.front());
            queue_.pop_front();
        }

        auto info = resolve(req.path);
        if (info) {
            if (req.on_success) {
                req.on_success(*info);
            }
        } else if (req.on_error) {
            req.on_error("no icon found for " + req.path);
        }
    }

    spdlog::debug("[DesktopIconExtractor] Worker exited");
}

} // namespace qdeck
