// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "icon_extractor.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace qdeck {

struct IconSearchConfig {
    /// Data roots holding icons/ and pixmaps/. Empty means XDG defaults.
    std::vector<std::string> search_roots;
    std::string theme = "hicolor";
};

/**
 * @brief IconExtractor backed by freedesktop icon themes
 *
 * Requests are served by one worker thread. `.desktop` entries resolve through
 * their Icon= key; any other file is looked up by its lowercased stem. Results
 * are cached per absolute path, failures are not.
 *
 * Callbacks run on the worker thread. Requests still queued when stop() runs
 * are failed with "extractor stopped", as are requests made while stopped.
 */
class DesktopIconExtractor : public IconExtractor {
  public:
    struct CacheStats {
        size_t entries = 0;
        size_t hits = 0;
        size_t misses = 0;
    };

    explicit DesktopIconExtractor(IconSearchConfig config = {});
    ~DesktopIconExtractor() override;

    DesktopIconExtractor(const DesktopIconExtractor&) = delete;
    DesktopIconExtractor& operator=(const DesktopIconExtractor&) = delete;

    void start();
    void stop();
    bool is_running() const;

    void extract_icon(const std::string& file_path, SuccessCallback on_success,
                      ErrorCallback on_error) override;

    /// Synchronous lookup used by the worker. Consults and fills the cache.
    std::optional<IconInfo> resolve(const std::string& file_path);

    /// Theme lookup for an icon name (no cache)
    std::optional<std::string> find_theme_icon(const std::string& icon_name) const;

    CacheStats cache_stats() const;
    void clear_cache();

    const std::vector<std::string>& search_roots() const {
        return roots_;
    }

    /// $XDG_DATA_HOME (or ~/.local/share) followed by $XDG_DATA_DIRS
    static std::vector<std::string> default_search_roots();

    /// Icon= value of the [Desktop Entry] group, if any
    static std::optional<std::string> read_desktop_icon_key(const std::string& desktop_path);

  private:
    struct Request {
        std::string path;
        SuccessCallback on_success;
        ErrorCallback on_error;
    };

    void worker_loop();
    std::optional<IconInfo> resolve_uncached(const std::string& abs_path) const;

    std::vector<std::string> roots_;
    std::string theme_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::deque<Request> queue_;

    mutable std::mutex cache_mutex_;
    std::map<std::string, IconInfo> cache_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

} // namespace qdeck
