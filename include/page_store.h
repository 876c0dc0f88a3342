// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launcher_config.h"

#include <functional>
#include <memory>
#include <vector>

namespace qdeck {

class Config;

/**
 * @brief Owns the launcher profiles and publishes the active page
 *
 * Pages are published as immutable snapshots (shared_ptr<const Page>).
 * Renderers keep the snapshot they drew; commit_page() swaps in a new one and
 * never touches a published object. Profile/page selection is driven by the
 * caller.
 *
 * Thread safety: main thread only.
 */
class PageStore {
  public:
    using PageObserver = std::function<void(const std::shared_ptr<const Page>&)>;

    explicit PageStore(Config& config);

    PageStore(const PageStore&) = delete;
    PageStore& operator=(const PageStore&) = delete;

    /// Read /profiles from the config
    void load();

    /// Select the active profile/page. Returns false if either index is out of range.
    bool select(size_t profile_index, size_t page_index);

    size_t profile_index() const {
        return profile_index_;
    }
    size_t page_index() const {
        return page_index_;
    }

    const LauncherConfig& launcher_config() const {
        return launcher_;
    }

    /// The published active page (never null after load())
    std::shared_ptr<const Page> current_page() const {
        return current_;
    }

    /// Replace the active page, persist it, and notify observers.
    /// Returns false if the config could not be saved (the page is still published).
    bool commit_page(Page page);

    /// Observers fire after every commit and select. Returns an id for remove_observer().
    int add_observer(PageObserver cb);
    void remove_observer(int id);

  private:
    void publish();

    Config& config_;
    LauncherConfig launcher_;
    size_t profile_index_ = 0;
    size_t page_index_ = 0;
    std::shared_ptr<const Page> current_;

    struct ObserverEntry {
        int id;
        PageObserver cb;
    };
    std::vector<ObserverEntry> observers_;
    int next_observer_id_ = 1;
};

} // namespace qdeck
