// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "page_store.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace qdeck {

PageStore::PageStore(Config& config) : config_(config) {}

void PageStore::load() {
    launcher_ = profiles_from_json(config_.get<json>("/profiles", json()));
    profile_index_ = 0;
    page_index_ = 0;
    current_ = std::make_shared<const Page>(launcher_.profiles[0].pages[0]);

    // Commits address pages by index; keep the document in the validated shape
    config_.set<json>("/profiles", profiles_to_json(launcher_));

    size_t buttons = 0;
    for (const auto& profile : launcher_.profiles) {
        for (const auto& page : profile.pages) {
            buttons += page.buttons.size();
        }
    }
    spdlog::info("[PageStore] Loaded {} profile(s), {} button(s)", launcher_.profiles.size(),
                 buttons);
}

bool PageStore::select(size_t profile_index, size_t page_index) {
    if (profile_index >= launcher_.profiles.size() ||
        page_index >= launcher_.profiles[profile_index].pages.size()) {
        spdlog::debug("[PageStore] select({}, {}) out of range", profile_index, page_index);
        return false;
    }
    profile_index_ = profile_index;
    page_index_ = page_index;
    current_ = std::make_shared<const Page>(launcher_.profiles[profile_index].pages[page_index]);
    publish();
    return true;
}

bool PageStore::commit_page(Page page) {
    if (launcher_.profiles.empty()) {
        spdlog::error("[PageStore] commit_page() before load()");
        return false;
    }
    launcher_.profiles[profile_index_].pages[page_index_] = page;
    current_ = std::make_shared<const Page>(std::move(page));

    std::string ptr = "/profiles/" + std::to_string(profile_index_) + "/pages/" +
                      std::to_string(page_index_);
    config_.set<json>(ptr, page_to_json(*current_));
    bool saved = config_.save();
    if (!saved) {
        spdlog::warn("[PageStore] Page '{}' committed but not persisted", current_->name);
    }

    spdlog::debug("[PageStore] Committed page '{}' ({} buttons)", current_->name,
                  current_->buttons.size());
    publish();
    return saved;
}

int PageStore::add_observer(PageObserver cb) {
    int id = next_observer_id_++;
    observers_.push_back({id, std::move(cb)});
    return id;
}

void PageStore::remove_observer(int id) {
    observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                    [id](const ObserverEntry& e) { return e.id == id; }),
                     observers_.end());
}

void PageStore::publish() {
    // Copy: an observer may remove itself
    auto observers = observers_;
    for (const auto& entry : observers) {
        if (entry.cb) {
            entry.cb(current_);
        }
    }
}

} // namespace qdeck
