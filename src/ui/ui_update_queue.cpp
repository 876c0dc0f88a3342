// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_update_queue.h"

#include <spdlog/spdlog.h>

namespace qdeck::ui {

UpdateQueue& UpdateQueue::instance() {
    static UpdateQueue q;
    return q;
}

void UpdateQueue::queue(Callback cb) {
    if (!cb) {
        return;
    }
    if (freeze_depth_.load() > 0) {
        spdlog::trace("[UpdateQueue] Frozen, discarding callback");
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(cb));
}

void UpdateQueue::drain() {
    std::vector<Callback> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(pending_);
    }
    for (auto& cb : batch) {
        cb();
    }
}

size_t UpdateQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

UpdateQueue::ScopedFreeze::ScopedFreeze(UpdateQueue& q) : queue_(&q) {
    queue_->freeze_depth_.fetch_add(1);
}

UpdateQueue::ScopedFreeze::~ScopedFreeze() {
    if (queue_) {
        queue_->freeze_depth_.fetch_sub(1);
    }
}

UpdateQueue::ScopedFreeze::ScopedFreeze(ScopedFreeze&& other) noexcept : queue_(other.queue_) {
    other.queue_ = nullptr;
}

void queue_update(UpdateQueue::Callback cb) {
    UpdateQueue::instance().queue(std::move(cb));
}

} // namespace qdeck::ui
