// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

namespace qdeck::ui {

/**
 * @brief Mailbox of callbacks to run on the main (LVGL) thread
 *
 * Any thread may queue(). The main thread runs drain() once per loop
 * iteration (the application registers an LVGL timer for it; tests call it
 * directly). Callbacks queued while a ScopedFreeze is alive are discarded.
 *
 * @code
 * worker_done([guard, this](Result r) {
 *     qdeck::ui::queue_update([guard, this, r]() {
 *         if (!*guard) return;
 *         apply(r);
 *     });
 * });
 * @endcode
 */
class UpdateQueue {
  public:
    using Callback = std::function<void()>;

    static UpdateQueue& instance();

    UpdateQueue(const UpdateQueue&) = delete;
    UpdateQueue& operator=(const UpdateQueue&) = delete;

    /// Thread-safe. Dropped if the queue is frozen.
    void queue(Callback cb);

    /// Run everything queued so far. Callbacks queued by a running callback
    /// wait for the next drain(). Main thread only.
    void drain();

    /// Number of callbacks waiting
    size_t pending() const;

    /// RAII freeze: while alive, queue() discards callbacks
    class ScopedFreeze {
      public:
        explicit ScopedFreeze(UpdateQueue& q);
        ~ScopedFreeze();
        ScopedFreeze(const ScopedFreeze&) = delete;
        ScopedFreeze& operator=(const ScopedFreeze&) = delete;
        ScopedFreeze(ScopedFreeze&& other) noexcept;
        ScopedFreeze& operator=(ScopedFreeze&&) = delete;

      private:
        UpdateQueue* queue_;
    };

    ScopedFreeze scoped_freeze() {
        return ScopedFreeze(*this);
    }

  private:
    UpdateQueue() = default;

    mutable std::mutex mutex_;
    std::vector<Callback> pending_;
    std::atomic<int> freeze_depth_{0};
};

/// Shorthand for UpdateQueue::instance().queue(cb)
void queue_update(UpdateQueue::Callback cb);

} // namespace qdeck::ui
