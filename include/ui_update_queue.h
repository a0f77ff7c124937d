// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC
/**
 * @file ui_update_queue.h
 * @brief Thread-safe hand-off of work to the LVGL thread
 *
 * Page stacks, pages and LVGL objects are only touched on the LVGL thread.
 * Navigation requests and asynchronous asset loads may originate anywhere, so
 * they are marshalled through this queue:
 *
 * 1. Any thread calls folio::ui::queue_update()
 * 2. Callbacks accumulate under a mutex
 * 3. A highest-priority lv_timer drains them at the start of every
 *    lv_timer_handler() cycle, before rendering
 *
 * Usage:
 * @code
 * // From a loader thread:
 * folio::ui::queue_update([this, asset]() { on_loaded(asset); });
 * @endcode
 */

#pragma once

#include "lvgl/lvgl.h"

#include <spdlog/spdlog.h>

#include <functional>
#include <mutex>
#include <queue>

namespace folio::ui {

using UpdateCallback = std::function<void()>;

class UpdateQueueTestAccess;

/**
 * @brief Thread-safe UI update queue (singleton)
 *
 * Call init() once after lv_init() to install the drain timer.
 */
class UpdateQueue {
  public:
    static UpdateQueue& instance() {
        static UpdateQueue instance;
        return instance;
    }

    /**
     * @brief Install the drain timer (idempotent)
     */
    void init() {
        if (initialized_)
            return;

        // 1ms period: the timer is ready on every lv_timer_handler() call
        timer_ = lv_timer_create(timer_cb, 1, this);
        if (!timer_) {
            spdlog::error("[UpdateQueue] Failed to create timer!");
            return;
        }

        initialized_ = true;
        spdlog::debug("[UpdateQueue] Initialized - timer created for queue drain");
    }

    /**
     * @brief Queue a callback for the LVGL thread. Safe from any thread.
     */
    void queue(UpdateCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push(std::move(callback));
    }

    /**
     * @brief Number of callbacks not yet run
     */
    size_t pending_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    void shutdown() {
        if (timer_) {
            lv_timer_delete(timer_);
            timer_ = nullptr;
        }
        initialized_ = false;
    }

  private:
    friend class UpdateQueueTestAccess;

    UpdateQueue() = default;
    ~UpdateQueue() {
        // lv_deinit() may already have freed the timer; never touch it here
        timer_ = nullptr;
    }

    UpdateQueue(const UpdateQueue&) = delete;
    UpdateQueue& operator=(const UpdateQueue&) = delete;

    static void timer_cb(lv_timer_t* timer) {
        auto* self = static_cast<UpdateQueue*>(lv_timer_get_user_data(timer));
        if (self && self->initialized_) {
            self->process_pending();
        }
    }

    void process_pending() {
        // Swap out under the lock; callbacks may queue more work
        std::queue<UpdateCallback> to_process;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::swap(to_process, pending_);
        }

        while (!to_process.empty()) {
            auto callback = std::move(to_process.front());
            to_process.pop();
            if (callback) {
                callback();
            }
        }
    }

    std::mutex mutex_;
    std::queue<UpdateCallback> pending_;
    lv_timer_t* timer_ = nullptr;
    bool initialized_ = false;
};

/**
 * @brief Queue work for the LVGL thread
 */
inline void queue_update(UpdateCallback callback) {
    UpdateQueue::instance().queue(std::move(callback));
}

inline void update_queue_init() {
    UpdateQueue::instance().init();
}

inline void update_queue_shutdown() {
    UpdateQueue::instance().shutdown();
}

} // namespace folio::ui
