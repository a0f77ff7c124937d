// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file navigation_request_queue.h
 * @brief Serializes push/pop requests from any thread into one PageStack
 *
 * @pattern Mutex-guarded FIFO, drained on the LVGL thread through the
 *          UpdateQueue. One request in flight; the next starts when the
 *          previous one reports success or error.
 * @threading push()/pop()/pop_to() and the counters are safe from any thread.
 *            Result callbacks always run on the LVGL thread. shutdown() and
 *            destruction belong to the LVGL thread.
 * @gotchas Push and pop requests share one FIFO, so arrival order holds across
 *          both kinds. A failed request never blocks the ones behind it.
 */

#pragma once

#include "cancellation_token.h"
#include "page_error.h"
#include "page_factory.h"
#include "page_stack.h"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace folio {

class NavigationRequestQueue {
  public:
    explicit NavigationRequestQueue(PageStack& stack);

    /// Fails pending requests with CANCELLED
    ~NavigationRequestQueue();

    NavigationRequestQueue(const NavigationRequestQueue&) = delete;
    NavigationRequestQueue& operator=(const NavigationRequestQueue&) = delete;

    /**
     * @brief Queue a push
     */
    void push(PushRequest request, PushCallback on_pushed = nullptr,
              ErrorCallback on_error = nullptr);

    /**
     * @brief Queue a push of a page type by its RESOURCE_KEY
     */
    template <typename TPage>
    void push(bool play_animation = true, bool stack = true, PushCallback on_pushed = nullptr,
              ErrorCallback on_error = nullptr) {
        PushRequest request;
        request.resource_key = resource_key_of<TPage>();
        request.play_animation = play_animation;
        request.stack = stack;
        push(std::move(request), std::move(on_pushed), std::move(on_error));
    }

    /**
     * @brief Queue a pop of @p count pages
     *
     * Depth is checked when the request runs, not when it is queued.
     */
    void pop(bool play_animation = true, int count = 1, SuccessCallback on_done = nullptr,
             ErrorCallback on_error = nullptr);

    /**
     * @brief Queue a pop back to a page id
     */
    void pop_to(bool play_animation, std::string destination_page_id,
                SuccessCallback on_done = nullptr, ErrorCallback on_error = nullptr);

    /**
     * @brief Stop accepting requests
     *
     * The in-flight request is cancelled, pending ones fail with CANCELLED,
     * and later submissions fail with CANCELLED. Idempotent.
     */
    void shutdown();

    /// Requests queued and not yet started
    size_t pending_count() const;

    /// True while a request is running against the stack
    bool is_busy() const {
        return busy_.load();
    }

  private:
    enum class RequestKind { PUSH, POP, POP_TO };

    struct Request {
        RequestKind kind = RequestKind::PUSH;
        PushRequest push;
        bool play_animation = true;
        int count = 1;
        std::string destination_page_id;
        PushCallback on_pushed;
        SuccessCallback on_done;
        ErrorCallback on_error;
    };

    void enqueue(Request request);
    void schedule_pump();
    void pump();
    void start(Request request);
    void finish_request();
    static void reject(Request& request, const PageError& error);

    PageStack& stack_;

    mutable std::mutex mutex_;
    std::deque<Request> pending_;
    CancellationSource in_flight_;
    bool shut_down_ = false;
    bool pump_scheduled_ = false;

    std::atomic<bool> busy_{false};
    bool pumping_ = false; ///< LVGL thread only

    // Expires on destruction so queued drains and late stack callbacks can tell
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace folio
