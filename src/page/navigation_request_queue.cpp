// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigation_request_queue.h"

#include "ui_update_queue.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace folio {

NavigationRequestQueue::NavigationRequestQueue(PageStack& stack) : stack_(stack) {
    spdlog::trace("[NavigationRequestQueue] Created");
}

NavigationRequestQueue::~NavigationRequestQueue() {
    shutdown();
    alive_.reset();
    spdlog::trace("[NavigationRequestQueue] Destroyed");
}

// ============================================================================
// SUBMISSION (any thread)
// ============================================================================

void NavigationRequestQueue::push(PushRequest request, PushCallback on_pushed,
                                  ErrorCallback on_error) {
    Request r;
    r.kind = RequestKind::PUSH;
    r.play_animation = request.play_animation;
    r.push = std::move(request);
    r.on_pushed = std::move(on_pushed);
    r.on_error = std::move(on_error);
    enqueue(std::move(r));
}

void NavigationRequestQueue::pop(bool play_animation, int count, SuccessCallback on_done,
                                 ErrorCallback on_error) {
    Request r;
    r.kind = RequestKind::POP;
    r.play_animation = play_animation;
    r.count = count;
    r.on_done = std::move(on_done);
    r.on_error = std::move(on_error);
    enqueue(std::move(r));
}

void NavigationRequestQueue::pop_to(bool play_animation, std::string destination_page_id,
                                    SuccessCallback on_done, ErrorCallback on_error) {
    Request r;
    r.kind = RequestKind::POP_TO;
    r.play_animation = play_animation;
    r.destination_page_id = std::move(destination_page_id);
    r.on_done = std::move(on_done);
    r.on_error = std::move(on_error);
    enqueue(std::move(r));
}

void NavigationRequestQueue::enqueue(Request request) {
    bool rejected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            rejected = true;
        } else {
            pending_.push_back(std::move(request));
        }
    }

    if (rejected) {
        spdlog::debug("[NavigationRequestQueue] Request after shutdown rejected");
        // Keep the callback on the LVGL thread like every other result
        auto on_error = std::move(request.on_error);
        if (on_error) {
            ui::queue_update([on_error]() {
                on_error(PageError::cancelled("Navigation request after shutdown"));
            });
        }
        return;
    }
    schedule_pump();
}

void NavigationRequestQueue::schedule_pump() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pump_scheduled_) {
            return;
        }
        pump_scheduled_ = true;
    }

    std::weak_ptr<bool> weak_alive = alive_;
    ui::queue_update([this, weak_alive]() {
        if (weak_alive.expired()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pump_scheduled_ = false;
        }
        pump();
    });
}

size_t NavigationRequestQueue::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

// ============================================================================
// CONSUMER (LVGL thread)
// ============================================================================

void NavigationRequestQueue::pump() {
    // Requests that finish synchronously come back here through finish_request();
    // the loop picks up the next one instead of recursing
    if (pumping_) {
        return;
    }
    pumping_ = true;

    while (!busy_.load()) {
        Request next;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_ || pending_.empty()) {
                break;
            }
            next = std::move(pending_.front());
            pending_.pop_front();
            in_flight_ = CancellationSource();
        }
        busy_ = true;
        start(std::move(next));
    }

    pumping_ = false;
}

void NavigationRequestQueue::start(Request request) {
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = in_flight_.token();
    }

    std::weak_ptr<bool> weak_alive = alive_;
    auto on_error = [this, weak_alive, cb = std::move(request.on_error)](const PageError& err) {
        if (!err.is_cancellation()) {
            spdlog::debug("[NavigationRequestQueue] Request failed ({}): {}",
                          err.get_type_string(), err.message);
        }
        if (cb) {
            cb(err);
        }
        if (!weak_alive.expired()) {
            finish_request();
        }
    };

    switch (request.kind) {
    case RequestKind::PUSH: {
        spdlog::trace("[NavigationRequestQueue] Starting push '{}'", request.push.resource_key);
        auto on_pushed = [this, weak_alive, cb = std::move(request.on_pushed)](
                             const std::string& page_id, Page* page) {
            if (cb) {
                cb(page_id, page);
            }
            if (!weak_alive.expired()) {
                finish_request();
            }
        };
        stack_.push(request.push, std::move(on_pushed), std::move(on_error), token);
        break;
    }
    case RequestKind::POP:
    case RequestKind::POP_TO: {
        auto on_done = [this, weak_alive, cb = std::move(request.on_done)]() {
            if (cb) {
                cb();
            }
            if (!weak_alive.expired()) {
                finish_request();
            }
        };
        if (request.kind == RequestKind::POP) {
            spdlog::trace("[NavigationRequestQueue] Starting pop of {}", request.count);
            stack_.pop(request.play_animation, request.count, std::move(on_done),
                       std::move(on_error), token);
        } else {
            spdlog::trace("[NavigationRequestQueue] Starting pop to '{}'",
                          request.destination_page_id);
            stack_.pop_to(request.play_animation, request.destination_page_id,
                          std::move(on_done), std::move(on_error), token);
        }
        break;
    }
    }
}

void NavigationRequestQueue::finish_request() {
    busy_ = false;
    pump();
}

void NavigationRequestQueue::reject(Request& request, const PageError& error) {
    if (request.on_error) {
        request.on_error(error);
    }
}

// ============================================================================
// SHUTDOWN
// ============================================================================

void NavigationRequestQueue::shutdown() {
    std::deque<Request> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        dropped.swap(pending_);
        in_flight_.cancel();
    }

    spdlog::debug("[NavigationRequestQueue] Shut down, {} pending request(s) cancelled",
                  dropped.size());
    for (auto& request : dropped) {
        reject(request, PageError::cancelled("Queued navigation request"));
    }
}

} // namespace folio
