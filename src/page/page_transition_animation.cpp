// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "page_transition_animation.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>
#include <vector>

namespace folio {

namespace {

using FrameApplyFn = std::function<void(lv_obj_t*, float)>;

/// Per-play state of one frame timer
struct FrameContext {
    lv_obj_t* surface = nullptr;
    lv_timer_t* timer = nullptr;
    CancellationToken token;
    AnimationDoneCallback done;
    FrameApplyFn apply; // may be empty (wait)
    uint32_t start_tick = 0;
    uint32_t duration_ms = 0;
    const char* name = "";
};

// Owns every running context. LVGL 9 timers have no delete hook, so contexts
// are freed here rather than by the timer.
std::vector<std::unique_ptr<FrameContext>>& running_frames() {
    static std::vector<std::unique_ptr<FrameContext>> frames;
    return frames;
}

std::unique_ptr<FrameContext> take_frames(FrameContext* ctx) {
    auto& frames = running_frames();
    auto it = std::find_if(frames.begin(), frames.end(),
                           [ctx](const std::unique_ptr<FrameContext>& f) { return f.get() == ctx; });
    if (it == frames.end()) {
        return nullptr;
    }
    auto owned = std::move(*it);
    frames.erase(it);
    return owned;
}

bool timer_is_live(lv_timer_t* timer) {
    if (!timer || !lv_is_initialized()) {
        return false;
    }
    for (lv_timer_t* t = lv_timer_get_next(nullptr); t; t = lv_timer_get_next(t)) {
        if (t == timer) {
            return true;
        }
    }
    return false;
}

void finish_frames(FrameContext* ctx, AnimationResult result) {
    auto owned = take_frames(ctx);
    if (!owned) {
        return;
    }
    lv_timer_delete(owned->timer);
    auto done = std::move(owned->done);
    spdlog::trace("[TransitionAnimation] {} {} on {}", owned->name,
                  result == AnimationResult::COMPLETED ? "completed" : "cancelled",
                  (void*)owned->surface);
    owned.reset();
    if (done) {
        done(result);
    }
}

void frame_timer_cb(lv_timer_t* timer) {
    auto* ctx = static_cast<FrameContext*>(lv_timer_get_user_data(timer));

    // Token first: the surface may already be gone once cancellation is requested
    if (ctx->token.is_cancelled()) {
        finish_frames(ctx, AnimationResult::CANCELLED);
        return;
    }
    if (ctx->surface && !lv_obj_is_valid(ctx->surface)) {
        spdlog::warn("[TransitionAnimation] Surface {} deleted mid-animation",
                     (void*)ctx->surface);
        finish_frames(ctx, AnimationResult::CANCELLED);
        return;
    }

    float progress = 1.0f;
    if (ctx->duration_ms > 0) {
        uint32_t elapsed = lv_tick_elaps(ctx->start_tick);
        progress = std::min(1.0f, static_cast<float>(elapsed) / ctx->duration_ms);
    }

    if (ctx->apply && ctx->surface) {
        ctx->apply(ctx->surface, progress);
    }

    if (progress >= 1.0f) {
        finish_frames(ctx, AnimationResult::COMPLETED);
    }
}

void start_frames(const char* name, lv_obj_t* surface, const CancellationToken& token,
                  uint32_t duration_ms, FrameApplyFn apply, AnimationDoneCallback done) {
    if (token.is_cancelled()) {
        if (done) {
            done(AnimationResult::CANCELLED);
        }
        return;
    }

    auto ctx = std::make_unique<FrameContext>();
    ctx->surface = surface;
    ctx->token = token;
    ctx->done = std::move(done);
    ctx->apply = std::move(apply);
    ctx->start_tick = lv_tick_get();
    ctx->duration_ms = duration_ms;
    ctx->name = name;

    // First frame at progress 0 so the start value is visible immediately
    if (ctx->apply && surface) {
        ctx->apply(surface, 0.0f);
    }

    ctx->timer = lv_timer_create(frame_timer_cb, TRANSITION_FRAME_PERIOD_MS, ctx.get());
    if (!ctx->timer) {
        spdlog::error("[TransitionAnimation] Failed to create frame timer for {}", name);
        auto cb = std::move(ctx->done);
        if (ctx->apply && surface) {
            ctx->apply(surface, 1.0f);
        }
        ctx.reset();
        if (cb) {
            cb(AnimationResult::COMPLETED);
        }
        return;
    }
    spdlog::trace("[TransitionAnimation] {} started on {} ({}ms)", name, (void*)surface,
                  duration_ms);
    running_frames().push_back(std::move(ctx));
}

float clamp01(float v) {
    return std::max(0.0f, std::min(1.0f, v));
}

} // namespace

void stop_all_transition_animations() {
    auto frames = std::move(running_frames());
    running_frames().clear();
    if (!frames.empty()) {
        spdlog::debug("[TransitionAnimation] Stopping {} running animation(s)", frames.size());
    }

    for (auto& ctx : frames) {
        // lv_deinit() may already have freed the timer
        if (timer_is_live(ctx->timer)) {
            lv_timer_delete(ctx->timer);
        }
        ctx->timer = nullptr;
    }
    for (auto& ctx : frames) {
        auto done = std::move(ctx->done);
        if (done) {
            done(AnimationResult::CANCELLED);
        }
    }
}

size_t running_transition_animation_count() {
    return running_frames().size();
}

lv_opa_t opacity_to_lv(float opacity) {
    return static_cast<lv_opa_t>(std::lround(clamp01(opacity) * LV_OPA_COVER));
}

void NopTransitionAnimation::play(lv_obj_t* /*surface*/, const CancellationToken& token,
                                  AnimationDoneCallback done) const {
    if (done) {
        done(token.is_cancelled() ? AnimationResult::CANCELLED : AnimationResult::COMPLETED);
    }
}

void WaitTransitionAnimation::play(lv_obj_t* surface, const CancellationToken& token,
                                   AnimationDoneCallback done) const {
    start_frames(get_name(), surface, token, duration_ms_, nullptr, std::move(done));
}

AlphaTransitionAnimation::AlphaTransitionAnimation(float from, float to, uint32_t duration_ms)
    : from_(clamp01(from)), to_(clamp01(to)), duration_ms_(duration_ms) {}

void AlphaTransitionAnimation::play(lv_obj_t* surface, const CancellationToken& token,
                                    AnimationDoneCallback done) const {
    const float from = from_;
    const float to = to_;
    start_frames(
        get_name(), surface, token, duration_ms_,
        [from, to](lv_obj_t* obj, float progress) {
            float value = (progress >= 1.0f) ? to : from + (to - from) * progress;
            lv_obj_set_style_opa(obj, opacity_to_lv(value), LV_PART_MAIN);
        },
        std::move(done));
}

void LinearTransitionAnimation::play(lv_obj_t* surface, const CancellationToken& token,
                                     AnimationDoneCallback done) const {
    int32_t parent_w = 0;
    int32_t parent_h = 0;
    if (surface) {
        lv_obj_t* parent = lv_obj_get_parent(surface);
        if (parent) {
            lv_obj_update_layout(parent);
            parent_w = lv_obj_get_width(parent);
            parent_h = lv_obj_get_height(parent);
        }
    }

    const int32_t from_x = static_cast<int32_t>(std::lround(parent_w * from_.x));
    const int32_t from_y = static_cast<int32_t>(std::lround(parent_h * from_.y));
    const int32_t to_x = static_cast<int32_t>(std::lround(parent_w * to_.x));
    const int32_t to_y = static_cast<int32_t>(std::lround(parent_h * to_.y));

    start_frames(
        get_name(), surface, token, duration_ms_,
        [from_x, from_y, to_x, to_y](lv_obj_t* obj, float progress) {
            int32_t x = to_x;
            int32_t y = to_y;
            if (progress < 1.0f) {
                x = from_x + static_cast<int32_t>(std::lround((to_x - from_x) * progress));
                y = from_y + static_cast<int32_t>(std::lround((to_y - from_y) * progress));
            }
            lv_obj_set_style_translate_x(obj, x, LV_PART_MAIN);
            lv_obj_set_style_translate_y(obj, y, LV_PART_MAIN);
        },
        std::move(done));
}

namespace transitions {

TransitionAnimationPtr nop() {
    return std::make_shared<NopTransitionAnimation>();
}

TransitionAnimationPtr wait(uint32_t duration_ms) {
    return std::make_shared<WaitTransitionAnimation>(duration_ms);
}

TransitionAnimationPtr alpha(float from, float to, uint32_t duration_ms) {
    return std::make_shared<AlphaTransitionAnimation>(from, to, duration_ms);
}

TransitionAnimationPtr alpha_in(uint32_t duration_ms) {
    return alpha(0.0f, 1.0f, duration_ms);
}

TransitionAnimationPtr alpha_out(uint32_t duration_ms) {
    return alpha(1.0f, 0.0f, duration_ms);
}

TransitionAnimationPtr linear(Anchor from, Anchor to, uint32_t duration_ms) {
    return std::make_shared<LinearTransitionAnimation>(from, to, duration_ms);
}

TransitionAnimationPtr linear_from_right_to_center(uint32_t duration_ms) {
    return linear({1.0f, 0.0f}, {0.0f, 0.0f}, duration_ms);
}

TransitionAnimationPtr linear_from_center_to_left(uint32_t duration_ms) {
    return linear({0.0f, 0.0f}, {-1.0f, 0.0f}, duration_ms);
}

TransitionAnimationPtr linear_from_left_to_center(uint32_t duration_ms) {
    return linear({-1.0f, 0.0f}, {0.0f, 0.0f}, duration_ms);
}

TransitionAnimationPtr linear_from_center_to_right(uint32_t duration_ms) {
    return linear({0.0f, 0.0f}, {1.0f, 0.0f}, duration_ms);
}

} // namespace transitions

} // namespace folio
