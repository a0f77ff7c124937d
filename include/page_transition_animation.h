// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file page_transition_animation.h
 * @brief Timed visual effects played on a page surface during a transition
 *
 * @pattern Stateless strategy objects; every play() call gets its own frame timer.
 * @threading LVGL thread only.
 * @gotchas done() fires exactly once, possibly synchronously (NopTransitionAnimation).
 *          Cancellation is checked at the start of every frame, before the surface is
 *          touched, so cancel the token before deleting a surface that is animating.
 */

#pragma once

#include "cancellation_token.h"

#include "lvgl/lvgl.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace folio {

enum class AnimationResult {
    COMPLETED, ///< Ran to the end, final value applied
    CANCELLED  ///< Stopped early, visual state unspecified
};

using AnimationDoneCallback = std::function<void(AnimationResult)>;

/**
 * @brief Interface for transition effects
 */
class IPageTransitionAnimation {
  public:
    virtual ~IPageTransitionAnimation() = default;

    /**
     * @brief Play the effect on a surface
     *
     * @param surface Root object of the page being animated
     * @param token Cancellation, polled once per frame
     * @param done Completion callback
     */
    virtual void play(lv_obj_t* surface, const CancellationToken& token,
                      AnimationDoneCallback done) const = 0;

    /// Short name for logging ("nop", "wait", "alpha", "linear")
    virtual const char* get_name() const = 0;
};

using TransitionAnimationPtr = std::shared_ptr<const IPageTransitionAnimation>;

/// Position expressed as a multiple of the parent's size (1, 0 = one width to the right)
struct Anchor {
    float x = 0.0f;
    float y = 0.0f;
};

/**
 * @brief Completes immediately
 */
class NopTransitionAnimation : public IPageTransitionAnimation {
  public:
    void play(lv_obj_t* surface, const CancellationToken& token,
              AnimationDoneCallback done) const override;
    const char* get_name() const override {
        return "nop";
    }
};

/**
 * @brief Waits a fixed duration without visual change
 *
 * Used to keep one side of a transition in step with a partner animation.
 */
class WaitTransitionAnimation : public IPageTransitionAnimation {
  public:
    explicit WaitTransitionAnimation(uint32_t duration_ms) : duration_ms_(duration_ms) {}

    void play(lv_obj_t* surface, const CancellationToken& token,
              AnimationDoneCallback done) const override;
    const char* get_name() const override {
        return "wait";
    }

    uint32_t duration_ms() const {
        return duration_ms_;
    }

  private:
    uint32_t duration_ms_;
};

/**
 * @brief Linear opacity fade
 *
 * Endpoints are clamped to [0, 1]. The last frame sets exactly @p to.
 */
class AlphaTransitionAnimation : public IPageTransitionAnimation {
  public:
    AlphaTransitionAnimation(float from, float to, uint32_t duration_ms);

    void play(lv_obj_t* surface, const CancellationToken& token,
              AnimationDoneCallback done) const override;
    const char* get_name() const override {
        return "alpha";
    }

    float from() const {
        return from_;
    }
    float to() const {
        return to_;
    }
    uint32_t duration_ms() const {
        return duration_ms_;
    }

  private:
    float from_;
    float to_;
    uint32_t duration_ms_;
};

/**
 * @brief Linear slide between two anchors
 *
 * Offsets are resolved against the parent's size when play() starts and
 * applied as translate_x/translate_y. The last frame sets exactly the target.
 */
class LinearTransitionAnimation : public IPageTransitionAnimation {
  public:
    LinearTransitionAnimation(Anchor from, Anchor to, uint32_t duration_ms)
        : from_(from), to_(to), duration_ms_(duration_ms) {}

    void play(lv_obj_t* surface, const CancellationToken& token,
              AnimationDoneCallback done) const override;
    const char* get_name() const override {
        return "linear";
    }

    Anchor from() const {
        return from_;
    }
    Anchor to() const {
        return to_;
    }
    uint32_t duration_ms() const {
        return duration_ms_;
    }

  private:
    Anchor from_;
    Anchor to_;
    uint32_t duration_ms_;
};

/// Frame period for transition timers
constexpr uint32_t TRANSITION_FRAME_PERIOD_MS = 16;

/**
 * @brief Stop every running transition animation
 *
 * Each one reports CANCELLED, leaving its surface at the last frame applied.
 * Call before lv_deinit(); calling after it only frees the bookkeeping.
 */
void stop_all_transition_animations();

size_t running_transition_animation_count();

/// Opacity in [0, 1] to LVGL opacity
lv_opa_t opacity_to_lv(float opacity);

namespace transitions {

TransitionAnimationPtr nop();
TransitionAnimationPtr wait(uint32_t duration_ms);
TransitionAnimationPtr alpha(float from, float to, uint32_t duration_ms);
TransitionAnimationPtr alpha_in(uint32_t duration_ms);
TransitionAnimationPtr alpha_out(uint32_t duration_ms);
TransitionAnimationPtr linear(Anchor from, Anchor to, uint32_t duration_ms);
TransitionAnimationPtr linear_from_right_to_center(uint32_t duration_ms);
TransitionAnimationPtr linear_from_center_to_left(uint32_t duration_ms);
TransitionAnimationPtr linear_from_left_to_center(uint32_t duration_ms);
TransitionAnimationPtr linear_from_center_to_right(uint32_t duration_ms);

} // namespace transitions

} // namespace folio
