// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cancellation_token.h"
#include "page_transition_animation.h"
#include "transition_animation_set.h"

#include "lvgl/lvgl.h"

#include <memory>

namespace folio {

/**
 * @file page.h
 * @brief Base class for navigable full-screen pages
 *
 * A Page owns one LVGL root object (its surface) and implements the lifecycle
 * a PageStack drives during a transition:
 *
 *   push:  after_load → [exit: before_exit] → before_enter → enter ‖ exit → [after_exit]
 *   pop:   before_exit (all) → before_enter → enter ‖ exit (top) → after_exit (all)
 *
 * The base implementation handles visibility, opacity, fill-parent layout and
 * animation. Concrete pages customise through the protected on_*() hooks.
 *
 * ## Usage Pattern:
 *
 * @code
 * class SettingsPage : public Page {
 *   public:
 *     static constexpr const char* RESOURCE_KEY = "settings";
 *
 *     explicit SettingsPage(lv_obj_t* parent) : Page(lv_obj_create(parent)) {
 *         lv_label_set_text(lv_label_create(get_surface()), "Settings");
 *     }
 *     const char* get_name() const override { return "Settings Page"; }
 *
 *   protected:
 *     void on_before_enter() override { refresh(); }
 * };
 * @endcode
 */
class Page {
  public:
    /**
     * @brief Take ownership of a root object
     * @param surface Root object, deleted with the page
     */
    explicit Page(lv_obj_t* surface);

    /// Stops in-flight animations and deletes the surface
    virtual ~Page();

    Page(const Page&) = delete;
    Page& operator=(const Page&) = delete;

    /// Human-readable name for logging
    virtual const char* get_name() const {
        return "Page";
    }

    lv_obj_t* get_surface() const {
        return surface_;
    }

    /// Lower values render behind higher values among pages of one stack
    int get_rendering_order() const {
        return rendering_order_;
    }

    void set_rendering_order(int order) {
        rendering_order_ = order;
    }

    //
    // === Lifecycle (driven by PageStack) ===
    //

    /**
     * @brief Attach the freshly built page to the stack container
     *
     * Fills the parent and starts fully transparent. Z-ordering among
     * sibling pages is done by the stack.
     */
    virtual void after_load(lv_obj_t* parent);

    /// Show at opacity 0, filling the parent
    virtual void before_enter();

    /**
     * @brief Become the visible page
     *
     * Sets opacity 1, plays the enter animation when @p animate, then snaps
     * back to fill the parent.
     */
    virtual void enter(bool is_push, bool animate, const TransitionAnimationSet& animations,
                       const CancellationToken& token, AnimationDoneCallback done);

    /// Show at opacity 1, filling the parent
    virtual void before_exit();

    /**
     * @brief Leave the screen
     *
     * Plays the exit animation when @p animate, then sets opacity 0.
     */
    virtual void exit(bool is_push, bool animate, const TransitionAnimationSet& animations,
                      const CancellationToken& token, AnimationDoneCallback done);

    /// Hide the surface
    virtual void after_exit();

    /**
     * @brief Return to the resting state of a current page
     *
     * Used when a transition is cancelled and this page stays on top.
     */
    void restore_visible();

    /// Return to the resting state of a page covered by another
    void restore_hidden();

    bool is_visible() const;

  protected:
    //
    // === Optional hooks (default: nothing) ===
    //

    virtual void on_after_load() {}
    virtual void on_before_enter() {}
    virtual void on_entered() {}
    virtual void on_before_exit() {}
    virtual void on_exited() {}
    virtual void on_after_exit() {}

    void fill_parent();

  private:
    void set_opacity(float opacity);

    lv_obj_t* surface_ = nullptr;
    lv_obj_t* parent_ = nullptr;
    int rendering_order_ = 0;

    // Cancelled in the destructor so frame timers stop before the surface dies
    CancellationSource lifetime_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace folio
