// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "page.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace folio {

Page::Page(lv_obj_t* surface) : surface_(surface) {
    if (!surface_) {
        spdlog::error("[Page] Constructed with a null surface");
    }
}

Page::~Page() {
    lifetime_.cancel();
    alive_.reset();

    if (surface_ && lv_is_initialized() && lv_obj_is_valid(surface_)) {
        lv_obj_delete(surface_);
    }
    surface_ = nullptr;
}

void Page::fill_parent() {
    if (!surface_) {
        return;
    }
    lv_obj_set_pos(surface_, 0, 0);
    lv_obj_set_size(surface_, LV_PCT(100), LV_PCT(100));
    lv_obj_set_style_translate_x(surface_, 0, LV_PART_MAIN);
    lv_obj_set_style_translate_y(surface_, 0, LV_PART_MAIN);
}

void Page::set_opacity(float opacity) {
    if (surface_) {
        lv_obj_set_style_opa(surface_, opacity_to_lv(opacity), LV_PART_MAIN);
    }
}

bool Page::is_visible() const {
    return surface_ && !lv_obj_has_flag(surface_, LV_OBJ_FLAG_HIDDEN);
}

void Page::after_load(lv_obj_t* parent) {
    parent_ = parent;
    if (surface_ && parent_ && lv_obj_get_parent(surface_) != parent_) {
        lv_obj_set_parent(surface_, parent_);
    }
    fill_parent();
    set_opacity(0.0f);
    spdlog::trace("[Page] {} loaded under {}", get_name(), (void*)parent_);
    on_after_load();
}

void Page::before_enter() {
    if (surface_) {
        lv_obj_remove_flag(surface_, LV_OBJ_FLAG_HIDDEN);
    }
    fill_parent();
    set_opacity(0.0f);
    on_before_enter();
}

void Page::enter(bool is_push, bool animate, const TransitionAnimationSet& animations,
                 const CancellationToken& token, AnimationDoneCallback done) {
    set_opacity(1.0f);

    if (!animate) {
        fill_parent();
        on_entered();
        if (done) {
            done(AnimationResult::COMPLETED);
        }
        return;
    }

    auto anim = animations.get(is_push, true);
    spdlog::trace("[Page] {} enter ({} {})", get_name(), is_push ? "push" : "pop",
                  anim->get_name());

    std::weak_ptr<bool> weak_alive = alive_;
    anim->play(surface_, CancellationToken::linked(token, lifetime_.token()),
               [this, weak_alive, done = std::move(done)](AnimationResult result) {
                   if (!weak_alive.expired() && result == AnimationResult::COMPLETED) {
                       fill_parent();
                       on_entered();
                   }
                   if (done) {
                       done(result);
                   }
               });
}

void Page::before_exit() {
    if (surface_) {
        lv_obj_remove_flag(surface_, LV_OBJ_FLAG_HIDDEN);
    }
    fill_parent();
    set_opacity(1.0f);
    on_before_exit();
}

void Page::exit(bool is_push, bool animate, const TransitionAnimationSet& animations,
                const CancellationToken& token, AnimationDoneCallback done) {
    if (!animate) {
        set_opacity(0.0f);
        on_exited();
        if (done) {
            done(AnimationResult::COMPLETED);
        }
        return;
    }

    auto anim = animations.get(is_push, false);
    spdlog::trace("[Page] {} exit ({} {})", get_name(), is_push ? "push" : "pop",
                  anim->get_name());

    std::weak_ptr<bool> weak_alive = alive_;
    anim->play(surface_, CancellationToken::linked(token, lifetime_.token()),
               [this, weak_alive, done = std::move(done)](AnimationResult result) {
                   if (!weak_alive.expired() && result == AnimationResult::COMPLETED) {
                       set_opacity(0.0f);
                       on_exited();
                   }
                   if (done) {
                       done(result);
                   }
               });
}

void Page::after_exit() {
    if (surface_) {
        lv_obj_add_flag(surface_, LV_OBJ_FLAG_HIDDEN);
    }
    on_after_exit();
}

void Page::restore_visible() {
    if (surface_) {
        lv_obj_remove_flag(surface_, LV_OBJ_FLAG_HIDDEN);
    }
    fill_parent();
    set_opacity(1.0f);
}

void Page::restore_hidden() {
    fill_parent();
    set_opacity(0.0f);
    if (surface_) {
        lv_obj_add_flag(surface_, LV_OBJ_FLAG_HIDDEN);
    }
}

} // namespace folio
