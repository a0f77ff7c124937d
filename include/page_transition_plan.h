// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file page_transition_plan.h
 * @brief Which pages enter and exit for one push or pop, and the lifecycle that moves them
 *
 * @pattern Computed from a snapshot of the committed stack; run() drives the paired
 *          before/animate/after calls. Plans never mutate the stack.
 * @threading LVGL thread only.
 * @gotchas The enter and exit halves are joined, not raced: done() fires once both
 *          have finished. A cancelled half cancels its partner, and after_exit() is
 *          skipped when the transition did not complete.
 */

#pragma once

#include "cancellation_token.h"
#include "page_record.h"
#include "page_transition_animation.h"
#include "transition_animation_set.h"

#include <memory>
#include <string>
#include <vector>

namespace folio {

using PageRecordList = std::vector<std::unique_ptr<PageRecord>>;

/// A page taking part in a transition
struct PlanEntry {
    std::string page_id;
    Page* page = nullptr;
};

/**
 * @brief Push: one page enters, the current top (if any) exits
 */
class PushTransitionPlan {
  public:
    /**
     * @brief Plan a push against the committed stack
     *
     * The exiting page is the current tail. It is removed after the push iff
     * its own stacked flag is false.
     */
    static PushTransitionPlan create(const std::string& entering_id, Page* entering_page,
                                     const PageRecordList& stack);

    /**
     * @brief Run before_exit/before_enter, the joined animations, then after_exit
     */
    void run(bool play_animation, const TransitionAnimationSet& animations,
             const CancellationToken& token, AnimationDoneCallback done) const;

    const PlanEntry& entering() const {
        return entering_;
    }

    bool has_exiting() const {
        return exiting_.page != nullptr;
    }

    const PlanEntry& exiting() const {
        return exiting_;
    }

    bool exiting_is_removed() const {
        return has_exiting() && !exiting_stacked_;
    }

  private:
    PlanEntry entering_;
    PlanEntry exiting_;
    bool exiting_stacked_ = true;
};

/**
 * @brief Pop: the top pop_count pages exit, the page beneath (if any) enters
 *
 * Only the top page's exit is animated and awaited; the other exiting pages
 * are taken off screen without animation.
 */
class PopTransitionPlan {
  public:
    /**
     * @brief Plan a pop against the committed stack
     *
     * Caller guarantees 1 <= pop_count <= stack.size().
     */
    static PopTransitionPlan create(const PageRecordList& stack, size_t pop_count);

    void run(bool play_animation, const TransitionAnimationSet& animations,
             const CancellationToken& token, AnimationDoneCallback done) const;

    /// Exiting pages, top first
    const std::vector<PlanEntry>& exiting() const {
        return exiting_;
    }

    bool has_entering() const {
        return entering_.page != nullptr;
    }

    const PlanEntry& entering() const {
        return entering_;
    }

  private:
    std::vector<PlanEntry> exiting_;
    PlanEntry entering_;
};

} // namespace folio
