// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "page_transition_plan.h"

#include <spdlog/spdlog.h>

#include <functional>
#include <utility>

namespace folio {

namespace {

/**
 * @brief Waits for the enter and exit halves of one transition
 *
 * The first CANCELLED result aborts the partner through abort_. The joined
 * result is reported once both halves have called back.
 */
class TransitionJoin : public std::enable_shared_from_this<TransitionJoin> {
  public:
    TransitionJoin(const CancellationToken& caller, std::function<void(AnimationResult)> on_joined)
        : token_(CancellationToken::linked(caller, abort_.token())),
          on_joined_(std::move(on_joined)) {}

    const CancellationToken& token() const {
        return token_;
    }

    AnimationDoneCallback arm() {
        auto self = shared_from_this();
        return [self](AnimationResult result) { self->half_done(result); };
    }

  private:
    void half_done(AnimationResult result) {
        if (result == AnimationResult::CANCELLED && !cancelled_) {
            cancelled_ = true;
            abort_.cancel();
        }
        if (--remaining_ == 0) {
            auto cb = std::move(on_joined_);
            if (cb) {
                cb(cancelled_ ? AnimationResult::CANCELLED : AnimationResult::COMPLETED);
            }
        }
    }

    CancellationSource abort_;
    CancellationToken token_;
    std::function<void(AnimationResult)> on_joined_;
    int remaining_ = 2;
    bool cancelled_ = false;
};

void complete_immediately(const AnimationDoneCallback& done) {
    if (done) {
        done(AnimationResult::COMPLETED);
    }
}

} // namespace

// ============================================================================
// PUSH
// ============================================================================

PushTransitionPlan PushTransitionPlan::create(const std::string& entering_id,
                                              Page* entering_page, const PageRecordList& stack) {
    PushTransitionPlan plan;
    plan.entering_ = PlanEntry{entering_id, entering_page};
    if (!stack.empty()) {
        const auto& top = stack.back();
        plan.exiting_ = PlanEntry{top->page_id, top->instance.get()};
        plan.exiting_stacked_ = top->stacked;
    }
    return plan;
}

void PushTransitionPlan::run(bool play_animation, const TransitionAnimationSet& animations,
                             const CancellationToken& token, AnimationDoneCallback done) const {
    if (token.is_cancelled()) {
        if (done) {
            done(AnimationResult::CANCELLED);
        }
        return;
    }

    Page* enter_page = entering_.page;
    Page* exit_page = exiting_.page;
    spdlog::trace("[PushTransitionPlan] {} -> {} (remove exiting: {})",
                  has_exiting() ? exiting_.page_id : std::string("<none>"), entering_.page_id,
                  exiting_is_removed());

    if (exit_page) {
        exit_page->before_exit();
    }
    enter_page->before_enter();

    auto join = std::make_shared<TransitionJoin>(
        token, [exit_page, done = std::move(done)](AnimationResult result) {
            if (result == AnimationResult::COMPLETED && exit_page) {
                exit_page->after_exit();
            }
            if (done) {
                done(result);
            }
        });

    // Both halves start in this frame
    auto exit_done = join->arm();
    auto enter_done = join->arm();
    if (exit_page) {
        exit_page->exit(true, play_animation, animations, join->token(), std::move(exit_done));
    } else {
        complete_immediately(exit_done);
    }
    enter_page->enter(true, play_animation, animations, join->token(), std::move(enter_done));
}

// ============================================================================
// POP
// ============================================================================

PopTransitionPlan PopTransitionPlan::create(const PageRecordList& stack, size_t pop_count) {
    PopTransitionPlan plan;
    const size_t size = stack.size();
    if (pop_count > size) {
        pop_count = size;
    }

    plan.exiting_.reserve(pop_count);
    for (size_t i = 0; i < pop_count; ++i) {
        const auto& record = stack[size - 1 - i];
        plan.exiting_.push_back(PlanEntry{record->page_id, record->instance.get()});
    }

    if (size > pop_count) {
        const auto& record = stack[size - pop_count - 1];
        plan.entering_ = PlanEntry{record->page_id, record->instance.get()};
    }
    return plan;
}

void PopTransitionPlan::run(bool play_animation, const TransitionAnimationSet& animations,
                            const CancellationToken& token, AnimationDoneCallback done) const {
    if (token.is_cancelled() || exiting_.empty()) {
        if (done) {
            done(exiting_.empty() ? AnimationResult::COMPLETED : AnimationResult::CANCELLED);
        }
        return;
    }

    spdlog::trace("[PopTransitionPlan] {} page(s) exit, {} enters", exiting_.size(),
                  has_entering() ? entering_.page_id : std::string("<none>"));

    for (const auto& entry : exiting_) {
        entry.page->before_exit();
    }
    Page* enter_page = entering_.page;
    if (enter_page) {
        enter_page->before_enter();
    }

    std::vector<Page*> exit_pages;
    exit_pages.reserve(exiting_.size());
    for (const auto& entry : exiting_) {
        exit_pages.push_back(entry.page);
    }

    auto join = std::make_shared<TransitionJoin>(
        token, [exit_pages, done = std::move(done)](AnimationResult result) {
            if (result == AnimationResult::COMPLETED) {
                for (Page* page : exit_pages) {
                    page->after_exit();
                }
            }
            if (done) {
                done(result);
            }
        });

    // Pages below the top leave with the group, without their own animation
    for (size_t i = 1; i < exit_pages.size(); ++i) {
        exit_pages[i]->exit(false, false, animations, join->token(), nullptr);
    }

    auto exit_done = join->arm();
    auto enter_done = join->arm();
    exit_pages.front()->exit(false, play_animation, animations, join->token(),
                             std::move(exit_done));
    if (enter_page) {
        enter_page->enter(false, play_animation, animations, join->token(),
                          std::move(enter_done));
    } else {
        complete_immediately(enter_done);
    }
}

} // namespace folio
