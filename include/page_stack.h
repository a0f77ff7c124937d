// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file page_stack.h
 * @brief Ordered stack of full-screen pages with animated push/pop transitions
 *
 * @pattern One transition at a time. Each push or pop runs
 *          accept → load → plan → lifecycle/animate → mutate → dispose, and
 *          reports through a success or error callback.
 * @threading LVGL thread only. Use NavigationRequestQueue to submit from
 *            other threads or to queue requests behind a running transition.
 * @gotchas A direct call while a transition is running is rejected with
 *          PRECONDITION_VIOLATION rather than queued. Introspection only ever
 *          shows committed state. Asset loads are shared between a push and a
 *          preload of the same key; a timer polls their tokens while a load is
 *          pending so a cancelled caller hears back without waiting for the
 *          backend.
 */

#pragma once

#include "asset_backend.h"
#include "asset_handle.h"
#include "cancellation_token.h"
#include "page_error.h"
#include "page_factory.h"
#include "page_record.h"
#include "page_transition_plan.h"
#include "transition_animation_set.h"

#include "lvgl/lvgl.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace folio {

/// Period of the timer that checks pending loads for cancelled callers
constexpr uint32_t LOAD_WATCH_PERIOD_MS = 16;

/**
 * @brief Parameters of one push
 */
struct PushRequest {
    std::string resource_key;
    bool play_animation = true;
    bool stack = true;   ///< Keep this page when a later page is pushed over it
    std::string page_id; ///< Empty: generate one
};

/// Reports the id and instance of a pushed page
using PushCallback = std::function<void(const std::string& page_id, Page* page)>;

/**
 * @brief Navigation stack of pages living under one LVGL container
 *
 * Usage:
 * @code
 * PrefabRegistryBackend backend;
 * backend.register_page<HomePage>();
 * PrefabPageFactory factory;
 * PageStack stack(lv_screen_active(), backend, factory);
 *
 * stack.push({"home", false, true, ""},
 *            [](const std::string& id, Page*) { spdlog::info("home is {}", id); },
 *            [](const PageError& e) { spdlog::error("{}", e.message); });
 * @endcode
 */
class PageStack {
  public:
    PageStack(lv_obj_t* container, IAssetBackend& backend, IPageFactory& factory,
              TransitionAnimationSet animations = TransitionAnimationSet());
    ~PageStack();

    PageStack(const PageStack&) = delete;
    PageStack& operator=(const PageStack&) = delete;

    //
    // === Navigation ===
    //

    /**
     * @brief Load, construct and transition to a new page
     *
     * The previous top stays resident if it was pushed with stack=true,
     * otherwise it is removed and disposed after the transition.
     *
     * @param request Resource key, animation, stacking and optional page id
     * @param on_pushed Called after the stack was mutated
     * @param on_error PRECONDITION_VIOLATION, RESOURCE_LOAD_FAILURE or CANCELLED
     * @param token Cancels the load and the animations; ignored once committed
     */
    void push(const PushRequest& request, PushCallback on_pushed, ErrorCallback on_error,
              const CancellationToken& token = CancellationToken());

    /**
     * @brief Remove the top @p count pages
     *
     * Only the top page's exit animation plays. The page beneath enters and
     * counts as stacked from then on.
     */
    void pop(bool play_animation, int count, SuccessCallback on_done, ErrorCallback on_error,
             const CancellationToken& token = CancellationToken());

    /**
     * @brief Pop until @p destination_page_id is the current page
     *
     * Succeeds without a transition if it is already current. An unknown id
     * is a PRECONDITION_VIOLATION.
     */
    void pop_to(bool play_animation, const std::string& destination_page_id,
                SuccessCallback on_done, ErrorCallback on_error,
                const CancellationToken& token = CancellationToken());

    //
    // === Preloading ===
    //

    /**
     * @brief Load an asset ahead of time and keep it outside the stack
     *
     * Later pushes of @p key reuse the handle and never release it. Fails
     * with DUPLICATE_PRELOAD if the key is preloaded or being preloaded.
     * Allowed while a transition runs.
     */
    void preload_asset(const std::string& key, SuccessCallback on_done, ErrorCallback on_error,
                       const CancellationToken& token = CancellationToken());

    /**
     * @brief Release a preloaded asset
     * @return false if @p key was not preloaded
     */
    bool unload_preloaded(const std::string& key);

    bool is_preloaded(const std::string& key) const;

    //
    // === Introspection (committed state) ===
    //

    std::optional<PageStackInfo> current() const;

    /// Oldest first
    std::vector<PageStackInfo> history() const;

    size_t page_count() const {
        return records_.size();
    }

    Page* current_page() const;

    /// nullptr if no resident page has that id
    Page* find_page(const std::string& page_id) const;

    bool is_in_transition() const {
        return active_ != nullptr;
    }

    /// Int subject: 1 while idle, 0 from acceptance until disposal finishes
    lv_subject_t* get_interactive_subject() {
        return &interactive_subject_;
    }

    bool is_interactive() const;

    lv_obj_t* get_container() const {
        return container_;
    }

    const TransitionAnimationSet& get_animations() const {
        return animations_;
    }

    /// Applies from the next transition on
    void set_animations(TransitionAnimationSet animations);

    //
    // === Teardown ===
    //

    /**
     * @brief Dispose every page and release every asset. Idempotent.
     *
     * A running transition is cancelled and its caller gets CANCELLED.
     * Later requests fail with CANCELLED.
     */
    void shutdown();

    bool is_shut_down() const {
        return shut_down_;
    }

  private:
    struct ActiveTransition {
        uint64_t serial = 0;
        CancellationSource source;
        CancellationToken token; ///< Caller token linked with source
        ErrorCallback on_error;
        std::string label;
        std::unique_ptr<PageRecord> entering; ///< Push only, until committed
    };

    bool check_accepting(const char* what, const ErrorCallback& on_error,
                         const CancellationToken& token) const;
    ActiveTransition& begin_transition(const std::string& label, ErrorCallback on_error,
                                       const CancellationToken& token);
    /// Clears the running transition and restores interactivity
    void end_transition();
    bool is_current_transition(uint64_t serial) const;
    void fail_transition(const PageError& error);

    void on_push_asset_loaded(uint64_t serial, const PushRequest& request,
                              const AssetPtr& asset, PushCallback on_pushed);
    void commit_push(const PushRequest& request, bool exiting_removed, PushCallback on_pushed);
    void cancel_push();
    void start_pop(bool play_animation, size_t count, SuccessCallback on_done,
                   ErrorCallback on_error, const CancellationToken& token);
    void commit_pop(size_t count, SuccessCallback on_done);
    void cancel_pop(const PopTransitionPlan& plan);

    void watch_pending_loads();
    void stop_load_watch();
    bool has_pending_loads() const;
    /// Fails cancelled callers of every pending load
    void poll_pending_loads();
    static void load_watch_cb(lv_timer_t* timer);

    void place_page(Page* page);
    std::string generate_page_id();
    bool has_page_id(const std::string& page_id) const;
    void set_interactive(bool interactive);

    lv_obj_t* container_;
    IAssetBackend& backend_;
    IPageFactory& factory_;
    TransitionAnimationSet animations_;

    PageRecordList records_;
    std::map<std::string, std::shared_ptr<AssetHandle>> preloaded_;
    lv_timer_t* load_watch_timer_ = nullptr;

    std::unique_ptr<ActiveTransition> active_;
    uint64_t next_serial_ = 1;
    uint64_t next_page_number_ = 1;
    std::mt19937 id_rng_{std::random_device{}()};

    lv_subject_t interactive_subject_{};
    bool subjects_initialized_ = false;
    bool shut_down_ = false;

    // Expires on destruction so late load and animation callbacks can tell
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace folio
