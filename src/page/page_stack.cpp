// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "page_stack.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace folio {

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

PageStack::PageStack(lv_obj_t* container, IAssetBackend& backend, IPageFactory& factory,
                     TransitionAnimationSet animations)
    : container_(container), backend_(backend), factory_(factory),
      animations_(std::move(animations)) {
    lv_subject_init_int(&interactive_subject_, 1);
    subjects_initialized_ = true;
    spdlog::debug("[PageStack] Created on container {}", (void*)container_);
}

PageStack::~PageStack() {
    shutdown();
    if (subjects_initialized_ && lv_is_initialized()) {
        lv_subject_deinit(&interactive_subject_);
    }
    subjects_initialized_ = false;
    alive_.reset();
    spdlog::trace("[PageStack] Destroyed");
}

// ============================================================================
// TRANSITION BOOKKEEPING
// ============================================================================

bool PageStack::check_accepting(const char* what, const ErrorCallback& on_error,
                                const CancellationToken& token) const {
    PageError error;
    if (shut_down_) {
        error = PageError::cancelled(std::string(what) + " on a shut down stack");
    } else if (active_) {
        spdlog::warn("[PageStack] {} rejected: {} is in progress", what, active_->label);
        error = PageError::precondition(std::string("Cannot ") + what +
                                        " while a transition is in progress");
    } else if (token.is_cancelled()) {
        error = PageError::cancelled(what);
    } else {
        return true;
    }

    if (on_error) {
        on_error(error);
    }
    return false;
}

PageStack::ActiveTransition& PageStack::begin_transition(const std::string& label,
                                                         ErrorCallback on_error,
                                                         const CancellationToken& token) {
    auto active = std::make_unique<ActiveTransition>();
    active->serial = next_serial_++;
    active->token = CancellationToken::linked(token, active->source.token());
    active->on_error = std::move(on_error);
    active->label = label;
    active_ = std::move(active);

    set_interactive(false);
    spdlog::debug("[PageStack] Begin {}", label);
    return *active_;
}

void PageStack::end_transition() {
    active_.reset();
    set_interactive(true);
}

bool PageStack::is_current_transition(uint64_t serial) const {
    return active_ && active_->serial == serial;
}

void PageStack::fail_transition(const PageError& error) {
    auto active = std::move(active_);
    if (active->entering) {
        active->entering->dispose();
    }
    end_transition();

    if (error.is_cancellation()) {
        spdlog::debug("[PageStack] {} cancelled", active->label);
    } else {
        spdlog::error("[PageStack] {} failed: {}", active->label, error.message);
    }
    if (active->on_error) {
        active->on_error(error);
    }
}

void PageStack::set_interactive(bool interactive) {
    if (!lv_is_initialized()) {
        return;
    }
    if (subjects_initialized_) {
        lv_subject_set_int(&interactive_subject_, interactive ? 1 : 0);
    }
    if (container_ && lv_obj_is_valid(container_)) {
        if (interactive) {
            lv_obj_remove_state(container_, LV_STATE_DISABLED);
        } else {
            lv_obj_add_state(container_, LV_STATE_DISABLED);
        }
    }
}

bool PageStack::is_interactive() const {
    return active_ == nullptr;
}

void PageStack::set_animations(TransitionAnimationSet animations) {
    animations_ = std::move(animations);
}

// ============================================================================
// PUSH
// ============================================================================

void PageStack::push(const PushRequest& request, PushCallback on_pushed, ErrorCallback on_error,
                     const CancellationToken& token) {
    if (!check_accepting("push", on_error, token)) {
        return;
    }
    if (request.resource_key.empty()) {
        spdlog::warn("[PageStack] push rejected: empty resource key");
        if (on_error) {
            on_error(PageError::precondition("Resource key must not be empty"));
        }
        return;
    }
    if (!request.page_id.empty() && has_page_id(request.page_id)) {
        spdlog::warn("[PageStack] push rejected: page id '{}' already in use", request.page_id);
        if (on_error) {
            PageError err = PageError::precondition("Page id '" + request.page_id +
                                                    "' is already in the stack");
            err.page_id = request.page_id;
            on_error(err);
        }
        return;
    }

    PushRequest resolved = request;
    if (resolved.page_id.empty()) {
        resolved.page_id = generate_page_id();
    }

    auto& active = begin_transition("push '" + resolved.resource_key + "' as " + resolved.page_id,
                                    std::move(on_error), token);
    const uint64_t serial = active.serial;
    const CancellationToken op_token = active.token;

    auto record = std::make_unique<PageRecord>();
    record->resource_key = resolved.resource_key;
    record->page_id = resolved.page_id;
    record->stacked = resolved.stack;
    auto preloaded = preloaded_.find(resolved.resource_key);
    if (preloaded != preloaded_.end()) {
        spdlog::trace("[PageStack] Using preloaded asset '{}'", resolved.resource_key);
        record->asset_handle = preloaded->second;
        record->preloaded = true;
    } else {
        record->asset_handle = std::make_shared<AssetHandle>(resolved.resource_key, backend_);
    }
    auto handle = record->asset_handle;
    active.entering = std::move(record);

    // May complete synchronously; `active` must not be touched past this point
    std::weak_ptr<bool> weak_alive = alive_;
    handle->load(
        [this, weak_alive, serial, resolved, handle,
         on_pushed = std::move(on_pushed)](const AssetPtr& asset) {
            if (weak_alive.expired() || !is_current_transition(serial)) {
                return;
            }
            on_push_asset_loaded(serial, resolved, asset, on_pushed);
        },
        [this, weak_alive, serial, handle](const PageError& error) {
            if (weak_alive.expired() || !is_current_transition(serial)) {
                return;
            }
            if (error.is_cancellation()) {
                cancel_push();
            } else {
                fail_transition(error);
            }
        },
        op_token);

    if (is_current_transition(serial) && handle->is_loading()) {
        watch_pending_loads();
    }
}

void PageStack::on_push_asset_loaded(uint64_t serial, const PushRequest& request,
                                     const AssetPtr& asset, PushCallback on_pushed) {
    if (active_->token.is_cancelled()) {
        cancel_push();
        return;
    }

    std::unique_ptr<Page> page;
    try {
        page = factory_.instantiate(asset, container_);
    } catch (const std::exception& e) {
        fail_transition(PageError::load_failure(
            request.resource_key, "Page construction for '" + request.resource_key +
                                      "' threw: " + e.what()));
        return;
    }
    if (!page) {
        fail_transition(PageError::load_failure(
            request.resource_key, "Could not instantiate page for '" + request.resource_key + "'"));
        return;
    }

    Page* entering = page.get();
    active_->entering->instance = std::move(page);
    entering->after_load(container_);
    place_page(entering);

    auto plan = PushTransitionPlan::create(request.page_id, entering, records_);
    const bool exiting_removed = plan.exiting_is_removed();

    std::weak_ptr<bool> weak_alive = alive_;
    plan.run(request.play_animation, animations_, active_->token,
             [this, weak_alive, serial, request, exiting_removed,
              on_pushed = std::move(on_pushed)](AnimationResult result) {
                 if (weak_alive.expired() || !is_current_transition(serial)) {
                     return;
                 }
                 if (result == AnimationResult::CANCELLED) {
                     cancel_push();
                 } else {
                     commit_push(request, exiting_removed, on_pushed);
                 }
             });
}

void PageStack::commit_push(const PushRequest& request, bool exiting_removed,
                            PushCallback on_pushed) {
    auto active = std::move(active_);

    // Detach first, dispose after
    std::unique_ptr<PageRecord> superseded;
    if (exiting_removed && !records_.empty()) {
        superseded = std::move(records_.back());
        records_.pop_back();
    }
    Page* page = active->entering->instance.get();
    records_.push_back(std::move(active->entering));

    if (superseded) {
        spdlog::debug("[PageStack] Disposing superseded page {} ('{}')", superseded->page_id,
                      superseded->resource_key);
        superseded->dispose();
    }
    end_transition();

    spdlog::debug("[PageStack] Pushed {} ('{}'), depth {}", request.page_id,
                  request.resource_key, records_.size());
    if (on_pushed) {
        on_pushed(request.page_id, page);
    }
}

void PageStack::cancel_push() {
    auto active = std::move(active_);
    if (active->entering) {
        active->entering->dispose();
    }
    if (!records_.empty() && records_.back()->instance) {
        records_.back()->instance->restore_visible();
    }
    end_transition();

    spdlog::debug("[PageStack] {} cancelled, stack unchanged", active->label);
    if (active->on_error) {
        active->on_error(PageError::cancelled(active->label));
    }
}

// ============================================================================
// POP
// ============================================================================

void PageStack::pop(bool play_animation, int count, SuccessCallback on_done,
                    ErrorCallback on_error, const CancellationToken& token) {
    if (!check_accepting("pop", on_error, token)) {
        return;
    }
    if (count < 1 || static_cast<size_t>(count) > records_.size()) {
        spdlog::warn("[PageStack] pop rejected: cannot pop {} page(s) from a stack of {}", count,
                     records_.size());
        if (on_error) {
            on_error(PageError::precondition(fmt::format(
                "Cannot pop {} page(s) from a stack of {}", count, records_.size())));
        }
        return;
    }
    start_pop(play_animation, static_cast<size_t>(count), std::move(on_done), std::move(on_error),
              token);
}

void PageStack::pop_to(bool play_animation, const std::string& destination_page_id,
                       SuccessCallback on_done, ErrorCallback on_error,
                       const CancellationToken& token) {
    if (!check_accepting("pop_to", on_error, token)) {
        return;
    }

    size_t index = records_.size();
    for (size_t i = 0; i < records_.size(); ++i) {
        if (records_[i]->page_id == destination_page_id) {
            index = i;
            break;
        }
    }
    if (index == records_.size()) {
        spdlog::warn("[PageStack] pop_to rejected: no page '{}' in the stack",
                     destination_page_id);
        if (on_error) {
            PageError err = PageError::precondition("The destination page '" +
                                                    destination_page_id + "' was not found");
            err.page_id = destination_page_id;
            on_error(err);
        }
        return;
    }

    const size_t count = records_.size() - 1 - index;
    if (count == 0) {
        spdlog::debug("[PageStack] pop_to: '{}' is already current", destination_page_id);
        if (on_done) {
            on_done();
        }
        return;
    }
    start_pop(play_animation, count, std::move(on_done), std::move(on_error), token);
}

void PageStack::start_pop(bool play_animation, size_t count, SuccessCallback on_done,
                          ErrorCallback on_error, const CancellationToken& token) {
    auto& active = begin_transition(fmt::format("pop {} of {}", count, records_.size()),
                                    std::move(on_error), token);
    const uint64_t serial = active.serial;
    const CancellationToken op_token = active.token;

    auto plan = PopTransitionPlan::create(records_, count);

    std::weak_ptr<bool> weak_alive = alive_;
    plan.run(play_animation, animations_, op_token,
             [this, weak_alive, serial, count, plan,
              on_done = std::move(on_done)](AnimationResult result) {
                 if (weak_alive.expired() || !is_current_transition(serial)) {
                     return;
                 }
                 if (result == AnimationResult::CANCELLED) {
                     cancel_pop(plan);
                 } else {
                     commit_pop(count, on_done);
                 }
             });
}

void PageStack::commit_pop(size_t count, SuccessCallback on_done) {
    auto active = std::move(active_);

    PageRecordList removed;
    removed.reserve(count);
    for (size_t i = 0; i < count && !records_.empty(); ++i) {
        removed.push_back(std::move(records_.back()));
        records_.pop_back();
    }
    // A page popped back to is always kept
    if (!records_.empty()) {
        records_.back()->stacked = true;
    }

    for (auto& record : removed) {
        spdlog::trace("[PageStack] Disposing popped page {} ('{}')", record->page_id,
                      record->resource_key);
        record->dispose();
    }
    removed.clear();
    end_transition();

    spdlog::debug("[PageStack] Popped {} page(s), depth {}", count, records_.size());
    if (on_done) {
        on_done();
    }
}

void PageStack::cancel_pop(const PopTransitionPlan& plan) {
    auto active = std::move(active_);

    const auto& exiting = plan.exiting();
    for (size_t i = 0; i < exiting.size(); ++i) {
        if (i == 0) {
            exiting[i].page->restore_visible();
        } else {
            exiting[i].page->restore_hidden();
        }
    }
    if (plan.has_entering()) {
        plan.entering().page->restore_hidden();
    }
    end_transition();

    spdlog::debug("[PageStack] {} cancelled, stack unchanged", active->label);
    if (active->on_error) {
        active->on_error(PageError::cancelled(active->label));
    }
}

// ============================================================================
// PRELOADING
// ============================================================================

void PageStack::preload_asset(const std::string& key, SuccessCallback on_done,
                              ErrorCallback on_error, const CancellationToken& token) {
    PageError error;
    if (shut_down_) {
        error = PageError::cancelled("preload on a shut down stack");
    } else if (key.empty()) {
        error = PageError::precondition("Resource key must not be empty");
    } else if (preloaded_.count(key) > 0) {
        spdlog::warn("[PageStack] preload rejected: '{}' already preloaded", key);
        error = PageError::duplicate_preload(key);
    } else if (token.is_cancelled()) {
        error = PageError::cancelled("Preload of '" + key + "'");
    }
    if (error.has_error()) {
        if (on_error) {
            on_error(error);
        }
        return;
    }

    auto handle = std::make_shared<AssetHandle>(key, backend_);
    preloaded_[key] = handle;
    spdlog::debug("[PageStack] Preloading '{}'", key);

    std::weak_ptr<bool> weak_alive = alive_;
    handle->load(
        [key, on_done = std::move(on_done)](const AssetPtr&) {
            spdlog::debug("[PageStack] Preloaded '{}'", key);
            if (on_done) {
                on_done();
            }
        },
        [this, weak_alive, key, handle, on_error = std::move(on_error)](const PageError& err) {
            bool handed_over = false;
            if (!weak_alive.expired()) {
                auto it = preloaded_.find(key);
                if (it != preloaded_.end() && it->second == handle) {
                    preloaded_.erase(it);
                }
                // A push joined this load; its record owns the handle from now on
                if (active_ && active_->entering && active_->entering->asset_handle == handle) {
                    active_->entering->preloaded = false;
                    handed_over = true;
                }
            }
            if (handed_over) {
                spdlog::debug("[PageStack] Preload of '{}' ended, the running push keeps the asset",
                              key);
            } else {
                handle->release();
            }
            if (on_error) {
                on_error(err);
            }
        },
        token);

    if (handle->is_loading()) {
        watch_pending_loads();
    }
}

bool PageStack::unload_preloaded(const std::string& key) {
    auto it = preloaded_.find(key);
    if (it == preloaded_.end()) {
        return false;
    }
    auto handle = std::move(it->second);
    preloaded_.erase(it);
    handle->release();
    spdlog::debug("[PageStack] Unloaded preloaded '{}'", key);
    return true;
}

bool PageStack::is_preloaded(const std::string& key) const {
    return preloaded_.count(key) > 0;
}

// ============================================================================
// LOAD WATCH
// ============================================================================

void PageStack::watch_pending_loads() {
    if (load_watch_timer_ || shut_down_) {
        return;
    }
    load_watch_timer_ = lv_timer_create(load_watch_cb, LOAD_WATCH_PERIOD_MS, this);
    if (!load_watch_timer_) {
        spdlog::warn("[PageStack] Could not create the load watch timer; cancelled loads "
                     "are reported when the backend answers");
    }
}

void PageStack::stop_load_watch() {
    if (load_watch_timer_ && lv_is_initialized()) {
        lv_timer_delete(load_watch_timer_);
    }
    load_watch_timer_ = nullptr;
}

bool PageStack::has_pending_loads() const {
    if (active_ && active_->entering && active_->entering->asset_handle &&
        active_->entering->asset_handle->is_loading()) {
        return true;
    }
    for (const auto& entry : preloaded_) {
        if (entry.second->is_loading()) {
            return true;
        }
    }
    return false;
}

void PageStack::poll_pending_loads() {
    // Callbacks may change active_ and preloaded_; hold the handles first
    std::vector<std::shared_ptr<AssetHandle>> loading;
    if (active_ && active_->entering && active_->entering->asset_handle &&
        active_->entering->asset_handle->is_loading()) {
        loading.push_back(active_->entering->asset_handle);
    }
    for (const auto& entry : preloaded_) {
        if (entry.second->is_loading()) {
            loading.push_back(entry.second);
        }
    }

    std::weak_ptr<bool> weak_alive = alive_;
    for (auto& handle : loading) {
        handle->drop_cancelled_waiters();
        if (weak_alive.expired()) {
            return;
        }
    }

    if (!has_pending_loads()) {
        stop_load_watch();
    }
}

void PageStack::load_watch_cb(lv_timer_t* timer) {
    auto* self = static_cast<PageStack*>(lv_timer_get_user_data(timer));
    if (self) {
        self->poll_pending_loads();
    }
}

// ============================================================================
// INTROSPECTION
// ============================================================================

std::optional<PageStackInfo> PageStack::current() const {
    if (records_.empty()) {
        return std::nullopt;
    }
    return records_.back()->to_info();
}

std::vector<PageStackInfo> PageStack::history() const {
    std::vector<PageStackInfo> result;
    result.reserve(records_.size());
    for (const auto& record : records_) {
        result.push_back(record->to_info());
    }
    return result;
}

Page* PageStack::current_page() const {
    return records_.empty() ? nullptr : records_.back()->instance.get();
}

Page* PageStack::find_page(const std::string& page_id) const {
    for (const auto& record : records_) {
        if (record->page_id == page_id) {
            return record->instance.get();
        }
    }
    return nullptr;
}

bool PageStack::has_page_id(const std::string& page_id) const {
    return find_page(page_id) != nullptr;
}

std::string PageStack::generate_page_id() {
    std::string id;
    do {
        id = fmt::format("page-{}-{:08x}", next_page_number_++, id_rng_());
    } while (has_page_id(id));
    return id;
}

// ============================================================================
// LAYOUT
// ============================================================================

void PageStack::place_page(Page* page) {
    lv_obj_t* surface = page->get_surface();
    if (!surface) {
        return;
    }

    // Lower rendering order draws behind
    int32_t target = -1;
    for (const auto& record : records_) {
        Page* resident = record->instance.get();
        if (!resident || !resident->get_surface() ||
            resident->get_rendering_order() <= page->get_rendering_order()) {
            continue;
        }
        int32_t index = lv_obj_get_index(resident->get_surface());
        if (target < 0 || index < target) {
            target = index;
        }
    }

    if (target >= 0) {
        lv_obj_move_to_index(surface, target);
    } else {
        lv_obj_move_foreground(surface);
    }
}

// ============================================================================
// TEARDOWN
// ============================================================================

void PageStack::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    spdlog::debug("[PageStack] Shutting down: {} page(s), {} preloaded asset(s)", records_.size(),
                  preloaded_.size());
    stop_load_watch();

    auto active = std::move(active_);
    if (active) {
        active->source.cancel();
        if (active->entering) {
            active->entering->dispose();
        }
    }

    PageRecordList resident;
    resident.swap(records_);
    for (auto it = resident.rbegin(); it != resident.rend(); ++it) {
        (*it)->dispose();
    }
    resident.clear();

    auto preloaded = std::move(preloaded_);
    preloaded_.clear();
    for (auto& entry : preloaded) {
        entry.second->release();
    }
    preloaded.clear();

    end_transition();

    if (active && active->on_error) {
        active->on_error(PageError::cancelled(active->label));
    }
}

} // namespace folio
