// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "asset_handle.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace folio {

AssetHandle::AssetHandle(std::string key, IAssetBackend& backend)
    : key_(std::move(key)), backend_(backend) {}

AssetHandle::~AssetHandle() {
    release();
}

void AssetHandle::load(LoadCallback on_loaded, ErrorCallback on_error,
                       const CancellationToken& token) {
    switch (state_) {
    case State::RELEASED:
        spdlog::warn("[AssetHandle] load('{}') on a released handle", key_);
        if (on_error) {
            on_error(PageError::precondition("Asset handle for '" + key_ + "' was released"));
        }
        return;

    case State::LOADED:
        spdlog::trace("[AssetHandle] '{}' already loaded, returning cached asset", key_);
        if (on_loaded) {
            on_loaded(asset_);
        }
        return;

    case State::LOADING:
    case State::UNLOADED:
        break;
    }

    if (token.is_cancelled()) {
        if (on_error) {
            on_error(PageError::cancelled("Load of '" + key_ + "'"));
        }
        return;
    }

    waiters_.push_back({std::move(on_loaded), std::move(on_error), token});
    if (state_ == State::LOADING) {
        spdlog::trace("[AssetHandle] '{}' load in flight, joining ({} waiting)", key_,
                      waiters_.size());
        return;
    }

    load_reissued_ = false;
    start_backend_load();
}

void AssetHandle::start_backend_load() {
    state_ = State::LOADING;
    load_source_ = CancellationSource();
    const uint64_t generation = ++load_generation_;
    spdlog::debug("[AssetHandle] Loading '{}'", key_);

    std::weak_ptr<bool> weak_alive = alive_;
    IAssetBackend* backend = &backend_;
    backend_.load_asset(
        key_,
        [this, weak_alive, backend, generation](AssetPtr asset) {
            if (weak_alive.expired()) {
                // Handle destroyed mid-load; nobody will ever release this asset
                if (asset) {
                    backend->release_asset(asset);
                }
                return;
            }
            handle_loaded(generation, std::move(asset));
        },
        [this, weak_alive, generation](const PageError& error) {
            if (weak_alive.expired()) {
                return;
            }
            handle_failed(generation, error);
        },
        load_source_.token());
}

void AssetHandle::handle_loaded(uint64_t generation, AssetPtr asset) {
    if (generation != load_generation_ || state_ != State::LOADING) {
        spdlog::debug("[AssetHandle] '{}' loaded after it was abandoned, handing it back", key_);
        if (asset) {
            backend_.release_asset(asset);
        }
        return;
    }

    if (!asset) {
        state_ = State::UNLOADED;
        spdlog::error("[AssetHandle] Backend returned no asset for '{}'", key_);
        fail_waiters(PageError::load_failure(key_, "Failed to load asset: " + key_));
        return;
    }

    asset_ = std::move(asset);
    state_ = State::LOADED;
    spdlog::debug("[AssetHandle] Loaded '{}'", key_);

    // Callbacks may re-enter load(); detach the list first
    auto waiters = std::move(waiters_);
    waiters_.clear();
    for (auto& w : waiters) {
        if (w.token.is_cancelled()) {
            if (w.on_error) {
                w.on_error(PageError::cancelled("Load of '" + key_ + "'"));
            }
        } else if (w.on_loaded) {
            w.on_loaded(asset_);
        }
    }
}

void AssetHandle::handle_failed(uint64_t generation, const PageError& error) {
    if (generation != load_generation_ || state_ != State::LOADING) {
        return;
    }

    if (!error.is_cancellation()) {
        state_ = State::UNLOADED;
        spdlog::error("[AssetHandle] Load of '{}' failed: {}", key_, error.message);
        fail_waiters(error);
        return;
    }

    // The backend gave up on its own; only callers that cancelled hear CANCELLED
    drop_cancelled_waiters();
    if (state_ != State::LOADING || generation != load_generation_) {
        return;
    }
    if (!load_reissued_) {
        load_reissued_ = true;
        spdlog::warn("[AssetHandle] Backend cancelled the load of '{}', retrying for {} waiter(s)",
                     key_, waiters_.size());
        start_backend_load();
        return;
    }

    state_ = State::UNLOADED;
    spdlog::error("[AssetHandle] Backend cancelled the load of '{}' twice", key_);
    fail_waiters(
        PageError::load_failure(key_, "Load of '" + key_ + "' was cancelled by the backend"));
}

void AssetHandle::fail_waiters(const PageError& error) {
    auto waiters = std::move(waiters_);
    waiters_.clear();
    for (auto& w : waiters) {
        if (w.on_error) {
            w.on_error(error);
        }
    }
}

void AssetHandle::drop_cancelled_waiters() {
    if (state_ != State::LOADING) {
        return;
    }

    std::vector<Waiter> dropped;
    std::vector<Waiter> kept;
    for (auto& w : waiters_) {
        if (w.token.is_cancelled()) {
            dropped.push_back(std::move(w));
        } else {
            kept.push_back(std::move(w));
        }
    }
    if (dropped.empty()) {
        return;
    }
    waiters_ = std::move(kept);

    if (waiters_.empty()) {
        spdlog::debug("[AssetHandle] Every caller of '{}' cancelled, abandoning the load", key_);
        load_source_.cancel();
        ++load_generation_;
        state_ = State::UNLOADED;
    }

    for (auto& w : dropped) {
        if (w.on_error) {
            w.on_error(PageError::cancelled("Load of '" + key_ + "'"));
        }
    }
}

const AssetPtr& AssetHandle::get() const {
    if (state_ != State::LOADED) {
        throw PageException(PageError::not_loaded(key_));
    }
    return asset_;
}

void AssetHandle::release() {
    if (state_ == State::RELEASED) {
        return;
    }

    const State previous = state_;
    state_ = State::RELEASED;

    if (previous == State::LOADED && asset_) {
        spdlog::debug("[AssetHandle] Releasing '{}'", key_);
        backend_.release_asset(asset_);
    }
    asset_.reset();

    if (previous == State::LOADING) {
        spdlog::debug("[AssetHandle] '{}' released mid-load", key_);
        load_source_.cancel();
        ++load_generation_;
        fail_waiters(PageError::cancelled("Load of '" + key_ + "'"));
    }
}

} // namespace folio
