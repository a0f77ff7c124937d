// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file asset_handle.h
 * @brief One loaded page asset, identified by its resource key
 *
 * @pattern Lazy load, cached result, release exactly once. The backend load
 *          belongs to the handle, not to the caller that started it: it is
 *          cancelled only when no waiter is left or on release().
 * @threading LVGL thread only.
 * @gotchas Caller tokens are checked when load() is called, when the backend
 *          answers, and on drop_cancelled_waiters(). Owners poll the latter
 *          while is_loading() so a cancelled caller hears back promptly.
 *          A release() while a load is in flight fails the waiters with
 *          CANCELLED; a late asset is handed straight back to the backend.
 */

#pragma once

#include "asset_backend.h"
#include "cancellation_token.h"
#include "page_error.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace folio {

class AssetHandle {
  public:
    using LoadCallback = std::function<void(const AssetPtr&)>;

    AssetHandle(std::string key, IAssetBackend& backend);

    /// Releases the asset if still held
    ~AssetHandle();

    AssetHandle(const AssetHandle&) = delete;
    AssetHandle& operator=(const AssetHandle&) = delete;

    /**
     * @brief Load the asset, or return the cached one
     *
     * A loaded handle calls on_loaded synchronously without touching the
     * backend. Calls made while a load is in flight join that load. Another
     * caller's cancellation never fails this one.
     *
     * @param on_loaded Called with the asset
     * @param on_error Called with RESOURCE_LOAD_FAILURE, CANCELLED, or
     *                 PRECONDITION_VIOLATION for a released handle
     * @param token Cancellation for this caller
     */
    void load(LoadCallback on_loaded, ErrorCallback on_error,
              const CancellationToken& token = CancellationToken());

    /**
     * @brief Fail every waiter whose token is cancelled with CANCELLED
     *
     * If nobody is left waiting the backend load is cancelled and the handle
     * returns to unloaded.
     */
    void drop_cancelled_waiters();

    /**
     * @brief Get the loaded asset
     * @throws PageException with NOT_LOADED if load has not completed
     */
    const AssetPtr& get() const;

    /**
     * @brief Free the backing asset. Idempotent.
     */
    void release();

    const std::string& key() const {
        return key_;
    }

    bool is_loaded() const {
        return state_ == State::LOADED;
    }

    bool is_loading() const {
        return state_ == State::LOADING;
    }

    bool is_released() const {
        return state_ == State::RELEASED;
    }

  private:
    enum class State { UNLOADED, LOADING, LOADED, RELEASED };

    struct Waiter {
        LoadCallback on_loaded;
        ErrorCallback on_error;
        CancellationToken token;
    };

    void start_backend_load();
    void handle_loaded(uint64_t generation, AssetPtr asset);
    void handle_failed(uint64_t generation, const PageError& error);
    void fail_waiters(const PageError& error);

    std::string key_;
    IAssetBackend& backend_;
    State state_ = State::UNLOADED;
    AssetPtr asset_;
    std::vector<Waiter> waiters_;

    CancellationSource load_source_;
    uint64_t load_generation_ = 0; ///< Results of older loads are stale
    bool load_reissued_ = false;   ///< Backend-side cancellation retried once

    // Expires on destruction so late backend callbacks can tell
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace folio
