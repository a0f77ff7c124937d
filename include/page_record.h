// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "asset_handle.h"
#include "page.h"

#include <memory>
#include <string>

namespace folio {

/**
 * @brief Read-only view of one stack entry, for callers outside the stack
 */
struct PageStackInfo {
    std::string resource_key;
    std::string page_id;
    bool stacked = true;
};

/**
 * @brief One entry of a PageStack
 *
 * Owns the page instance. Owns the asset handle unless the asset was
 * preloaded, in which case the handle is shared with the stack's preload
 * table and outlives this record.
 */
struct PageRecord {
    std::string resource_key;
    std::string page_id;
    std::unique_ptr<Page> instance;
    bool stacked = true; ///< Kept when a later page is pushed over it
    std::shared_ptr<AssetHandle> asset_handle;
    bool preloaded = false; ///< asset_handle belongs to the preload table

    PageStackInfo to_info() const {
        return PageStackInfo{resource_key, page_id, stacked};
    }

    /**
     * @brief Destroy the instance and release an owned handle
     *
     * Idempotent. A preloaded handle is left untouched.
     */
    void dispose() {
        instance.reset();
        if (asset_handle && !preloaded) {
            asset_handle->release();
        }
        asset_handle.reset();
    }
};

} // namespace folio
