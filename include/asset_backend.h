// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cancellation_token.h"
#include "page_error.h"

#include <functional>
#include <memory>
#include <string>

namespace folio {

/**
 * @brief A loaded resource, resolved from an opaque resource key
 *
 * Concrete backends subclass this to carry whatever the page factory needs
 * (see PrefabAsset).
 */
class Asset {
  public:
    virtual ~Asset() = default;

    virtual const std::string& key() const = 0;
};

using AssetPtr = std::shared_ptr<Asset>;

/**
 * @brief Asset storage backend
 *
 * Resolves a resource key to a loadable asset. Implementations may complete
 * load_asset() synchronously (preloaded or in-memory assets) or later on the
 * LVGL thread (on-demand loading). Exactly one of the two callbacks fires.
 *
 * The backend must outlive every AssetHandle that references it.
 */
class IAssetBackend {
  public:
    using LoadCallback = std::function<void(AssetPtr)>;

    virtual ~IAssetBackend() = default;

    /**
     * @brief Load the asset for a key
     *
     * @param key Resource key
     * @param on_loaded Called with the asset on success
     * @param on_error Called with RESOURCE_LOAD_FAILURE or CANCELLED
     * @param token Cooperative cancellation for slow loads
     */
    virtual void load_asset(const std::string& key, LoadCallback on_loaded, ErrorCallback on_error,
                            const CancellationToken& token) = 0;

    /**
     * @brief Free an asset previously returned by load_asset()
     */
    virtual void release_asset(const AssetPtr& asset) = 0;
};

} // namespace folio
