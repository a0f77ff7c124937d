// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "asset_backend.h"
#include "page.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace folio {

/// Builds a page instance under a parent surface
using PageBuilder = std::function<std::unique_ptr<Page>(lv_obj_t* parent)>;

/**
 * @brief Asset describing how to build one kind of page
 */
class PrefabAsset : public Asset {
  public:
    PrefabAsset(std::string key, PageBuilder builder)
        : key_(std::move(key)), builder_(std::move(builder)) {}

    const std::string& key() const override {
        return key_;
    }

    const PageBuilder& builder() const {
        return builder_;
    }

  private:
    std::string key_;
    PageBuilder builder_;
};

/**
 * @brief Resource key of a page type
 *
 * Page types that can be pushed by type declare
 * `static constexpr const char* RESOURCE_KEY`.
 */
template <typename TPage> constexpr const char* resource_key_of() {
    return TPage::RESOURCE_KEY;
}

/**
 * @brief Constructs page instances from loaded assets
 */
class IPageFactory {
  public:
    virtual ~IPageFactory() = default;

    /**
     * @brief Build a page under @p parent
     * @return The page, or nullptr if the asset cannot be instantiated
     */
    virtual std::unique_ptr<Page> instantiate(const AssetPtr& prefab, lv_obj_t* parent) = 0;
};

/**
 * @brief Factory for PrefabAsset-backed pages
 */
class PrefabPageFactory : public IPageFactory {
  public:
    std::unique_ptr<Page> instantiate(const AssetPtr& prefab, lv_obj_t* parent) override;
};

/**
 * @brief In-memory asset backend mapping resource keys to page builders
 *
 * Loads complete synchronously by default. With set_async(true) completion is
 * deferred to the next UpdateQueue drain, which models on-demand loading
 * without changing the caller's protocol.
 *
 * Usage:
 * @code
 * PrefabRegistryBackend backend;
 * backend.register_prefab("home", [](lv_obj_t* parent) {
 *     return std::make_unique<HomePage>(parent);
 * });
 * backend.register_page<SettingsPage>();  // uses SettingsPage::RESOURCE_KEY
 * @endcode
 */
class PrefabRegistryBackend : public IAssetBackend {
  public:
    PrefabRegistryBackend() = default;
    ~PrefabRegistryBackend() override;

    PrefabRegistryBackend(const PrefabRegistryBackend&) = delete;
    PrefabRegistryBackend& operator=(const PrefabRegistryBackend&) = delete;

    /// Register (or replace) the builder for a key
    void register_prefab(const std::string& key, PageBuilder builder);

    /// Register a page type constructible from its parent surface
    template <typename TPage> void register_page() {
        register_prefab(resource_key_of<TPage>(), [](lv_obj_t* parent) -> std::unique_ptr<Page> {
            return std::make_unique<TPage>(parent);
        });
    }

    bool has_prefab(const std::string& key) const;

    void set_async(bool async) {
        async_ = async;
    }

    bool is_async() const {
        return async_;
    }

    void load_asset(const std::string& key, LoadCallback on_loaded, ErrorCallback on_error,
                    const CancellationToken& token) override;
    void release_asset(const AssetPtr& asset) override;

    /// Completed loads for a key since construction
    int load_count(const std::string& key) const;

    /// Releases for a key since construction
    int release_count(const std::string& key) const;

    /// Assets loaded and not yet released
    int live_count() const;

  private:
    void complete_load(const std::string& key, const LoadCallback& on_loaded,
                       const ErrorCallback& on_error, const CancellationToken& token);

    mutable std::mutex mutex_;
    std::map<std::string, PageBuilder> prefabs_;
    std::map<std::string, int> load_counts_;
    std::map<std::string, int> release_counts_;
    int live_ = 0;
    bool async_ = false;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace folio
