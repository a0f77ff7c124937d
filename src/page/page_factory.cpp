// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "page_factory.h"

#include "ui_update_queue.h"

#include <spdlog/spdlog.h>

namespace folio {

// ============================================================================
// PrefabPageFactory
// ============================================================================

std::unique_ptr<Page> PrefabPageFactory::instantiate(const AssetPtr& prefab, lv_obj_t* parent) {
    auto* asset = dynamic_cast<PrefabAsset*>(prefab.get());
    if (!asset) {
        spdlog::error("[PrefabPageFactory] Asset '{}' is not a prefab",
                      prefab ? prefab->key() : std::string("<null>"));
        return nullptr;
    }
    if (!asset->builder()) {
        spdlog::error("[PrefabPageFactory] Prefab '{}' has no builder", asset->key());
        return nullptr;
    }

    auto page = asset->builder()(parent);
    if (!page || !page->get_surface()) {
        spdlog::error("[PrefabPageFactory] Builder for '{}' produced no page", asset->key());
        return nullptr;
    }
    spdlog::trace("[PrefabPageFactory] Instantiated '{}' as {}", asset->key(), page->get_name());
    return page;
}

// ============================================================================
// PrefabRegistryBackend
// ============================================================================

PrefabRegistryBackend::~PrefabRegistryBackend() {
    if (live_ > 0) {
        spdlog::warn("[PrefabRegistryBackend] Destroyed with {} unreleased asset(s)", live_);
    }
}

void PrefabRegistryBackend::register_prefab(const std::string& key, PageBuilder builder) {
    std::lock_guard<std::mutex> lock(mutex_);
    prefabs_[key] = std::move(builder);
    spdlog::debug("[PrefabRegistryBackend] Registered prefab '{}'", key);
}

bool PrefabRegistryBackend::has_prefab(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prefabs_.count(key) > 0;
}

void PrefabRegistryBackend::load_asset(const std::string& key, LoadCallback on_loaded,
                                       ErrorCallback on_error, const CancellationToken& token) {
    if (!async_) {
        complete_load(key, on_loaded, on_error, token);
        return;
    }

    spdlog::trace("[PrefabRegistryBackend] Deferring load of '{}'", key);
    std::weak_ptr<bool> weak_alive = alive_;
    ui::queue_update([this, weak_alive, key, on_loaded = std::move(on_loaded),
                      on_error = std::move(on_error), token]() {
        if (weak_alive.expired()) {
            return;
        }
        complete_load(key, on_loaded, on_error, token);
    });
}

void PrefabRegistryBackend::complete_load(const std::string& key, const LoadCallback& on_loaded,
                                          const ErrorCallback& on_error,
                                          const CancellationToken& token) {
    if (token.is_cancelled()) {
        if (on_error) {
            on_error(PageError::cancelled("Load of '" + key + "'"));
        }
        return;
    }

    PageBuilder builder;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = prefabs_.find(key);
        if (it != prefabs_.end()) {
            builder = it->second;
            load_counts_[key]++;
            live_++;
        }
    }

    if (!builder) {
        if (on_error) {
            on_error(PageError::load_failure(key, "No prefab registered for key '" + key + "'"));
        }
        return;
    }

    if (on_loaded) {
        on_loaded(std::make_shared<PrefabAsset>(key, std::move(builder)));
    }
}

void PrefabRegistryBackend::release_asset(const AssetPtr& asset) {
    if (!asset) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    release_counts_[asset->key()]++;
    live_--;
    spdlog::trace("[PrefabRegistryBackend] Released '{}' ({} live)", asset->key(), live_);
}

int PrefabRegistryBackend::load_count(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = load_counts_.find(key);
    return it == load_counts_.end() ? 0 : it->second;
}

int PrefabRegistryBackend::release_count(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = release_counts_.find(key);
    return it == release_counts_.end() ? 0 : it->second;
}

int PrefabRegistryBackend::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
}

} // namespace folio
