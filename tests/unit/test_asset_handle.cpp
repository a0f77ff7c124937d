// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "asset_handle.h"

#include "../mocks/manual_asset_backend.h"

#include <memory>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace folio;

namespace {

struct LoadRecorder {
    int loaded = 0;
    std::vector<PageError> errors;
    AssetPtr asset;

    AssetHandle::LoadCallback on_loaded() {
        return [this](const AssetPtr& a) {
            loaded++;
            asset = a;
        };
    }

    ErrorCallback on_error() {
        return [this](const PageError& e) { errors.push_back(e); };
    }
};

} // namespace

TEST_CASE("AssetHandle: starts unloaded", "[asset_handle]") {
    ManualAssetBackend backend;
    AssetHandle handle("home", backend);

    REQUIRE(handle.key() == "home");
    REQUIRE_FALSE(handle.is_loaded());
    REQUIRE_FALSE(handle.is_loading());
    REQUIRE_FALSE(handle.is_released());
}

TEST_CASE("AssetHandle: get() before load throws NOT_LOADED", "[asset_handle]") {
    ManualAssetBackend backend;
    AssetHandle handle("home", backend);

    REQUIRE_THROWS_AS(handle.get(), PageException);

    try {
        handle.get();
    } catch (const PageException& e) {
        REQUIRE(e.error().type == PageErrorType::NOT_LOADED);
        REQUIRE(e.error().resource_key == "home");
    }

    SECTION("still throws while the load is in flight") {
        LoadRecorder seen;
        handle.load(seen.on_loaded(), seen.on_error());
        REQUIRE(handle.is_loading());
        REQUIRE_THROWS_AS(handle.get(), PageException);
    }
}

TEST_CASE("AssetHandle: loading twice calls the backend once", "[asset_handle]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);
    AssetHandle handle("home", backend);

    LoadRecorder first;
    handle.load(first.on_loaded(), first.on_error());
    REQUIRE(backend.resolve_next());
    REQUIRE(first.loaded == 1);
    REQUIRE(handle.is_loaded());
    REQUIRE(handle.get() == first.asset);

    LoadRecorder second;
    handle.load(second.on_loaded(), second.on_error());

    // Cached: answered synchronously, nothing parked in the backend
    REQUIRE(second.loaded == 1);
    REQUIRE(second.asset == first.asset);
    REQUIRE(backend.pending_count() == 0);
    REQUIRE(backend.load_requests("home") == 1);
}

TEST_CASE("AssetHandle: concurrent loads join the in-flight load", "[asset_handle]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);
    AssetHandle handle("home", backend);

    LoadRecorder a;
    LoadRecorder b;
    handle.load(a.on_loaded(), a.on_error());
    handle.load(b.on_loaded(), b.on_error());

    REQUIRE(backend.load_requests("home") == 1);
    REQUIRE(a.loaded == 0);

    backend.resolve_all();
    REQUIRE(a.loaded == 1);
    REQUIRE(b.loaded == 1);
    REQUIRE(a.asset == b.asset);
}

TEST_CASE("AssetHandle: a cancelled joiner does not affect the others", "[asset_handle]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);
    AssetHandle handle("home", backend);

    LoadRecorder first;
    LoadRecorder second;
    CancellationSource second_cancel;
    handle.load(first.on_loaded(), first.on_error());
    handle.load(second.on_loaded(), second.on_error(), second_cancel.token());

    second_cancel.cancel();
    backend.resolve_all();

    REQUIRE(first.loaded == 1);
    REQUIRE(second.loaded == 0);
    REQUIRE(second.errors.size() == 1);
    REQUIRE(second.errors[0].is_cancellation());
    REQUIRE(handle.is_loaded());
}

TEST_CASE("AssetHandle: the initiator cancelling does not fail a joined caller",
          "[asset_handle][cancellation]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);
    AssetHandle handle("home", backend);

    LoadRecorder initiator;
    LoadRecorder joiner;
    CancellationSource initiator_cancel;
    handle.load(initiator.on_loaded(), initiator.on_error(), initiator_cancel.token());
    handle.load(joiner.on_loaded(), joiner.on_error());

    initiator_cancel.cancel();

    SECTION("noticed when the backend answers") {
        REQUIRE_FALSE(backend.next_is_cancelled());
        REQUIRE(backend.resolve_next());
    }

    SECTION("noticed early") {
        handle.drop_cancelled_waiters();
        REQUIRE(initiator.errors.size() == 1);
        REQUIRE(handle.is_loading());
        REQUIRE_FALSE(backend.next_is_cancelled());
        REQUIRE(backend.resolve_next());
    }

    REQUIRE(initiator.loaded == 0);
    REQUIRE(initiator.errors.size() == 1);
    REQUIRE(initiator.errors[0].is_cancellation());
    REQUIRE(joiner.loaded == 1);
    REQUIRE(joiner.errors.empty());
    REQUIRE(handle.is_loaded());
    REQUIRE(backend.load_requests("home") == 1);
}

TEST_CASE("AssetHandle: a cancelled joiner hears back before the backend answers",
          "[asset_handle][cancellation]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);
    AssetHandle handle("home", backend);

    LoadRecorder first;
    LoadRecorder joiner;
    CancellationSource joiner_cancel;
    handle.load(first.on_loaded(), first.on_error());
    handle.load(joiner.on_loaded(), joiner.on_error(), joiner_cancel.token());

    joiner_cancel.cancel();
    handle.drop_cancelled_waiters();

    REQUIRE(joiner.errors.size() == 1);
    REQUIRE(joiner.errors[0].is_cancellation());
    REQUIRE(backend.pending_count() == 1);

    backend.resolve_all();
    REQUIRE(first.loaded == 1);
    REQUIRE(joiner.loaded == 0);
    REQUIRE(joiner.errors.size() == 1);
}

TEST_CASE("AssetHandle: load is abandoned once every caller cancelled",
          "[asset_handle][cancellation]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);
    AssetHandle handle("home", backend);

    LoadRecorder a;
    LoadRecorder b;
    CancellationSource cancel_a;
    CancellationSource cancel_b;
    handle.load(a.on_loaded(), a.on_error(), cancel_a.token());
    handle.load(b.on_loaded(), b.on_error(), cancel_b.token());

    cancel_a.cancel();
    handle.drop_cancelled_waiters();
    REQUIRE(handle.is_loading());
    REQUIRE_FALSE(backend.next_is_cancelled());

    cancel_b.cancel();
    handle.drop_cancelled_waiters();
    REQUIRE_FALSE(handle.is_loading());
    REQUIRE(backend.next_is_cancelled());
    REQUIRE(a.errors.size() == 1);
    REQUIRE(b.errors.size() == 1);

    SECTION("a stale asset is handed back") {
        REQUIRE(backend.deliver_next());
        REQUIRE(backend.release_count("home") == 1);
        REQUIRE_FALSE(handle.is_loaded());
    }

    SECTION("a later caller starts a fresh load") {
        LoadRecorder later;
        handle.load(later.on_loaded(), later.on_error());
        REQUIRE(backend.load_requests("home") == 2);
        backend.resolve_all();
        REQUIRE(later.loaded == 1);
        REQUIRE(backend.live_count() == 1);
    }
}

TEST_CASE("AssetHandle: already cancelled token never reaches the backend",
          "[asset_handle][cancellation]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);
    AssetHandle handle("home", backend);

    CancellationSource source;
    source.cancel();
    LoadRecorder seen;
    handle.load(seen.on_loaded(), seen.on_error(), source.token());

    REQUIRE(seen.errors.size() == 1);
    REQUIRE(seen.errors[0].is_cancellation());
    REQUIRE(backend.load_requests("home") == 0);
    REQUIRE_FALSE(handle.is_loading());
}

TEST_CASE("AssetHandle: backend-side cancellation is retried for callers still waiting",
          "[asset_handle][cancellation]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);
    AssetHandle handle("home", backend);

    LoadRecorder gave_up;
    LoadRecorder waiting;
    CancellationSource source;
    handle.load(gave_up.on_loaded(), gave_up.on_error(), source.token());
    handle.load(waiting.on_loaded(), waiting.on_error());
    source.cancel();

    REQUIRE(backend.cancel_next());
    REQUIRE(gave_up.errors.size() == 1);
    REQUIRE(gave_up.errors[0].is_cancellation());
    REQUIRE(waiting.errors.empty());
    REQUIRE(backend.load_requests("home") == 2);

    SECTION("the retry succeeds") {
        backend.resolve_all();
        REQUIRE(waiting.loaded == 1);
    }

    SECTION("a second backend cancellation is a load failure") {
        REQUIRE(backend.cancel_next());
        REQUIRE(waiting.errors.size() == 1);
        REQUIRE(waiting.errors[0].type == PageErrorType::RESOURCE_LOAD_FAILURE);
        REQUIRE_FALSE(handle.is_loading());
    }
}

TEST_CASE("AssetHandle: release frees the asset exactly once", "[asset_handle]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);
    AssetHandle handle("home", backend);

    LoadRecorder seen;
    handle.load(seen.on_loaded(), seen.on_error());
    backend.resolve_all();
    REQUIRE(backend.live_count() == 1);

    handle.release();
    handle.release();

    REQUIRE(handle.is_released());
    REQUIRE(backend.release_count("home") == 1);
    REQUIRE(backend.live_count() == 0);
    REQUIRE_THROWS_AS(handle.get(), PageException);
}

TEST_CASE("AssetHandle: release of an unloaded handle frees nothing", "[asset_handle]") {
    ManualAssetBackend backend;
    AssetHandle handle("home", backend);

    handle.release();
    REQUIRE(handle.is_released());
    REQUIRE(backend.release_count("home") == 0);
}

TEST_CASE("AssetHandle: destructor releases a loaded asset", "[asset_handle]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);

    {
        AssetHandle handle("home", backend);
        LoadRecorder seen;
        handle.load(seen.on_loaded(), seen.on_error());
        backend.resolve_all();
    }

    REQUIRE(backend.release_count("home") == 1);
    REQUIRE(backend.live_count() == 0);
}

TEST_CASE("AssetHandle: release during a load", "[asset_handle]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);
    AssetHandle handle("home", backend);

    LoadRecorder seen;
    handle.load(seen.on_loaded(), seen.on_error());
    handle.release();

    // Waiters hear back at once and the backend load is cancelled
    REQUIRE(seen.errors.size() == 1);
    REQUIRE(seen.errors[0].type == PageErrorType::CANCELLED);
    REQUIRE(backend.next_is_cancelled());

    SECTION("a backend that honours the token frees nothing") {
        backend.resolve_all();
        REQUIRE(backend.release_count("home") == 0);
    }

    SECTION("a late asset is handed back") {
        REQUIRE(backend.deliver_next());
        REQUIRE(backend.release_count("home") == 1);
    }

    REQUIRE(seen.loaded == 0);
    REQUIRE(seen.errors.size() == 1);
    REQUIRE(backend.live_count() == 0);
}

TEST_CASE("AssetHandle: load completing after destruction is handed back", "[asset_handle]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);

    LoadRecorder seen;
    {
        AssetHandle handle("home", backend);
        handle.load(seen.on_loaded(), seen.on_error());
    }
    REQUIRE(seen.errors.size() == 1);
    REQUIRE(seen.errors[0].is_cancellation());

    REQUIRE(backend.deliver_next());

    REQUIRE(seen.loaded == 0);
    REQUIRE(backend.release_count("home") == 1);
    REQUIRE(backend.live_count() == 0);
}

TEST_CASE("AssetHandle: load failure is reported and can be retried", "[asset_handle]") {
    ManualAssetBackend backend;
    backend.add_prefab("home", nullptr);
    AssetHandle handle("home", backend);

    LoadRecorder seen;
    handle.load(seen.on_loaded(), seen.on_error());
    REQUIRE(backend.fail_next());

    REQUIRE(seen.errors.size() == 1);
    REQUIRE(seen.errors[0].type == PageErrorType::RESOURCE_LOAD_FAILURE);
    REQUIRE_FALSE(handle.is_loaded());
    REQUIRE_FALSE(handle.is_loading());

    LoadRecorder retry;
    handle.load(retry.on_loaded(), retry.on_error());
    backend.resolve_all();
    REQUIRE(retry.loaded == 1);
    REQUIRE(backend.load_requests("home") == 2);
}

TEST_CASE("AssetHandle: unknown key fails with RESOURCE_LOAD_FAILURE", "[asset_handle]") {
    ManualAssetBackend backend;
    AssetHandle handle("missing", backend);

    LoadRecorder seen;
    handle.load(seen.on_loaded(), seen.on_error());
    backend.resolve_all();

    REQUIRE(seen.errors.size() == 1);
    REQUIRE(seen.errors[0].type == PageErrorType::RESOURCE_LOAD_FAILURE);
    REQUIRE(seen.errors[0].resource_key == "missing");
}

TEST_CASE("AssetHandle: null asset counts as a load failure", "[asset_handle]") {
    ManualAssetBackend backend;
    AssetHandle handle("home", backend);

    LoadRecorder seen;
    handle.load(seen.on_loaded(), seen.on_error());
    REQUIRE(backend.resolve_next_with_null());

    REQUIRE(seen.errors.size() == 1);
    REQUIRE(seen.errors[0].type == PageErrorType::RESOURCE_LOAD_FAILURE);
    REQUIRE_FALSE(handle.is_loaded());
}

TEST_CASE("AssetHandle: load on a released handle is a precondition violation",
          "[asset_handle]") {
    ManualAssetBackend backend;
    AssetHandle handle("home", backend);
    handle.release();

    LoadRecorder seen;
    handle.load(seen.on_loaded(), seen.on_error());

    REQUIRE(seen.errors.size() == 1);
    REQUIRE(seen.errors[0].type == PageErrorType::PRECONDITION_VIOLATION);
    REQUIRE(backend.load_requests("home") == 0);
}
