// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace folio {

/**
 * @brief Error types for page stack operations
 */
enum class PageErrorType {
    NONE,                   // No error
    PRECONDITION_VIOLATION, // Request rejected before any side effect
    RESOURCE_LOAD_FAILURE,  // Asset missing or page construction failed
    DUPLICATE_PRELOAD,      // Key already preloaded (or preload in flight)
    NOT_LOADED,             // Asset accessed before its load completed
    CANCELLED               // Operation cancelled by the caller or by teardown
};

/**
 * @brief Error information for page stack operations
 *
 * Delivered through ErrorCallback for asynchronous operations. Cancellation
 * is reported with type CANCELLED so callers can tell it apart from a failure.
 */
struct PageError {
    PageErrorType type = PageErrorType::NONE;
    std::string message;      // Human-readable description
    std::string resource_key; // Resource key involved, if any
    std::string page_id;      // Page id involved, if any

    bool has_error() const {
        return type != PageErrorType::NONE;
    }

    bool is_cancellation() const {
        return type == PageErrorType::CANCELLED;
    }

    std::string get_type_string() const {
        switch (type) {
        case PageErrorType::NONE:
            return "NONE";
        case PageErrorType::PRECONDITION_VIOLATION:
            return "PRECONDITION_VIOLATION";
        case PageErrorType::RESOURCE_LOAD_FAILURE:
            return "RESOURCE_LOAD_FAILURE";
        case PageErrorType::DUPLICATE_PRELOAD:
            return "DUPLICATE_PRELOAD";
        case PageErrorType::NOT_LOADED:
            return "NOT_LOADED";
        case PageErrorType::CANCELLED:
            return "CANCELLED";
        }
        return "UNKNOWN";
    }

    static PageError precondition(const std::string& msg) {
        PageError err;
        err.type = PageErrorType::PRECONDITION_VIOLATION;
        err.message = msg;
        return err;
    }

    static PageError load_failure(const std::string& key, const std::string& msg) {
        PageError err;
        err.type = PageErrorType::RESOURCE_LOAD_FAILURE;
        err.resource_key = key;
        err.message = msg;
        return err;
    }

    static PageError duplicate_preload(const std::string& key) {
        PageError err;
        err.type = PageErrorType::DUPLICATE_PRELOAD;
        err.resource_key = key;
        err.message = "The resource with key \"" + key + "\" has already been preloaded";
        return err;
    }

    static PageError not_loaded(const std::string& key) {
        PageError err;
        err.type = PageErrorType::NOT_LOADED;
        err.resource_key = key;
        err.message = "Asset not loaded: " + key;
        return err;
    }

    static PageError cancelled(const std::string& what) {
        PageError err;
        err.type = PageErrorType::CANCELLED;
        err.message = what + " cancelled";
        return err;
    }
};

/**
 * @brief Exception thrown by synchronous accessors that cannot report through a callback
 */
class PageException : public std::runtime_error {
  public:
    explicit PageException(PageError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    const PageError& error() const {
        return error_;
    }

  private:
    PageError error_;
};

using SuccessCallback = std::function<void()>;
using ErrorCallback = std::function<void(const PageError&)>;

} // namespace folio
