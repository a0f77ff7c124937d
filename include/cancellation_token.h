// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file cancellation_token.h
 * @brief Cooperative cancellation for page transitions and asset loads
 *
 * @pattern Source owns the flag, tokens observe it. Linked tokens observe several flags.
 * @threading cancel() and is_cancelled() are safe from any thread.
 * @gotchas Nothing is interrupted: long-running work polls is_cancelled() once per frame
 *          (animations) or before completing (asset loads).
 */

#pragma once

#include <atomic>
#include <memory>
#include <vector>

namespace folio {

class CancellationSource;

/**
 * @brief Read-only view of one or more cancellation flags
 *
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
  public:
    CancellationToken() = default;

    bool is_cancelled() const;

    /// True if this token can ever become cancelled
    bool can_be_cancelled() const {
        return !flags_.empty();
    }

    /**
     * @brief Token cancelled as soon as either input is cancelled
     */
    static CancellationToken linked(const CancellationToken& a, const CancellationToken& b);

  private:
    friend class CancellationSource;

    using Flag = std::shared_ptr<std::atomic<bool>>;
    explicit CancellationToken(Flag flag);

    std::vector<Flag> flags_;
};

/**
 * @brief Owner of a cancellation flag
 *
 * Copies share the same flag.
 */
class CancellationSource {
  public:
    CancellationSource();

    /// Request cancellation. Idempotent.
    void cancel();

    bool is_cancelled() const;

    CancellationToken token() const;

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace folio
