// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cancellation_token.h"

#include <algorithm>
#include <utility>

namespace folio {

CancellationToken::CancellationToken(Flag flag) {
    flags_.push_back(std::move(flag));
}

bool CancellationToken::is_cancelled() const {
    return std::any_of(flags_.begin(), flags_.end(),
                       [](const Flag& f) { return f->load(std::memory_order_acquire); });
}

CancellationToken CancellationToken::linked(const CancellationToken& a,
                                            const CancellationToken& b) {
    CancellationToken result;
    result.flags_.reserve(a.flags_.size() + b.flags_.size());
    result.flags_.insert(result.flags_.end(), a.flags_.begin(), a.flags_.end());
    for (const auto& f : b.flags_) {
        if (std::find(result.flags_.begin(), result.flags_.end(), f) == result.flags_.end()) {
            result.flags_.push_back(f);
        }
    }
    return result;
}

CancellationSource::CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

void CancellationSource::cancel() {
    flag_->store(true, std::memory_order_release);
}

bool CancellationSource::is_cancelled() const {
    return flag_->load(std::memory_order_acquire);
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(flag_);
}

} // namespace folio
