// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "page_transition_animation.h"

#include "hv/json.hpp"

using json = nlohmann::json;

namespace folio {

/**
 * @brief The four animations a page stack plays
 *
 * Owned per PageStack so independent stacks can animate differently.
 * All four default to nop.
 *
 * Config format (see Config defaults):
 * ```json
 * "transitions": {
 *   "push_enter": {"type": "linear", "from": [1, 0], "to": [0, 0], "duration_ms": 250},
 *   "push_exit":  {"type": "wait", "duration_ms": 250},
 *   "pop_enter":  {"type": "alpha", "from": 0, "to": 1, "duration_ms": 200},
 *   "pop_exit":   {"type": "nop"}
 * }
 * ```
 */
struct TransitionAnimationSet {
    TransitionAnimationPtr push_enter = transitions::nop();
    TransitionAnimationPtr push_exit = transitions::nop();
    TransitionAnimationPtr pop_enter = transitions::nop();
    TransitionAnimationPtr pop_exit = transitions::nop();

    /**
     * @brief Pick the animation for one side of a transition
     *
     * Never returns null; a missing entry is treated as nop.
     */
    TransitionAnimationPtr get(bool is_push, bool is_enter) const;

    /**
     * @brief Build a set from a "transitions" JSON object
     *
     * Missing keys keep the nop default. Malformed entries are logged and
     * fall back to nop.
     */
    static TransitionAnimationSet from_json(const json& transitions);
};

/**
 * @brief Parse one animation description
 *
 * @return The animation, or nop for unknown/malformed input (logged)
 */
TransitionAnimationPtr animation_from_json(const json& entry);

} // namespace folio
