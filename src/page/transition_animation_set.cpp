// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "transition_animation_set.h"

#include <spdlog/spdlog.h>

#include <string>

namespace folio {

namespace {

Anchor anchor_from_json(const json& value) {
    Anchor anchor;
    if (value.is_array() && value.size() == 2) {
        anchor.x = value[0].get<float>();
        anchor.y = value[1].get<float>();
    } else {
        spdlog::warn("[TransitionAnimationSet] Anchor must be [x, y], got {}", value.dump());
    }
    return anchor;
}

} // namespace

TransitionAnimationPtr TransitionAnimationSet::get(bool is_push, bool is_enter) const {
    const TransitionAnimationPtr& anim =
        is_push ? (is_enter ? push_enter : push_exit) : (is_enter ? pop_enter : pop_exit);
    return anim ? anim : transitions::nop();
}

TransitionAnimationSet TransitionAnimationSet::from_json(const json& transitions) {
    TransitionAnimationSet set;
    if (!transitions.is_object()) {
        if (!transitions.is_null()) {
            spdlog::warn("[TransitionAnimationSet] 'transitions' is not an object, using nop");
        }
        return set;
    }

    auto read = [&transitions](const char* name, TransitionAnimationPtr& slot) {
        auto it = transitions.find(name);
        if (it != transitions.end()) {
            slot = animation_from_json(*it);
        }
    };
    read("push_enter", set.push_enter);
    read("push_exit", set.push_exit);
    read("pop_enter", set.pop_enter);
    read("pop_exit", set.pop_exit);

    spdlog::debug("[TransitionAnimationSet] push: {}/{} pop: {}/{}", set.push_enter->get_name(),
                  set.push_exit->get_name(), set.pop_enter->get_name(), set.pop_exit->get_name());
    return set;
}

TransitionAnimationPtr animation_from_json(const json& entry) {
    if (!entry.is_object()) {
        spdlog::warn("[TransitionAnimationSet] Animation entry is not an object: {}", entry.dump());
        return transitions::nop();
    }

    try {
        const std::string type = entry.value("type", std::string("nop"));
        const uint32_t duration = entry.value("duration_ms", 0u);

        if (type == "nop") {
            return transitions::nop();
        }
        if (type == "wait") {
            return transitions::wait(duration);
        }
        if (type == "alpha") {
            return transitions::alpha(entry.value("from", 0.0f), entry.value("to", 1.0f), duration);
        }
        if (type == "linear") {
            Anchor from = entry.contains("from") ? anchor_from_json(entry["from"]) : Anchor{};
            Anchor to = entry.contains("to") ? anchor_from_json(entry["to"]) : Anchor{};
            return transitions::linear(from, to, duration);
        }

        spdlog::warn("[TransitionAnimationSet] Unknown animation type '{}', using nop", type);
    } catch (const json::exception& e) {
        spdlog::warn("[TransitionAnimationSet] Malformed animation {}: {}", entry.dump(), e.what());
    }
    return transitions::nop();
}

} // namespace folio
