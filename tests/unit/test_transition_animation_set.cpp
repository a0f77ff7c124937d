// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "transition_animation_set.h"

#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace folio;

TEST_CASE("TransitionAnimationSet: defaults are nop", "[transitions][config]") {
    TransitionAnimationSet set;
    REQUIRE(std::string(set.get(true, true)->get_name()) == "nop");
    REQUIRE(std::string(set.get(true, false)->get_name()) == "nop");
    REQUIRE(std::string(set.get(false, true)->get_name()) == "nop");
    REQUIRE(std::string(set.get(false, false)->get_name()) == "nop");
}

TEST_CASE("TransitionAnimationSet: get picks the matching slot", "[transitions]") {
    TransitionAnimationSet set;
    set.push_enter = transitions::alpha_in(100);
    set.push_exit = transitions::wait(100);
    set.pop_enter = transitions::linear_from_left_to_center(100);

    REQUIRE(set.get(true, true) == set.push_enter);
    REQUIRE(set.get(true, false) == set.push_exit);
    REQUIRE(set.get(false, true) == set.pop_enter);
    REQUIRE(std::string(set.get(false, false)->get_name()) == "nop");

    SECTION("a null slot is treated as nop") {
        set.pop_exit = nullptr;
        REQUIRE(set.get(false, false) != nullptr);
        REQUIRE(std::string(set.get(false, false)->get_name()) == "nop");
    }
}

TEST_CASE("animation_from_json: known types", "[transitions][config]") {
    SECTION("nop") {
        auto anim = animation_from_json(json{{"type", "nop"}});
        REQUIRE(std::string(anim->get_name()) == "nop");
    }

    SECTION("wait") {
        auto anim = animation_from_json(json{{"type", "wait"}, {"duration_ms", 250}});
        auto wait = std::dynamic_pointer_cast<const WaitTransitionAnimation>(anim);
        REQUIRE(wait != nullptr);
        REQUIRE(wait->duration_ms() == 250);
    }

    SECTION("alpha") {
        auto anim = animation_from_json(
            json{{"type", "alpha"}, {"from", 0.25}, {"to", 0.75}, {"duration_ms", 120}});
        auto alpha = std::dynamic_pointer_cast<const AlphaTransitionAnimation>(anim);
        REQUIRE(alpha != nullptr);
        REQUIRE(alpha->from() == 0.25f);
        REQUIRE(alpha->to() == 0.75f);
        REQUIRE(alpha->duration_ms() == 120);
    }

    SECTION("linear") {
        auto anim = animation_from_json(json{{"type", "linear"},
                                             {"from", {1, 0}},
                                             {"to", {0, -0.5}},
                                             {"duration_ms", 300}});
        auto linear = std::dynamic_pointer_cast<const LinearTransitionAnimation>(anim);
        REQUIRE(linear != nullptr);
        REQUIRE(linear->from().x == 1.0f);
        REQUIRE(linear->from().y == 0.0f);
        REQUIRE(linear->to().x == 0.0f);
        REQUIRE(linear->to().y == -0.5f);
        REQUIRE(linear->duration_ms() == 300);
    }
}

TEST_CASE("animation_from_json: bad input falls back to nop", "[transitions][config]") {
    SECTION("unknown type") {
        auto anim = animation_from_json(json{{"type", "spin"}});
        REQUIRE(std::string(anim->get_name()) == "nop");
    }

    SECTION("not an object") {
        auto anim = animation_from_json(json("alpha"));
        REQUIRE(std::string(anim->get_name()) == "nop");
    }

    SECTION("wrong value type") {
        auto anim = animation_from_json(json{{"type", "wait"}, {"duration_ms", "long"}});
        REQUIRE(std::string(anim->get_name()) == "nop");
    }
}

TEST_CASE("TransitionAnimationSet::from_json: fills named slots", "[transitions][config]") {
    json transitions = {
        {"push_enter", {{"type", "linear"}, {"from", {1, 0}}, {"to", {0, 0}}, {"duration_ms", 250}}},
        {"push_exit", {{"type", "wait"}, {"duration_ms", 250}}},
        {"pop_enter", {{"type", "alpha"}, {"from", 0}, {"to", 1}, {"duration_ms", 200}}}};

    auto set = TransitionAnimationSet::from_json(transitions);
    REQUIRE(std::string(set.push_enter->get_name()) == "linear");
    REQUIRE(std::string(set.push_exit->get_name()) == "wait");
    REQUIRE(std::string(set.pop_enter->get_name()) == "alpha");
    // Missing key keeps the default
    REQUIRE(std::string(set.pop_exit->get_name()) == "nop");

    SECTION("null or non-object gives all nop") {
        auto empty = TransitionAnimationSet::from_json(json());
        REQUIRE(std::string(empty.push_enter->get_name()) == "nop");
        auto bad = TransitionAnimationSet::from_json(json::array());
        REQUIRE(std::string(bad.pop_enter->get_name()) == "nop");
    }
}
