// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "page.h"

#include "../lvgl_test_fixture.h"
#include "../mocks/recording_page.h"

#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace folio;

namespace {

lv_opa_t opa_of(const Page& page) {
    return lv_obj_get_style_opa(page.get_surface(), LV_PART_MAIN);
}

} // namespace

TEST_CASE_METHOD(LVGLTestFixture, "Page: visual state through a push lifecycle",
                 "[page][lifecycle]") {
    auto log = std::make_shared<PageEventLog>();
    RecordingPage page(test_screen(), "P", log);
    TransitionAnimationSet animations;
    std::vector<AnimationResult> results;

    page.after_load(test_screen());
    REQUIRE(lv_obj_get_parent(page.get_surface()) == test_screen());
    REQUIRE(opa_of(page) == LV_OPA_TRANSP);

    page.before_enter();
    REQUIRE(page.is_visible());
    REQUIRE(opa_of(page) == LV_OPA_TRANSP);

    page.enter(true, false, animations, CancellationToken(),
               [&results](AnimationResult r) { results.push_back(r); });
    REQUIRE(opa_of(page) == LV_OPA_COVER);
    REQUIRE(results == std::vector<AnimationResult>{AnimationResult::COMPLETED});

    page.before_exit();
    REQUIRE(opa_of(page) == LV_OPA_COVER);

    page.exit(true, false, animations, CancellationToken(), nullptr);
    REQUIRE(opa_of(page) == LV_OPA_TRANSP);

    page.after_exit();
    REQUIRE_FALSE(page.is_visible());

    std::vector<std::string> expected = {"P:after_load", "P:before_enter", "P:entered",
                                         "P:before_exit", "P:exited", "P:after_exit"};
    REQUIRE(log->events == expected);
}

TEST_CASE_METHOD(LVGLTestFixture, "Page: animated enter lands on the resting layout",
                 "[page][animation]") {
    auto log = std::make_shared<PageEventLog>();
    RecordingPage page(test_screen(), "P", log);
    TransitionAnimationSet animations;
    animations.push_enter = transitions::linear_from_right_to_center(100);

    page.after_load(test_screen());
    page.before_enter();

    bool done = false;
    page.enter(true, true, animations, CancellationToken(),
               [&done](AnimationResult) { done = true; });
    REQUIRE_FALSE(log->contains("P:entered"));

    process_lvgl(200);
    REQUIRE(done);
    REQUIRE(log->contains("P:entered"));
    REQUIRE(lv_obj_get_style_translate_x(page.get_surface(), LV_PART_MAIN) == 0);
    REQUIRE(opa_of(page) == LV_OPA_COVER);
}

TEST_CASE_METHOD(LVGLTestFixture, "Page: restore after a cancelled transition",
                 "[page][cancellation]") {
    auto log = std::make_shared<PageEventLog>();
    RecordingPage page(test_screen(), "P", log);
    page.after_load(test_screen());

    page.restore_visible();
    REQUIRE(page.is_visible());
    REQUIRE(opa_of(page) == LV_OPA_COVER);

    page.restore_hidden();
    REQUIRE_FALSE(page.is_visible());
    REQUIRE(opa_of(page) == LV_OPA_TRANSP);

    // Hooks are not part of a restore
    REQUIRE(log->events == std::vector<std::string>{"P:after_load"});
}

TEST_CASE_METHOD(LVGLTestFixture, "Page: destruction deletes the surface", "[page]") {
    auto log = std::make_shared<PageEventLog>();
    lv_obj_t* surface = nullptr;
    {
        RecordingPage page(test_screen(), "P", log);
        surface = page.get_surface();
        REQUIRE(lv_obj_is_valid(surface));
    }
    REQUIRE_FALSE(lv_obj_is_valid(surface));
    REQUIRE(log->destroyed == 1);
}
