// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "transition_animation_set.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace folio;

namespace fs = std::filesystem;

// Test fixture for Config class testing
class ConfigTestFixture {
  protected:
    Config config;
    fs::path temp_dir;

    ConfigTestFixture() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        temp_dir = fs::temp_directory_path() / ("folio_config_test_" + std::to_string(stamp));
        fs::create_directories(temp_dir);
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        fs::remove_all(temp_dir, ec);
    }

    std::string config_path(const std::string& name = "folio.json") const {
        return (temp_dir / name).string();
    }

    void write_file(const std::string& path, const std::string& contents) {
        std::ofstream out(path);
        out << contents;
    }

    json read_file(const std::string& path) {
        std::ifstream in(path);
        return json::parse(in);
    }

    json& raw_data() {
        return config.data;
    }
};

// ============================================================================
// get() / set()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with and without default",
                 "[core][config][get]") {
    raw_data() = {{"log_level", "debug"}, {"transitions", {{"push_enter", {{"type", "alpha"}}}}}};

    REQUIRE(config.get<std::string>("/log_level") == "debug");
    REQUIRE(config.get<std::string>("/transitions/push_enter/type") == "alpha");
    REQUIRE(config.get<std::string>("/log_target", "auto") == "auto");
    REQUIRE(config.get<int>("/missing/nested", 42) == 42);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates intermediate paths",
                 "[core][config][set]") {
    config.set<std::string>("/transitions/pop_exit/type", "wait");
    config.set<int>("/transitions/pop_exit/duration_ms", 250);

    REQUIRE(config.get<std::string>("/transitions/pop_exit/type") == "wait");
    REQUIRE(config.get<int>("/transitions/pop_exit/duration_ms") == 250);
    REQUIRE(config.get_json("/transitions").is_object());
}

// ============================================================================
// init()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() creates a default file",
                 "[core][config][init]") {
    std::string path = (temp_dir / "nested" / "dir" / "folio.json").string();
    config.init(path);

    REQUIRE(fs::exists(path));
    REQUIRE(config.get_path() == path);
    REQUIRE(read_file(path) == Config::get_defaults());
    REQUIRE(config.get<std::string>("/log_level") == "info");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() keeps values and merges missing defaults",
                 "[core][config][init]") {
    std::string path = config_path();
    write_file(path, R"({"log_level": "trace",
                         "transitions": {"push_enter": {"type": "alpha", "duration_ms": 150}}})");

    config.init(path);

    REQUIRE(config.get<std::string>("/log_level") == "trace");
    REQUIRE(config.get<std::string>("/log_target") == "auto");
    REQUIRE(config.get<int>("/transitions/push_enter/duration_ms") == 150);
    REQUIRE(config.get<std::string>("/transitions/pop_exit/type") == "nop");

    // The merge was written back
    json on_disk = read_file(path);
    REQUIRE(on_disk["log_target"] == "auto");
    REQUIRE(on_disk["transitions"]["push_enter"]["type"] == "alpha");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() resets a corrupt file",
                 "[core][config][init]") {
    std::string path = config_path();

    SECTION("unparseable") {
        write_file(path, "{ not json");
    }
    SECTION("root is not an object") {
        write_file(path, "[1, 2, 3]");
    }

    config.init(path);

    REQUIRE(config.get<std::string>("/log_level") == "info");
    REQUIRE(read_file(path) == Config::get_defaults());
}

// ============================================================================
// save() / reset_to_defaults()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() persists changes", "[core][config][save]") {
    std::string path = config_path();
    config.init(path);
    config.set<std::string>("/log_level", "error");

    REQUIRE(config.save());

    Config reloaded;
    reloaded.init(path);
    REQUIRE(reloaded.get<std::string>("/log_level") == "error");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() reports an unwritable path",
                 "[core][config][save]") {
    std::string path = config_path();
    config.init(path);

    // A directory where the file should be
    fs::remove(path);
    fs::create_directories(path);
    REQUIRE_FALSE(config.save());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: reset_to_defaults()", "[core][config]") {
    raw_data() = {{"log_level", "trace"}, {"extra", true}};
    config.reset_to_defaults();

    REQUIRE(config.get<std::string>("/log_level") == "info");
    REQUIRE_FALSE(raw_data().contains("extra"));
}

// ============================================================================
// Transitions section
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: transitions section builds an animation set",
                 "[core][config][transitions]") {
    std::string path = config_path();
    write_file(path, R"({"transitions": {"push_enter": {"type": "alpha", "from": 0, "to": 1,
                                                        "duration_ms": 120}}})");
    config.init(path);

    auto set = TransitionAnimationSet::from_json(config.get_json("/transitions"));
    REQUIRE(std::string(set.push_enter->get_name()) == "alpha");
    REQUIRE(std::string(set.pop_exit->get_name()) == "nop");
}
