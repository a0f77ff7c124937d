// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <fstream>
#include <iomanip>
#include <sys/stat.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace folio {

Config* Config::instance{NULL};

namespace {

/// Add keys present in defaults but missing in data. Returns true if anything was added.
bool merge_missing_defaults(json& data, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!data.contains(it.key())) {
            data[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && data[it.key()].is_object()) {
            modified |= merge_missing_defaults(data[it.key()], it.value());
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::get_defaults() {
    const json nop = {{"type", "nop"}};
    return {{"log_level", "info"},
            {"log_target", "auto"},
            {"transitions",
             {{"push_enter", nop}, {"push_exit", nop}, {"pop_enter", nop}, {"pop_exit", nop}}}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");
            data = get_defaults();
            config_modified = true;
        }
        if (!data.is_object()) {
            spdlog::warn("[Config] Config root is not an object, resetting to defaults");
            data = get_defaults();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
            if (ec) {
                spdlog::warn("[Config] Could not create {}: {}", config_dir.string(),
                             ec.message());
            }
        }
        data = get_defaults();
        config_modified = true;
    }

    if (merge_missing_defaults(data, get_defaults())) {
        config_modified = true;
    }

    // Save updated config with any new defaults
    if (config_modified) {
        std::ofstream o(config_path);
        o << std::setw(2) << data << std::endl;
        spdlog::debug("[Config] Saved updated config to {}", config_path);
    }

    spdlog::debug("[Config] initialized: log_level={} log_target={}",
                  get<std::string>("/log_level", "info"), get<std::string>("/log_target", "auto"));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

void Config::reset_to_defaults() {
    data = get_defaults();
    spdlog::info("[Config] Reset to defaults");
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace folio
