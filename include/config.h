// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __FOLIO_CONFIG_H__
#define __FOLIO_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace folio {

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from the LVGL thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/folio.json");
 *
 * // Get with default fallback
 * std::string level = cfg->get<std::string>("/log_level", "info");
 *
 * // Build the stack's animations from the "transitions" object
 * auto animations = TransitionAnimationSet::from_json(cfg->get_json("/transitions"));
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    /**
     * @brief Construct configuration manager
     *
     * Use get_instance() to obtain singleton instance.
     */
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file and fills in any missing defaults. Creates the file
     * with defaults if it doesn't exist. A corrupt file is replaced by
     * defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/log_level")
     * @return Configuration value of type T
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path
     * @param default_value Fallback value if path not found
     * @return Configuration value or default_value
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            return data[ptr].template get<T>();
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Get JSON sub-object at path
     *
     * @param json_path JSON pointer path
     * @return Reference to JSON object at path (created as null if missing)
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * @return true on success, false if the file could not be written
     */
    bool save();

    /**
     * @brief Replace the configuration with defaults (in memory)
     */
    void reset_to_defaults();

    /**
     * @brief Get configuration file path
     */
    std::string get_path();

    /**
     * @brief Default configuration
     *
     * log_level "info", log_target "auto", and all four transitions nop.
     */
    static json get_defaults();

    /**
     * @brief Get singleton instance
     */
    static Config* get_instance();
};

} // namespace folio

#endif // __FOLIO_CONFIG_H__
