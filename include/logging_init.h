// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief spdlog setup: console plus one system sink, LVGL log bridge
 *
 * Usage:
 * @code
 * folio::Config* cfg = folio::Config::get_instance();
 * cfg->init("folio.json");
 * folio::logging::init(folio::logging::config_from(*cfg));
 * @endcode
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace folio {

class Config;

namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (Linux); console elsewhere
    Journal, ///< systemd journal (needs FOLIO_HAS_SYSTEMD)
    Syslog,  ///< syslog
    File,    ///< Rotating file, 5 MB x 3
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Empty: /var/log/folio.log or $XDG_DATA_HOME/folio/folio.log
};

/**
 * @brief Install the default "folio" logger
 *
 * Also enables a 32 message backtrace and routes LVGL's own log output
 * through spdlog.
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace" ... "off", "warning" alias)
 *
 * Case sensitive. Returns @p default_level for anything else.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::info);

/// Parse a target name; "auto" or anything unrecognized is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Derive a LogConfig from /log_level, /log_target and /log_file
 */
LogConfig config_from(Config& config);

} // namespace logging
} // namespace folio
