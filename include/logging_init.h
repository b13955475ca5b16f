// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief spdlog setup for a process that owns the terminal
 *
 * While the game runs, stdout/stderr belong to the game screen, so the
 * default target is a rotating log file rather than the console.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace slither {
namespace logging {

/**
 * @brief Where log output goes
 */
enum class LogTarget {
    Auto,    ///< File (the terminal is in use by the game)
    Syslog,  ///< syslog(3), Linux only
    File,    ///< Rotating file under $XDG_DATA_HOME/slither/
    Console, ///< stderr with colours; corrupts the screen unless redirected
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< Override for LogTarget::File (empty = default)
};

/**
 * @brief Minimal stderr logger for messages emitted before init()
 *
 * Only used before raw mode is entered.
 */
void init_early();

/**
 * @brief Replace the default logger according to @p config
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name from the config file
 *
 * Accepts trace, debug, info, warn/warning, error, critical, off (case
 * sensitive). Anything else gives @p default_level.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// Parse "auto", "syslog", "file", "console"; anything else gives Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Map -v count to a level
 *
 * 0 = keep @p fallback, 1 = info, 2 = debug, 3+ = trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity, spdlog::level::level_enum fallback);

/// Default log file: $XDG_DATA_HOME/slither/slither.log (or ~/.local/share/...)
std::string default_log_file_path();

} // namespace logging
} // namespace slither
