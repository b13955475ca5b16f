// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace slither {
namespace logging {

namespace {

/// 1MB max size, 3 rotated files
constexpr size_t LOG_FILE_MAX_SIZE = 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

/// Get XDG_DATA_HOME or default ~/.local/share
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp"; // Last resort fallback
}

/// Resolve log file path, creating its directory
std::string resolve_log_file_path(const std::string& override_path) {
    std::string path = override_path.empty() ? default_log_file_path() : override_path;

    std::error_code ec;
    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
    }
    return path;
}

/// Add the sink for @p target; returns false if it could not be created
bool add_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
              const std::string& file_path) {
    switch (target) {
    case LogTarget::Syslog:
#ifdef __linux__
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>("slither", LOG_PID, LOG_USER, false));
        return true;
#else
        return false;
#endif
    case LogTarget::Console:
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        return true;
    case LogTarget::File:
    case LogTarget::Auto: {
        std::string path = resolve_log_file_path(file_path);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, LOG_FILE_MAX_SIZE, LOG_FILE_COUNT));
        } catch (const spdlog::spdlog_ex&) {
            // Nothing else may write to the game screen; stay silent
            return false;
        }
        return true;
    }
    }
    return false;
}

} // namespace

std::string default_log_file_path() {
    return get_xdg_data_home() + "/slither/slither.log";
}

void init_early() {
    // Before raw mode stderr is still ours
    auto logger = spdlog::get("slither-early");
    if (!logger) {
        logger = spdlog::stderr_color_mt("slither-early");
    }
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // Auto means file: the game owns stdout while running
    LogTarget effective_target = (config.target == LogTarget::Auto) ? LogTarget::File : config.target;

    // Without a sink the logger stays silent rather than drawing over the game
    bool has_sink = add_sink(sinks, effective_target, config.file_path);

    // Create logger with all sinks (possibly none)
    auto logger = std::make_shared<spdlog::logger>("slither", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);

    // Set as default logger
    spdlog::set_default_logger(logger);
    spdlog::drop("slither-early");

    // Keep recent messages around for dumping after a failure
    spdlog::enable_backtrace(32);

    spdlog::debug("[Logging] Initialized: target={}, level={}, backtrace=32 messages",
                  has_sink ? log_target_name(effective_target) : "none",
                  spdlog::level::to_string_view(config.level));
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto; // Default for "auto" or unrecognized
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum verbosity_to_level(int verbosity, spdlog::level::level_enum fallback) {
    if (verbosity <= 0) {
        return fallback;
    }
    if (verbosity == 1) {
        return spdlog::level::info;
    }
    if (verbosity == 2) {
        return spdlog::level::debug;
    }
    return spdlog::level::trace;
}

} // namespace logging
} // namespace slither
