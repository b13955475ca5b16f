// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace slither;
using namespace slither::logging;

namespace fs = std::filesystem;

// ============================================================================
// parse_level() tests
// ============================================================================

TEST_CASE("parse_level: valid level strings", "[logging][config]") {
    SECTION("trace") {
        REQUIRE(parse_level("trace") == spdlog::level::trace);
    }

    SECTION("debug") {
        REQUIRE(parse_level("debug") == spdlog::level::debug);
    }

    SECTION("info") {
        REQUIRE(parse_level("info") == spdlog::level::info);
    }

    SECTION("warn") {
        REQUIRE(parse_level("warn") == spdlog::level::warn);
    }

    SECTION("warning (alias)") {
        REQUIRE(parse_level("warning") == spdlog::level::warn);
    }

    SECTION("error") {
        REQUIRE(parse_level("error") == spdlog::level::err);
    }

    SECTION("critical") {
        REQUIRE(parse_level("critical") == spdlog::level::critical);
    }

    SECTION("off") {
        REQUIRE(parse_level("off") == spdlog::level::off);
    }
}

TEST_CASE("parse_level: returns default for invalid input", "[logging][config]") {
    SECTION("empty string") {
        REQUIRE(parse_level("", spdlog::level::warn) == spdlog::level::warn);
        REQUIRE(parse_level("", spdlog::level::debug) == spdlog::level::debug);
    }

    SECTION("unrecognized string") {
        REQUIRE(parse_level("verbose", spdlog::level::warn) == spdlog::level::warn);
        REQUIRE(parse_level("TRACE", spdlog::level::info) == spdlog::level::info); // case sensitive
    }
}

// ============================================================================
// Targets
// ============================================================================

TEST_CASE("parse_log_target: names and fallback", "[logging][config]") {
    REQUIRE(parse_log_target("auto") == LogTarget::Auto);
    REQUIRE(parse_log_target("syslog") == LogTarget::Syslog);
    REQUIRE(parse_log_target("file") == LogTarget::File);
    REQUIRE(parse_log_target("console") == LogTarget::Console);
    REQUIRE(parse_log_target("journal") == LogTarget::Auto);
    REQUIRE(parse_log_target("") == LogTarget::Auto);
}

TEST_CASE("log_target_name: round trips every target", "[logging]") {
    for (LogTarget target :
         {LogTarget::Auto, LogTarget::Syslog, LogTarget::File, LogTarget::Console}) {
        REQUIRE(parse_log_target(log_target_name(target)) == target);
    }
}

// ============================================================================
// Verbosity
// ============================================================================

TEST_CASE("verbosity_to_level: -v count overrides the configured level", "[logging]") {
    REQUIRE(verbosity_to_level(0, spdlog::level::err) == spdlog::level::err);
    REQUIRE(verbosity_to_level(1, spdlog::level::err) == spdlog::level::info);
    REQUIRE(verbosity_to_level(2, spdlog::level::err) == spdlog::level::debug);
    REQUIRE(verbosity_to_level(3, spdlog::level::err) == spdlog::level::trace);
    REQUIRE(verbosity_to_level(7, spdlog::level::err) == spdlog::level::trace);
}

// ============================================================================
// File output
// ============================================================================

TEST_CASE("default_log_file_path: follows XDG_DATA_HOME", "[logging][path]") {
    const char* saved = std::getenv("XDG_DATA_HOME");
    std::string saved_value = saved ? saved : "";

    setenv("XDG_DATA_HOME", "/tmp/slither-data", 1);
    REQUIRE(default_log_file_path() == "/tmp/slither-data/slither/slither.log");

    if (saved) {
        setenv("XDG_DATA_HOME", saved_value.c_str(), 1);
    } else {
        unsetenv("XDG_DATA_HOME");
    }
}

TEST_CASE("init: file target writes to the given path", "[logging][file]") {
    fs::path dir = fs::temp_directory_path() /
                   ("slither_log_test_" +
                    std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::path log_file = dir / "nested" / "test.log";

    LogConfig config;
    config.level = spdlog::level::info;
    config.target = LogTarget::File;
    config.file_path = log_file.string();
    init(config);

    REQUIRE(spdlog::default_logger()->level() == spdlog::level::info);

    spdlog::warn("[Test] marker line");
    spdlog::default_logger()->flush();

    REQUIRE(fs::exists(log_file));
    std::ifstream in(log_file);
    std::stringstream contents;
    contents << in.rdbuf();
    REQUIRE(contents.str().find("[Test] marker line") != std::string::npos);

    // Leave a quiet logger behind for other tests
    init_early();
    std::error_code ec;
    fs::remove_all(dir, ec);
}
