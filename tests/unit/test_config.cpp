// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_config.cpp
 * @brief Unit tests for the JSON settings file: defaults, merge, errors, save
 */

#include "config.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;

namespace slither {

// Test fixture for Config class testing
class ConfigTestFixture {
  public:
    ConfigTestFixture() {
        temp_dir_ = fs::temp_directory_path() /
                    ("slither_config_test_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(temp_dir_);
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

  protected:
    Config config;
    fs::path temp_dir_;

    std::string config_path() const {
        return (temp_dir_ / "settings.json").string();
    }

    void write_file(const std::string& content) const {
        std::ofstream ofs(config_path());
        ofs << content;
    }

    std::string read_file() const {
        std::ifstream ifs(config_path());
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }

    // Helper methods to access protected members
    void set_data(const json& data) {
        config.data = data;
    }

    const json& data() const {
        return config.data;
    }
};

} // namespace slither

using namespace slither;

// ============================================================================
// Loading
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: missing file is created with defaults",
                 "[core][config][init]") {
    REQUIRE(config.init(config_path()));

    REQUIRE(fs::exists(config_path()));
    REQUIRE(config.get<int>("/game/initial_interval_ms") == 150);
    REQUIRE(config.get<int>("/game/min_interval_ms") == 60);
    REQUIRE(config.get<int>("/game/interval_step_ms") == 5);
    REQUIRE(config.get<int>("/game/initial_length") == 3);
    REQUIRE(config.get<std::string>("/log_level") == "warn");
    REQUIRE(config.get<std::string>("/log_dest") == "auto");
    REQUIRE(config.get_path() == config_path());

    json on_disk = json::parse(read_file());
    REQUIRE(on_disk == Config::defaults());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: missing directories are created",
                 "[config][init]") {
    std::string nested = (temp_dir_ / "a" / "b" / "settings.json").string();
    REQUIRE(config.init(nested));
    REQUIRE(fs::exists(nested));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: user values are kept and gaps filled",
                 "[core][config][init]") {
    write_file(R"({"game": {"initial_interval_ms": 200}, "log_level": "debug"})");

    REQUIRE(config.init(config_path()));

    REQUIRE(config.get<int>("/game/initial_interval_ms") == 200);
    REQUIRE(config.get<int>("/game/min_interval_ms") == 60);
    REQUIRE(config.get<std::string>("/log_level") == "debug");
    REQUIRE(config.get<std::string>("/log_dest") == "auto");

    // Merged defaults are written back
    json on_disk = json::parse(read_file());
    REQUIRE(on_disk["game"]["initial_interval_ms"] == 200);
    REQUIRE(on_disk["game"]["initial_length"] == 3);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: unparseable file is left untouched",
                 "[core][config][init]") {
    const std::string broken = "{\"game\": { not json";
    write_file(broken);

    REQUIRE_FALSE(config.init(config_path()));

    REQUIRE(read_file() == broken);
    REQUIRE(config.get<int>("/game/initial_interval_ms") == 150);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: non-object JSON falls back to defaults",
                 "[config][init]") {
    write_file("[1, 2, 3]");

    REQUIRE_FALSE(config.init(config_path()));
    REQUIRE(data() == Config::defaults());
}

// ============================================================================
// get()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with missing key throws",
                 "[config][get]") {
    set_data(Config::defaults());
    REQUIRE_THROWS_AS(config.get<std::string>("/nonexistent"), nlohmann::json::type_error);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default", "[config][get]") {
    set_data({{"game", {{"initial_interval_ms", "fast"}}}, {"log_level", "info"}});

    SECTION("existing value wins") {
        REQUIRE(config.get<std::string>("/log_level", "warn") == "info");
    }

    SECTION("missing key gives the default") {
        REQUIRE(config.get<int>("/game/min_interval_ms", 60) == 60);
        REQUIRE(config.get<std::string>("/log_dest", "auto") == "auto");
    }

    SECTION("wrong type gives the default") {
        REQUIRE(config.get<int>("/game/initial_interval_ms", 150) == 150);
    }
}

// ============================================================================
// set() / save()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: saved values survive a reload",
                 "[core][config][save]") {
    REQUIRE(config.init(config_path()));
    config.set<int>("/game/initial_length", 5);
    config.set<std::string>("/log_level", "trace");
    REQUIRE(config.save());
    REQUIRE_FALSE(fs::exists(config_path() + ".tmp"));

    Config reloaded;
    REQUIRE(reloaded.init(config_path()));
    REQUIRE(reloaded.get<int>("/game/initial_length") == 5);
    REQUIRE(reloaded.get<std::string>("/log_level") == "trace");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save into a missing directory fails",
                 "[config][save]") {
    REQUIRE(config.init(config_path()));
    fs::remove_all(temp_dir_);

    REQUIRE_FALSE(config.save());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get_json returns a live reference",
                 "[config]") {
    set_data(Config::defaults());
    json& game = config.get_json("/game");
    game["initial_length"] = 7;
    REQUIRE(config.get<int>("/game/initial_length") == 7);
}

// ============================================================================
// Location
// ============================================================================

TEST_CASE("Config: default path follows XDG_CONFIG_HOME", "[config][path]") {
    const char* saved = std::getenv("XDG_CONFIG_HOME");
    std::string saved_value = saved ? saved : "";

    setenv("XDG_CONFIG_HOME", "/tmp/slither-xdg", 1);
    REQUIRE(Config::default_path() == "/tmp/slither-xdg/slither/settings.json");

    setenv("XDG_CONFIG_HOME", "", 1);
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        REQUIRE(Config::default_path() == std::string(home) + "/.config/slither/settings.json");
    }

    if (saved) {
        setenv("XDG_CONFIG_HOME", saved_value.c_str(), 1);
    } else {
        unsetenv("XDG_CONFIG_HOME");
    }
}
