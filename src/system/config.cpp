// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "game_settings.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace slither {

Config* Config::instance{nullptr};

namespace {

/// Default game tuning section
json get_default_game_config() {
    return {{"initial_interval_ms", GameSettings::DEFAULT_INITIAL_INTERVAL_MS},
            {"min_interval_ms", GameSettings::DEFAULT_MIN_INTERVAL_MS},
            {"interval_step_ms", GameSettings::DEFAULT_INTERVAL_STEP_MS},
            {"initial_length", GameSettings::DEFAULT_INITIAL_LENGTH}};
}

/// Fill keys missing from @p target with values from @p defaults (recursively)
/// @return true if anything was added
bool merge_missing(json& target, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            modified |= merge_missing(target[it.key()], it.value());
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

json Config::defaults() {
    return {{"game", get_default_game_config()}, {"log_level", "warn"}, {"log_dest", "auto"}};
}

std::string Config::default_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/slither/settings.json";
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/slither/settings.json";
    }

    return "slither.json"; // Last resort: current directory
}

bool Config::init(const std::string& config_path) {
    path = config_path;
    data = defaults();

    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        spdlog::info("[Config] No config at {}, creating with defaults", config_path);

        fs::path config_dir = fs::path(config_path).parent_path();
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
            if (ec) {
                spdlog::warn("[Config] Cannot create {}: {}", config_dir.string(), ec.message());
            }
        }

        if (!save()) {
            spdlog::warn("[Config] Running with in-memory defaults");
        }
        return true;
    }

    try {
        std::ifstream in(config_path);
        json loaded = json::parse(in);
        if (!loaded.is_object()) {
            spdlog::warn("[Config] {} is not a JSON object, using defaults", config_path);
            return false;
        }
        data = std::move(loaded);
    } catch (const json::parse_error& e) {
        spdlog::warn("[Config] Failed to parse {}: {}", config_path, e.what());
        spdlog::warn("[Config] Using defaults; the file is left untouched");
        return false;
    }

    if (merge_missing(data, defaults())) {
        spdlog::info("[Config] Added missing defaults to {}", config_path);
        save();
    }

    spdlog::debug("[Config] Loaded {}", config_path);
    return true;
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    // Write to a temp file, then rename over the original
    std::string tmp_path = path + ".tmp";
    try {
        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", tmp_path);
            return false;
        }
        o.close();
    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", tmp_path, e.what());
        return false;
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        spdlog::error("[Config] Could not replace {}", path);
        std::remove(tmp_path.c_str());
        return false;
    }

    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

} // namespace slither
