// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __SLITHER_CONFIG_H__
#define __SLITHER_CONFIG_H__

#include <spdlog/spdlog.h>

#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace slither {

/**
 * @brief Settings file access (singleton)
 *
 * Holds the parsed settings.json and hands out values by JSON pointer
 * ("/game/min_interval_ms"). The document always contains every key of
 * defaults(): missing keys are merged in at init().
 *
 * @threading Main thread only, initialized once before the game starts
 *
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init(Config::default_path());
 * int floor_ms = cfg->get<int>("/game/min_interval_ms", 60);
 * ```
 */
class Config {
  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    static Config* get_instance();

    /**
     * @brief Load @p config_path, creating it from defaults() if absent
     *
     * A file that exists but does not parse (or is not an object) is never
     * rewritten; the in-memory document stays at defaults().
     *
     * @return false if an existing file was unusable
     */
    bool init(const std::string& config_path);

    /// Value at @p json_ptr; throws nlohmann::json::exception when absent
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /// Value at @p json_ptr, or @p default_value when absent or mistyped
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::type_error& e) {
            spdlog::warn("[Config] Wrong type at {}: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /// Store @p v at @p json_ptr (in memory until save())
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /// Mutable sub-document at @p json_path
    json& get_json(const std::string& json_path);

    /**
     * @brief Write the document to the loaded path
     *
     * Goes through "<path>.tmp" and a rename, so a failed write leaves the
     * previous file intact.
     */
    bool save();

    std::string get_path();

    /// $XDG_CONFIG_HOME/slither/settings.json, else ~/.config/..., else ./slither.json
    static std::string default_path();

    /// Game tuning plus log_level and log_dest
    static json defaults();

  protected:
    json data;

    friend class ConfigTestFixture;

  private:
    static Config* instance;
    std::string path;
};

} // namespace slither

#endif // __SLITHER_CONFIG_H__
