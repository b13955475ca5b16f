// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file game_settings.h
 * @brief Tuning constants for pacing and the starting snake
 */

#pragma once

#include <chrono>

namespace slither {

class Config;

/**
 * @brief Pacing and start-of-game parameters
 *
 * The tick interval starts at initial_interval and shrinks by
 * interval_step for every food eaten, never going below min_interval.
 */
struct GameSettings {
    static constexpr int DEFAULT_INITIAL_INTERVAL_MS = 150;
    static constexpr int DEFAULT_MIN_INTERVAL_MS = 60;
    static constexpr int DEFAULT_INTERVAL_STEP_MS = 5;
    static constexpr int DEFAULT_INITIAL_LENGTH = 3;

    /// Largest magnitude accepted from the settings file (ms or segments)
    static constexpr int MAX_SETTING_VALUE = 1000000;

    std::chrono::milliseconds initial_interval{DEFAULT_INITIAL_INTERVAL_MS};
    std::chrono::milliseconds min_interval{DEFAULT_MIN_INTERVAL_MS};
    std::chrono::milliseconds interval_step{DEFAULT_INTERVAL_STEP_MS};
    int initial_length = DEFAULT_INITIAL_LENGTH;

    /**
     * @brief Read /game/... keys from the config
     *
     * Invalid values (non-positive, floor above start, step negative,
     * length below 1) fall back to their defaults with a warning.
     */
    static GameSettings from_config(Config& config);

    /// Replace invalid fields with defaults; returns true if anything changed
    bool sanitize();
};

} // namespace slither
