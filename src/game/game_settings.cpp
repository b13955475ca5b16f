// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "game_settings.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <string>

namespace slither {

namespace {

/**
 * @brief Read an integer setting that may be stored as any JSON number
 *
 * Fractions and magnitudes above MAX_SETTING_VALUE give @p default_value,
 * so nothing out of range is ever converted to int. Sign and ordering
 * checks are left to sanitize().
 */
int read_setting(Config& config, const std::string& json_ptr, int default_value) {
    double value = config.get<double>(json_ptr, default_value);
    if (!std::isfinite(value) || value < -GameSettings::MAX_SETTING_VALUE ||
        value > GameSettings::MAX_SETTING_VALUE || value != std::trunc(value)) {
        spdlog::warn("[GameSettings] {} out of range or not an integer: {}", json_ptr, value);
        return default_value;
    }
    return static_cast<int>(value);
}

} // namespace

GameSettings GameSettings::from_config(Config& config) {
    GameSettings settings;
    settings.initial_interval = std::chrono::milliseconds(
        read_setting(config, "/game/initial_interval_ms", DEFAULT_INITIAL_INTERVAL_MS));
    settings.min_interval = std::chrono::milliseconds(
        read_setting(config, "/game/min_interval_ms", DEFAULT_MIN_INTERVAL_MS));
    settings.interval_step = std::chrono::milliseconds(
        read_setting(config, "/game/interval_step_ms", DEFAULT_INTERVAL_STEP_MS));
    settings.initial_length =
        read_setting(config, "/game/initial_length", DEFAULT_INITIAL_LENGTH);

    if (settings.sanitize()) {
        spdlog::warn("[GameSettings] Invalid values in {}, defaults substituted",
                     config.get_path());
    }

    spdlog::debug("[GameSettings] interval {}ms -> {}ms, step {}ms, initial length {}",
                  settings.initial_interval.count(), settings.min_interval.count(),
                  settings.interval_step.count(), settings.initial_length);
    return settings;
}

bool GameSettings::sanitize() {
    bool changed = false;

    if (initial_interval.count() <= 0) {
        spdlog::warn("[GameSettings] initial_interval_ms must be positive, got {}",
                     initial_interval.count());
        initial_interval = std::chrono::milliseconds(DEFAULT_INITIAL_INTERVAL_MS);
        changed = true;
    }

    if (min_interval.count() <= 0) {
        spdlog::warn("[GameSettings] min_interval_ms must be positive, got {}",
                     min_interval.count());
        min_interval = std::chrono::milliseconds(DEFAULT_MIN_INTERVAL_MS);
        changed = true;
    }

    // Floor above the start would make the game slow down
    if (min_interval > initial_interval) {
        spdlog::warn("[GameSettings] min_interval_ms {} exceeds initial_interval_ms {}, clamping",
                     min_interval.count(), initial_interval.count());
        min_interval = initial_interval;
        changed = true;
    }

    if (interval_step.count() < 0) {
        spdlog::warn("[GameSettings] interval_step_ms must not be negative, got {}",
                     interval_step.count());
        interval_step = std::chrono::milliseconds(DEFAULT_INTERVAL_STEP_MS);
        changed = true;
    }

    if (initial_length < 1) {
        spdlog::warn("[GameSettings] initial_length must be at least 1, got {}", initial_length);
        initial_length = DEFAULT_INITIAL_LENGTH;
        changed = true;
    }

    return changed;
}

} // namespace slither
