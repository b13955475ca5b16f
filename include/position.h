// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file position.h
 * @brief Board coordinates and movement directions
 *
 * Position is a value type: positions are computed, never mutated in place.
 */

#pragma once

namespace slither {

enum class Direction { UP, DOWN, LEFT, RIGHT };

/// Direction pointing the other way (UP <-> DOWN, LEFT <-> RIGHT)
constexpr Direction opposite(Direction dir) {
    switch (dir) {
    case Direction::UP:
        return Direction::DOWN;
    case Direction::DOWN:
        return Direction::UP;
    case Direction::LEFT:
        return Direction::RIGHT;
    case Direction::RIGHT:
        return Direction::LEFT;
    }
    return dir;
}

/// Human-readable direction name for logging
const char* direction_name(Direction dir);

/**
 * @brief Board-relative cell coordinate, 0-indexed, y grows downward
 */
struct Position {
    int x = 0;
    int y = 0;

    constexpr Position() = default;
    constexpr Position(int x_, int y_) : x(x_), y(y_) {}

    constexpr bool operator==(const Position& o) const {
        return x == o.x && y == o.y;
    }
    constexpr bool operator!=(const Position& o) const {
        return !(*this == o);
    }

    constexpr Position operator+(const Position& o) const {
        return {x + o.x, y + o.y};
    }
    constexpr Position operator-(const Position& o) const {
        return {x - o.x, y - o.y};
    }

    /// Neighbouring cell one step in @p dir
    constexpr Position step(Direction dir) const {
        return *this + unit(dir);
    }

    /// Unit offset for a direction
    static constexpr Position unit(Direction dir) {
        switch (dir) {
        case Direction::UP:
            return {0, -1};
        case Direction::DOWN:
            return {0, 1};
        case Direction::LEFT:
            return {-1, 0};
        case Direction::RIGHT:
            return {1, 0};
        }
        return {0, 0};
    }
};

} // namespace slither
