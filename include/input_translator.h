// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file input_translator.h
 * @brief Key event to game command mapping
 *
 * Controls:
 * - W/A/S/D (either case) and arrow keys steer
 * - Q, Esc and Ctrl+C quit
 */

#pragma once

#include "position.h"
#include "terminal_io.h"

#include <optional>

namespace slither::input {

/**
 * @brief Game command produced from a key event
 */
struct Command {
    enum class Type { NONE, MOVE, QUIT };

    Type type = Type::NONE;
    Direction direction = Direction::UP; ///< Valid for Type::MOVE only

    static Command none() {
        return {};
    }
    static Command move(Direction dir) {
        return {Type::MOVE, dir};
    }
    static Command quit() {
        return {Type::QUIT, Direction::UP};
    }

    bool is_none() const {
        return type == Type::NONE;
    }
    bool is_move() const {
        return type == Type::MOVE;
    }
    bool is_quit() const {
        return type == Type::QUIT;
    }

    bool operator==(const Command& o) const {
        return type == o.type && (type != Type::MOVE || direction == o.direction);
    }
    bool operator!=(const Command& o) const {
        return !(*this == o);
    }
};

/// Map a key event to a command; no key and unmapped keys give Command::none()
Command translate(const std::optional<RawKey>& key);

} // namespace slither::input
