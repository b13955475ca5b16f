// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "input_translator.h"

namespace slither::input {

Command translate(const std::optional<RawKey>& key) {
    if (!key) {
        return Command::none();
    }

    switch (key->code) {
    case KeyCode::UP:
        return Command::move(Direction::UP);
    case KeyCode::DOWN:
        return Command::move(Direction::DOWN);
    case KeyCode::LEFT:
        return Command::move(Direction::LEFT);
    case KeyCode::RIGHT:
        return Command::move(Direction::RIGHT);
    case KeyCode::ESCAPE:
    case KeyCode::INTERRUPT:
        return Command::quit();
    case KeyCode::CHAR:
        break;
    case KeyCode::UNKNOWN:
        return Command::none();
    }

    switch (key->ch) {
    case 'w':
    case 'W':
        return Command::move(Direction::UP);
    case 's':
    case 'S':
        return Command::move(Direction::DOWN);
    case 'a':
    case 'A':
        return Command::move(Direction::LEFT);
    case 'd':
    case 'D':
        return Command::move(Direction::RIGHT);
    case 'q':
    case 'Q':
        return Command::quit();
    default:
        return Command::none();
    }
}

} // namespace slither::input
