// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "position.h"

namespace slither {

const char* direction_name(Direction dir) {
    switch (dir) {
    case Direction::UP:
        return "up";
    case Direction::DOWN:
        return "down";
    case Direction::LEFT:
        return "left";
    case Direction::RIGHT:
        return "right";
    }
    return "unknown";
}

} // namespace slither
