// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "snake.h"

#include "board.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace slither {

Snake::Snake(Body body, Direction direction) : m_body(std::move(body)), m_direction(direction) {
    if (m_body.empty()) {
        spdlog::warn("[Snake] Empty body, starting with a single segment at origin");
        m_body.push_back({0, 0});
    }
}

Snake Snake::initial(const Board& board, int length) {
    Position head = board.center();

    // Tail extends to the left of the head and must stay on the board
    int max_length = head.x + 1;
    int clamped = std::clamp(length, 1, max_length);
    if (clamped != length) {
        spdlog::warn("[Snake] Initial length {} does not fit, using {}", length, clamped);
    }

    Body body;
    for (int i = 0; i < clamped; i++) {
        body.push_back({head.x - i, head.y});
    }
    return Snake(std::move(body), Direction::RIGHT);
}

void Snake::advance(const Position& next_head) {
    m_body.push_front(next_head);
    if (m_growth_pending > 0) {
        m_growth_pending--;
    } else {
        m_body.pop_back();
    }
}

bool Snake::set_direction(Direction dir) {
    if (dir == opposite(m_direction)) {
        return false;
    }
    // Covers a heading queued earlier in the same tick
    if (m_body.size() > 1 && head().step(dir) == m_body[1]) {
        return false;
    }
    m_direction = dir;
    return true;
}

Position Snake::next_head_position() const {
    return head().step(m_direction);
}

bool Snake::occupies(const Position& p) const {
    return std::find(m_body.begin(), m_body.end(), p) != m_body.end();
}

bool Snake::will_collide(const Position& next_head) const {
    auto end = m_body.end();
    if (m_growth_pending == 0) {
        --end; // Tail moves away this tick
    }
    return std::find(m_body.begin(), end, next_head) != end;
}

void Snake::grow(int n) {
    if (n > 0) {
        m_growth_pending += n;
    }
}

} // namespace slither
