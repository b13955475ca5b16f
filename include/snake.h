// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file snake.h
 * @brief Snake body, heading and growth
 *
 * @pattern Value-owning model, no rendering or input knowledge
 * @threading Game loop thread only
 */

#pragma once

#include "position.h"

#include <cstddef>
#include <deque>

namespace slither {

class Board;

/**
 * @class Snake
 * @brief Ordered body (head first) with direction and pending growth
 *
 * The body is never empty. Apart from the tick in which a collision is
 * being evaluated, no two segments share a cell.
 *
 * ## Usage:
 * @code
 * Snake snake({{5, 5}, {4, 5}, {3, 5}}, Direction::RIGHT);
 * Position next = snake.next_head_position();
 * if (!snake.will_collide(next)) {
 *     snake.advance(next);
 * }
 * @endcode
 */
class Snake {
  public:
    using Body = std::deque<Position>;

    /**
     * @brief Construct from an explicit body
     *
     * @param body Segments head first; an empty body is replaced by a single
     *             segment at the origin
     * @param direction Initial heading
     */
    Snake(Body body, Direction direction);

    /**
     * @brief Build the starting snake for a board
     *
     * Horizontal, heading right, head at the board centre. The length is
     * clamped so the tail stays on the board.
     */
    static Snake initial(const Board& board, int length);

    /**
     * @brief Move one cell: insert @p next_head at the front
     *
     * The tail is dropped unless growth is pending, in which case the
     * pending count is decremented and the snake gets one segment longer.
     * Caller guarantees @p next_head is adjacent to the current head.
     */
    void advance(const Position& next_head);

    /**
     * @brief Change heading
     *
     * Ignored when @p dir is the reverse of the current heading or would
     * step the head onto the neck segment.
     *
     * @return true if the heading was changed or already equal
     */
    bool set_direction(Direction dir);

    /// Cell the head moves to on the next advance (does not mutate)
    Position next_head_position() const;

    /// Membership test over every segment
    bool occupies(const Position& p) const;

    /**
     * @brief Self-collision test for a prospective head position
     *
     * Same as occupies() except the tail cell is treated as free when it
     * will be vacated this tick (no growth pending).
     */
    bool will_collide(const Position& next_head) const;

    /// Owe @p n more segments; each subsequent advance keeps the tail once
    void grow(int n);

    const Position& head() const {
        return m_body.front();
    }
    const Position& tail() const {
        return m_body.back();
    }
    const Body& body() const {
        return m_body;
    }
    std::size_t length() const {
        return m_body.size();
    }
    Direction direction() const {
        return m_direction;
    }
    int growth_pending() const {
        return m_growth_pending;
    }

  private:
    Body m_body;
    Direction m_direction;
    int m_growth_pending = 0;
};

} // namespace slither
