// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file board.h
 * @brief Playfield bounds and wall collision
 */

#pragma once

#include "position.h"

#include <optional>

namespace slither {

struct TerminalSize;

/**
 * @class Board
 * @brief Fixed playable interior [0,width) x [0,height)
 *
 * Walls lie outside the interior. The board is sized once at startup and
 * stays immutable for the session.
 */
class Board {
  public:
    /// Smallest board that still makes a playable game
    static constexpr int MIN_WIDTH = 8;
    static constexpr int MIN_HEIGHT = 8;

    /// Terminal columns per board cell
    static constexpr int CELL_COLUMNS = 2;

    Board(int width, int height);

    /**
     * @brief Derive the board from the terminal size
     *
     * One wall cell on each side plus a status line below the bottom wall.
     *
     * @return Board, or std::nullopt if the terminal is too small
     */
    static std::optional<Board> from_terminal(const TerminalSize& size);

    /// true iff @p p lies inside the playable interior
    bool contains(const Position& p) const {
        return p.x >= 0 && p.x < m_width && p.y >= 0 && p.y < m_height;
    }

    int width() const {
        return m_width;
    }
    int height() const {
        return m_height;
    }
    int cell_count() const {
        return m_width * m_height;
    }
    Position center() const {
        return {m_width / 2, m_height / 2};
    }

  private:
    int m_width;
    int m_height;
};

} // namespace slither
