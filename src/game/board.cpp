// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "board.h"

#include "terminal_io.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace slither {

namespace {

// One wall cell left and right, each CELL_COLUMNS wide
constexpr int WALL_COLUMNS = 2 * Board::CELL_COLUMNS;

// Top wall, bottom wall, status line
constexpr int RESERVED_ROWS = 3;

} // namespace

Board::Board(int width, int height) : m_width(std::max(1, width)), m_height(std::max(1, height)) {}

std::optional<Board> Board::from_terminal(const TerminalSize& size) {
    int width = (size.columns - WALL_COLUMNS) / CELL_COLUMNS;
    int height = size.rows - RESERVED_ROWS;

    if (width < MIN_WIDTH || height < MIN_HEIGHT) {
        spdlog::error("[Board] Terminal {}x{} too small: board would be {}x{}, need at least {}x{}",
                      size.columns, size.rows, width, height, MIN_WIDTH, MIN_HEIGHT);
        return std::nullopt;
    }

    spdlog::debug("[Board] Terminal {}x{} -> board {}x{}", size.columns, size.rows, width, height);
    return Board(width, height);
}

} // namespace slither
