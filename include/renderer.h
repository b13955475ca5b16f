// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file renderer.h
 * @brief ANSI frame composition for the game screen
 *
 * Every frame is a full repaint (cursor home, every cell written) handed to
 * the terminal in one write. No diffing against the previous frame.
 *
 * @threading Game loop thread only
 */

#pragma once

#include <chrono>
#include <string>

namespace slither {

class GameSession;
class TerminalIo;

namespace ansi {
constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* DIM = "\033[2m";
constexpr const char* RED = "\033[31m";
constexpr const char* GREEN = "\033[32m";
constexpr const char* YELLOW = "\033[33m";
constexpr const char* MAGENTA = "\033[35m";
constexpr const char* CYAN = "\033[36m";
constexpr const char* WHITE = "\033[37m";
constexpr const char* BRIGHT_BLACK = "\033[90m";
constexpr const char* BRIGHT_RED = "\033[91m";
constexpr const char* CURSOR_HOME = "\033[H";
constexpr const char* CLEAR_EOL = "\033[K";
constexpr const char* CLEAR_BELOW = "\033[J";
} // namespace ansi

/**
 * @brief Snake colour for a tick interval
 *
 * Five bands, faster speeds map to warmer colours:
 * >=130ms green, >=110ms cyan, >=90ms yellow, >=70ms magenta, else red.
 */
const char* speed_color(std::chrono::milliseconds interval);

/**
 * @class Renderer
 * @brief Stateless drawer for a GameSession
 */
class Renderer {
  public:
    static constexpr const char* HEAD_GLYPH = "@@";
    static constexpr const char* BODY_GLYPH = "[]";
    static constexpr const char* FOOD_GLYPH = "<>";
    static constexpr const char* WALL_GLYPH = "##";
    static constexpr const char* EMPTY_GLYPH = "  ";

    /**
     * @brief Build the complete frame for the current state
     *
     * Layout: wall row, board rows framed by walls, wall row, status line.
     * A GAME_OVER session also gets a banner over the board centre.
     */
    static std::string compose(const GameSession& session);

    /**
     * @brief Compose and write one frame
     * @return false if the terminal write failed
     */
    static bool draw(const GameSession& session, TerminalIo& terminal);
};

} // namespace slither
