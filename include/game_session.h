// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file game_session.h
 * @brief Snake game state machine: one tick of move/eat/collide
 *
 * @pattern State machine {RUNNING -> GAME_OVER}, GAME_OVER is terminal
 * @threading Game loop thread only
 */

#pragma once

#include "board.h"
#include "food_spawner.h"
#include "game_settings.h"
#include "input_translator.h"
#include "snake.h"

#include <chrono>

namespace slither {

enum class GameStatus { RUNNING, GAME_OVER };

/**
 * @brief Result of one tick
 */
enum class TickOutcome {
    MOVED,          ///< Plain move, length unchanged
    ATE,            ///< Food eaten: grew by one, score +1, faster
    WALL_COLLISION, ///< Next head left the board -> GAME_OVER
    SELF_COLLISION, ///< Next head hit the body -> GAME_OVER
    WON,            ///< Snake fills the board, no room for food -> GAME_OVER
    IDLE            ///< Tick requested after GAME_OVER, nothing changed
};

const char* tick_outcome_name(TickOutcome outcome);

/**
 * @class GameSession
 * @brief Owns snake, board, food, score and speed for one game
 *
 * ## Usage:
 * @code
 * GameSession session(board, settings);
 * session.apply(input::translate(key));
 * TickOutcome outcome = session.tick();
 * @endcode
 */
class GameSession {
  public:
    /**
     * @brief Start a new game on @p board
     *
     * Builds the starting snake from settings and places the first food.
     */
    GameSession(const Board& board, const GameSettings& settings,
                FoodSpawner spawner = FoodSpawner());

    /**
     * @brief Start from an explicit position (tests, replays)
     *
     * @param food Initial food cell, must not overlap the snake
     */
    GameSession(const Board& board, Snake snake, Position food, const GameSettings& settings,
                FoodSpawner spawner = FoodSpawner());

    /**
     * @brief Apply a steering command
     *
     * MOVE changes heading (reversals ignored by Snake). NONE and QUIT are
     * no-ops here; quitting is handled by the loop.
     */
    void apply(const input::Command& command);

    /**
     * @brief Advance the game by one tick
     *
     * Classification of the next head is total, exactly one branch:
     * wall, self, food, plain move.
     */
    TickOutcome tick();

    const Board& board() const {
        return m_board;
    }
    const Snake& snake() const {
        return m_snake;
    }
    const Position& food() const {
        return m_food;
    }
    /// false once the board is full and no food could be placed
    bool has_food() const {
        return m_has_food;
    }
    int score() const {
        return m_score;
    }
    /// Current tick interval (lower is faster)
    std::chrono::milliseconds speed() const {
        return m_speed;
    }
    std::chrono::milliseconds min_speed() const {
        return m_settings.min_interval;
    }
    GameStatus status() const {
        return m_status;
    }
    bool is_over() const {
        return m_status == GameStatus::GAME_OVER;
    }
    /// Outcome that ended the game (meaningful once is_over())
    TickOutcome end_reason() const {
        return m_end_reason;
    }

  private:
    void end_game(TickOutcome reason);
    void speed_up();

    Board m_board;
    GameSettings m_settings;
    FoodSpawner m_spawner;
    Snake m_snake;
    Position m_food;
    bool m_has_food = true;
    int m_score = 0;
    std::chrono::milliseconds m_speed;
    GameStatus m_status = GameStatus::RUNNING;
    TickOutcome m_end_reason = TickOutcome::IDLE;
};

} // namespace slither
