// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "game_session.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace slither {

const char* tick_outcome_name(TickOutcome outcome) {
    switch (outcome) {
    case TickOutcome::MOVED:
        return "moved";
    case TickOutcome::ATE:
        return "ate";
    case TickOutcome::WALL_COLLISION:
        return "wall collision";
    case TickOutcome::SELF_COLLISION:
        return "self collision";
    case TickOutcome::WON:
        return "won";
    case TickOutcome::IDLE:
        return "idle";
    }
    return "unknown";
}

GameSession::GameSession(const Board& board, const GameSettings& settings, FoodSpawner spawner)
    : m_board(board), m_settings(settings), m_spawner(std::move(spawner)),
      m_snake(Snake::initial(board, settings.initial_length)), m_speed(settings.initial_interval) {
    auto food = m_spawner.spawn(m_board, m_snake);
    if (food) {
        m_food = *food;
    } else {
        // Only reachable on a board the starting snake already fills
        m_has_food = false;
        end_game(TickOutcome::WON);
    }

    spdlog::info("[GameSession] New game on {}x{} board, snake length {}, food at ({}, {})",
                 m_board.width(), m_board.height(), m_snake.length(), m_food.x, m_food.y);
}

GameSession::GameSession(const Board& board, Snake snake, Position food,
                         const GameSettings& settings, FoodSpawner spawner)
    : m_board(board), m_settings(settings), m_spawner(std::move(spawner)),
      m_snake(std::move(snake)), m_food(food), m_speed(settings.initial_interval) {
    if (m_snake.occupies(m_food) || !m_board.contains(m_food)) {
        spdlog::warn("[GameSession] Food at ({}, {}) not on a free cell, respawning", m_food.x,
                     m_food.y);
        auto respawned = m_spawner.spawn(m_board, m_snake);
        if (respawned) {
            m_food = *respawned;
        } else {
            m_has_food = false;
            end_game(TickOutcome::WON);
        }
    }
}

void GameSession::apply(const input::Command& command) {
    if (!command.is_move() || is_over()) {
        return;
    }
    if (!m_snake.set_direction(command.direction)) {
        spdlog::trace("[GameSession] Ignored reversal to {} while heading {}",
                      direction_name(command.direction), direction_name(m_snake.direction()));
    }
}

TickOutcome GameSession::tick() {
    if (is_over()) {
        return TickOutcome::IDLE;
    }

    Position next_head = m_snake.next_head_position();

    if (!m_board.contains(next_head)) {
        end_game(TickOutcome::WALL_COLLISION);
        return TickOutcome::WALL_COLLISION;
    }

    if (m_snake.will_collide(next_head)) {
        end_game(TickOutcome::SELF_COLLISION);
        return TickOutcome::SELF_COLLISION;
    }

    if (m_has_food && next_head == m_food) {
        m_snake.grow(1);
        m_snake.advance(next_head);
        m_score++;
        speed_up();

        auto food = m_spawner.spawn(m_board, m_snake);
        if (!food) {
            m_has_food = false;
            end_game(TickOutcome::WON);
            return TickOutcome::WON;
        }
        m_food = *food;
        spdlog::debug("[GameSession] Ate food, score {}, length {}, interval {}ms", m_score,
                      m_snake.length(), m_speed.count());
        return TickOutcome::ATE;
    }

    m_snake.advance(next_head);
    return TickOutcome::MOVED;
}

void GameSession::end_game(TickOutcome reason) {
    m_status = GameStatus::GAME_OVER;
    m_end_reason = reason;
    spdlog::info("[GameSession] Game over ({}): score {}, length {}", tick_outcome_name(reason),
                 m_score, m_snake.length());
}

void GameSession::speed_up() {
    m_speed = std::max(m_settings.min_interval, m_speed - m_settings.interval_step);
}

} // namespace slither
