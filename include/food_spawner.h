// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file food_spawner.h
 * @brief Random food placement on free board cells
 */

#pragma once

#include "position.h"

#include <cstdint>
#include <optional>
#include <random>

namespace slither {

class Board;
class Snake;

/**
 * @class FoodSpawner
 * @brief Uniform choice among the cells the snake does not cover
 *
 * Free cells are enumerated instead of retried, so a nearly full board
 * costs one pass and a full board is reported rather than looped on.
 */
class FoodSpawner {
  public:
    /// Seeded from std::random_device
    FoodSpawner();

    /// Deterministic sequence for tests and --seed
    explicit FoodSpawner(uint32_t seed);

    /**
     * @brief Pick a food position
     *
     * @return Free cell, or std::nullopt when the snake fills the board
     */
    std::optional<Position> spawn(const Board& board, const Snake& snake);

  private:
    std::mt19937 m_rng;
};

} // namespace slither
