// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "food_spawner.h"

#include "board.h"
#include "snake.h"

#include <spdlog/spdlog.h>

#include <vector>

namespace slither {

FoodSpawner::FoodSpawner() : m_rng(std::random_device{}()) {}

FoodSpawner::FoodSpawner(uint32_t seed) : m_rng(seed) {}

std::optional<Position> FoodSpawner::spawn(const Board& board, const Snake& snake) {
    // Mark the body on a grid so the free-cell scan is linear in board size
    std::vector<bool> occupied(static_cast<size_t>(board.cell_count()), false);
    for (const auto& segment : snake.body()) {
        if (board.contains(segment)) {
            occupied[static_cast<size_t>(segment.y * board.width() + segment.x)] = true;
        }
    }

    std::vector<Position> free_cells;
    free_cells.reserve(occupied.size());
    for (int y = 0; y < board.height(); y++) {
        for (int x = 0; x < board.width(); x++) {
            if (!occupied[static_cast<size_t>(y * board.width() + x)]) {
                free_cells.push_back({x, y});
            }
        }
    }

    if (free_cells.empty()) {
        spdlog::info("[FoodSpawner] No free cell left on {}x{} board", board.width(),
                     board.height());
        return std::nullopt;
    }

    std::uniform_int_distribution<size_t> pick(0, free_cells.size() - 1);
    Position food = free_cells[pick(m_rng)];
    spdlog::trace("[FoodSpawner] Food at ({}, {}), {} free cells", food.x, food.y,
                  free_cells.size());
    return food;
}

} // namespace slither
