// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file renderer.cpp
 * @brief Full-frame ANSI rendering of the board, snake, food and status line
 *
 * Each board cell is CELL_COLUMNS (2) characters wide so cells look square.
 * Colour escapes are only emitted when the colour changes along a row.
 */

#include "renderer.h"

#include "game_session.h"
#include "terminal_io.h"

#include <spdlog/fmt/fmt.h>

#include <iterator>
#include <vector>

namespace slither {

// ============================================================================
// CONSTANTS
// ============================================================================

namespace {

struct SpeedBand {
    int min_interval_ms; // Band applies to intervals >= this
    const char* color;
};

// Slow to fast; the last band catches everything below 70ms
constexpr SpeedBand SPEED_BANDS[] = {
    {130, ansi::GREEN}, {110, ansi::CYAN}, {90, ansi::YELLOW}, {70, ansi::MAGENTA}, {0, ansi::RED},
};

constexpr const char* WALL_COLOR = ansi::BRIGHT_BLACK;
constexpr const char* FOOD_COLOR = ansi::BRIGHT_RED;
constexpr const char* DEAD_COLOR = ansi::RED;
constexpr const char* BANNER_COLOR = "\033[1;37m";

constexpr const char* GAME_OVER_BANNER = " GAME OVER ";
constexpr const char* WIN_BANNER = " YOU WIN! ";

// ============================================================================
// TYPES
// ============================================================================

enum class CellKind { EMPTY, BODY, HEAD, FOOD };

/// One rendered cell: glyph plus the colour it is drawn in
struct Cell {
    std::string glyph;
    const char* color;
};

/// Appends to a frame, emitting colour escapes only on change
class FrameBuilder {
  public:
    explicit FrameBuilder(size_t reserve) {
        m_out.reserve(reserve);
    }

    void put(const std::string& text, const char* color) {
        if (color != m_color) {
            m_out += ansi::RESET;
            if (color) {
                m_out += color;
            }
            m_color = color;
        }
        m_out += text;
    }

    void end_line() {
        m_out += ansi::RESET;
        m_color = nullptr;
        m_out += ansi::CLEAR_EOL;
        m_out += "\r\n";
    }

    void raw(const char* text) {
        m_out += text;
    }

    std::string take() {
        return std::move(m_out);
    }

  private:
    std::string m_out;
    const char* m_color = nullptr;
};

// ============================================================================
// HELPERS
// ============================================================================

std::vector<CellKind> build_grid(const GameSession& session) {
    const Board& board = session.board();
    std::vector<CellKind> grid(static_cast<size_t>(board.cell_count()), CellKind::EMPTY);

    auto index = [&board](const Position& p) {
        return static_cast<size_t>(p.y * board.width() + p.x);
    };

    if (session.has_food() && board.contains(session.food())) {
        grid[index(session.food())] = CellKind::FOOD;
    }

    const auto& body = session.snake().body();
    for (size_t i = 0; i < body.size(); i++) {
        if (board.contains(body[i])) {
            grid[index(body[i])] = (i == 0) ? CellKind::HEAD : CellKind::BODY;
        }
    }
    return grid;
}

Cell cell_for(CellKind kind, const char* snake_color) {
    switch (kind) {
    case CellKind::HEAD:
        return {Renderer::HEAD_GLYPH, snake_color};
    case CellKind::BODY:
        return {Renderer::BODY_GLYPH, snake_color};
    case CellKind::FOOD:
        return {Renderer::FOOD_GLYPH, FOOD_COLOR};
    case CellKind::EMPTY:
        break;
    }
    return {Renderer::EMPTY_GLYPH, nullptr};
}

/// Overwrite the middle of @p row with @p text, two characters per cell
void overlay_banner(std::vector<Cell>& row, const std::string& text) {
    std::string padded = text;
    if (padded.size() % 2 != 0) {
        padded += ' ';
    }

    size_t cells = padded.size() / 2;
    if (cells > row.size()) {
        cells = row.size();
    }
    size_t start = (row.size() - cells) / 2;

    for (size_t i = 0; i < cells; i++) {
        row[start + i] = {padded.substr(i * 2, 2), BANNER_COLOR};
    }
}

/// Status text, cut to @p max_columns so the last row never wraps and scrolls
std::string status_line(const GameSession& session, size_t max_columns) {
    std::string line = fmt::format("Score: {}  Length: {}  Speed: {}ms", session.score(),
                                   session.snake().length(), session.speed().count());
    if (session.is_over()) {
        line += "  |  Press Q to quit";
    } else {
        line += "  |  WASD/arrows steer, Q quits";
    }
    if (line.size() > max_columns) {
        line.resize(max_columns);
    }
    return line;
}

} // namespace

// ============================================================================
// PUBLIC API
// ============================================================================

const char* speed_color(std::chrono::milliseconds interval) {
    for (const auto& band : SPEED_BANDS) {
        if (interval.count() >= band.min_interval_ms) {
            return band.color;
        }
    }
    return SPEED_BANDS[std::size(SPEED_BANDS) - 1].color;
}

std::string Renderer::compose(const GameSession& session) {
    const Board& board = session.board();
    const int width = board.width();
    const int height = board.height();

    const char* snake_color = session.is_over() ? DEAD_COLOR : speed_color(session.speed());
    std::vector<CellKind> grid = build_grid(session);

    // Rough upper bound: every cell with a colour change
    FrameBuilder frame(static_cast<size_t>((width + 2) * (height + 3)) * 16);
    frame.raw(ansi::CURSOR_HOME);

    // Top wall
    for (int x = 0; x < width + 2; x++) {
        frame.put(WALL_GLYPH, WALL_COLOR);
    }
    frame.end_line();

    const int banner_row = height / 2;
    std::vector<Cell> row;
    row.reserve(static_cast<size_t>(width));

    for (int y = 0; y < height; y++) {
        row.clear();
        for (int x = 0; x < width; x++) {
            row.push_back(cell_for(grid[static_cast<size_t>(y * width + x)], snake_color));
        }

        if (session.is_over() && y == banner_row) {
            overlay_banner(row, session.end_reason() == TickOutcome::WON ? WIN_BANNER
                                                                         : GAME_OVER_BANNER);
        }

        frame.put(WALL_GLYPH, WALL_COLOR);
        for (const auto& cell : row) {
            frame.put(cell.glyph, cell.color);
        }
        frame.put(WALL_GLYPH, WALL_COLOR);
        frame.end_line();
    }

    // Bottom wall
    for (int x = 0; x < width + 2; x++) {
        frame.put(WALL_GLYPH, WALL_COLOR);
    }
    frame.end_line();

    frame.put(status_line(session, static_cast<size_t>((width + 2) * Board::CELL_COLUMNS)),
              ansi::BOLD);
    frame.raw(ansi::RESET);
    frame.raw(ansi::CLEAR_EOL);
    frame.raw(ansi::CLEAR_BELOW);

    return frame.take();
}

bool Renderer::draw(const GameSession& session, TerminalIo& terminal) {
    return terminal.write_frame(compose(session));
}

} // namespace slither
