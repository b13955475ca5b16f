// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file application.cpp
 * @brief Application lifecycle orchestrator - startup, game, and shutdown coordination
 *
 * @pattern Ordered phases, each returning bool; first failure ends startup
 * @threading Main thread only; shutdown guards against double-call
 * @gotchas Nothing may print to stdout between TerminalGuard::acquire() and
 *          release(); the summary is printed only after the guard is gone
 */

#include "application.h"

#include "board.h"
#include "config.h"
#include "food_spawner.h"
#include "game_loop.h"
#include "game_session.h"
#include "logging_init.h"
#include "system/signal_handler.h"
#include "terminal_guard.h"
#include "terminal_io.h"

#include <spdlog/spdlog.h>

#include <cstdio>

namespace slither {

namespace {

/// Conventional exit status for a process stopped by SIGINT
constexpr int EXIT_INTERRUPTED = 130;

} // namespace

Application::Application() = default;

Application::Application(std::unique_ptr<TerminalIo> terminal) : m_terminal(std::move(terminal)) {}

Application::~Application() {
    shutdown();
}

int Application::run(int argc, char** argv) {
    // Initialize minimal logging first so early log calls go somewhere
    logging::init_early();

    // Phase 1: Parse command line args
    if (!parse_args(argc, argv)) {
        return m_args.exit_code; // Help/version shown or usage error
    }

    // Phase 2: Initialize config system
    if (!init_config()) {
        return EXIT_SETUP_FAILURE;
    }

    // Phase 3: Initialize logging
    if (!init_logging()) {
        return EXIT_SETUP_FAILURE;
    }

    spdlog::info("[Application] Starting slither");
    spdlog::debug("[Application] Interval {}ms -> {}ms (step {}ms), initial length {}",
                  m_settings.initial_interval.count(), m_settings.min_interval.count(),
                  m_settings.interval_step.count(), m_settings.initial_length);

    // Phases 4-7: terminal, board, game
    int exit_code = play();

    shutdown();
    return exit_code;
}

bool Application::parse_args(int argc, char** argv) {
    if (!parse_cli_args(argc, argv, m_args)) {
        return false;
    }
    if (m_args.seed) {
        spdlog::debug("[Application] Food seed {}", *m_args.seed);
    }
    return true;
}

bool Application::init_config() {
    m_config = Config::get_instance();

    std::string config_path = m_args.config_path.empty() ? Config::default_path()
                                                         : m_args.config_path;
    spdlog::info("[Application] Using config: {}", config_path);
    if (!m_config->init(config_path)) {
        // Unreadable settings are not fatal; defaults are already loaded
        spdlog::warn("[Application] Continuing with default settings");
    }

    m_settings = GameSettings::from_config(*m_config);
    return true;
}

bool Application::init_logging() {
    logging::LogConfig log_config;

    // CLI verbosity takes precedence, then config file
    log_config.level = logging::verbosity_to_level(
        m_args.verbosity, logging::parse_level(m_config->get<std::string>("/log_level", "warn")));

    std::string log_dest_str = m_args.log_dest;
    if (log_dest_str.empty()) {
        log_dest_str = m_config->get<std::string>("/log_dest", "auto");
    }
    log_config.target = logging::parse_log_target(log_dest_str);

    log_config.file_path = m_args.log_file;
    if (log_config.file_path.empty()) {
        log_config.file_path = m_config->get<std::string>("/log_path", "");
    }

    logging::init(log_config);
    return true;
}

int Application::play() {
    if (!m_terminal) {
        m_terminal = TerminalIo::create();
    }

    signal_handler::install();
    m_signals_installed = true;

    auto size = m_terminal->get_size();
    if (!size) {
        spdlog::error("[Application] Cannot query terminal size");
        fprintf(stderr, "Error: cannot determine the terminal size (is stdout a terminal?)\n");
        return EXIT_SETUP_FAILURE;
    }

    auto board = Board::from_terminal(*size);
    if (!board) {
        spdlog::error("[Application] Terminal {}x{} too small", size->columns, size->rows);
        fprintf(stderr, "Error: terminal is %dx%d, need at least %dx%d\n", size->columns,
                size->rows, Board::MIN_WIDTH * Board::CELL_COLUMNS + 4, Board::MIN_HEIGHT + 3);
        return EXIT_SETUP_FAILURE;
    }
    spdlog::info("[Application] Terminal {}x{}, board {}x{}", size->columns, size->rows,
                 board->width(), board->height());

    LoopResult result;
    int score = 0;
    bool won = false;
    {
        TerminalGuard guard(*m_terminal);
        if (!guard.acquire()) {
            fprintf(stderr, "Error: cannot put the terminal into raw mode\n");
            return EXIT_SETUP_FAILURE;
        }

        // Game state only exists once the terminal is ours
        FoodSpawner spawner = m_args.seed ? FoodSpawner(*m_args.seed) : FoodSpawner();
        GameSession session(*board, m_settings, std::move(spawner));

        GameLoop loop(session, *m_terminal);
        result = loop.run();
        score = session.score();
        won = session.is_over() && session.end_reason() == TickOutcome::WON;
        spdlog::info("[Application] Loop ended: {} after {} ticks, score {}",
                     loop_result_name(result), loop.ticks(), score);
    } // Terminal restored here

    print_summary(result, score, won);

    return result == LoopResult::INTERRUPTED ? EXIT_INTERRUPTED : 0;
}

void Application::print_summary(LoopResult result, int score, bool won) const {
    if (won) {
        printf("You win! Your score is %d\n", score);
    } else if (result == LoopResult::GAME_OVER) {
        printf("Game Over! Your score is %d\n", score);
    } else {
        printf("Bye! Your score is %d\n", score);
    }
    fflush(stdout);
}

void Application::shutdown() {
    if (m_signals_installed) {
        signal_handler::uninstall();
        signal_handler::clear_interrupt();
        m_signals_installed = false;
    }
    spdlog::default_logger()->flush();
}

} // namespace slither
