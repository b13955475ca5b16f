// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cli_args.h"
#include "game_settings.h"

#include <memory>

namespace slither {

class Config;
class TerminalIo;
enum class LoopResult;

/**
 * @brief Main application orchestrator
 *
 * Application coordinates startup in order:
 * 1. Parse CLI args
 * 2. Load config
 * 3. Initialize logging
 * 4. Install signal handlers
 * 5. Query the terminal and size the board
 * 6. Enter raw mode and run the game loop
 * 7. Release the terminal and print the final score
 *
 * Usage:
 *   Application app;
 *   return app.run(argc, argv);
 */
class Application {
  public:
    /// Exit code for setup failures (terminal unusable)
    static constexpr int EXIT_SETUP_FAILURE = 1;

    Application();

    /// Use a specific terminal backend (tests)
    explicit Application(std::unique_ptr<TerminalIo> terminal);

    ~Application();

    // Non-copyable, non-movable
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * @brief Run the application
     * @param argc Command line argument count
     * @param argv Command line argument array
     * @return Exit code (0 = success)
     */
    int run(int argc, char** argv);

  private:
    // Initialization phases
    bool parse_args(int argc, char** argv);
    bool init_config();
    bool init_logging();

    /// Size the board, own the terminal and play; returns exit code
    int play();

    void print_summary(LoopResult result, int score, bool won) const;

    void shutdown();

    CliArgs m_args;
    GameSettings m_settings;
    Config* m_config = nullptr;
    std::unique_ptr<TerminalIo> m_terminal;
    bool m_signals_installed = false;
};

} // namespace slither
