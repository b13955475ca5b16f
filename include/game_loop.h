// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file game_loop.h
 * @brief Real-time tick loop: input, update, render, pace
 *
 * Single-threaded. The only blocking call is TerminalIo::poll_key() with
 * the time left in the current tick, which doubles as the pacing sleep and
 * returns as soon as a key arrives, so Quit never waits for the tick to end.
 */

#pragma once

#include "game_session.h"

#include <chrono>
#include <functional>

namespace slither {

class TerminalIo;

/**
 * @brief Why the loop stopped
 */
enum class LoopResult {
    QUIT,       ///< User pressed Q/Esc while playing
    GAME_OVER,  ///< Game ended and the user acknowledged with Q/Esc
    INTERRUPTED ///< SIGINT/SIGTERM/SIGHUP
};

const char* loop_result_name(LoopResult result);

/**
 * @class GameLoop
 * @brief Drives a GameSession against a TerminalIo
 *
 * Per tick:
 * 1. Drain buffered keys without waiting (Quit stops here)
 * 2. GameSession::tick()
 * 3. Render a full frame
 * 4. Wait out the rest of the interval, applying keys as they arrive
 *
 * The interval is the session speed after the update, so eating food
 * shortens the very next wait.
 */
class GameLoop {
  public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    /// Poll interval while waiting for acknowledgement after game over
    static constexpr std::chrono::milliseconds ACK_POLL_INTERVAL{100};

    /**
     * @param session Game to drive (not owned)
     * @param terminal Terminal to read keys from and draw to (not owned)
     * @param now Monotonic time source, injectable for tests
     */
    GameLoop(GameSession& session, TerminalIo& terminal, TimeSource now = &Clock::now);

    /**
     * @brief Run until quit, acknowledged game over or interrupt
     */
    LoopResult run();

    /// Number of completed game ticks
    int ticks() const {
        return m_ticks;
    }

    /// Number of frames handed to the terminal
    int frames() const {
        return m_frames;
    }

  private:
    /// Handle one command; false if the loop must stop
    bool handle(const input::Command& command);

    /// Process keys already buffered; false if the loop must stop
    bool drain_input();

    /// Wait until @p deadline while processing keys; false if the loop must stop
    bool pace_until(Clock::time_point deadline);

    /// Block until the user quits after game over
    LoopResult wait_for_acknowledge();

    void render();

    GameSession& m_session;
    TerminalIo& m_terminal;
    TimeSource m_now;
    LoopResult m_stop_reason = LoopResult::QUIT;
    int m_ticks = 0;
    int m_frames = 0;
    bool m_write_failing = false;
};

} // namespace slither
