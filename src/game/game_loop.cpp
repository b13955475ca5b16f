// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "game_loop.h"

#include "input_translator.h"
#include "renderer.h"
#include "system/signal_handler.h"
#include "terminal_io.h"

#include <spdlog/spdlog.h>

namespace slither {

const char* loop_result_name(LoopResult result) {
    switch (result) {
    case LoopResult::QUIT:
        return "quit";
    case LoopResult::GAME_OVER:
        return "game over";
    case LoopResult::INTERRUPTED:
        return "interrupted";
    }
    return "unknown";
}

GameLoop::GameLoop(GameSession& session, TerminalIo& terminal, TimeSource now)
    : m_session(session), m_terminal(terminal), m_now(std::move(now)) {}

LoopResult GameLoop::run() {
    spdlog::info("[GameLoop] Entering game loop, interval {}ms", m_session.speed().count());

    render();

    while (!m_session.is_over()) {
        Clock::time_point tick_start = m_now();

        // Phase 1: keys that arrived while we were drawing
        if (!drain_input()) {
            spdlog::info("[GameLoop] Stopped ({}) after {} ticks",
                         loop_result_name(m_stop_reason), m_ticks);
            return m_stop_reason;
        }

        // Phase 2: move / eat / collide
        TickOutcome outcome = m_session.tick();
        m_ticks++;
        spdlog::trace("[GameLoop] Tick {}: {}", m_ticks, tick_outcome_name(outcome));

        // Phase 3: full repaint
        render();

        if (m_session.is_over()) {
            break;
        }

        // Phase 4: hold the tick rate at the (possibly shortened) interval
        if (!pace_until(tick_start + m_session.speed())) {
            spdlog::info("[GameLoop] Stopped ({}) after {} ticks",
                         loop_result_name(m_stop_reason), m_ticks);
            return m_stop_reason;
        }
    }

    return wait_for_acknowledge();
}

bool GameLoop::handle(const input::Command& command) {
    if (command.is_quit()) {
        m_stop_reason = LoopResult::QUIT;
        return false;
    }
    m_session.apply(command);
    return true;
}

bool GameLoop::drain_input() {
    while (true) {
        if (signal_handler::interrupt_requested()) {
            m_stop_reason = LoopResult::INTERRUPTED;
            return false;
        }

        auto key = m_terminal.poll_key(std::chrono::milliseconds(0));
        if (!key) {
            return true;
        }
        if (!handle(input::translate(key))) {
            return false;
        }
    }
}

bool GameLoop::pace_until(Clock::time_point deadline) {
    while (true) {
        if (signal_handler::interrupt_requested()) {
            m_stop_reason = LoopResult::INTERRUPTED;
            return false;
        }

        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - m_now());
        if (remaining.count() <= 0) {
            return true;
        }

        auto key = m_terminal.poll_key(remaining);
        if (key && !handle(input::translate(key))) {
            return false;
        }
    }
}

LoopResult GameLoop::wait_for_acknowledge() {
    spdlog::info("[GameLoop] Game over after {} ticks ({}), waiting for quit", m_ticks,
                 tick_outcome_name(m_session.end_reason()));

    while (true) {
        if (signal_handler::interrupt_requested()) {
            return LoopResult::INTERRUPTED;
        }

        auto command = input::translate(m_terminal.poll_key(ACK_POLL_INTERVAL));
        if (command.is_quit()) {
            return LoopResult::GAME_OVER;
        }
    }
}

void GameLoop::render() {
    bool ok = Renderer::draw(m_session, m_terminal);
    m_frames++;

    // Log once per failure streak, the loop keeps going either way
    if (!ok && !m_write_failing) {
        spdlog::warn("[GameLoop] Frame write failed at tick {}", m_ticks);
    } else if (ok && m_write_failing) {
        spdlog::info("[GameLoop] Frame writes recovered at tick {}", m_ticks);
    }
    m_write_failing = !ok;
}

} // namespace slither
