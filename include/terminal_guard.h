// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "terminal_io.h"

namespace slither {

/**
 * @brief RAII wrapper for terminal raw mode
 *
 * Releases the terminal in the destructor, so every path out of the scope
 * (quit, game over, interrupt unwinding, early return) restores it. Release
 * happens at most once per successful acquire.
 *
 * @code{.cpp}
 * TerminalGuard guard(*terminal);
 * if (!guard.acquire()) {
 *     return 1; // setup failure
 * }
 * run_game(); // guard releases on scope exit
 * @endcode
 */
class TerminalGuard {
  public:
    explicit TerminalGuard(TerminalIo& terminal) : terminal_(terminal) {}

    ~TerminalGuard() {
        release();
    }

    // Non-copyable, non-movable
    TerminalGuard(const TerminalGuard&) = delete;
    TerminalGuard& operator=(const TerminalGuard&) = delete;
    TerminalGuard(TerminalGuard&&) = delete;
    TerminalGuard& operator=(TerminalGuard&&) = delete;

    /**
     * @brief Enter raw mode
     * @return false on setup failure (nothing to release)
     */
    bool acquire();

    /// Leave raw mode if acquired; later calls are no-ops
    void release();

    bool active() const {
        return active_;
    }

  private:
    TerminalIo& terminal_;
    bool active_ = false;
};

} // namespace slither
