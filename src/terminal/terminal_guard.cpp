// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "terminal_guard.h"

#include <spdlog/spdlog.h>

namespace slither {

bool TerminalGuard::acquire() {
    if (active_) {
        return true;
    }
    active_ = terminal_.enter_raw_mode();
    if (!active_) {
        spdlog::error("[TerminalGuard] Could not enter raw mode");
    }
    return active_;
}

void TerminalGuard::release() {
    if (!active_) {
        return;
    }
    active_ = false;
    terminal_.leave_raw_mode();
    spdlog::debug("[TerminalGuard] Terminal released");
}

} // namespace slither
