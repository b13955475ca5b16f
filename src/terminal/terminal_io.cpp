// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "terminal_io.h"

#include "terminal_io_posix.h"

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace slither {

namespace {

constexpr char ESC = '\x1b';
constexpr char CTRL_C = '\x03';

/// Arrow keys share their final byte between CSI (ESC [) and SS3 (ESC O) forms
std::optional<KeyCode> arrow_for(char final_byte) {
    switch (final_byte) {
    case 'A':
        return KeyCode::UP;
    case 'B':
        return KeyCode::DOWN;
    case 'C':
        return KeyCode::RIGHT;
    case 'D':
        return KeyCode::LEFT;
    default:
        return std::nullopt;
    }
}

/// Take @p count bytes off the front and return @p key
RawKey consume(std::string& pending, size_t count, RawKey key) {
    pending.erase(0, count);
    return key;
}

} // namespace

std::optional<RawKey> decode_key(std::string& pending, bool complete) {
    if (pending.empty()) {
        return std::nullopt;
    }

    char first = pending[0];

    if (first != ESC) {
        if (first == CTRL_C) {
            return consume(pending, 1, RawKey::special(KeyCode::INTERRUPT));
        }
        if (first >= 0x20 && first < 0x7f) {
            return consume(pending, 1, RawKey::character(first));
        }
        return consume(pending, 1, RawKey::special(KeyCode::UNKNOWN));
    }

    if (pending.size() == 1) {
        if (complete) {
            return consume(pending, 1, RawKey::special(KeyCode::ESCAPE));
        }
        return std::nullopt;
    }

    char introducer = pending[1];

    // ESC O x (application cursor mode)
    if (introducer == 'O') {
        if (pending.size() < 3) {
            if (complete) {
                return consume(pending, pending.size(), RawKey::special(KeyCode::UNKNOWN));
            }
            return std::nullopt;
        }
        auto arrow = arrow_for(pending[2]);
        return consume(pending, 3, RawKey::special(arrow.value_or(KeyCode::UNKNOWN)));
    }

    // ESC [ params final; final byte is in 0x40..0x7e
    if (introducer == '[') {
        for (size_t i = 2; i < pending.size(); i++) {
            char c = pending[i];
            if (c >= 0x40 && c <= 0x7e) {
                auto arrow = arrow_for(c);
                return consume(pending, i + 1, RawKey::special(arrow.value_or(KeyCode::UNKNOWN)));
            }
        }
        if (complete) {
            return consume(pending, pending.size(), RawKey::special(KeyCode::UNKNOWN));
        }
        return std::nullopt;
    }

    // ESC followed by an ordinary byte (Alt+key or a fast ESC then key): ESC alone
    return consume(pending, 1, RawKey::special(KeyCode::ESCAPE));
}

std::unique_ptr<TerminalIo> TerminalIo::create() {
    spdlog::debug("[TerminalIo] Using POSIX terminal on fds {}/{}", STDIN_FILENO, STDOUT_FILENO);
    return std::make_unique<PosixTerminalIo>(STDIN_FILENO, STDOUT_FILENO);
}

} // namespace slither
