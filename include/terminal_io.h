// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file terminal_io.h
 * @brief Abstract terminal service consumed by the game
 *
 * @pattern Pure virtual interface + static create() factory
 * @threading Game loop thread only
 *
 * @see terminal_io_posix.cpp
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace slither {

/**
 * @brief Terminal dimensions in character cells
 */
struct TerminalSize {
    int columns = 0;
    int rows = 0;
};

/**
 * @brief Decoded key codes
 */
enum class KeyCode {
    CHAR,      ///< Printable character, see RawKey::ch
    UP,        ///< Arrow up (ESC [ A)
    DOWN,      ///< Arrow down (ESC [ B)
    RIGHT,     ///< Arrow right (ESC [ C)
    LEFT,      ///< Arrow left (ESC [ D)
    ESCAPE,    ///< Bare ESC
    INTERRUPT, ///< Ctrl+C byte (only seen when ISIG is off)
    UNKNOWN    ///< Anything else, including unhandled escape sequences
};

/**
 * @brief One key event as read from the terminal
 */
struct RawKey {
    KeyCode code = KeyCode::UNKNOWN;
    char ch = 0; ///< Valid for KeyCode::CHAR only

    static RawKey character(char c) {
        return {KeyCode::CHAR, c};
    }
    static RawKey special(KeyCode code) {
        return {code, 0};
    }
};

/**
 * @brief Decode the first key from buffered input bytes
 *
 * Consumes the bytes of the decoded key from @p pending. A lone ESC is only
 * reported as KeyCode::ESCAPE when @p complete is true (no more bytes are
 * expected); otherwise it is left pending so a following "[A" can join it.
 *
 * @param pending Raw bytes read from the terminal (modified)
 * @param complete true if no further bytes are expected right now
 * @return Decoded key, or std::nullopt if more bytes are needed
 */
std::optional<RawKey> decode_key(std::string& pending, bool complete);

/**
 * @brief Terminal service interface
 *
 * Concrete implementations:
 * - PosixTerminalIo: termios raw mode, select() polling, ANSI output
 * - MockTerminalIo (tests): scripted keys and captured frames
 */
class TerminalIo {
  public:
    virtual ~TerminalIo() = default;

    /**
     * @brief Query the terminal size
     * @return Size in cells, or std::nullopt if it cannot be determined
     */
    virtual std::optional<TerminalSize> get_size() = 0;

    /**
     * @brief Wait at most @p timeout for a key
     *
     * A zero timeout only drains what is already buffered. Read errors are
     * recovered here and reported as "no key".
     *
     * @return Key event, or std::nullopt if none arrived in time
     */
    virtual std::optional<RawKey> poll_key(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Write one complete frame in a single call
     * @return false if the write failed
     */
    virtual bool write_frame(std::string_view bytes) = 0;

    /**
     * @brief Enter raw mode and the alternate screen, hide the cursor
     * @return false if the terminal cannot be configured
     */
    virtual bool enter_raw_mode() = 0;

    /// Undo enter_raw_mode(); safe to call when not in raw mode
    virtual void leave_raw_mode() = 0;

    /**
     * @brief Create the terminal service for stdin/stdout
     * @return Terminal backend, never null
     */
    static std::unique_ptr<TerminalIo> create();
};

} // namespace slither
