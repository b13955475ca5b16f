// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file terminal_io_posix.h
 * @brief TerminalIo on a POSIX tty (termios, select, ioctl)
 */

#pragma once

#include "terminal_io.h"

#include <string>
#include <termios.h>

namespace slither {

/**
 * @brief POSIX terminal backend
 *
 * Raw mode clears ECHO and ICANON but keeps ISIG, so Ctrl+C still raises
 * SIGINT and goes through signal_handler. Output goes through the
 * alternate screen with the cursor hidden.
 */
class PosixTerminalIo : public TerminalIo {
  public:
    /// Escape delay: how long to wait for the rest of an ESC sequence
    static constexpr std::chrono::milliseconds ESCAPE_TIMEOUT{5};

    PosixTerminalIo(int in_fd, int out_fd);
    ~PosixTerminalIo() override;

    // Non-copyable, non-movable
    PosixTerminalIo(const PosixTerminalIo&) = delete;
    PosixTerminalIo& operator=(const PosixTerminalIo&) = delete;

    std::optional<TerminalSize> get_size() override;
    std::optional<RawKey> poll_key(std::chrono::milliseconds timeout) override;
    bool write_frame(std::string_view bytes) override;
    bool enter_raw_mode() override;
    void leave_raw_mode() override;

  private:
    /// Wait up to @p timeout for input; false on timeout or error
    bool wait_readable(std::chrono::milliseconds timeout);

    /// Append whatever is readable now to m_pending; false on read error
    bool read_available();

    bool write_all(std::string_view bytes);

    int m_in_fd;
    int m_out_fd;
    bool m_raw = false;
    struct termios m_original {};
    std::string m_pending;
};

} // namespace slither
