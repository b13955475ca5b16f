// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "terminal_io_posix.h"

#include "system/signal_handler.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <thread>
#include <unistd.h>

namespace slither {

namespace {

// Alternate screen on, cursor hidden, screen cleared
constexpr const char* ENTER_SEQUENCE = "\033[?1049h\033[?25l\033[2J\033[H";

// Attributes reset, cursor shown, alternate screen off
constexpr const char* LEAVE_SEQUENCE = "\033[0m\033[?25h\033[?1049l";

constexpr size_t READ_CHUNK = 64;

} // namespace

PosixTerminalIo::PosixTerminalIo(int in_fd, int out_fd) : m_in_fd(in_fd), m_out_fd(out_fd) {}

PosixTerminalIo::~PosixTerminalIo() {
    leave_raw_mode();
}

std::optional<TerminalSize> PosixTerminalIo::get_size() {
    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    if (ioctl(m_out_fd, TIOCGWINSZ, &ws) == -1) {
        spdlog::error("[TerminalIo] TIOCGWINSZ failed: {}", std::strerror(errno));
        return std::nullopt;
    }
    if (ws.ws_col == 0 || ws.ws_row == 0) {
        spdlog::error("[TerminalIo] Terminal reports zero size");
        return std::nullopt;
    }
    return TerminalSize{ws.ws_col, ws.ws_row};
}

bool PosixTerminalIo::wait_readable(std::chrono::milliseconds timeout) {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(m_in_fd, &fds);

    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    int ready = select(m_in_fd + 1, &fds, nullptr, nullptr, &tv);
    if (ready < 0) {
        // EINTR: a signal arrived; the caller checks the interrupt flag
        if (errno != EINTR) {
            spdlog::warn("[TerminalIo] select() failed: {}", std::strerror(errno));
        }
        return false;
    }
    return ready > 0;
}

bool PosixTerminalIo::read_available() {
    char buf[READ_CHUNK];
    ssize_t n = read(m_in_fd, buf, sizeof(buf));
    if (n > 0) {
        m_pending.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n == 0) {
        return false;
    }
    if (errno != EINTR && errno != EAGAIN) {
        spdlog::warn("[TerminalIo] read() failed: {}", std::strerror(errno));
    }
    return false;
}

std::optional<RawKey> PosixTerminalIo::poll_key(std::chrono::milliseconds timeout) {
    if (m_pending.empty()) {
        if (!wait_readable(timeout)) {
            return std::nullopt;
        }
        if (!read_available()) {
            // EOF or read error: no input this time, but don't spin on a dead fd
            if (timeout.count() > 0) {
                std::this_thread::sleep_for(timeout);
            }
            return std::nullopt;
        }
    }

    auto key = decode_key(m_pending, false);
    if (!key && !m_pending.empty()) {
        // Partial escape sequence: give the rest a moment to arrive
        if (wait_readable(ESCAPE_TIMEOUT)) {
            read_available();
        }
        key = decode_key(m_pending, true);
    }
    return key;
}

bool PosixTerminalIo::write_all(std::string_view bytes) {
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = write(m_out_fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::debug("[TerminalIo] write() failed: {}", std::strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

bool PosixTerminalIo::write_frame(std::string_view bytes) {
    return write_all(bytes);
}

bool PosixTerminalIo::enter_raw_mode() {
    if (m_raw) {
        return true;
    }

    if (!isatty(m_in_fd)) {
        spdlog::error("[TerminalIo] stdin is not a terminal");
        return false;
    }

    if (tcgetattr(m_in_fd, &m_original) == -1) {
        spdlog::error("[TerminalIo] tcgetattr failed: {}", std::strerror(errno));
        return false;
    }

    struct termios raw = m_original;
    // ISIG stays on so Ctrl+C arrives as SIGINT
    raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | IEXTEN);
    raw.c_iflag &= ~static_cast<tcflag_t>(IXON | ICRNL | BRKINT | INPCK | ISTRIP);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    // Ctrl+\ and Ctrl+Z would kill or stop the game with the screen still raw
    raw.c_cc[VQUIT] = _POSIX_VDISABLE;
    raw.c_cc[VSUSP] = _POSIX_VDISABLE;

    if (tcsetattr(m_in_fd, TCSAFLUSH, &raw) == -1) {
        spdlog::error("[TerminalIo] tcsetattr failed: {}", std::strerror(errno));
        return false;
    }

    // From here on a fatal signal must put the terminal back
    signal_handler::arm_terminal_restore(m_in_fd, m_original);
    m_raw = true;

    if (!write_all(ENTER_SEQUENCE)) {
        spdlog::warn("[TerminalIo] Could not switch to the alternate screen");
    }

    spdlog::info("[TerminalIo] Raw mode on");
    return true;
}

void PosixTerminalIo::leave_raw_mode() {
    if (!m_raw) {
        return;
    }

    if (!write_all(LEAVE_SEQUENCE)) {
        spdlog::warn("[TerminalIo] Could not leave the alternate screen");
    }
    if (tcsetattr(m_in_fd, TCSAFLUSH, &m_original) == -1) {
        spdlog::error("[TerminalIo] Restoring terminal settings failed: {}", std::strerror(errno));
    }

    signal_handler::disarm_terminal_restore();
    m_raw = false;
    m_pending.clear();

    spdlog::info("[TerminalIo] Raw mode off");
}

} // namespace slither
