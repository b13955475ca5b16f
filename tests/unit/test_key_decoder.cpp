// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_key_decoder.cpp
 * @brief Unit tests for raw byte decoding and the POSIX terminal over a pipe
 *        and a pseudo-terminal
 */

#include "terminal_io.h"
#include "system/signal_handler.h"
#include "terminal_io_posix.h"

#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <string>
#include <termios.h>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>

using namespace slither;
using namespace std::chrono_literals;

// ============================================================================
// decode_key()
// ============================================================================

TEST_CASE("decode_key: printable characters", "[terminal][keys]") {
    std::string pending = "wq";

    auto first = decode_key(pending, false);
    REQUIRE(first.has_value());
    REQUIRE(first->code == KeyCode::CHAR);
    REQUIRE(first->ch == 'w');
    REQUIRE(pending == "q");

    auto second = decode_key(pending, false);
    REQUIRE(second.has_value());
    REQUIRE(second->ch == 'q');
    REQUIRE(pending.empty());

    REQUIRE_FALSE(decode_key(pending, true).has_value());
}

TEST_CASE("decode_key: CSI arrow keys", "[terminal][keys]") {
    std::string pending = "\x1b[A\x1b[B\x1b[C\x1b[D";

    REQUIRE(decode_key(pending, false)->code == KeyCode::UP);
    REQUIRE(decode_key(pending, false)->code == KeyCode::DOWN);
    REQUIRE(decode_key(pending, false)->code == KeyCode::RIGHT);
    REQUIRE(decode_key(pending, false)->code == KeyCode::LEFT);
    REQUIRE(pending.empty());
}

TEST_CASE("decode_key: application cursor mode arrows", "[terminal][keys]") {
    std::string pending = "\x1bOA\x1bOD";

    REQUIRE(decode_key(pending, false)->code == KeyCode::UP);
    REQUIRE(decode_key(pending, false)->code == KeyCode::LEFT);
    REQUIRE(pending.empty());
}

TEST_CASE("decode_key: lone escape waits for more bytes", "[terminal][keys]") {
    std::string pending = "\x1b";

    SECTION("incomplete input keeps the byte") {
        REQUIRE_FALSE(decode_key(pending, false).has_value());
        REQUIRE(pending == "\x1b");
    }

    SECTION("complete input reports escape") {
        auto key = decode_key(pending, true);
        REQUIRE(key.has_value());
        REQUIRE(key->code == KeyCode::ESCAPE);
        REQUIRE(pending.empty());
    }

    SECTION("the rest of an arrow joins the escape") {
        REQUIRE_FALSE(decode_key(pending, false).has_value());
        pending += "[C";
        REQUIRE(decode_key(pending, false)->code == KeyCode::RIGHT);
    }
}

TEST_CASE("decode_key: escape followed by a plain key", "[terminal][keys]") {
    std::string pending = "\x1bq";

    REQUIRE(decode_key(pending, false)->code == KeyCode::ESCAPE);
    auto next = decode_key(pending, false);
    REQUIRE(next->code == KeyCode::CHAR);
    REQUIRE(next->ch == 'q');
}

TEST_CASE("decode_key: unhandled sequences are consumed whole", "[terminal][keys]") {
    // F5 and Delete
    std::string pending = "\x1b[15~\x1b[3~d";

    REQUIRE(decode_key(pending, false)->code == KeyCode::UNKNOWN);
    REQUIRE(decode_key(pending, false)->code == KeyCode::UNKNOWN);
    auto key = decode_key(pending, false);
    REQUIRE(key->code == KeyCode::CHAR);
    REQUIRE(key->ch == 'd');
}

TEST_CASE("decode_key: partial CSI", "[terminal][keys]") {
    std::string pending = "\x1b[1;5";

    REQUIRE_FALSE(decode_key(pending, false).has_value());
    REQUIRE(pending.size() == 5);

    REQUIRE(decode_key(pending, true)->code == KeyCode::UNKNOWN);
    REQUIRE(pending.empty());
}

TEST_CASE("decode_key: control bytes", "[terminal][keys]") {
    std::string pending = "\x03\x01";

    REQUIRE(decode_key(pending, false)->code == KeyCode::INTERRUPT);
    REQUIRE(decode_key(pending, false)->code == KeyCode::UNKNOWN);
}

// ============================================================================
// PosixTerminalIo on a pipe
// ============================================================================

class PipeTerminalFixture {
  public:
    PipeTerminalFixture() {
        REQUIRE(pipe(in_fds) == 0);
        REQUIRE(pipe(out_fds) == 0);
    }

    ~PipeTerminalFixture() {
        close(in_fds[0]);
        close(in_fds[1]);
        close(out_fds[0]);
        close(out_fds[1]);
    }

  protected:
    int in_fds[2] = {-1, -1};
    int out_fds[2] = {-1, -1};

    void type(const std::string& bytes) {
        REQUIRE(write(in_fds[1], bytes.data(), bytes.size()) ==
                static_cast<ssize_t>(bytes.size()));
    }

    std::string read_output(size_t max_bytes) {
        std::string buf(max_bytes, '\0');
        ssize_t n = read(out_fds[0], &buf[0], max_bytes);
        REQUIRE(n >= 0);
        buf.resize(static_cast<size_t>(n));
        return buf;
    }
};

TEST_CASE_METHOD(PipeTerminalFixture, "PosixTerminalIo: keys arrive through poll_key",
                 "[terminal][posix]") {
    PosixTerminalIo term(in_fds[0], out_fds[1]);
    type("d\x1b[A");

    auto first = term.poll_key(10ms);
    REQUIRE(first.has_value());
    REQUIRE(first->code == KeyCode::CHAR);
    REQUIRE(first->ch == 'd');

    auto second = term.poll_key(0ms);
    REQUIRE(second.has_value());
    REQUIRE(second->code == KeyCode::UP);

    REQUIRE_FALSE(term.poll_key(0ms).has_value());
}

TEST_CASE_METHOD(PipeTerminalFixture, "PosixTerminalIo: lone escape after the timeout",
                 "[terminal][posix]") {
    PosixTerminalIo term(in_fds[0], out_fds[1]);
    type("\x1b");

    auto key = term.poll_key(10ms);
    REQUIRE(key.has_value());
    REQUIRE(key->code == KeyCode::ESCAPE);
}

TEST_CASE_METHOD(PipeTerminalFixture, "PosixTerminalIo: timeout without input",
                 "[terminal][posix]") {
    PosixTerminalIo term(in_fds[0], out_fds[1]);
    REQUIRE_FALSE(term.poll_key(5ms).has_value());
}

TEST_CASE_METHOD(PipeTerminalFixture, "PosixTerminalIo: frames are written whole",
                 "[terminal][posix]") {
    PosixTerminalIo term(in_fds[0], out_fds[1]);
    std::string frame = "\033[H##  ##\r\nScore: 0";

    REQUIRE(term.write_frame(frame));
    REQUIRE(read_output(256) == frame);
}

TEST_CASE_METHOD(PipeTerminalFixture, "PosixTerminalIo: a pipe is not a terminal",
                 "[terminal][posix]") {
    PosixTerminalIo term(in_fds[0], out_fds[1]);

    REQUIRE_FALSE(term.get_size().has_value());
    REQUIRE_FALSE(term.enter_raw_mode());

    // Nothing to undo, nothing written
    term.leave_raw_mode();
    REQUIRE(term.write_frame("x"));
    REQUIRE(read_output(16) == "x");
}

// ============================================================================
// PosixTerminalIo on a pseudo-terminal
// ============================================================================

class PtyTerminalFixture {
  public:
    PtyTerminalFixture() {
        master_fd = posix_openpt(O_RDWR | O_NOCTTY);
        if (master_fd < 0 || grantpt(master_fd) != 0 || unlockpt(master_fd) != 0) {
            return;
        }
        const char* name = ptsname(master_fd);
        if (name) {
            slave_fd = open(name, O_RDWR | O_NOCTTY);
        }
    }

    ~PtyTerminalFixture() {
        signal_handler::disarm_terminal_restore();
        if (slave_fd >= 0) {
            close(slave_fd);
        }
        if (master_fd >= 0) {
            close(master_fd);
        }
    }

  protected:
    int master_fd = -1;
    int slave_fd = -1;

    bool ready() const {
        return slave_fd >= 0;
    }

    struct termios current() const {
        struct termios t {};
        REQUIRE(tcgetattr(slave_fd, &t) == 0);
        return t;
    }
};

TEST_CASE_METHOD(PtyTerminalFixture, "PosixTerminalIo: raw mode disables quit and suspend keys",
                 "[terminal][posix][signal]") {
    if (!ready()) {
        WARN("No pseudo-terminal available");
        return;
    }

    struct termios before = current();

    PosixTerminalIo term(slave_fd, slave_fd);
    REQUIRE(term.enter_raw_mode());

    struct termios raw = current();
    REQUIRE(raw.c_cc[VQUIT] == _POSIX_VDISABLE);
    REQUIRE(raw.c_cc[VSUSP] == _POSIX_VDISABLE);
    // Ctrl+C still reaches the interrupt handler
    REQUIRE((raw.c_lflag & ISIG) != 0);
    REQUIRE(raw.c_cc[VINTR] == before.c_cc[VINTR]);
    REQUIRE((raw.c_lflag & (ECHO | ICANON)) == 0);
    REQUIRE(signal_handler::terminal_restore_armed());

    term.leave_raw_mode();

    struct termios after = current();
    REQUIRE(after.c_cc[VQUIT] == before.c_cc[VQUIT]);
    REQUIRE(after.c_cc[VSUSP] == before.c_cc[VSUSP]);
    REQUIRE(after.c_lflag == before.c_lflag);
    REQUIRE_FALSE(signal_handler::terminal_restore_armed());
}
