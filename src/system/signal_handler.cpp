// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/signal_handler.h"

#include <spdlog/spdlog.h>

#include <cstring>
#include <signal.h>
#include <unistd.h>

// =============================================================================
// Static state for async-signal-safe handlers
// All data must be pre-allocated -- NO heap in the signal handler.
// =============================================================================

/// Set by SIGINT/SIGTERM/SIGHUP, polled by the game loop
static volatile sig_atomic_t s_interrupted = 0;

/// Whether the handlers are installed
static volatile sig_atomic_t s_installed = 0;

/// Terminal restore state for fatal signals (copied at arm time)
static volatile sig_atomic_t s_restore_armed = 0;
static int s_restore_fd = -1;
static struct termios s_restore_termios = {};

/// Saved previous signal actions for restoration
static struct sigaction s_old_sigint = {};
static struct sigaction s_old_sigterm = {};
static struct sigaction s_old_sighup = {};
static struct sigaction s_old_sigquit = {};
static struct sigaction s_old_sigsegv = {};
static struct sigaction s_old_sigabrt = {};
static struct sigaction s_old_sigbus = {};
static struct sigaction s_old_sigfpe = {};

// =============================================================================
// Handlers
// These use ONLY functions from the POSIX async-signal-safe list.
// =============================================================================

namespace {

/// Attributes reset, cursor shown, alternate screen off
constexpr char RESTORE_SEQUENCE[] = "\033[0m\033[?25h\033[?1049l";

void interrupt_signal_handler(int /*sig*/) {
    s_interrupted = 1;
}

void fatal_signal_handler(int sig) {
    if (s_restore_armed) {
        s_restore_armed = 0;
        // Ignore write() return; best effort in signal handler
        (void)write(STDOUT_FILENO, RESTORE_SEQUENCE, sizeof(RESTORE_SEQUENCE) - 1);
        tcsetattr(s_restore_fd, TCSAFLUSH, &s_restore_termios);
    }

    // Re-raise with default handler so the process exits with the correct status
    // and generates a core dump if configured
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_DFL;
    sigaction(sig, &sa, nullptr);
    raise(sig);

    // Fallback if raise() somehow returns
    _exit(128 + sig);
}

} // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

namespace slither::signal_handler {

void install() {
    if (s_installed) {
        spdlog::debug("[SignalHandler] Already installed, skipping");
        return;
    }

    // Interrupts: no SA_RESTART so a blocking select() returns EINTR promptly
    struct sigaction sa_int;
    std::memset(&sa_int, 0, sizeof(sa_int));
    sa_int.sa_handler = interrupt_signal_handler;
    sigemptyset(&sa_int.sa_mask);
    sa_int.sa_flags = 0;

    sigaction(SIGINT, &sa_int, &s_old_sigint);
    sigaction(SIGTERM, &sa_int, &s_old_sigterm);
    sigaction(SIGHUP, &sa_int, &s_old_sighup);

    // Fatal: SA_RESETHAND restores default after first signal (no recursion)
    struct sigaction sa_fatal;
    std::memset(&sa_fatal, 0, sizeof(sa_fatal));
    sa_fatal.sa_handler = fatal_signal_handler;
    sigemptyset(&sa_fatal.sa_mask);
    sa_fatal.sa_flags = SA_RESETHAND;

    sigaction(SIGQUIT, &sa_fatal, &s_old_sigquit);
    sigaction(SIGSEGV, &sa_fatal, &s_old_sigsegv);
    sigaction(SIGABRT, &sa_fatal, &s_old_sigabrt);
    sigaction(SIGBUS, &sa_fatal, &s_old_sigbus);
    sigaction(SIGFPE, &sa_fatal, &s_old_sigfpe);

    s_installed = 1;
    spdlog::info("[SignalHandler] Installed interrupt and fatal signal handlers");
}

void uninstall() {
    if (!s_installed) {
        return;
    }

    // Restore previous handlers
    sigaction(SIGINT, &s_old_sigint, nullptr);
    sigaction(SIGTERM, &s_old_sigterm, nullptr);
    sigaction(SIGHUP, &s_old_sighup, nullptr);
    sigaction(SIGQUIT, &s_old_sigquit, nullptr);
    sigaction(SIGSEGV, &s_old_sigsegv, nullptr);
    sigaction(SIGABRT, &s_old_sigabrt, nullptr);
    sigaction(SIGBUS, &s_old_sigbus, nullptr);
    sigaction(SIGFPE, &s_old_sigfpe, nullptr);

    s_installed = 0;
    spdlog::debug("[SignalHandler] Uninstalled signal handlers");
}

bool interrupt_requested() {
    return s_interrupted != 0;
}

void request_interrupt() {
    s_interrupted = 1;
}

void clear_interrupt() {
    s_interrupted = 0;
}

void arm_terminal_restore(int fd, const struct termios& original) {
    // Disarm first so a signal never sees a half-copied termios
    s_restore_armed = 0;
    s_restore_fd = fd;
    s_restore_termios = original;
    s_restore_armed = 1;
    spdlog::debug("[SignalHandler] Terminal restore armed for fd {}", fd);
}

void disarm_terminal_restore() {
    s_restore_armed = 0;
}

bool terminal_restore_armed() {
    return s_restore_armed != 0;
}

} // namespace slither::signal_handler
