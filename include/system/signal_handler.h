// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file signal_handler.h
 * @brief Interrupt and fatal-signal handling for the terminal session
 *
 * Two exit paths are covered:
 * - SIGINT/SIGTERM/SIGHUP set an interrupt flag. The game loop polls it and
 *   unwinds normally, so TerminalGuard restores the terminal.
 * - SIGQUIT/SIGSEGV/SIGABRT/SIGBUS/SIGFPE cannot unwind. The handler writes the
 *   saved terminal state back with async-signal-safe calls (tcsetattr,
 *   write), then re-raises with the default action.
 *
 * @threading install()/uninstall()/arm_terminal_restore() from main thread;
 *            the flag is sig_atomic_t
 */

#pragma once

#include <termios.h>

namespace slither::signal_handler {

/**
 * @brief Install handlers for interrupt and fatal signals
 *
 * Safe to call repeatedly; subsequent calls are no-ops.
 */
void install();

/**
 * @brief Restore the handlers that were active before install()
 */
void uninstall();

/// true once SIGINT, SIGTERM or SIGHUP was received
bool interrupt_requested();

/// Raise the interrupt flag from normal code (same effect as SIGINT)
void request_interrupt();

/// Lower the interrupt flag
void clear_interrupt();

/**
 * @brief Remember how to restore the terminal from a fatal signal
 *
 * The termios copy lives in a static buffer; nothing is allocated in the
 * handler.
 *
 * @param fd Terminal file descriptor the settings belong to
 * @param original Settings to restore
 */
void arm_terminal_restore(int fd, const struct termios& original);

/// Forget the saved terminal state (terminal already restored)
void disarm_terminal_restore();

/// true while a terminal restore is armed
bool terminal_restore_armed();

} // namespace slither::signal_handler
