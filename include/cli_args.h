// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for slither
 *
 * Play needs no flags; everything here is logging, config location and
 * reproducibility.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace slither {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    // Logging
    int verbosity = 0;    // -v count
    std::string log_dest; // --log-dest: empty = use config
    std::string log_file; // --log-file: empty = default location

    // Configuration
    std::string config_path; // --config: empty = Config::default_path()

    // Food placement seed (--seed), unset = random
    std::optional<uint32_t> seed;

    // Set when parsing decided the process should exit (help, version, error)
    bool exit_requested = false;
    int exit_code = 0;
};

/// Exit code for invalid command-line usage
constexpr int EXIT_USAGE = 2;

/**
 * @brief Parse command-line arguments
 *
 * Help and version output go to stdout, errors to stderr.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true to continue, false if the process should exit with
 *         args.exit_code (help/version shown or bad arguments)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace slither
