// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifndef SLITHER_VERSION
#define SLITHER_VERSION "0.0.0-dev"
#endif

namespace slither {

namespace {

// Helper to parse an unsigned 32-bit value with validation
bool parse_u32(const char* str, uint32_t& out, const char* name) {
    if (str[0] == '\0' || str[0] == '-') {
        fprintf(stderr, "Error: invalid %s (must be 0-4294967295): %s\n", name, str);
        return false;
    }
    char* endptr;
    errno = 0;
    unsigned long long val = strtoull(str, &endptr, 10);
    if (*endptr != '\0' || errno == ERANGE || val > 0xFFFFFFFFULL) {
        fprintf(stderr, "Error: invalid %s (must be 0-4294967295): %s\n", name, str);
        return false;
    }
    out = static_cast<uint32_t>(val);
    return true;
}

/// Value of "--opt value" or "--opt=value"; nullptr (with an error) if missing
const char* option_value(int argc, char** argv, int& i, const char* option) {
    size_t len = strlen(option);
    if (strncmp(argv[i], option, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    fprintf(stderr, "Error: %s requires an argument\n", option);
    return nullptr;
}

/// True for "--opt" and "--opt=..."
bool matches_option(const char* arg, const char* option) {
    size_t len = strlen(option);
    return strncmp(arg, option, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("\nPlay Snake in the terminal. Steer with arrow keys or WASD, quit with Q,\n");
    printf("Esc or Ctrl+C.\n");
    printf("\nOptions:\n");
    printf("  -h, --help           Show this help message\n");
    printf("  -V, --version        Show version information\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when logging to a file)\n");
    printf("  --config <path>      Settings file (default: $XDG_CONFIG_HOME/slither/settings.json)\n");
    printf("  --seed <n>           Seed food placement for a reproducible game\n");
    printf("\nLogs go to a file by default so they never draw over the board.\n");
}

bool usage_error(CliArgs& args) {
    fprintf(stderr, "Use --help for usage information\n");
    args.exit_requested = true;
    args.exit_code = EXIT_USAGE;
    return false;
}

} // namespace

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    const char* program_name = (argc > 0 && argv[0]) ? argv[0] : "slither";

    for (int i = 1; i < argc; i++) {
        // Verbosity
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
            strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if (matches_option(argv[i], "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value)
                return usage_error(args);
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                fprintf(stderr, "Error: invalid --log-dest value: %s\n", value);
                fprintf(stderr, "Valid values: auto, syslog, file, console\n");
                return usage_error(args);
            }
        } else if (matches_option(argv[i], "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value)
                return usage_error(args);
            args.log_file = value;
        }
        // Settings file
        else if (matches_option(argv[i], "--config")) {
            const char* value = option_value(argc, argv, i, "--config");
            if (!value)
                return usage_error(args);
            if (value[0] == '\0') {
                fprintf(stderr, "Error: --config requires a non-empty path\n");
                return usage_error(args);
            }
            args.config_path = value;
        }
        // Reproducible food placement
        else if (matches_option(argv[i], "--seed")) {
            const char* value = option_value(argc, argv, i, "--seed");
            if (!value)
                return usage_error(args);
            uint32_t seed = 0;
            if (!parse_u32(value, seed, "seed"))
                return usage_error(args);
            args.seed = seed;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(program_name);
            args.exit_requested = true;
            args.exit_code = 0;
            return false;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("slither %s\n", SLITHER_VERSION);
            args.exit_requested = true;
            args.exit_code = 0;
            return false;
        }
        // Unknown argument
        else {
            fprintf(stderr, "Unknown argument: %s\n", argv[i]);
            return usage_error(args);
        }
    }

    return true;
}

} // namespace slither
