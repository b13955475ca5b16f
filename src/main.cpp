// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"

#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    int exit_code;
    {
        slither::Application app;
        exit_code = app.run(argc, argv);
    }

    // Flush and drop sinks before static destruction
    spdlog::shutdown();
    return exit_code;
}
