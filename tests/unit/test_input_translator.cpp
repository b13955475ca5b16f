// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "input_translator.h"

#include <catch2/catch_test_macros.hpp>

using namespace slither;
using namespace slither::input;

// ============================================================================
// Steering keys
// ============================================================================

TEST_CASE("translate: WASD in either case", "[input]") {
    SECTION("lowercase") {
        REQUIRE(translate(RawKey::character('w')) == Command::move(Direction::UP));
        REQUIRE(translate(RawKey::character('a')) == Command::move(Direction::LEFT));
        REQUIRE(translate(RawKey::character('s')) == Command::move(Direction::DOWN));
        REQUIRE(translate(RawKey::character('d')) == Command::move(Direction::RIGHT));
    }

    SECTION("uppercase") {
        REQUIRE(translate(RawKey::character('W')) == Command::move(Direction::UP));
        REQUIRE(translate(RawKey::character('A')) == Command::move(Direction::LEFT));
        REQUIRE(translate(RawKey::character('S')) == Command::move(Direction::DOWN));
        REQUIRE(translate(RawKey::character('D')) == Command::move(Direction::RIGHT));
    }
}

TEST_CASE("translate: arrow keys", "[input]") {
    REQUIRE(translate(RawKey::special(KeyCode::UP)) == Command::move(Direction::UP));
    REQUIRE(translate(RawKey::special(KeyCode::DOWN)) == Command::move(Direction::DOWN));
    REQUIRE(translate(RawKey::special(KeyCode::LEFT)) == Command::move(Direction::LEFT));
    REQUIRE(translate(RawKey::special(KeyCode::RIGHT)) == Command::move(Direction::RIGHT));
}

// ============================================================================
// Quit keys
// ============================================================================

TEST_CASE("translate: Q, Esc and Ctrl+C quit", "[input]") {
    REQUIRE(translate(RawKey::character('q')).is_quit());
    REQUIRE(translate(RawKey::character('Q')).is_quit());
    REQUIRE(translate(RawKey::special(KeyCode::ESCAPE)).is_quit());
    REQUIRE(translate(RawKey::special(KeyCode::INTERRUPT)).is_quit());
}

// ============================================================================
// Everything else
// ============================================================================

TEST_CASE("translate: no key and unmapped keys give none", "[input]") {
    REQUIRE(translate(std::nullopt).is_none());
    REQUIRE(translate(RawKey::character('x')).is_none());
    REQUIRE(translate(RawKey::character(' ')).is_none());
    REQUIRE(translate(RawKey::character('1')).is_none());
    REQUIRE(translate(RawKey::special(KeyCode::UNKNOWN)).is_none());
}

TEST_CASE("Command: equality ignores direction unless moving", "[input]") {
    Command a = Command::quit();
    Command b{Command::Type::QUIT, Direction::LEFT};
    REQUIRE(a == b);

    REQUIRE(Command::move(Direction::UP) != Command::move(Direction::DOWN));
    REQUIRE(Command::none() != Command::quit());
}
