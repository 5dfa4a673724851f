/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include <catch.hpp>

#include "conversion-error.hpp"
#include "verse-number.hpp"

#include <string>

TEST_CASE("parse chapter numbers")
{
    REQUIRE(parse_chapter_number("1") == 1);
    REQUIRE(parse_chapter_number("150") == 150);
    REQUIRE(parse_chapter_number(" 12\n") == 12);
    REQUIRE(parse_chapter_number("007") == 7);
    REQUIRE(parse_chapter_number("4294967295") == 4294967295UL);
}

TEST_CASE("invalid chapter numbers")
{
    auto const str = GENERATE(as<std::string>{}, "", " ", "0", "-3", "+3", "3a",
                              "a3", "1.5", "1-2", "4294967296");

    REQUIRE_THROWS_AS(parse_chapter_number(str), conversion_error);
}

TEST_CASE("invalid chapter number error has the right kind")
{
    try {
        parse_chapter_number("x");
        FAIL("Expected an exception");
    } catch (conversion_error const &e) {
        REQUIRE(e.kind() == error_kind::invalid_numeral);
        REQUIRE(std::string{e.what()} == "Invalid chapter number 'x'.");
    }
}

TEST_CASE("parse single verse numbers")
{
    auto const v = parse_verse_number("16");
    REQUIRE(v.first() == 16);
    REQUIRE(v.last() == 16);
    REQUIRE_FALSE(v.is_bridge());
    REQUIRE(v.to_string() == "16");

    REQUIRE(parse_verse_number("016").to_string() == "16");
}

TEST_CASE("parse verse bridges")
{
    auto const v = parse_verse_number("6-7");
    REQUIRE(v.first() == 6);
    REQUIRE(v.last() == 7);
    REQUIRE(v.is_bridge());
    REQUIRE(v.to_string() == "6-7");

    REQUIRE(parse_verse_number(" 1 - 3 ") == verse_number_t{1, 3});
    REQUIRE(parse_verse_number("09-10").to_string() == "9-10");
}

TEST_CASE("invalid verse numbers")
{
    auto const str = GENERATE(as<std::string>{}, "", "0", "x", "5b", "-",
                              "6-", "-7", "7-6", "7-7", "1-2-3", "0-1");

    REQUIRE_THROWS_AS(parse_verse_number(str), conversion_error);
}

TEST_CASE("verse from bcv attribute")
{
    REQUIRE(verse_from_bcv("GEN.1.1") == "1");
    REQUIRE(verse_from_bcv("PSA.119.176") == "176");
    REQUIRE(verse_from_bcv("ROM.16.25-27") == "25-27");
    REQUIRE(verse_from_bcv("").empty());
    REQUIRE(verse_from_bcv("GEN").empty());
    REQUIRE(verse_from_bcv("GEN.1").empty());
    REQUIRE(verse_from_bcv("GEN.1.1.1").empty());
}
