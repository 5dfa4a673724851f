/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include <catch.hpp>

#include "verse-text.hpp"

TEST_CASE("empty verse text")
{
    verse_text_t text;
    REQUIRE(text.empty());
    REQUIRE(text.release().empty());
}

TEST_CASE("single chunk is trimmed and collapsed")
{
    verse_text_t text;
    text.append("  \t Jesus \n\n wept.  ");
    REQUIRE(text.str() == "Jesus wept.");
}

TEST_CASE("chunks are joined as written")
{
    verse_text_t text;
    text.append("Hello ");
    text.append("world");
    text.append("!");
    REQUIRE(text.str() == "Hello world!");
}

TEST_CASE("whitespace on both sides of a chunk boundary gives one space")
{
    verse_text_t text;
    text.append("one  ");
    text.append("  two");
    REQUIRE(text.str() == "one two");
}

TEST_CASE("whitespace only chunks don't add anything at the start or end")
{
    verse_text_t text;
    text.append("   ");
    text.append("\n");
    text.append("word");
    text.append(" \r\n ");
    REQUIRE(text.str() == "word");
}

TEST_CASE("break separates words but never adds double spaces")
{
    verse_text_t text;
    text.add_break();
    text.append("first");
    text.add_break();
    text.append(" second");
    text.add_break();
    text.add_break();
    text.append("third");
    text.add_break();
    REQUIRE(text.str() == "first second third");
}

TEST_CASE("release returns the text and starts over")
{
    verse_text_t text;
    text.append("one ");
    REQUIRE(text.release() == "one");
    REQUIRE(text.empty());

    // The trailing space from before must not show up here.
    text.append("two");
    REQUIRE(text.release() == "two");
}

TEST_CASE("non-ASCII text is kept unchanged")
{
    verse_text_t text;
    text.append("\xce\x95\xce\xbd \xe1\xbc\x80\xcf\x81\xcf\x87\xe1\xbf\x87");
    text.append("\xc2\xa0"); // no-break space is not collapsed
    REQUIRE(text.str() ==
            "\xce\x95\xce\xbd \xe1\xbc\x80\xcf\x81\xcf\x87\xe1\xbf\x87\xc2\xa0");
}
