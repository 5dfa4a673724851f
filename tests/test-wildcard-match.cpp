/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include <catch.hpp>

#include "wildcmp.hpp"

TEST_CASE("Wildcard matching")
{
    CHECK(wildcard_match("fhwieurwe", "fhwieurwe"));
    CHECK_FALSE(wildcard_match("fhwieurwe", "fhwieurw"));
    CHECK_FALSE(wildcard_match("fhwieurw", "fhwieurwe"));
    CHECK(wildcard_match("*", "foo"));
    CHECK_FALSE(wildcard_match("r*", "foo"));
    CHECK(wildcard_match("r*", "roo"));
    CHECK(wildcard_match("*bar", "Hausbar"));
    CHECK_FALSE(wildcard_match("*bar", "Haustar"));
    CHECK(wildcard_match("*", ""));
    CHECK(wildcard_match("kin*la", "kinla"));
    CHECK(wildcard_match("kin*la", "kinLLla"));
    CHECK(wildcard_match("kin*la", "kinlalalala"));
    CHECK_FALSE(wildcard_match("kin*la", "kinlaa"));
    CHECK_FALSE(wildcard_match("kin*la", "ki??laa"));
    CHECK(wildcard_match("1*2*3", "123"));
    CHECK(wildcard_match("1*2*3", "1xX23"));
    CHECK(wildcard_match("1*2*3", "12y23"));
    CHECK_FALSE(wildcard_match("1*2*3", "12"));
    CHECK(wildcard_match("bo??f", "boxxf"));
    CHECK_FALSE(wildcard_match("bo??f", "boxf"));
    CHECK(wildcard_match("?5?", "?5?"));
    CHECK(wildcard_match("?5?", "x5x"));
}

TEST_CASE("Wildcard matching of USFX tag names")
{
    CHECK(wildcard_match("f?", "fr"));
    CHECK(wildcard_match("f?", "ft"));
    CHECK_FALSE(wildcard_match("f?", "f"));
    CHECK_FALSE(wildcard_match("f?", "fig"));
    CHECK(wildcard_match("x*", "xo"));
    CHECK(wildcard_match("x*", "x"));
    CHECK_FALSE(wildcard_match("x*", "ve"));
}

TEST_CASE("Detect wildcards")
{
    CHECK(has_wildcard("f*"));
    CHECK(has_wildcard("?"));
    CHECK_FALSE(has_wildcard("verse"));
    CHECK_FALSE(has_wildcard(""));
}
