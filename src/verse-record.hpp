#ifndef USFX2TSV_VERSE_RECORD_HPP
#define USFX2TSV_VERSE_RECORD_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "verse-number.hpp"

#include <cstdint>
#include <string>

/**
 * One output row: A verse with the book and chapter it belongs to.
 */
struct verse_record_t
{
    /// Book code from the source (like "GEN")
    std::string book;

    std::uint32_t chapter = 0;

    verse_number_t verse;

    /// Verse text without markup, tabs or newlines
    std::string text;
};

#endif // USFX2TSV_VERSE_RECORD_HPP
