#ifndef USFX2TSV_VERSE_NUMBER_HPP
#define USFX2TSV_VERSE_NUMBER_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include <cstdint>
#include <string>
#include <string_view>

/**
 * A verse number as given in the source. This is either a single verse
 * or a verse bridge ("6-7") covering several printed verses which the
 * source has merged into one unit of text. Bridges are kept as they are.
 */
class verse_number_t
{
public:
    constexpr verse_number_t() noexcept = default;

    constexpr explicit verse_number_t(std::uint32_t verse) noexcept
    : m_first(verse), m_last(verse)
    {}

    constexpr verse_number_t(std::uint32_t first, std::uint32_t last) noexcept
    : m_first(first), m_last(last)
    {}

    constexpr std::uint32_t first() const noexcept { return m_first; }

    constexpr std::uint32_t last() const noexcept { return m_last; }

    constexpr bool is_bridge() const noexcept { return m_first != m_last; }

    /// "7" for a single verse, "6-7" for a bridge.
    std::string to_string() const;

    friend constexpr bool operator==(verse_number_t a,
                                     verse_number_t b) noexcept
    {
        return a.m_first == b.m_first && a.m_last == b.m_last;
    }

    friend constexpr bool operator!=(verse_number_t a,
                                     verse_number_t b) noexcept
    {
        return !(a == b);
    }

private:
    std::uint32_t m_first = 0;
    std::uint32_t m_last = 0;

}; // class verse_number_t

/**
 * Parse a chapter number: Decimal digits only, optionally surrounded by
 * whitespace, at least 1.
 *
 * \throws conversion_error (invalid_numeral)
 */
std::uint32_t parse_chapter_number(std::string_view str);

/**
 * Parse a verse number, which is either a single number like a chapter
 * number or a bridge of two of them separated by a hyphen where the
 * first is smaller than the second.
 *
 * \throws conversion_error (invalid_numeral)
 */
verse_number_t parse_verse_number(std::string_view str);

/**
 * Get the verse part of a USFX "bcv" attribute ("GEN.1.1" -> "1").
 * Returns an empty view if the attribute doesn't have three parts.
 */
std::string_view verse_from_bcv(std::string_view bcv) noexcept;

#endif // USFX2TSV_VERSE_NUMBER_HPP
