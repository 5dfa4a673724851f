/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "verse-number.hpp"

#include "conversion-error.hpp"
#include "format.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>

namespace {

constexpr bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string_view trim(std::string_view str) noexcept
{
    while (!str.empty() && is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

/**
 * Parse a positive decimal number. Returns 0 if this isn't one. strtoull()
 * accepts leading whitespace and signs, so the first character is checked
 * separately.
 */
std::uint32_t parse_positive(std::string_view str)
{
    if (str.empty() || str.front() < '0' || str.front() > '9') {
        return 0;
    }

    std::string const number{str};
    char *end = nullptr;
    errno = 0;
    unsigned long long const value = std::strtoull(number.c_str(), &end, 10);
    if (errno || *end != '\0' ||
        value > std::numeric_limits<std::uint32_t>::max()) {
        return 0;
    }

    return static_cast<std::uint32_t>(value);
}

} // anonymous namespace

std::string verse_number_t::to_string() const
{
    if (is_bridge()) {
        return fmt::format("{}-{}", m_first, m_last);
    }
    return fmt::format("{}", m_first);
}

std::uint32_t parse_chapter_number(std::string_view str)
{
    auto const value = parse_positive(trim(str));
    if (value == 0) {
        throw conversion_error_of(error_kind::invalid_numeral,
                                  "Invalid chapter number '{}'.", str);
    }
    return value;
}

verse_number_t parse_verse_number(std::string_view str)
{
    auto const trimmed = trim(str);
    auto const pos = trimmed.find('-');

    if (pos == std::string_view::npos) {
        auto const value = parse_positive(trimmed);
        if (value == 0) {
            throw conversion_error_of(error_kind::invalid_numeral,
                                      "Invalid verse number '{}'.", str);
        }
        return verse_number_t{value};
    }

    auto const first = parse_positive(trim(trimmed.substr(0, pos)));
    auto const last = parse_positive(trim(trimmed.substr(pos + 1)));
    if (first == 0 || last == 0) {
        throw conversion_error_of(error_kind::invalid_numeral,
                                  "Invalid verse bridge '{}'.", str);
    }

    if (first >= last) {
        throw conversion_error_of(
            error_kind::invalid_numeral,
            "Invalid verse bridge '{}': {} is not before {}.", str, first,
            last);
    }

    return verse_number_t{first, last};
}

std::string_view verse_from_bcv(std::string_view bcv) noexcept
{
    auto const first_dot = bcv.find('.');
    if (first_dot == std::string_view::npos) {
        return {};
    }

    auto const second_dot = bcv.find('.', first_dot + 1);
    if (second_dot == std::string_view::npos ||
        bcv.find('.', second_dot + 1) != std::string_view::npos) {
        return {};
    }

    return bcv.substr(second_dot + 1);
}
