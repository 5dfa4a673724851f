/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "wildcmp.hpp"

bool wildcard_match(std::string_view expr, std::string_view str) noexcept
{
    std::size_t e = 0;
    std::size_t s = 0;

    // Position of the last '*' seen in expr and the position in str it
    // was matched against. Used to backtrack when a later match fails.
    std::size_t star = std::string_view::npos;
    std::size_t star_match = 0;

    while (s < str.size()) {
        if (e < expr.size() && (expr[e] == '?' || expr[e] == str[s])) {
            ++e;
            ++s;
        } else if (e < expr.size() && expr[e] == '*') {
            star = e++;
            star_match = s;
        } else if (star != std::string_view::npos) {
            e = star + 1;
            s = ++star_match;
        } else {
            return false;
        }
    }

    while (e < expr.size() && expr[e] == '*') {
        ++e;
    }

    return e == expr.size();
}

bool has_wildcard(std::string_view str) noexcept
{
    return str.find_first_of("*?") != std::string_view::npos;
}
