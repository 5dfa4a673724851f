#ifndef USFX2TSV_WILDCMP_HPP
#define USFX2TSV_WILDCMP_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include <string_view>

/**
 * Case sensitive wild card match with a string.
 * * matches any string or no character.
 * ? matches any single character.
 * anything else must match the character exactly.
 *
 * Returns if a match was found.
 */
bool wildcard_match(std::string_view expr, std::string_view str) noexcept;

/// Does this string contain any wildcard characters?
bool has_wildcard(std::string_view str) noexcept;

#endif // USFX2TSV_WILDCMP_HPP
