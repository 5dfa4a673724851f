#ifndef USFX2TSV_CONVERSION_ERROR_HPP
#define USFX2TSV_CONVERSION_ERROR_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "format.hpp"

#include <stdexcept>
#include <string>
#include <utility>

/**
 * The reasons a conversion can fail. All of them are terminal, the
 * conversion of the document stops at the first one.
 */
enum class error_kind
{
    /// The XML parser could not read the input.
    malformed_xml,

    /// Chapter without a book or verse without a chapter.
    missing_context,

    /// Chapter or verse number that can not be interpreted.
    invalid_numeral
};

char const *error_kind_name(error_kind kind) noexcept;

class conversion_error : public std::runtime_error
{
public:
    conversion_error(error_kind kind, std::string const &message)
    : std::runtime_error(message), m_kind(kind)
    {}

    error_kind kind() const noexcept { return m_kind; }

private:
    error_kind m_kind;
}; // class conversion_error

template <typename S, typename... TArgs>
conversion_error conversion_error_of(error_kind kind, S const &format_str,
                                     TArgs &&...args)
{
    return conversion_error{
        kind, fmt::format(format_str, std::forward<TArgs>(args)...)};
}

#endif // USFX2TSV_CONVERSION_ERROR_HPP
