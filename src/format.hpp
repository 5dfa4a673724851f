#ifndef USFX2TSV_FORMAT_HPP
#define USFX2TSV_FORMAT_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#define FMT_HEADER_ONLY
#include <fmt/format.h>

#include <stdexcept>
#include <utility>

template <typename S, typename... TArgs>
std::runtime_error fmt_error(S const &format_str, TArgs &&...args)
{
    return std::runtime_error{
        fmt::format(format_str, std::forward<TArgs>(args)...)};
}

#endif // USFX2TSV_FORMAT_HPP
