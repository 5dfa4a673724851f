/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "logging.hpp"

#include <ctime>

#ifndef _WIN32
#include <unistd.h>
#endif

/// Global logger singleton
logger the_logger{};

/// Access the global logger singleton
logger &get_logger() noexcept { return the_logger; }

bool logger::stderr_is_terminal() noexcept
{
#ifdef _WIN32
    return false;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

std::string logger::generate_common_prefix(fmt::text_style const &ts,
                                           char const *prefix) const
{
    std::string str = fmt::format("{:%Y-%m-%d %H:%M:%S}  ",
                                  fmt::localtime(std::time(nullptr)));

    if (prefix) {
        str += fmt::format(ts, "{}: ", prefix);
    }

    return str;
}
