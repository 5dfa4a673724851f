/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "util.hpp"

#include "format.hpp"

namespace util {

std::string human_readable_duration(std::uint64_t seconds)
{
    if (seconds < 60) {
        return fmt::format("{}s", seconds);
    }

    if (seconds < (60 * 60)) {
        return fmt::format("{}s ({}m {}s)", seconds, seconds / 60,
                           seconds % 60);
    }

    auto const secs = seconds % 60;
    auto const mins = seconds / 60;
    return fmt::format("{}s ({}h {}m {}s)", seconds, mins / 60, mins % 60,
                       secs);
}

std::string human_readable_duration(std::chrono::microseconds duration)
{
    return human_readable_duration(static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(duration).count()));
}

} // namespace util
