#ifndef USFX2TSV_UTIL_HPP
#define USFX2TSV_UTIL_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include <chrono>
#include <cstdint>
#include <string>

namespace util {

/**
 * Wall clock timer for the summary message. Starts on construction,
 * stop() can be called more than once, the last call counts.
 */
class timer_t
{
public:
    timer_t() noexcept : m_start(clock::now()) {}

    std::chrono::microseconds stop() noexcept
    {
        m_elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            clock::now() - m_start);
        return m_elapsed;
    }

    std::chrono::microseconds elapsed() const noexcept { return m_elapsed; }

private:
    using clock = std::chrono::steady_clock;
    std::chrono::time_point<clock> m_start;
    std::chrono::microseconds m_elapsed{};

}; // class timer_t

/// Format a duration like "75s (1m 15s)".
std::string human_readable_duration(std::uint64_t seconds);

std::string human_readable_duration(std::chrono::microseconds duration);

} // namespace util

#endif // USFX2TSV_UTIL_HPP
