/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "verse-text.hpp"

#include <utility>

namespace {

constexpr bool is_whitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
}

} // anonymous namespace

void verse_text_t::append(std::string_view chunk)
{
    for (char const c : chunk) {
        if (is_whitespace(c)) {
            m_pending_space = true;
            continue;
        }

        if (m_pending_space && !m_text.empty()) {
            m_text += ' ';
        }
        m_pending_space = false;
        m_text += c;
    }
}

std::string verse_text_t::release()
{
    std::string result{std::move(m_text)};
    clear();
    return result;
}
