#ifndef USFX2TSV_VERSE_TEXT_HPP
#define USFX2TSV_VERSE_TEXT_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include <string>
#include <string_view>

/**
 * Assembles the text of a verse from the text chunks found in the XML.
 *
 * Whitespace runs are collapsed into a single space and a space is only
 * ever written between two non-whitespace characters, so the result has
 * no leading or trailing whitespace, no double spaces and, in particular,
 * no tab or newline characters. Chunk boundaries by themselves don't
 * separate words: "Hello " + "world" + "!" gives "Hello world!".
 */
class verse_text_t
{
public:
    void append(std::string_view chunk);

    /// Separate what comes next from what was before (if anything).
    void add_break() noexcept { m_pending_space = true; }

    std::string const &str() const noexcept { return m_text; }

    bool empty() const noexcept { return m_text.empty(); }

    /// Return the text assembled so far and start over.
    std::string release();

    void clear() noexcept
    {
        m_text.clear();
        m_pending_space = false;
    }

private:
    std::string m_text;
    bool m_pending_space = false;

}; // class verse_text_t

#endif // USFX2TSV_VERSE_TEXT_HPP
