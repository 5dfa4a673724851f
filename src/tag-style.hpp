#ifndef USFX2TSV_TAG_STYLE_HPP
#define USFX2TSV_TAG_STYLE_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

/**
 * \file
 *
 * The tag style decides what the verse extractor does with each XML
 * element: Structural elements set the book/chapter/verse context,
 * content elements contribute their text to the verse and annotation
 * elements are skipped with everything inside them.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

enum class tag_role : std::uint8_t
{
    /// Inline markup, the text inside is part of the verse.
    content,

    /// Block markup, like content, but its boundaries separate words.
    paragraph,

    /// Footnotes, cross-references, headings, ... are not verse text.
    annotation,

    book,
    chapter,
    verse,
    verse_end
};

constexpr bool is_structural(tag_role role) noexcept
{
    return role == tag_role::book || role == tag_role::chapter ||
           role == tag_role::verse || role == tag_role::verse_end;
}

/**
 * Get the name of a role as used in style files.
 */
char const *tag_role_name(tag_role role) noexcept;

/**
 * Get the role from its name in a style file. Returns false if there is
 * no such role.
 */
bool tag_role_from_name(std::string_view name, tag_role *role) noexcept;

class tag_style_t
{
public:
    /**
     * Add a tag name (which can contain wildcards) with its role. Later
     * calls for the same exact name override earlier ones.
     */
    void add(std::string const &name, tag_role role);

    /**
     * Look up the role of a tag. Exact names are tried first, then the
     * wildcard entries in the order they were added. Unknown tags are
     * content.
     */
    tag_role role(std::string const &name) const;

    /// Is this tag name in the table (exactly or through a wildcard)?
    bool known(std::string const &name) const;

    /// Is there at least one exact tag name with this role?
    bool has_role(tag_role role) const noexcept;

    bool empty() const noexcept
    {
        return m_exact.empty() && m_wildcards.empty();
    }

    std::size_t size() const noexcept
    {
        return m_exact.size() + m_wildcards.size();
    }

private:
    tag_role const *find(std::string const &name) const;

    std::unordered_map<std::string, tag_role> m_exact;
    std::vector<std::pair<std::string, tag_role>> m_wildcards;

}; // class tag_style_t

/**
 * The built-in tag table for the USFX dialect.
 */
tag_style_t default_tag_style();

/**
 * Read a tag style file. Each non-empty line contains a tag name and its
 * role separated by whitespace, '#' starts a comment.
 *
 * \throws std::runtime_error if the file can't be read or is invalid.
 */
tag_style_t read_tag_style_file(std::string const &filename);

#endif // USFX2TSV_TAG_STYLE_HPP
