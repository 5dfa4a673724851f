/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "tag-style.hpp"

#include "format.hpp"
#include "logging.hpp"
#include "wildcmp.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace {

struct role_name_t
{
    tag_role role;
    char const *name;
};

constexpr std::array<role_name_t, 7> const role_names = {
    {{tag_role::content, "content"},
     {tag_role::paragraph, "paragraph"},
     {tag_role::annotation, "annotation"},
     {tag_role::book, "book"},
     {tag_role::chapter, "chapter"},
     {tag_role::verse, "verse"},
     {tag_role::verse_end, "verse_end"}}};

} // anonymous namespace

char const *tag_role_name(tag_role role) noexcept
{
    for (auto const &rn : role_names) {
        if (rn.role == role) {
            return rn.name;
        }
    }
    return "unknown";
}

bool tag_role_from_name(std::string_view name, tag_role *role) noexcept
{
    for (auto const &rn : role_names) {
        if (name == rn.name) {
            *role = rn.role;
            return true;
        }
    }
    return false;
}

void tag_style_t::add(std::string const &name, tag_role role)
{
    if (has_wildcard(name)) {
        m_wildcards.emplace_back(name, role);
    } else {
        m_exact[name] = role;
    }
}

tag_role const *tag_style_t::find(std::string const &name) const
{
    auto const it = m_exact.find(name);
    if (it != m_exact.end()) {
        return &it->second;
    }

    for (auto const &entry : m_wildcards) {
        if (wildcard_match(entry.first, name)) {
            return &entry.second;
        }
    }

    return nullptr;
}

tag_role tag_style_t::role(std::string const &name) const
{
    auto const *const r = find(name);
    return r ? *r : tag_role::content;
}

bool tag_style_t::known(std::string const &name) const
{
    return find(name) != nullptr;
}

bool tag_style_t::has_role(tag_role role) const noexcept
{
    for (auto const &entry : m_exact) {
        if (entry.second == role) {
            return true;
        }
    }
    return false;
}

tag_style_t default_tag_style()
{
    tag_style_t style;

    style.add("book", tag_role::book);
    style.add("c", tag_role::chapter);
    style.add("chapter", tag_role::chapter);
    style.add("v", tag_role::verse);
    style.add("verse", tag_role::verse);
    style.add("ve", tag_role::verse_end);

    // footnotes, endnotes, cross-references, headings, titles, remarks,
    // alternate and published chapter/verse numbers, figures
    for (char const *const name :
         {"f", "fe", "x", "s", "h", "toc", "mt", "id", "ide", "rem", "cl", "cp",
          "ca", "va", "vp", "fig", "rq", "periph", "languageCode"}) {
        style.add(name, tag_role::annotation);
    }

    for (char const *const name : {"p", "q", "d", "b", "li", "table", "tr",
                                   "th", "tc", "optionalLineBreak"}) {
        style.add(name, tag_role::paragraph);
    }

    // Everything else (w, wj, add, nd, tl, qt, k, sc, it, bd, ...) is
    // inline content and doesn't need to be listed.

    return style;
}

tag_style_t read_tag_style_file(std::string const &filename)
{
    FILE *const in = std::fopen(filename.c_str(), "rt");
    if (!in) {
        throw std::system_error{
            errno, std::system_category(),
            fmt::format("Couldn't open style file '{}'", filename)};
    }

    tag_style_t style;

    char buffer[1024];
    int lineno = 0;
    while (std::fgets(buffer, sizeof(buffer), in) != nullptr) {
        ++lineno;

        // find where a comment starts and terminate the string there
        char *const str = std::strchr(buffer, '#');
        if (str) {
            *str = '\0';
        }

        char tag[128] = {0};
        char role_name[32] = {0};
        char extra[8] = {0};
        int const fields =
            std::sscanf(buffer, "%127s %31s %7s", tag, role_name, extra);
        if (fields <= 0) { // blank line
            continue;
        }

        if (fields != 2) {
            std::fclose(in);
            throw fmt_error("Error reading style file {} line {}: expected "
                            "'TAG ROLE' (fields={}).",
                            filename, lineno, fields);
        }

        tag_role role{};
        if (!tag_role_from_name(role_name, &role)) {
            std::fclose(in);
            throw fmt_error("Unknown role '{}' in style file {} line {}.",
                            role_name, filename, lineno);
        }

        if (is_structural(role) && has_wildcard(tag)) {
            std::fclose(in);
            throw fmt_error("Wildcard '{}' in {} entry in style file {} "
                            "line {}.",
                            tag, role_name, filename, lineno);
        }

        style.add(tag, role);
    }

    if (std::ferror(in)) {
        int const err = errno;
        std::fclose(in);
        throw std::system_error{
            err, std::system_category(),
            fmt::format("Error reading style file '{}'", filename)};
    }

    std::fclose(in);

    if (style.empty()) {
        throw fmt_error("No tags found in style file '{}'.", filename);
    }

    for (auto const role : {tag_role::book, tag_role::chapter, tag_role::verse}) {
        if (!style.has_role(role)) {
            throw fmt_error("Style file '{}' doesn't define any {} tag.",
                            filename, tag_role_name(role));
        }
    }

    log_debug("Read {} tags from style file '{}'.", style.size(), filename);

    return style;
}
