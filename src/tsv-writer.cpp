/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "tsv-writer.hpp"

#include "format.hpp"

#include <cassert>
#include <cerrno>
#include <iterator>
#include <system_error>

tsv_writer_t::tsv_writer_t()
: m_name("(stdout)"), m_file(stdout), m_owns_file(false)
{}

tsv_writer_t::tsv_writer_t(std::string const &filename)
: m_name(filename), m_file(std::fopen(filename.c_str(), "wb")),
  m_owns_file(true)
{
    if (!m_file) {
        throw std::system_error{
            errno, std::system_category(),
            fmt::format("Couldn't open output file '{}'", filename)};
    }
}

tsv_writer_t::~tsv_writer_t()
{
    if (!m_file) {
        return;
    }

    // Lines already written stay written even if the conversion failed,
    // the caller decides what to do with a truncated output.
    if (m_owns_file) {
        std::fclose(m_file);
    } else {
        std::fflush(m_file);
    }
}

void tsv_writer_t::add_escaped(std::string_view str, std::string *buffer)
{
    for (char const c : str) {
        switch (c) {
        case '\\':
            *buffer += "\\\\";
            break;
        case '\n':
            *buffer += "\\n";
            break;
        case '\r':
            *buffer += "\\r";
            break;
        case '\t':
            *buffer += "\\t";
            break;
        default:
            *buffer += c;
            break;
        }
    }
}

void tsv_writer_t::add_column(std::string_view value)
{
    add_escaped(value, &m_buffer);
    m_buffer += '\t';
}

void tsv_writer_t::add_column(std::uint32_t value)
{
    fmt::format_to(std::back_inserter(m_buffer), "{}\t", value);
}

void tsv_writer_t::finish_line()
{
    assert(!m_buffer.empty());

    // Expect that a column has been written last which ended in a '\t'.
    // Replace it with the row delimiter '\n'.
    assert(m_buffer.back() == '\t');
    m_buffer.back() = '\n';
}

void tsv_writer_t::write(verse_record_t const &record)
{
    if (!m_file) {
        throw fmt_error("Output '{}' is already closed.", m_name);
    }

    m_buffer.clear();
    add_column(record.book);
    add_column(record.chapter);
    add_column(record.verse.to_string());
    add_column(record.text);
    finish_line();

    if (std::fwrite(m_buffer.data(), 1, m_buffer.size(), m_file) !=
        m_buffer.size()) {
        throw std::system_error{
            errno, std::system_category(),
            fmt::format("Error writing to '{}'", m_name)};
    }

    ++m_lines;
}

void tsv_writer_t::close()
{
    if (!m_file) {
        return;
    }

    std::FILE *const file = m_file;
    m_file = nullptr;

    int const ret = m_owns_file ? std::fclose(file) : std::fflush(file);
    if (ret != 0) {
        throw std::system_error{
            errno, std::system_category(),
            fmt::format("Error writing to '{}'", m_name)};
    }
}
