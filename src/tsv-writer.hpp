#ifndef USFX2TSV_TSV_WRITER_HPP
#define USFX2TSV_TSV_WRITER_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "verse-record.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

/**
 * Writes verse records as tab separated lines in the text format
 * understood by the PostgreSQL COPY command:
 *
 *   BOOK \t CHAPTER \t VERSE \t TEXT \n
 *
 * There is no header line.
 */
class tsv_writer_t
{
public:
    /// Write to standard output.
    tsv_writer_t();

    /// Write to the named file, which is created or truncated.
    explicit tsv_writer_t(std::string const &filename);

    tsv_writer_t(tsv_writer_t const &) = delete;
    tsv_writer_t &operator=(tsv_writer_t const &) = delete;

    tsv_writer_t(tsv_writer_t &&) = delete;
    tsv_writer_t &operator=(tsv_writer_t &&) = delete;

    ~tsv_writer_t();

    void write(verse_record_t const &record);

    /**
     * Flush everything written so far and close the output (not if it is
     * standard output). Errors are only detected here for buffered output,
     * call this before reporting success.
     */
    void close();

    std::size_t lines() const noexcept { return m_lines; }

    /**
     * Append the string to the buffer, escaping backslash, tab, newline
     * and carriage return characters.
     */
    static void add_escaped(std::string_view str, std::string *buffer);

private:
    void add_column(std::string_view value);
    void add_column(std::uint32_t value);
    void finish_line();

    std::string m_name;
    std::string m_buffer;
    std::FILE *m_file;
    std::size_t m_lines = 0;
    bool m_owns_file;

}; // class tsv_writer_t

#endif // USFX2TSV_TSV_WRITER_HPP
