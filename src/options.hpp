#ifndef USFX2TSV_OPTIONS_HPP
#define USFX2TSV_OPTIONS_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include <string>

enum class command_t
{
    help,
    version,
    process
};

/**
 * Structure for storing command-line settings.
 */
struct options_t
{
    command_t command = command_t::process;

    /// USFX input file, "-" for stdin
    std::string input_file{"xml/source.xml"};

    /// TSV output file, empty or "-" for stdout
    std::string output_file;

    /// Tag style file, empty for the built-in table
    std::string style_file;

    bool output_to_stdout() const noexcept
    {
        return output_file.empty() || output_file == "-";
    }
};

#endif // USFX2TSV_OPTIONS_HPP
