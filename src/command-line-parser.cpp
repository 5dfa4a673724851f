/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "command-line-parser.hpp"

#include "command-line-app.hpp"
#include "format.hpp"
#include "logging.hpp"
#include "version.hpp"

#include <CLI/CLI.hpp>

#include <libxml/xmlversion.h>

#include <iostream>
#include <stdexcept>

void print_version()
{
    fmt::print(stderr, "usfx2tsv version {}\n", get_usfx2tsv_version());
    fmt::print(stderr, "Build: {}\n", get_build_type());
    fmt::print(stderr, "Compiled using the following library versions:\n");
    fmt::print(stderr, "libxml2 {}\n", LIBXML_DOTTED_VERSION);
    fmt::print(stderr, "{{fmt}} {}.{}.{}\n", FMT_VERSION / 10000,
               FMT_VERSION / 100 % 100, FMT_VERSION % 100);
    fmt::print(stderr, "CLI11 {}\n", CLI11_VERSION);
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,hicpp-avoid-c-arrays,modernize-avoid-c-arrays)
options_t parse_command_line(int argc, char const *const argv[])
{
    options_t options;

    command_line_app_t app{"usfx2tsv -- Convert USFX Bible text into tab "
                           "separated verse lines\n"};
    app.get_formatter()->column_width(38);

    app.add_option("USFXFILE", options.input_file)
        ->description("Input file ('-' for stdin, default: "
                      "'xml/source.xml').")
        ->type_name("FILE");

    // ----------------------------------------------------------------------
    // Input options
    // ----------------------------------------------------------------------

    app.add_option("-s,--style", options.style_file)
        ->description("Tag style file telling which tags contain verse "
                      "text (default: built-in USFX table).")
        ->type_name("FILE")
        ->group("Input options");

    // ----------------------------------------------------------------------
    // Output options
    // ----------------------------------------------------------------------

    app.add_option("-o,--output", options.output_file)
        ->description("Output file ('-' for stdout, default: stdout).")
        ->type_name("FILE")
        ->group("Output options");

    try {
        app.parse(argc, argv);
    } catch (...) {
        log_info("usfx2tsv version {}", get_usfx2tsv_version());
        throw;
    }

    if (app.want_help()) {
        std::cout << app.help();
        options.command = command_t::help;
        return options;
    }

    if (app.want_version()) {
        options.command = command_t::version;
        return options;
    }

    if (options.input_file.empty()) {
        throw std::runtime_error{"Missing input file."};
    }

    if (!options.output_to_stdout() &&
        options.output_file == options.input_file) {
        throw std::runtime_error{
            "Input and output file can not be the same."};
    }

    return options;
}
