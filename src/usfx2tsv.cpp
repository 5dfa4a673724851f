/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "command-line-parser.hpp"
#include "conversion-error.hpp"
#include "converter.hpp"
#include "logging.hpp"
#include "options.hpp"
#include "tag-style.hpp"
#include "tsv-writer.hpp"
#include "util.hpp"
#include "version.hpp"
#include "xml-reader.hpp"

#include <exception>
#include <memory>

namespace {

tag_style_t load_tag_style(options_t const &options)
{
    if (options.style_file.empty()) {
        log_debug("Using built-in tag style.");
        return default_tag_style();
    }

    log_info("Reading tag style from '{}'...", options.style_file);
    return read_tag_style_file(options.style_file);
}

std::unique_ptr<tsv_writer_t> open_output(options_t const &options)
{
    if (options.output_to_stdout()) {
        return std::make_unique<tsv_writer_t>();
    }

    log_info("Writing to '{}'.", options.output_file);
    return std::make_unique<tsv_writer_t>(options.output_file);
}

void run(options_t const &options)
{
    util::timer_t timer;

    auto const style = load_tag_style(options);

    log_info("Reading '{}'...", options.input_file);
    auto reader = xml_reader_t::from_file(options.input_file);
    auto writer = open_output(options);

    auto const stats = convert(reader.get(), style, writer.get());
    writer->close();

    log_info("Wrote {} verses in {} chapters of {} books.", stats.verses,
             stats.chapters, stats.books);
    log_info("All done. Conversion took {}.",
             util::human_readable_duration(timer.stop()));
}

} // anonymous namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char *argv[])
{
    try {
        auto const options = parse_command_line(argc, argv);

        if (options.command == command_t::help) {
            // Already handled inside parse_command_line()
            return 0;
        }

        if (options.command == command_t::version) {
            print_version();
            return 0;
        }

        log_info("usfx2tsv version {}", get_usfx2tsv_version());

        run(options);
    } catch (conversion_error const &e) {
        log_error("Conversion failed ({}): {}", error_kind_name(e.kind()),
                  e.what());
        return 1;
    } catch (std::exception const &e) {
        log_error("{}", e.what());
        return 1;
    } catch (...) {
        log_error("Unknown exception.");
        return 1;
    }

    return 0;
}
