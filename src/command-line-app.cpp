/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "command-line-app.hpp"

#include "logging.hpp"

#include <cstdint>
#include <map>
#include <utility>

command_line_app_t::command_line_app_t(std::string app_description)
: CLI::App(std::move(app_description))
{
    // Remove help flag, because we add our own which doesn't throw and
    // works without any other arguments.
    set_help_flag();

    add_flag("-h,--help", "Print this help message and exit.");
    add_flag("-V,--version", "Show version and exit.");

    init_logging_options();
}

bool command_line_app_t::want_help() const { return count("--help") > 0; }

bool command_line_app_t::want_version() const
{
    return count("--version") > 0;
}

void command_line_app_t::init_logging_options()
{
    static std::map<std::string, log_level> const log_levels = {
        {"debug", log_level::debug},
        {"info", log_level::info},
        {"warn", log_level::warn},
        {"warning", log_level::warn},
        {"error", log_level::error}};

    add_option_function<std::string>("--log-level",
                                     [&](std::string const &arg) {
                                         get_logger().set_level(
                                             log_levels.at(arg));
                                     })
        ->description("Set log level ('debug', 'info' (default), 'warn', "
                      "'error').")
        ->option_text("LEVEL")
        ->check(CLI::IsMember(log_levels))
        ->group("Logging options");

    add_flag_function("-v,--verbose",
                      [](std::int64_t) {
                          get_logger().set_level(log_level::debug);
                      })
        ->description("Enable debug logging (same as --log-level=debug).")
        ->group("Logging options");

    add_flag_function("--no-color",
                      [](std::int64_t) { get_logger().disable_color(); })
        ->description("Never use colors in log messages.")
        ->group("Logging options");
}
