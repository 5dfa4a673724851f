#ifndef USFX2TSV_COMMAND_LINE_APP_HPP
#define USFX2TSV_COMMAND_LINE_APP_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include <CLI/CLI.hpp>

#include <string>

class command_line_app_t : public CLI::App
{
public:
    explicit command_line_app_t(std::string app_description);

    bool want_help() const;

    bool want_version() const;

private:
    void init_logging_options();

}; // class command_line_app_t

#endif // USFX2TSV_COMMAND_LINE_APP_HPP
