#ifndef USFX2TSV_COMMAND_LINE_PARSER_HPP
#define USFX2TSV_COMMAND_LINE_PARSER_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "options.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,hicpp-avoid-c-arrays,modernize-avoid-c-arrays)
options_t parse_command_line(int argc, char const *const argv[]);

void print_version();

#endif // USFX2TSV_COMMAND_LINE_PARSER_HPP
