#ifndef USFX2TSV_VERSION_HPP
#define USFX2TSV_VERSION_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

char const *get_build_type() noexcept;
char const *get_usfx2tsv_version() noexcept;

#endif // USFX2TSV_VERSION_HPP
