/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "conversion-error.hpp"

char const *error_kind_name(error_kind kind) noexcept
{
    switch (kind) {
    case error_kind::malformed_xml:
        return "malformed XML";
    case error_kind::missing_context:
        return "missing context";
    case error_kind::invalid_numeral:
        return "invalid numeral";
    }
    return "unknown error";
}
