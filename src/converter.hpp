#ifndef USFX2TSV_CONVERTER_HPP
#define USFX2TSV_CONVERTER_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "verse-extractor.hpp"

class tag_style_t;
class tsv_writer_t;
class xml_event_source_t;

using conversion_stats_t = verse_extractor_t::stats_t;

/**
 * Convert a whole USFX document: Read all events from the source and
 * write one line per verse.
 *
 * \throws conversion_error if the document can't be converted. Lines for
 *         verses completed before the problem was found are written.
 */
conversion_stats_t convert(xml_event_source_t *source,
                           tag_style_t const &style, tsv_writer_t *writer);

#endif // USFX2TSV_CONVERTER_HPP
