/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "converter.hpp"

#include "tsv-writer.hpp"

conversion_stats_t convert(xml_event_source_t *source,
                           tag_style_t const &style, tsv_writer_t *writer)
{
    verse_extractor_t extractor{source, style};

    verse_record_t record;
    while (extractor.next(&record)) {
        writer->write(record);
    }

    return extractor.stats();
}
