#ifndef USFX2TSV_VERSE_EXTRACTOR_HPP
#define USFX2TSV_VERSE_EXTRACTOR_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "tag-style.hpp"
#include "verse-record.hpp"
#include "verse-text.hpp"
#include "xml-event.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

enum class extractor_state
{
    idle,
    in_book,
    in_chapter,
    in_verse
};

/**
 * Turns the stream of XML events from a USFX document into verse records.
 *
 * The book and chapter are not repeated on each verse in USFX, they are
 * given by the last book and chapter marker. The extractor keeps track of
 * them and of the verse currently being assembled. A verse is complete when
 * the next verse, chapter or book starts, when it is explicitly ended or at
 * the end of the document.
 *
 * Records are produced on demand by calling next(), so the document is
 * never held in memory as a whole. One extractor handles exactly one pass
 * over one document.
 */
class verse_extractor_t
{
public:
    struct stats_t
    {
        std::size_t books = 0;
        std::size_t chapters = 0;
        std::size_t verses = 0;
    };

    verse_extractor_t(xml_event_source_t *source, tag_style_t const &style);

    /**
     * Get the next verse record.
     *
     * \returns false at the end of the document.
     * \throws conversion_error if the document can't be converted. After
     *         that no more records will be returned.
     */
    bool next(verse_record_t *record);

    extractor_state state() const noexcept { return m_state; }

    stats_t const &stats() const noexcept { return m_stats; }

private:
    void handle(xml_event_t const &event);
    void start_element(xml_event_t const &event);
    void end_element(xml_event_t const &event);
    void text(xml_event_t const &event);

    void start_book(xml_event_t const &event);
    void start_chapter(xml_event_t const &event);
    void start_verse(xml_event_t const &event);

    void end_book();
    void end_chapter();
    void end_verse();

    /// Complete the pending verse, if there is one.
    void flush();

    void note_unknown_tag(std::string const &name);

    xml_event_source_t *m_source;
    tag_style_t const &m_style;

    xml_event_t m_event;

    extractor_state m_state = extractor_state::idle;
    std::string m_current_book;
    std::uint32_t m_current_chapter = 0;

    // The verse currently being assembled
    std::optional<verse_record_t> m_pending;
    verse_text_t m_text;

    // A completed verse waiting to be picked up by next()
    std::optional<verse_record_t> m_completed;

    // Depth inside an annotation element, 0 if not in an annotation.
    std::size_t m_skip_depth = 0;

    // Name of the structural element opened by the last event, if any.
    // Its end tag directly following means it was a milestone.
    std::string m_just_opened;

    std::unordered_set<std::string> m_unknown_tags;

    stats_t m_stats;

    bool m_done = false;

}; // class verse_extractor_t

#endif // USFX2TSV_VERSE_EXTRACTOR_HPP
