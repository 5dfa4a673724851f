/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "verse-extractor.hpp"

#include "conversion-error.hpp"
#include "logging.hpp"
#include "verse-number.hpp"

#include <cassert>
#include <string_view>
#include <utility>

namespace {

std::string trimmed(std::string const &str)
{
    auto const begin = str.find_first_not_of(" \t\n\r");
    if (begin == std::string::npos) {
        return {};
    }
    auto const end = str.find_last_not_of(" \t\n\r");
    return str.substr(begin, end - begin + 1);
}

} // anonymous namespace

verse_extractor_t::verse_extractor_t(xml_event_source_t *source,
                                     tag_style_t const &style)
: m_source(source), m_style(style)
{
    assert(m_source);
}

bool verse_extractor_t::next(verse_record_t *record)
{
    assert(record);

    while (!m_completed) {
        if (m_done) {
            return false;
        }

        try {
            if (m_source->next(&m_event)) {
                handle(m_event);
                continue;
            }
        } catch (...) {
            // The conversion is over, but the caller has to know why.
            m_done = true;
            m_pending.reset();
            throw;
        }

        // end of document
        flush();
        m_state = extractor_state::idle;
        m_done = true;
    }

    *record = std::move(*m_completed);
    m_completed.reset();
    return true;
}

void verse_extractor_t::handle(xml_event_t const &event)
{
    if (m_skip_depth > 0) {
        if (event.type == xml_event_type::start_tag && !event.empty) {
            ++m_skip_depth;
        } else if (event.type == xml_event_type::end_tag) {
            --m_skip_depth;
        }
        return;
    }

    switch (event.type) {
    case xml_event_type::start_tag:
        m_just_opened.clear();
        start_element(event);
        break;
    case xml_event_type::end_tag:
        end_element(event);
        m_just_opened.clear();
        break;
    case xml_event_type::text:
        m_just_opened.clear();
        text(event);
        break;
    }
}

void verse_extractor_t::start_element(xml_event_t const &event)
{
    auto const role = m_style.role(event.name);

    switch (role) {
    case tag_role::book:
        start_book(event);
        break;
    case tag_role::chapter:
        start_chapter(event);
        break;
    case tag_role::verse:
        start_verse(event);
        break;
    case tag_role::verse_end:
        end_verse();
        break;
    case tag_role::annotation:
        if (!event.empty) {
            m_skip_depth = 1;
        }
        break;
    case tag_role::paragraph:
        if (m_state == extractor_state::in_verse) {
            m_text.add_break();
        }
        break;
    case tag_role::content:
        if (!m_style.known(event.name)) {
            note_unknown_tag(event.name);
        }
        break;
    }

    if (is_structural(role) && role != tag_role::verse_end && !event.empty) {
        m_just_opened = event.name;
    }
}

void verse_extractor_t::end_element(xml_event_t const &event)
{
    // A structural element without any child events (not even whitespace)
    // is a milestone like <c id="1"></c>, its end tag doesn't end anything.
    if (event.name == m_just_opened) {
        return;
    }

    switch (m_style.role(event.name)) {
    case tag_role::book:
        end_book();
        break;
    case tag_role::chapter:
        end_chapter();
        break;
    case tag_role::verse:
        end_verse();
        break;
    case tag_role::paragraph:
        if (m_state == extractor_state::in_verse) {
            m_text.add_break();
        }
        break;
    default:
        break;
    }
}

void verse_extractor_t::text(xml_event_t const &event)
{
    // Text outside of verses (titles, introductions, material between
    // verses) is not wanted.
    if (m_state != extractor_state::in_verse) {
        return;
    }

    m_text.append(event.text);
}

void verse_extractor_t::start_book(xml_event_t const &event)
{
    auto const *const id = event.get_attribute("id");
    std::string code = id ? trimmed(*id) : std::string{};
    if (code.empty()) {
        throw conversion_error_of(
            error_kind::missing_context,
            "Book element <{}> without book code in 'id' attribute.",
            event.name);
    }

    flush();

    m_current_book = std::move(code);
    m_current_chapter = 0;
    m_state = extractor_state::in_book;
    ++m_stats.books;

    log_debug("Processing book {}...", m_current_book);
}

void verse_extractor_t::start_chapter(xml_event_t const &event)
{
    auto const *const id = event.get_attribute("id");

    if (m_current_book.empty()) {
        throw conversion_error_of(error_kind::missing_context,
                                  "Chapter '{}' outside of a book.",
                                  id ? *id : std::string{});
    }

    if (!id) {
        throw conversion_error_of(error_kind::invalid_numeral,
                                  "Chapter element <{}> without 'id' "
                                  "attribute in book {}.",
                                  event.name, m_current_book);
    }

    std::uint32_t chapter = 0;
    try {
        chapter = parse_chapter_number(*id);
    } catch (conversion_error const &e) {
        throw conversion_error_of(e.kind(), "{} (in book {})", e.what(),
                                  m_current_book);
    }

    flush();

    m_current_chapter = chapter;
    m_state = extractor_state::in_chapter;
    ++m_stats.chapters;
}

void verse_extractor_t::start_verse(xml_event_t const &event)
{
    std::string_view number;
    if (auto const *const id = event.get_attribute("id")) {
        number = *id;
    } else if (auto const *const bcv = event.get_attribute("bcv")) {
        number = verse_from_bcv(*bcv);
    }

    if (m_current_book.empty()) {
        throw conversion_error_of(error_kind::missing_context,
                                  "Verse '{}' outside of a book.", number);
    }

    if (m_current_chapter == 0) {
        throw conversion_error_of(error_kind::missing_context,
                                  "Verse '{}' outside of a chapter in book {}.",
                                  number, m_current_book);
    }

    if (number.empty()) {
        throw conversion_error_of(error_kind::invalid_numeral,
                                  "Verse element <{}> without verse number "
                                  "in {} {}.",
                                  event.name, m_current_book,
                                  m_current_chapter);
    }

    verse_number_t verse;
    try {
        verse = parse_verse_number(number);
    } catch (conversion_error const &e) {
        throw conversion_error_of(e.kind(), "{} (in {} {})", e.what(),
                                  m_current_book, m_current_chapter);
    }

    flush();

    m_pending = verse_record_t{m_current_book, m_current_chapter, verse, {}};
    m_text.clear();
    m_state = extractor_state::in_verse;
    ++m_stats.verses;
}

void verse_extractor_t::end_book()
{
    flush();
    m_current_book.clear();
    m_current_chapter = 0;
    m_state = extractor_state::idle;
}

void verse_extractor_t::end_chapter()
{
    flush();
    m_current_chapter = 0;
    m_state = m_current_book.empty() ? extractor_state::idle
                                     : extractor_state::in_book;
}

void verse_extractor_t::end_verse()
{
    flush();
    if (m_state == extractor_state::in_verse) {
        m_state = extractor_state::in_chapter;
    }
}

void verse_extractor_t::flush()
{
    if (!m_pending) {
        return;
    }

    // Every event completes at most one verse and next() picks it up
    // before the next event is handled.
    assert(!m_completed);

    m_pending->text = m_text.release();
    m_completed = std::move(m_pending);
    m_pending.reset();
}

void verse_extractor_t::note_unknown_tag(std::string const &name)
{
    if (m_unknown_tags.insert(name).second) {
        log_debug("Unknown tag <{}>, treating it as content.", name);
    }
}
