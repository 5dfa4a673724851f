/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "xml-reader.hpp"

#include "conversion-error.hpp"
#include "format.hpp"
#include "logging.hpp"

#include <libxml/xmlstring.h>
#include <libxml/xmlversion.h>

#include <cerrno>
#include <cstdio>
#include <system_error>
#include <utility>

namespace {

// Only predefined entities and character references are replaced. Other
// entity references stay references (and are dropped by next()), external
// entities are never loaded.
// XML_PARSE_NO_XXE is an enum value available since libxml2 2.13.
#if LIBXML_VERSION >= 21300
constexpr int const reader_options = XML_PARSE_NONET | XML_PARSE_NO_XXE;
#else
constexpr int const reader_options = XML_PARSE_NONET;
#endif

char const *to_chars(xmlChar const *str) noexcept
{
    return str ? reinterpret_cast<char const *>(str) : "";
}

std::string strip_newline(char const *msg)
{
    std::string str{msg ? msg : ""};
    while (!str.empty() && (str.back() == '\n' || str.back() == '\r')) {
        str.pop_back();
    }
    return str;
}

} // anonymous namespace

std::unique_ptr<xml_reader_t>
xml_reader_t::from_file(std::string const &filename)
{
    // Check the file first to get a proper error message, libxml2 only
    // tells us that it failed. libxml2 reads "-" as stdin.
    if (filename != "-") {
        std::FILE *const file = std::fopen(filename.c_str(), "rb");
        if (!file) {
            throw std::system_error{
                errno, std::system_category(),
                fmt::format("Couldn't open input file '{}'", filename)};
        }
        std::fclose(file);
    }

    std::unique_ptr<xml_reader_t> reader{
        new xml_reader_t{filename, std::string{}}};
    reader->open(xmlReaderForFile(filename.c_str(), nullptr, reader_options));

    return reader;
}

std::unique_ptr<xml_reader_t>
xml_reader_t::from_buffer(std::string const &buffer, std::string const &url)
{
    std::unique_ptr<xml_reader_t> reader{new xml_reader_t{url, buffer}};
    reader->open(xmlReaderForMemory(
        reader->m_buffer.data(), static_cast<int>(reader->m_buffer.size()),
        url.c_str(), nullptr, reader_options));

    return reader;
}

xml_reader_t::xml_reader_t(std::string name, std::string buffer)
: m_buffer(std::move(buffer)), m_name(std::move(name))
{}

void xml_reader_t::open(xmlTextReaderPtr reader)
{
    if (!reader) {
        throw fmt_error("Couldn't create XML reader for '{}'.", m_name);
    }

    m_reader = reader;
    xmlTextReaderSetErrorHandler(m_reader, error_handler, this);
}

xml_reader_t::~xml_reader_t()
{
    if (m_reader) {
        xmlFreeTextReader(m_reader);
    }
}

void xml_reader_t::error_handler(void *arg, char const *msg,
                                 xmlParserSeverities severity,
                                 xmlTextReaderLocatorPtr locator)
{
    auto *const self = static_cast<xml_reader_t *>(arg);
    int const line = locator ? xmlTextReaderLocatorLineNumber(locator) : 0;

    if (severity == XML_PARSER_SEVERITY_WARNING ||
        severity == XML_PARSER_SEVERITY_VALIDITY_WARNING) {
        log_warn("{}:{}: {}", self->m_name, line, strip_newline(msg));
        return;
    }

    // Only the first error is interesting, the others are often follow-up
    // errors of the first. Errors libxml2 could recover from are reported
    // by next() just like fatal ones.
    if (self->m_error.empty()) {
        self->m_error = strip_newline(msg);
        self->m_error_line = line;
    }
}

int xml_reader_t::line() const noexcept
{
    return m_reader ? xmlTextReaderGetParserLineNumber(m_reader) : 0;
}

void xml_reader_t::throw_parse_error() const
{
    if (m_error.empty()) {
        throw conversion_error_of(error_kind::malformed_xml,
                                  "{}:{}: XML parse error.", m_name, line());
    }

    throw conversion_error_of(error_kind::malformed_xml, "{}:{}: {}", m_name,
                              m_error_line, m_error);
}

void xml_reader_t::read_attributes(xml_event_t *event)
{
    while (xmlTextReaderMoveToNextAttribute(m_reader) == 1) {
        event->attributes.emplace_back(
            to_chars(xmlTextReaderConstName(m_reader)),
            to_chars(xmlTextReaderConstValue(m_reader)));
    }
    xmlTextReaderMoveToElement(m_reader);
}

bool xml_reader_t::next(xml_event_t *event)
{
    if (m_done) {
        return false;
    }

    while (true) {
        int const ret = xmlTextReaderRead(m_reader);
        if (ret < 0 || !m_error.empty()) {
            m_done = true;
            throw_parse_error();
        }

        if (ret == 0) {
            m_done = true;
            return false;
        }

        event->clear();

        switch (xmlTextReaderNodeType(m_reader)) {
        case XML_READER_TYPE_ELEMENT:
            event->type = xml_event_type::start_tag;
            event->name = to_chars(xmlTextReaderConstName(m_reader));
            event->empty = xmlTextReaderIsEmptyElement(m_reader) == 1;
            if (xmlTextReaderHasAttributes(m_reader) == 1) {
                read_attributes(event);
            }
            return true;
        case XML_READER_TYPE_END_ELEMENT:
            event->type = xml_event_type::end_tag;
            event->name = to_chars(xmlTextReaderConstName(m_reader));
            return true;
        case XML_READER_TYPE_TEXT:
        case XML_READER_TYPE_CDATA:
        case XML_READER_TYPE_WHITESPACE:
        case XML_READER_TYPE_SIGNIFICANT_WHITESPACE:
            event->type = xml_event_type::text;
            event->text = to_chars(xmlTextReaderConstValue(m_reader));
            return true;
        default:
            // comments, processing instructions, doctype, ...
            break;
        }
    }
}
