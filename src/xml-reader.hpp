#ifndef USFX2TSV_XML_READER_HPP
#define USFX2TSV_XML_READER_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include "xml-event.hpp"

#include <libxml/xmlreader.h>

#include <memory>
#include <string>

/**
 * XML event source reading a document incrementally with the libxml2
 * xmlTextReader pull parser.
 */
class xml_reader_t : public xml_event_source_t
{
public:
    /// Stream the XML file with the given name.
    static std::unique_ptr<xml_reader_t> from_file(std::string const &filename);

    /**
     * Parse an in-memory document. The buffer is copied, it doesn't have
     * to outlive the reader.
     */
    static std::unique_ptr<xml_reader_t>
    from_buffer(std::string const &buffer,
                std::string const &url = "memory.xml");

    ~xml_reader_t() override;

    bool next(xml_event_t *event) override;

    /// Line number the parser is currently at (0 if unknown).
    int line() const noexcept;

private:
    xml_reader_t(std::string name, std::string buffer);

    void open(xmlTextReaderPtr reader);

    static void error_handler(void *arg, char const *msg,
                              xmlParserSeverities severity,
                              xmlTextReaderLocatorPtr locator);

    [[noreturn]] void throw_parse_error() const;

    void read_attributes(xml_event_t *event);

    // libxml2 reads directly from this buffer, it must not change
    std::string m_buffer;
    std::string m_name;
    std::string m_error;
    int m_error_line = 0;
    xmlTextReaderPtr m_reader = nullptr;
    bool m_done = false;

}; // class xml_reader_t

#endif // USFX2TSV_XML_READER_HPP
