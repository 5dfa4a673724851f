#ifndef USFX2TSV_XML_EVENT_HPP
#define USFX2TSV_XML_EVENT_HPP

/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

/**
 * \file
 *
 * Structural events as produced by a pull-style XML tokenizer and the
 * interface of anything that produces them in document order.
 */

#include <string>
#include <string_view>
#include <utility>
#include <vector>

enum class xml_event_type
{
    start_tag,
    end_tag,
    text
};

struct xml_event_t
{
    using attribute_t = std::pair<std::string, std::string>;

    xml_event_type type = xml_event_type::text;

    /// Tag name (start_tag and end_tag only)
    std::string name;

    /// Attributes in document order (start_tag only)
    std::vector<attribute_t> attributes;

    /// Character content (text only)
    std::string text;

    /**
     * Set on the start_tag of a self-closing element like <v id="1"/>.
     * There is no end_tag event for those elements.
     */
    bool empty = false;

    /// Return the value of the named attribute or nullptr if it isn't set.
    std::string const *get_attribute(std::string_view key) const noexcept
    {
        for (auto const &attr : attributes) {
            if (attr.first == key) {
                return &attr.second;
            }
        }
        return nullptr;
    }

    void clear() noexcept
    {
        type = xml_event_type::text;
        name.clear();
        attributes.clear();
        text.clear();
        empty = false;
    }
};

/**
 * Source of XML events, one at a time and in document order.
 */
class xml_event_source_t
{
public:
    xml_event_source_t() = default;

    xml_event_source_t(xml_event_source_t const &) = delete;
    xml_event_source_t &operator=(xml_event_source_t const &) = delete;

    xml_event_source_t(xml_event_source_t &&) = delete;
    xml_event_source_t &operator=(xml_event_source_t &&) = delete;

    virtual ~xml_event_source_t() = default;

    /**
     * Read the next event into *event.
     *
     * \returns false at the end of the document, *event is undefined then.
     * \throws conversion_error (malformed_xml) if the input can't be parsed.
     */
    virtual bool next(xml_event_t *event) = 0;

}; // class xml_event_source_t

#endif // USFX2TSV_XML_EVENT_HPP
