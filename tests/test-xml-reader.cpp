/**
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * This file is part of usfx2tsv.
 *
 * Copyright (C) 2024-2026 by the usfx2tsv developer community.
 * For a full list of authors see the git log.
 */

#include <catch.hpp>

#include "common-cleanup.hpp"
#include "common-events.hpp"

#include "conversion-error.hpp"
#include "xml-reader.hpp"

#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace {

/**
 * Read all events and render them in a compact form. Adjacent text
 * events are merged, libxml2 is free to split text where it wants.
 */
std::vector<std::string> render(xml_event_source_t *source)
{
    std::vector<std::string> out;
    bool last_was_text = false;

    xml_event_t event;
    while (source->next(&event)) {
        if (event.type == xml_event_type::text) {
            if (last_was_text) {
                out.back() += event.text;
            } else {
                out.push_back(event.text);
            }
            last_was_text = true;
            continue;
        }

        last_was_text = false;
        if (event.type == xml_event_type::end_tag) {
            out.push_back("</" + event.name + ">");
            continue;
        }

        std::string str{"<" + event.name};
        for (auto const &attr : event.attributes) {
            str += " " + attr.first + "=" + attr.second;
        }
        str += event.empty ? "/>" : ">";
        out.push_back(str);
    }

    return out;
}

std::vector<std::string> render(std::string const &xml)
{
    auto reader = xml_reader_t::from_buffer(xml);
    return render(reader.get());
}

} // anonymous namespace

TEST_CASE("elements, attributes and text come out in document order")
{
    auto const events =
        render("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
               "<usfx><book id=\"GEN\"><c id=\"1\"/>"
               "<v id=\"1\" bcv=\"GEN.1.1\"/>In the beginning<ve/>"
               "</book></usfx>");

    std::vector<std::string> const expected = {
        "<usfx>",  "<book id=GEN>",          "<c id=1/>",
        "<v id=1 bcv=GEN.1.1/>", "In the beginning", "<ve/>",
        "</book>", "</usfx>"};

    REQUIRE(events == expected);
}

TEST_CASE("explicitly closed empty element has an end tag")
{
    auto const events = render("<book id=\"RUT\"><c id=\"4\"></c></book>");

    std::vector<std::string> const expected = {"<book id=RUT>", "<c id=4>",
                                               "</c>", "</book>"};

    REQUIRE(events == expected);
}

TEST_CASE("entities are resolved")
{
    auto const events = render("<p>Tom &amp; Jerry &lt;3 &#x05D0;</p>");

    REQUIRE(events.size() == 3);
    REQUIRE(events[1] == "Tom & Jerry <3 \xD7\x90");
}

TEST_CASE("external entities are never loaded")
{
    testing::cleanup::file_t const secret{"test-xml-reader-entity.txt"};
    {
        std::FILE *const file = std::fopen(secret.name().c_str(), "w");
        REQUIRE(file);
        std::fputs("SECRET-LINE", file);
        std::fclose(file);
    }

    std::string const path = std::filesystem::absolute(secret.name()).string();
    std::string const xml = "<!DOCTYPE usfx [<!ENTITY e SYSTEM \"file://" +
                            path +
                            "\">]>"
                            "<usfx><book id=\"GEN\"><c id=\"1\"/>"
                            "<v id=\"1\"/>In &e; the beginning</book></usfx>";

    for (auto const &event : render(xml)) {
        CHECK_THAT(event, !Catch::Matchers::Contains("SECRET"));
    }

    auto reader = xml_reader_t::from_buffer(xml);
    auto const records = testing::extract_all(reader.get());

    REQUIRE(records.size() == 1);
    REQUIRE(records[0].text == "In the beginning");
}

TEST_CASE("attribute values are unescaped")
{
    xml_event_t event;
    auto reader = xml_reader_t::from_buffer("<v id=\"1&amp;2\" x='a'/>");

    REQUIRE(reader->next(&event));
    REQUIRE(event.type == xml_event_type::start_tag);
    REQUIRE(event.name == "v");
    REQUIRE(event.empty);
    REQUIRE(event.attributes.size() == 2);

    auto const *const id = event.get_attribute("id");
    REQUIRE(id);
    REQUIRE(*id == "1&2");
    REQUIRE(event.get_attribute("bcv") == nullptr);

    REQUIRE_FALSE(reader->next(&event));
}

TEST_CASE("CDATA sections are text, comments and processing instructions "
          "are dropped")
{
    auto const events = render("<p><!-- note -->a<?pi data?> "
                               "<![CDATA[x < y]]></p>");

    std::vector<std::string> const expected = {"<p>", "a x < y", "</p>"};

    REQUIRE(events == expected);
}

TEST_CASE("whitespace between elements is reported as text")
{
    auto const events = render("<c>\n  <v/>\n</c>");

    std::vector<std::string> const expected = {"<c>", "\n  ", "<v/>", "\n",
                                               "</c>"};

    REQUIRE(events == expected);
}

TEST_CASE("next() after the end of the document returns false")
{
    xml_event_t event;
    auto reader = xml_reader_t::from_buffer("<usfx/>");

    REQUIRE(reader->next(&event));
    REQUIRE_FALSE(reader->next(&event));
    REQUIRE_FALSE(reader->next(&event));
}

TEST_CASE("malformed XML")
{
    std::string const xml = GENERATE(
        std::string{"<usfx><book id=\"GEN\"></usfx>"},
        std::string{"<usfx><v id=\"1></usfx>"}, std::string{"<usfx>"},
        std::string{"no xml at all"});

    auto reader = xml_reader_t::from_buffer(xml);
    REQUIRE(testing::conversion_error_kind([&]() { render(reader.get()); }) ==
            error_kind::malformed_xml);

    // The reader stays at the end after an error.
    xml_event_t event;
    REQUIRE_FALSE(reader->next(&event));
}

TEST_CASE("errors libxml2 recovers from are errors, too")
{
    // undeclared namespace prefix
    auto reader = xml_reader_t::from_buffer("<usfx><p:b/></usfx>");

    REQUIRE(testing::conversion_error_kind([&]() { render(reader.get()); }) ==
            error_kind::malformed_xml);
}

TEST_CASE("parse errors mention the input name")
{
    auto reader = xml_reader_t::from_buffer("<a>\n<b>\n</a>", "broken.xml");

    REQUIRE_THROWS_WITH(render(reader.get()),
                        Catch::Matchers::StartsWith("broken.xml:"));
}

TEST_CASE("read from file")
{
    auto reader = xml_reader_t::from_file(USFX2TSVDATA_DIR
                                          "tests/data/genesis-excerpt.xml");

    std::size_t starts = 0;
    std::size_t verse_starts = 0;
    xml_event_t event;
    while (reader->next(&event)) {
        if (event.type == xml_event_type::start_tag) {
            ++starts;
            if (event.name == "v") {
                ++verse_starts;
            }
        }
    }

    REQUIRE(starts > 0);
    REQUIRE(verse_starts == 6);
}

TEST_CASE("missing input file")
{
    REQUIRE_THROWS_AS(
        xml_reader_t::from_file(USFX2TSVDATA_DIR "tests/data/nonexistent.xml"),
        std::system_error);
}
