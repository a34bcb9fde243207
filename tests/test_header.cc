#include <catch2/catch.hpp>

#include <vector>

#include "tabbuilder.hh"
#include "tabstate/header.hh"

using namespace tabstate;

CATCH_TEST_CASE("header accepts both file states", "[header]") {
    for (uint8_t state : { 0, 1 }) {
        std::vector<uint8_t> bytes = { 'N', 'P', 0x07, state };
        Parser p = Parser::over(bytes.data(), bytes.size());

        Header h;
        CATCH_REQUIRE_FALSE(Header::parse(&h, &p));
        CATCH_CHECK(h.reserved == 0x07);
        CATCH_CHECK(h.file_state == static_cast<FileState>(state));
        CATCH_CHECK(p.eof());
    }
}

CATCH_TEST_CASE("header rejects a bad signature", "[header]") {
    std::vector<uint8_t> bytes = { 'P', 'K', 0x00, 0x01 };
    Parser p = Parser::over(bytes.data(), bytes.size());

    Header h;
    Error e = Header::parse(&h, &p);
    CATCH_REQUIRE(e);
    CATCH_CHECK(e.cause() == Error::INVALIDFORMAT);
}

CATCH_TEST_CASE("header rejects an unknown file state", "[header]") {
    std::vector<uint8_t> bytes = { 'N', 'P', 0x00, 0x02 };
    Parser p = Parser::over(bytes.data(), bytes.size());

    Header h;
    Error e = Header::parse(&h, &p);
    CATCH_CHECK(e.cause() == Error::INVALIDFORMAT);
}

CATCH_TEST_CASE("header shorter than four bytes is truncated", "[header]") {
    std::vector<uint8_t> bytes = { 'N', 'P', 0x00 };
    Parser p = Parser::over(bytes.data(), bytes.size());

    Header h;
    Error e = Header::parse(&h, &p);
    CATCH_CHECK(e.cause() == Error::TRUNCATEDSTREAM);
}

CATCH_TEST_CASE("saved tab metadata", "[header][metadata]") {
    TabBuilder b(1);
    b.path = u"D:\\notes\\todo.txt";
    b.metadata(42);
    size_t size = b.bytes.size();
    b.bytes.push_back(0xEE);

    Parser p = Parser::over(b.bytes.data(), b.bytes.size());
    Metadata m;
    CATCH_REQUIRE_FALSE(Metadata::parse(&m, &p, SAVED));
    CATCH_CHECK(p.position() == size);

    CATCH_REQUIRE(m.saved());
    const SavedTabMetadata& saved = std::get<SavedTabMetadata>(m.metadata);
    CATCH_CHECK(saved.path == u"D:\\notes\\todo.txt");
    CATCH_CHECK(saved.file_size == 42);
    CATCH_CHECK(saved.encoding == 5);
    CATCH_CHECK(saved.carriage_return_type == 1);
    CATCH_CHECK(saved.timestamp == 133497000000000000u);
    CATCH_CHECK(saved.content_hash[0] == 0xA0);
    CATCH_CHECK(saved.content_hash[31] == 0xA0 + 31);
    CATCH_CHECK(m.file_size() == 42);
}

CATCH_TEST_CASE("unsaved tab metadata", "[header][metadata]") {
    TabBuilder b(0);
    b.metadata(0);

    Parser p = Parser::over(b.bytes.data(), b.bytes.size());
    Metadata m;
    CATCH_REQUIRE_FALSE(Metadata::parse(&m, &p, UNSAVED));
    CATCH_CHECK(p.eof());

    CATCH_REQUIRE_FALSE(m.saved());
    const UnsavedTabMetadata& unsaved = std::get<UnsavedTabMetadata>(m.metadata);
    CATCH_CHECK(unsaved.reserved1 == 0x01);
    CATCH_CHECK(unsaved.file_size == 0);
    CATCH_CHECK(unsaved.file_size_duplicate == 0);
    CATCH_CHECK(m.file_size() == 0);
}

CATCH_TEST_CASE("metadata shape follows the file state only", "[header][metadata]") {
    // An unsaved record read as saved misparses rather than silently
    // switching shape.
    TabBuilder b(0);
    b.metadata(3);

    Parser p = Parser::over(b.bytes.data(), b.bytes.size());
    Metadata m;
    Error e = Metadata::parse(&m, &p, SAVED);
    CATCH_CHECK(e.cause() == Error::TRUNCATEDSTREAM);
}

CATCH_TEST_CASE("saved metadata with an oversized path length", "[header][metadata]") {
    std::vector<uint8_t> bytes;
    TabBuilder::varint(&bytes, 1u << 30);
    bytes.push_back('a');
    bytes.push_back(0);

    Parser p = Parser::over(bytes.data(), bytes.size());
    Metadata m;
    Error e = Metadata::parse(&m, &p, SAVED);
    CATCH_CHECK(e.cause() == Error::TRUNCATEDSTREAM);
    CATCH_CHECK(e.frames.size() >= 2);
}
