/**
 * @file test_charreader.cpp
 * @brief Unit tests for CharReader class.
 */

#include <catch2/catch.hpp>
#include <polyline/charreader.hpp>

#include <string>

using namespace polyline;

TEST_CASE("CharReader construction", "[charreader]") {
    SECTION("with string") {
        CharReader reader("_p~iF");
        REQUIRE(reader.remaining() == 5);
        REQUIRE(reader.position() == 0);
        REQUIRE_FALSE(reader.at_end());
    }

    SECTION("with empty string") {
        CharReader reader("");
        REQUIRE(reader.remaining() == 0);
        REQUIRE(reader.at_end());
    }
}

TEST_CASE("CharReader read_char", "[charreader]") {
    CharReader reader("?~");

    SECTION("read characters in order") {
        REQUIRE(reader.read_char() == '?');
        REQUIRE(reader.read_char() == '~');
        REQUIRE(reader.at_end());
    }

    SECTION("read past end returns -1") {
        reader.read_char();
        reader.read_char();
        REQUIRE(reader.read_char() == -1);
        REQUIRE(reader.position() == 2);
    }

    SECTION("high bytes are not sign-extended") {
        std::string high = "\xC3";
        CharReader high_reader(high);
        REQUIRE(high_reader.read_char() == 0xC3);
    }
}

TEST_CASE("CharReader read_chunk", "[charreader]") {
    SECTION("offset is removed") {
        CharReader reader("?@_~");
        REQUIRE(reader.read_chunk() == 0);
        REQUIRE(reader.read_chunk() == 1);
        REQUIRE(reader.read_chunk() == 32); // continuation bit, no payload
        REQUIRE(reader.read_chunk() == 63);
    }

    SECTION("end of input returns -1") {
        CharReader reader("");
        REQUIRE(reader.read_chunk() == -1);
    }

    SECTION("character outside alphabet returns -2 and advances") {
        CharReader reader(" ?");
        REQUIRE(reader.read_chunk() == -2);
        REQUIRE(reader.position() == 1);
        REQUIRE(reader.read_chunk() == 0);
    }

    SECTION("DEL is outside alphabet") {
        CharReader reader("\x7F");
        REQUIRE(reader.read_chunk() == -2);
    }

    SECTION("digits are outside alphabet") {
        CharReader reader("1");
        REQUIRE(reader.read_chunk() == -2);
    }
}

TEST_CASE("CharReader position tracking", "[charreader]") {
    CharReader reader("abcdef");

    reader.read_char();
    reader.read_char();
    REQUIRE(reader.position() == 2);
    REQUIRE(reader.remaining() == 4);

    while (reader.read_char() >= 0) {
    }
    REQUIRE(reader.position() == 6);
    REQUIRE(reader.remaining() == 0);
}
