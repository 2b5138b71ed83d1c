/**
 * @file test_decoder.cpp
 * @brief Unit tests for the unwrapping Decoder.
 */

#include <mpdecode/decoder.hpp>

#include <catch2/catch.hpp>

#include "packer.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace mpdecode;
using mpdecode::test::Packer;

TEST_CASE("Decoder returns plain values", "[decoder]") {
    Packer packer;
    packer.boolean(true).int_value(-200).uint_value(70000).float64(2.5).str("hey");
    packer.bin({9, 8}).nil();

    Decoder decoder(packer.bytes());
    REQUIRE(decoder.peek_tag() == tag::BOOL_TRUE);
    REQUIRE(decoder.read_bool());
    REQUIRE(decoder.read_int16() == -200);
    REQUIRE(decoder.read_uint32() == 70000);
    REQUIRE(decoder.read_float32() == 2.5f);
    REQUIRE(decoder.read_string() == "hey");
    REQUIRE(decoder.read_byte_array() == std::vector<std::uint8_t>{9, 8});
    REQUIRE(decoder.is_next_nil());
    REQUIRE(decoder.at_end());
}

TEST_CASE("Decoder views and sizes", "[decoder]") {
    Packer packer;
    packer.str("abc").bin({1}).array(2).map(3);

    Decoder decoder(packer.bytes());
    REQUIRE(decoder.read_string_view() == "abc");
    REQUIRE(decoder.read_bytes_view().size() == 1);
    REQUIRE(decoder.read_array_size() == 2);
    REQUIRE(decoder.read_map_size() == 3);
    REQUIRE(decoder.remaining() == 0);
}

#if !MPDECODE_NO_EXCEPTIONS

TEST_CASE("Decoder throws on malformed input", "[decoder]") {
    SECTION("bad tag") {
        std::uint8_t data[] = {0xa1, 'x'};
        Decoder decoder(data, sizeof(data));
        REQUIRE_THROWS_AS(decoder.read_int32(), DecodeException);
    }

    SECTION("exception carries code and message") {
        std::uint8_t data[] = {0xcc, 0xff};
        Decoder decoder(data, sizeof(data));
        try {
            (void)decoder.read_int8();
            FAIL("expected DecodeException");
        } catch (const DecodeException& e) {
            REQUIRE(e.code() == Error::IntegerOverflow);
            REQUIRE(std::string(e.what()).find("bits = 8") != std::string::npos);
        }
    }

    SECTION("catchable as the base exception") {
        std::uint8_t data[] = {tag::FLOAT64, 0x7f, 0xef, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff};
        Decoder decoder(data, sizeof(data));
        REQUIRE_THROWS_AS(decoder.read_float32(), MpdecodeException);
    }

    SECTION("truncated buffer") {
        std::uint8_t data[] = {tag::UINT32, 0x00};
        Decoder decoder(data, sizeof(data));
        try {
            (void)decoder.read_uint64();
            FAIL("expected DecodeException");
        } catch (const DecodeException& e) {
            REQUIRE(e.code() == Error::BufferUnderrun);
        }
    }

    SECTION("skip on never-used tag") {
        std::uint8_t data[] = {tag::NEVER_USED};
        Decoder decoder(data, sizeof(data));
        REQUIRE_THROWS_AS(decoder.skip(), DecodeException);
    }

    SECTION("unwrap") {
        REQUIRE(unwrap(Result<int>::ok(3)) == 3);
        REQUIRE_THROWS_AS(unwrap(Result<int>::err(Error::InvalidLength, "no")), DecodeException);
    }
}

TEST_CASE("Decoder container reads", "[decoder][containers]") {
    SECTION("array") {
        Packer packer;
        packer.array(3).int_value(1).int_value(-2).int_value(3);
        Decoder decoder(packer.bytes());
        auto items = decoder.read_array([](Decoder& d) { return d.read_int32(); });
        REQUIRE(items == std::vector<std::int32_t>{1, -2, 3});
    }

    SECTION("array with index") {
        Packer packer;
        packer.array(2).str("a").str("b");
        Decoder decoder(packer.bytes());
        auto items = decoder.read_array([](Decoder& d, std::uint32_t i) {
            return d.read_string() + std::to_string(i);
        });
        REQUIRE(items == std::vector<std::string>{"a0", "b1"});
    }

    SECTION("element failure throws") {
        std::uint8_t data[] = {0x92, 0x01, tag::BOOL_TRUE};
        Decoder decoder(data, sizeof(data));
        REQUIRE_THROWS_AS(decoder.read_array([](Decoder& d) { return d.read_int64(); }),
                          DecodeException);
    }

    SECTION("nullable array") {
        std::uint8_t data[] = {tag::NIL, 0x91, 0x05};
        Decoder decoder(data, sizeof(data));
        auto none = decoder.read_nullable_array([](Decoder& d) { return d.read_uint8(); });
        REQUIRE_FALSE(none.has_value());
        auto some = decoder.read_nullable_array([](Decoder& d) { return d.read_uint8(); });
        REQUIRE(some.has_value());
        REQUIRE(*some == std::vector<std::uint8_t>{5});
    }

    SECTION("map") {
        Packer packer;
        packer.map(2).str("x").float64(1.0).str("y").float32(2.0f);
        Decoder decoder(packer.bytes());
        auto entries = decoder.read_map([](Decoder& d) { return d.read_string(); },
                                        [](Decoder& d) { return d.read_float64(); });
        REQUIRE(entries == std::map<std::string, double>{{"x", 1.0}, {"y", 2.0}});
    }

    SECTION("nullable map") {
        Packer packer;
        packer.nil().map(1).int_value(1).boolean(false);
        Decoder decoder(packer.bytes());
        auto key = [](Decoder& d) { return d.read_int64(); };
        auto value = [](Decoder& d) { return d.read_bool(); };
        REQUIRE_FALSE(decoder.read_nullable_map(key, value).has_value());
        auto entries = decoder.read_nullable_map(key, value);
        REQUIRE(entries.has_value());
        REQUIRE(entries->at(1) == false);
    }

    SECTION("nil is not a map") {
        std::uint8_t data[] = {tag::NIL};
        Decoder decoder(data, sizeof(data));
        REQUIRE_THROWS_AS(decoder.read_map_size(), DecodeException);
    }
}

#endif // !MPDECODE_NO_EXCEPTIONS

TEST_CASE("Decoder skip and get_size", "[decoder][skip]") {
    Packer packer;
    packer.map(1).str("k").array(2).nil().nil();
    const std::size_t first = packer.size();
    packer.int_value(9);

    Decoder decoder(packer.bytes());
    REQUIRE(decoder.skip() == first);
    REQUIRE(decoder.position() == first);
    REQUIRE(decoder.get_size() == 0);
    REQUIRE(decoder.at_end());
}

TEST_CASE("Safe reads through the facade", "[decoder]") {
    std::uint8_t data[] = {0xa1, 'x', 0x07};
    Decoder decoder(data, sizeof(data));

    auto attempt = decoder.safe().read_int64();
    REQUIRE(attempt.code() == Error::BadTag);

    // The failed read consumed only the tag byte
    REQUIRE(decoder.position() == 1);
    REQUIRE(decoder.safe().skip().is_ok());
    REQUIRE(decoder.read_int64() == 7);
}
