/**
 * @file test_floats.cpp
 * @brief Unit tests for float32/float64 decoding and precision reconciliation.
 */

#include <catch2/catch.hpp>
#include <mpdecode/safe_decoder.hpp>

#include "packer.hpp"

#include <cfloat>
#include <cmath>
#include <limits>
#include <string>

using namespace mpdecode;
using mpdecode::test::Packer;

TEST_CASE("float32 reads", "[floats]") {
    SECTION("float32 tag directly") {
        Packer packer;
        packer.float32(1.5f).float32(-0.25f);
        SafeDecoder decoder(packer.bytes());
        REQUIRE(*decoder.read_float32() == 1.5f);
        REQUIRE(*decoder.read_float32() == -0.25f);
        REQUIRE(decoder.at_end());
    }

    SECTION("float64 narrows") {
        Packer packer;
        packer.float64(3.25).float64(-1024.0);
        SafeDecoder decoder(packer.bytes());
        REQUIRE(*decoder.read_float32() == 3.25f);
        REQUIRE(*decoder.read_float32() == -1024.0f);
    }

    SECTION("float64 inexact value narrows with rounding") {
        Packer packer;
        packer.float64(0.1);
        SafeDecoder decoder(packer.bytes());
        REQUIRE(*decoder.read_float32() == 0.1f);
    }
}

TEST_CASE("float32 clamps at FLT_MAX", "[floats]") {
    Packer packer;
    packer.float64(static_cast<double>(FLT_MAX));
    SafeDecoder decoder(packer.bytes());

    auto value = decoder.read_float32();
    REQUIRE(value.is_ok());
    REQUIRE(*value == FLT_MAX);
}

TEST_CASE("float32 overflow beyond FLT_MAX", "[floats]") {
    const double too_large[] = {1e39, static_cast<double>(FLT_MAX) * 2.0, DBL_MAX,
                                std::numeric_limits<double>::infinity()};

    for (auto v : too_large) {
        Packer packer;
        packer.float64(v);
        SafeDecoder decoder(packer.bytes());

        INFO("value = " << v);
        auto value = decoder.read_float32();
        REQUIRE(value.code() == Error::FloatOverflow);
        REQUIRE(value.error().message.find("float overflow") != std::string::npos);
    }
}

TEST_CASE("float32 narrowing of values below -FLT_MAX", "[floats]") {
    Packer packer;
    packer.float64(-1e39);
    SafeDecoder decoder(packer.bytes());

    auto value = decoder.read_float32();
    REQUIRE(value.is_ok());
    REQUIRE(std::isinf(*value));
    REQUIRE(*value < 0);
}

TEST_CASE("float32 narrowing keeps NaN", "[floats]") {
    Packer packer;
    packer.float64(std::numeric_limits<double>::quiet_NaN());
    SafeDecoder decoder(packer.bytes());

    auto value = decoder.read_float32();
    REQUIRE(value.is_ok());
    REQUIRE(std::isnan(*value));
}

TEST_CASE("float64 reads", "[floats]") {
    SECTION("float64 tag directly") {
        Packer packer;
        packer.float64(DBL_MAX).float64(-0.0).float64(1e-300);
        SafeDecoder decoder(packer.bytes());
        REQUIRE(*decoder.read_float64() == DBL_MAX);
        auto negative_zero = decoder.read_float64();
        REQUIRE(*negative_zero == 0.0);
        REQUIRE(std::signbit(*negative_zero));
        REQUIRE(*decoder.read_float64() == 1e-300);
    }

    SECTION("float32 widens losslessly") {
        Packer packer;
        packer.float32(0.1f).float32(FLT_MAX).float32(FLT_MIN);
        SafeDecoder decoder(packer.bytes());
        REQUIRE(*decoder.read_float64() == static_cast<double>(0.1f));
        REQUIRE(*decoder.read_float64() == static_cast<double>(FLT_MAX));
        REQUIRE(*decoder.read_float64() == static_cast<double>(FLT_MIN));
    }
}

TEST_CASE("Float readers reject other tags", "[floats]") {
    const std::uint8_t tags[] = {0x01, 0xff, tag::NIL, tag::UINT32, tag::INT64, 0xa0};

    for (auto prefix : tags) {
        std::uint8_t data[] = {prefix, 0, 0, 0, 0, 0, 0, 0, 0};
        INFO("prefix = " << static_cast<int>(prefix));

        SafeDecoder narrow(data, sizeof(data));
        auto f32 = narrow.read_float32();
        REQUIRE(f32.code() == Error::BadTag);
        REQUIRE(f32.error().message.find("bad prefix for float") != std::string::npos);

        SafeDecoder wide(data, sizeof(data));
        REQUIRE(wide.read_float64().code() == Error::BadTag);
    }
}

TEST_CASE("Truncated floats report buffer underrun", "[floats]") {
    std::uint8_t f32[] = {tag::FLOAT32, 0x3F, 0xC0};
    SafeDecoder narrow(f32, sizeof(f32));
    REQUIRE(narrow.read_float32().code() == Error::BufferUnderrun);

    std::uint8_t f64[] = {tag::FLOAT64, 0x40, 0x09};
    SafeDecoder wide(f64, sizeof(f64));
    REQUIRE(wide.read_float32().code() == Error::BufferUnderrun);
}
