/**
 * @file decoder.cpp
 * @brief Unwrapping MessagePack decoder implementation.
 */

#include <mpdecode/decoder.hpp>

#include <cstdio>
#include <cstdlib>

namespace mpdecode {

void fail(const DecodeError& error) {
#if MPDECODE_NO_EXCEPTIONS
    std::fprintf(stderr, "mpdecode: %s (%s)\n", error.message.c_str(), error_string(error.code));
    std::abort();
#else
    throw DecodeException(error);
#endif
}

std::uint8_t Decoder::peek_tag() const {
    return unwrap(decoder_.peek_tag());
}

bool Decoder::read_bool() {
    return unwrap(decoder_.read_bool());
}

std::int8_t Decoder::read_int8() {
    return unwrap(decoder_.read_int8());
}

std::int16_t Decoder::read_int16() {
    return unwrap(decoder_.read_int16());
}

std::int32_t Decoder::read_int32() {
    return unwrap(decoder_.read_int32());
}

std::int64_t Decoder::read_int64() {
    return unwrap(decoder_.read_int64());
}

std::uint8_t Decoder::read_uint8() {
    return unwrap(decoder_.read_uint8());
}

std::uint16_t Decoder::read_uint16() {
    return unwrap(decoder_.read_uint16());
}

std::uint32_t Decoder::read_uint32() {
    return unwrap(decoder_.read_uint32());
}

std::uint64_t Decoder::read_uint64() {
    return unwrap(decoder_.read_uint64());
}

float Decoder::read_float32() {
    return unwrap(decoder_.read_float32());
}

double Decoder::read_float64() {
    return unwrap(decoder_.read_float64());
}

std::uint32_t Decoder::read_string_length() {
    return unwrap(decoder_.read_string_length());
}

std::string Decoder::read_string() {
    return unwrap(decoder_.read_string());
}

std::string_view Decoder::read_string_view() {
    return unwrap(decoder_.read_string_view());
}

std::uint32_t Decoder::read_bin_length() {
    return unwrap(decoder_.read_bin_length());
}

std::vector<std::uint8_t> Decoder::read_byte_array() {
    return unwrap(decoder_.read_byte_array());
}

std::span<const std::uint8_t> Decoder::read_bytes_view() {
    return unwrap(decoder_.read_bytes_view());
}

std::uint32_t Decoder::read_array_size() {
    return unwrap(decoder_.read_array_size());
}

std::uint32_t Decoder::read_map_size() {
    return unwrap(decoder_.read_map_size());
}

std::uint64_t Decoder::get_size() {
    return unwrap(decoder_.get_size());
}

std::size_t Decoder::skip() {
    return unwrap(decoder_.skip());
}

} // namespace mpdecode
