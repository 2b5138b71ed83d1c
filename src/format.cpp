/**
 * @file format.cpp
 * @brief Tag family names for diagnostics.
 */

#include <mpdecode/classify.hpp>
#include <mpdecode/format.hpp>

namespace mpdecode {

const char* format_name(std::uint8_t prefix) noexcept {
    if (is_fixed_int(prefix)) {
        return "positive fixint";
    }
    if (is_negative_fixed_int(prefix)) {
        return "negative fixint";
    }
    if (is_fixed_map(prefix)) {
        return "fixmap";
    }
    if (is_fixed_array(prefix)) {
        return "fixarray";
    }
    if (is_fixed_string(prefix)) {
        return "fixstr";
    }

    switch (prefix) {
    case tag::NIL:
        return "nil";
    case tag::NEVER_USED:
        return "never used";
    case tag::BOOL_FALSE:
        return "false";
    case tag::BOOL_TRUE:
        return "true";
    case tag::BIN8:
        return "bin8";
    case tag::BIN16:
        return "bin16";
    case tag::BIN32:
        return "bin32";
    case tag::EXT8:
        return "ext8";
    case tag::EXT16:
        return "ext16";
    case tag::EXT32:
        return "ext32";
    case tag::FLOAT32:
        return "float32";
    case tag::FLOAT64:
        return "float64";
    case tag::UINT8:
        return "uint8";
    case tag::UINT16:
        return "uint16";
    case tag::UINT32:
        return "uint32";
    case tag::UINT64:
        return "uint64";
    case tag::INT8:
        return "int8";
    case tag::INT16:
        return "int16";
    case tag::INT32:
        return "int32";
    case tag::INT64:
        return "int64";
    case tag::FIXEXT1:
        return "fixext1";
    case tag::FIXEXT2:
        return "fixext2";
    case tag::FIXEXT4:
        return "fixext4";
    case tag::FIXEXT8:
        return "fixext8";
    case tag::FIXEXT16:
        return "fixext16";
    case tag::STR8:
        return "str8";
    case tag::STR16:
        return "str16";
    case tag::STR32:
        return "str32";
    case tag::ARRAY16:
        return "array16";
    case tag::ARRAY32:
        return "array32";
    case tag::MAP16:
        return "map16";
    case tag::MAP32:
        return "map32";
    default:
        return "unknown";
    }
}

} // namespace mpdecode
