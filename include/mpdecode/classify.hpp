/**
 * @file classify.hpp
 * @brief Tag classification predicates.
 *
 * Stateless tests over a single tag byte. These are the only place the
 * bit layout of the fixed-range families is spelled out; every decode
 * path classifies through them.
 */

#ifndef MPDECODE_CLASSIFY_HPP
#define MPDECODE_CLASSIFY_HPP

#include "config.hpp"
#include "format.hpp"

namespace mpdecode {

/// 0xxxxxxx
constexpr bool is_fixed_int(std::uint8_t u) noexcept {
    return (u >> 7) == 0;
}

/// 111xxxxx
constexpr bool is_negative_fixed_int(std::uint8_t u) noexcept {
    return (u & tag::THREE_BIT_MASK) == tag::NEGATIVE_FIXINT;
}

/// 1000xxxx
constexpr bool is_fixed_map(std::uint8_t u) noexcept {
    return (u & tag::FOUR_BIT_MASK) == tag::FIXMAP;
}

/// 1001xxxx
constexpr bool is_fixed_array(std::uint8_t u) noexcept {
    return (u & tag::FOUR_BIT_MASK) == tag::FIXARRAY;
}

/// 101xxxxx
constexpr bool is_fixed_string(std::uint8_t u) noexcept {
    return (u & tag::THREE_BIT_MASK) == tag::FIXSTR;
}

constexpr bool is_nil(std::uint8_t u) noexcept {
    return u == tag::NIL;
}

constexpr bool is_bool(std::uint8_t u) noexcept {
    return u == tag::BOOL_TRUE || u == tag::BOOL_FALSE;
}

constexpr bool is_float32(std::uint8_t u) noexcept {
    return u == tag::FLOAT32;
}

constexpr bool is_float64(std::uint8_t u) noexcept {
    return u == tag::FLOAT64;
}

/**
 * @defgroup payload Fixed-range payload extraction
 *
 * Only meaningful when the matching predicate holds.
 * @{
 */
constexpr std::int64_t fixed_int_value(std::uint8_t u) noexcept {
    return static_cast<std::int64_t>(u & 0x7f);
}

constexpr std::int64_t negative_fixed_int_value(std::uint8_t u) noexcept {
    return static_cast<std::int64_t>(static_cast<std::int8_t>(u));
}

constexpr std::uint32_t fixed_container_size(std::uint8_t u) noexcept {
    return static_cast<std::uint32_t>(u & tag::FOUR_LEAST_SIG_BITS);
}

constexpr std::uint32_t fixed_string_length(std::uint8_t u) noexcept {
    return static_cast<std::uint32_t>(u & tag::FIVE_LEAST_SIG_BITS);
}
/** @} */

} // namespace mpdecode

#endif // MPDECODE_CLASSIFY_HPP
