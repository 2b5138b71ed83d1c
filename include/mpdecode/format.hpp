/**
 * @file format.hpp
 * @brief MessagePack tag byte table.
 *
 * Single-byte tags are exact matches. The fixed-range families (fixint,
 * negative fixint, fixmap, fixarray, fixstr) are identified by the mask
 * and prefix pairs below, see classify.hpp.
 *
 * @see https://msgpack.org
 */

#ifndef MPDECODE_FORMAT_HPP
#define MPDECODE_FORMAT_HPP

#include "config.hpp"

namespace mpdecode {
namespace tag {

/**
 * @defgroup fixed_ranges Fixed-range family prefixes
 * @{
 */
inline constexpr std::uint8_t POSITIVE_FIXINT = 0x00; ///< 0xxxxxxx
inline constexpr std::uint8_t FIXMAP = 0x80;          ///< 1000xxxx
inline constexpr std::uint8_t FIXARRAY = 0x90;        ///< 1001xxxx
inline constexpr std::uint8_t FIXSTR = 0xa0;          ///< 101xxxxx
inline constexpr std::uint8_t NEGATIVE_FIXINT = 0xe0; ///< 111xxxxx

inline constexpr std::uint8_t FOUR_BIT_MASK = 0xf0;
inline constexpr std::uint8_t THREE_BIT_MASK = 0xe0;
inline constexpr std::uint8_t FOUR_LEAST_SIG_BITS = 0x0f;
inline constexpr std::uint8_t FIVE_LEAST_SIG_BITS = 0x1f;
/** @} */

/**
 * @defgroup single_byte Single-byte tags
 * @{
 */
inline constexpr std::uint8_t NIL = 0xc0;
inline constexpr std::uint8_t NEVER_USED = 0xc1;
inline constexpr std::uint8_t BOOL_FALSE = 0xc2;
inline constexpr std::uint8_t BOOL_TRUE = 0xc3;
inline constexpr std::uint8_t BIN8 = 0xc4;
inline constexpr std::uint8_t BIN16 = 0xc5;
inline constexpr std::uint8_t BIN32 = 0xc6;
inline constexpr std::uint8_t EXT8 = 0xc7;
inline constexpr std::uint8_t EXT16 = 0xc8;
inline constexpr std::uint8_t EXT32 = 0xc9;
inline constexpr std::uint8_t FLOAT32 = 0xca;
inline constexpr std::uint8_t FLOAT64 = 0xcb;
inline constexpr std::uint8_t UINT8 = 0xcc;
inline constexpr std::uint8_t UINT16 = 0xcd;
inline constexpr std::uint8_t UINT32 = 0xce;
inline constexpr std::uint8_t UINT64 = 0xcf;
inline constexpr std::uint8_t INT8 = 0xd0;
inline constexpr std::uint8_t INT16 = 0xd1;
inline constexpr std::uint8_t INT32 = 0xd2;
inline constexpr std::uint8_t INT64 = 0xd3;
inline constexpr std::uint8_t FIXEXT1 = 0xd4;
inline constexpr std::uint8_t FIXEXT2 = 0xd5;
inline constexpr std::uint8_t FIXEXT4 = 0xd6;
inline constexpr std::uint8_t FIXEXT8 = 0xd7;
inline constexpr std::uint8_t FIXEXT16 = 0xd8;
inline constexpr std::uint8_t STR8 = 0xd9;
inline constexpr std::uint8_t STR16 = 0xda;
inline constexpr std::uint8_t STR32 = 0xdb;
inline constexpr std::uint8_t ARRAY16 = 0xdc;
inline constexpr std::uint8_t ARRAY32 = 0xdd;
inline constexpr std::uint8_t MAP16 = 0xde;
inline constexpr std::uint8_t MAP32 = 0xdf;
/** @} */

} // namespace tag

/**
 * @brief Human-readable family name of a tag byte.
 *
 * @param prefix Tag byte
 * @return Static string such as "fixint", "uint16" or "never used"
 */
const char* format_name(std::uint8_t prefix) noexcept;

} // namespace mpdecode

#endif // MPDECODE_FORMAT_HPP
