/**
 * @file config.hpp
 * @brief mpdecode compile-time configuration.
 *
 * Every macro below may be overridden on the compiler command line.
 */

#ifndef MPDECODE_CONFIG_HPP
#define MPDECODE_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace mpdecode {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Accept a fixarray tag as a string/binary length (legacy payloads)
#ifndef MPDECODE_FIXARRAY_LENGTH_COMPAT
#define MPDECODE_FIXARRAY_LENGTH_COMPAT 0
#endif

/// Nesting limit of the mpdump tree printer
#ifndef MPDECODE_MAX_DUMP_DEPTH
#define MPDECODE_MAX_DUMP_DEPTH 64U
#endif

inline constexpr bool FIXARRAY_LENGTH_COMPAT = MPDECODE_FIXARRAY_LENGTH_COMPAT != 0;
inline constexpr std::size_t MAX_DUMP_DEPTH = MPDECODE_MAX_DUMP_DEPTH;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define MPDECODE_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * The unwrapping Decoder then aborts instead of throwing.
 * @{
 */
#ifndef MPDECODE_NO_EXCEPTIONS
#define MPDECODE_NO_EXCEPTIONS 0
#endif
/** @} */

/**
 * @brief Runtime decoder options.
 */
struct DecoderOptions {
    /// See MPDECODE_FIXARRAY_LENGTH_COMPAT
    bool fixarray_length_compat = FIXARRAY_LENGTH_COMPAT;
};

} // namespace mpdecode

#endif // MPDECODE_CONFIG_HPP
