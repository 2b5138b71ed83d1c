/**
 * @file mpdecode.hpp
 * @brief High-level mpdecode API.
 *
 * Pulls in the whole library and provides whole-buffer helpers for
 * buffers holding a sequence of concatenated values.
 */

#ifndef MPDECODE_HPP
#define MPDECODE_HPP

#include "byte_reader.hpp"
#include "classify.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "format.hpp"
#include "result.hpp"
#include "safe_decoder.hpp"

#include <span>

namespace mpdecode {

/**
 * @brief Count the top-level values in a buffer of concatenated values.
 *
 * Walks the buffer with SafeDecoder::skip(); nothing is materialized.
 *
 * @param buffer Encoded values
 * @param options Decoder options
 * @return Number of complete values, or the first skip failure
 */
inline Result<std::size_t> count_values(std::span<const std::uint8_t> buffer,
                                        DecoderOptions options = {}) {
    SafeDecoder decoder(buffer, options);
    std::size_t count = 0;

    while (!decoder.at_end()) {
        auto skipped = decoder.skip();
        if (skipped.is_err()) {
            return Result<std::size_t>::err(skipped.error());
        }
        ++count;
    }
    return Result<std::size_t>::ok(count);
}

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace mpdecode

#endif // MPDECODE_HPP
