/**
 * @file decoder.hpp
 * @brief Unwrapping MessagePack decoder.
 *
 * Mirrors every SafeDecoder operation but returns plain values. Any
 * decoding failure aborts the calling context: a DecodeException is
 * thrown, or with MPDECODE_NO_EXCEPTIONS=1 the message is written to
 * stderr and the process aborts. Use it where malformed input is a
 * contract violation rather than a condition to recover from.
 */

#ifndef MPDECODE_DECODER_HPP
#define MPDECODE_DECODER_HPP

#include "config.hpp"
#include "error.hpp"
#include "result.hpp"
#include "safe_decoder.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace mpdecode {

/**
 * @brief Abort the calling context with @p error.
 *
 * Throws DecodeException, or logs and calls std::abort() when exceptions
 * are disabled.
 */
[[noreturn]] void fail(const DecodeError& error);

/**
 * @brief Unwrap a Result, aborting the calling context on failure.
 */
template <typename T> T unwrap(Result<T>&& result) {
    if (result.is_err()) {
        fail(result.error());
    }
    return std::move(result).value();
}

/**
 * @brief Decoder that treats malformed input as unrecoverable.
 *
 * Element decoders for the container reads are called as
 * fn(decoder, index) or fn(decoder) and return plain values.
 */
class Decoder {
public:
    Decoder(const std::uint8_t* data, std::size_t size, DecoderOptions options = {}) noexcept
        : decoder_(data, size, options) {}

    explicit Decoder(std::span<const std::uint8_t> buffer, DecoderOptions options = {}) noexcept
        : decoder_(buffer, options) {}

    bool is_next_nil() noexcept {
        return decoder_.is_next_nil();
    }

    std::uint8_t peek_tag() const;

    bool read_bool();

    std::int8_t read_int8();
    std::int16_t read_int16();
    std::int32_t read_int32();
    std::int64_t read_int64();

    std::uint8_t read_uint8();
    std::uint16_t read_uint16();
    std::uint32_t read_uint32();
    std::uint64_t read_uint64();

    float read_float32();
    double read_float64();

    std::uint32_t read_string_length();
    std::string read_string();
    std::string_view read_string_view();

    std::uint32_t read_bin_length();
    std::vector<std::uint8_t> read_byte_array();
    std::span<const std::uint8_t> read_bytes_view();

    std::uint32_t read_array_size();
    std::uint32_t read_map_size();

    template <typename Fn> auto read_array(Fn&& fn) {
        using T = std::remove_cvref_t<
            decltype(detail::invoke_element(fn, std::declval<Decoder&>(), 0U))>;

        const std::uint32_t size = read_array_size();
        std::vector<T> items;
        // Every element takes at least one byte
        items.reserve(std::min<std::size_t>(size, decoder_.remaining()));
        for (std::uint32_t i = 0; i < size; ++i) {
            items.push_back(detail::invoke_element(fn, *this, i));
        }
        return items;
    }

    template <typename Fn> auto read_nullable_array(Fn&& fn) {
        using Items = decltype(read_array(std::forward<Fn>(fn)));

        if (is_next_nil()) {
            return std::optional<Items>();
        }
        return std::optional<Items>(read_array(std::forward<Fn>(fn)));
    }

    template <typename KeyFn, typename ValueFn> auto read_map(KeyFn&& key_fn, ValueFn&& value_fn) {
        using K = std::remove_cvref_t<
            decltype(detail::invoke_element(key_fn, std::declval<Decoder&>(), 0U))>;
        using V = std::remove_cvref_t<
            decltype(detail::invoke_element(value_fn, std::declval<Decoder&>(), 0U))>;

        const std::uint32_t size = read_map_size();
        std::map<K, V> entries;
        for (std::uint32_t i = 0; i < size; ++i) {
            K key = detail::invoke_element(key_fn, *this, i);
            V value = detail::invoke_element(value_fn, *this, i);
            entries.insert_or_assign(std::move(key), std::move(value));
        }
        return entries;
    }

    template <typename KeyFn, typename ValueFn>
    auto read_nullable_map(KeyFn&& key_fn, ValueFn&& value_fn) {
        using Entries =
            decltype(read_map(std::forward<KeyFn>(key_fn), std::forward<ValueFn>(value_fn)));

        if (is_next_nil()) {
            return std::optional<Entries>();
        }
        return std::optional<Entries>(
            read_map(std::forward<KeyFn>(key_fn), std::forward<ValueFn>(value_fn)));
    }

    std::uint64_t get_size();
    std::size_t skip();

    [[nodiscard]] std::size_t position() const noexcept {
        return decoder_.position();
    }

    [[nodiscard]] std::size_t remaining() const noexcept {
        return decoder_.remaining();
    }

    [[nodiscard]] bool at_end() const noexcept {
        return decoder_.at_end();
    }

    /// Fallible decoder underneath, for reads that may legitimately fail
    SafeDecoder& safe() noexcept {
        return decoder_;
    }

private:
    SafeDecoder decoder_;
};

} // namespace mpdecode

#endif // MPDECODE_DECODER_HPP
