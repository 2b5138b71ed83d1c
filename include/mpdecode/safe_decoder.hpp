/**
 * @file safe_decoder.hpp
 * @brief Fallible MessagePack decoder.
 *
 * Every operation returns a Result and never throws. Integer reads funnel
 * through the canonical 64-bit readers and are range-checked against the
 * requested width. Container reads are parameterized by caller-supplied
 * element decoders and fail fast on the first element error.
 *
 * A failed read leaves the cursor after whatever bytes were consumed
 * before the failure was detected (typically the tag byte). Callers that
 * get an error should treat the rest of the buffer as unusable.
 */

#ifndef MPDECODE_SAFE_DECODER_HPP
#define MPDECODE_SAFE_DECODER_HPP

#include "byte_reader.hpp"
#include "classify.hpp"
#include "config.hpp"
#include "error.hpp"
#include "format.hpp"
#include "result.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace mpdecode {

class SafeDecoder;

namespace detail {

/// Element decoders may take (decoder, index) or just (decoder).
template <typename Fn, typename Dec>
decltype(auto) invoke_element(Fn& fn, Dec& decoder, std::uint32_t index) {
    if constexpr (std::is_invocable_v<Fn&, Dec&, std::uint32_t>) {
        return std::invoke(fn, decoder, index);
    } else {
        return std::invoke(fn, decoder);
    }
}

template <typename Fn, typename Dec>
using element_result_t =
    std::remove_cvref_t<decltype(invoke_element(std::declval<Fn&>(), std::declval<Dec&>(), 0U))>;

} // namespace detail

/**
 * @brief Decoder over one read-only buffer that reports every failure
 *        as a Result.
 *
 * Does not take ownership: the buffer must outlive the decoder. Not
 * thread safe; each call advances the shared cursor.
 */
class SafeDecoder {
public:
    /**
     * @brief Construct a decoder.
     *
     * @param data Pointer to encoded buffer
     * @param size Buffer size in bytes
     * @param options Runtime decoder options
     */
    SafeDecoder(const std::uint8_t* data, std::size_t size, DecoderOptions options = {}) noexcept
        : reader_(data, size), options_(options) {}

    explicit SafeDecoder(std::span<const std::uint8_t> buffer,
                         DecoderOptions options = {}) noexcept
        : SafeDecoder(buffer.data(), buffer.size(), options) {}

    /**
     * @brief Consume a nil tag if one is next.
     *
     * @return true if a nil was consumed; false (cursor untouched) for any
     *         other tag or at end of buffer
     */
    bool is_next_nil() noexcept;

    /// Next tag byte, not consumed
    Result<std::uint8_t> peek_tag() const;

    Result<bool> read_bool();

    /**
     * @defgroup integers Integer decoding
     *
     * read_int64() and read_uint64() are canonical; the narrower readers
     * decode through them and then range-check.
     * @{
     */
    Result<std::int8_t> read_int8();
    Result<std::int16_t> read_int16();
    Result<std::int32_t> read_int32();
    Result<std::int64_t> read_int64();

    Result<std::uint8_t> read_uint8();
    Result<std::uint16_t> read_uint16();
    Result<std::uint32_t> read_uint32();
    Result<std::uint64_t> read_uint64();
    /** @} */

    /**
     * @brief Read a float32, narrowing a float64 if needed.
     *
     * A float64 within FLT_EPSILON of FLT_MAX is clamped to FLT_MAX; above
     * that it fails with Error::FloatOverflow.
     */
    Result<float> read_float32();

    /// Read a float64, widening a float32 if needed.
    Result<double> read_float64();

    Result<std::uint32_t> read_string_length();
    Result<std::string> read_string();

    /// Zero-copy string read; the view points into the decoder's buffer.
    Result<std::string_view> read_string_view();

    /// Binary length; a nil tag reads as length 0.
    Result<std::uint32_t> read_bin_length();
    Result<std::vector<std::uint8_t>> read_byte_array();

    /// Zero-copy binary read; the span points into the decoder's buffer.
    Result<std::span<const std::uint8_t>> read_bytes_view();

    /// Array element count; a nil tag reads as an empty array.
    Result<std::uint32_t> read_array_size();
    Result<std::uint32_t> read_map_size();

    /**
     * @brief Decode an array with a per-element decoder.
     *
     * @p fn is called as fn(decoder, index) (or fn(decoder)) and must
     * return a Result. The first element failure is returned as-is and
     * the partially decoded elements are discarded.
     *
     * @tparam Fn Element decoder
     * @return Result holding std::vector of element values
     */
    template <typename Fn> auto read_array(Fn&& fn) {
        using T = typename detail::element_result_t<Fn, SafeDecoder>::value_type;
        using R = Result<std::vector<T>>;

        auto size = read_array_size();
        if (size.is_err()) {
            return R::err(size.error());
        }

        std::vector<T> items;
        // Every element takes at least one byte
        items.reserve(std::min<std::size_t>(*size, reader_.remaining()));
        for (std::uint32_t i = 0; i < *size; ++i) {
            auto item = detail::invoke_element(fn, *this, i);
            if (item.is_err()) {
                return R::err(item.error());
            }
            items.push_back(std::move(item).value());
        }
        return R::ok(std::move(items));
    }

    /**
     * @brief Decode an array, or nothing if the next tag is nil.
     */
    template <typename Fn> auto read_nullable_array(Fn&& fn) {
        using T = typename detail::element_result_t<Fn, SafeDecoder>::value_type;
        using R = Result<std::optional<std::vector<T>>>;

        if (is_next_nil()) {
            return R::ok(std::nullopt);
        }

        auto items = read_array(std::forward<Fn>(fn));
        if (items.is_err()) {
            return R::err(items.error());
        }
        return R::ok(std::move(items).value());
    }

    /**
     * @brief Decode a map with per-key and per-value decoders.
     *
     * Each pair is decoded key first, then value. A repeated key
     * overwrites the earlier value. Fails fast like read_array().
     *
     * @tparam KeyFn Key decoder
     * @tparam ValueFn Value decoder
     * @return Result holding std::map of decoded pairs
     */
    template <typename KeyFn, typename ValueFn> auto read_map(KeyFn&& key_fn, ValueFn&& value_fn) {
        using K = typename detail::element_result_t<KeyFn, SafeDecoder>::value_type;
        using V = typename detail::element_result_t<ValueFn, SafeDecoder>::value_type;
        using R = Result<std::map<K, V>>;

        auto size = read_map_size();
        if (size.is_err()) {
            return R::err(size.error());
        }

        std::map<K, V> entries;
        for (std::uint32_t i = 0; i < *size; ++i) {
            auto key = detail::invoke_element(key_fn, *this, i);
            if (key.is_err()) {
                return R::err(key.error());
            }
            auto value = detail::invoke_element(value_fn, *this, i);
            if (value.is_err()) {
                return R::err(value.error());
            }
            entries.insert_or_assign(std::move(key).value(), std::move(value).value());
        }
        return R::ok(std::move(entries));
    }

    /**
     * @brief Decode a map, or nothing if the next tag is nil.
     */
    template <typename KeyFn, typename ValueFn>
    auto read_nullable_map(KeyFn&& key_fn, ValueFn&& value_fn) {
        using K = typename detail::element_result_t<KeyFn, SafeDecoder>::value_type;
        using V = typename detail::element_result_t<ValueFn, SafeDecoder>::value_type;
        using R = Result<std::optional<std::map<K, V>>>;

        if (is_next_nil()) {
            return R::ok(std::nullopt);
        }

        auto entries = read_map(std::forward<KeyFn>(key_fn), std::forward<ValueFn>(value_fn));
        if (entries.is_err()) {
            return R::err(entries.error());
        }
        return R::ok(std::move(entries).value());
    }

    /**
     * @brief Consume the next tag and its own payload.
     *
     * Length prefixes and scalar/string/binary/extension payloads are
     * discarded. Container children are not.
     *
     * @return Number of child objects that still follow: 0 for scalars,
     *         N for an array of N, 2N for a map of N
     */
    Result<std::uint64_t> get_size();

    /**
     * @brief Advance past one complete value, nested children included.
     *
     * Iterative: nesting depth does not consume native stack.
     *
     * @return Number of bytes skipped
     */
    Result<std::size_t> skip();

    [[nodiscard]] std::size_t position() const noexcept {
        return reader_.position();
    }

    [[nodiscard]] std::size_t remaining() const noexcept {
        return reader_.remaining();
    }

    [[nodiscard]] bool at_end() const noexcept {
        return reader_.at_end();
    }

    [[nodiscard]] const DecoderOptions& options() const noexcept {
        return options_;
    }

private:
    template <typename T> Result<T> underrun(std::size_t needed) const;
    template <typename V, typename T> Result<T> read_as();
    Result<std::uint32_t> read_length(std::uint8_t prefix, std::uint8_t tag8, std::uint8_t tag16,
                                      std::uint8_t tag32);

    ByteReader reader_;
    DecoderOptions options_;
};

} // namespace mpdecode

#endif // MPDECODE_SAFE_DECODER_HPP
