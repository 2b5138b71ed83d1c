/**
 * @file byte_reader.hpp
 * @brief Bounds-checked sequential byte reading.
 *
 * The byte reader provides stateful access to an encoded buffer. All
 * multi-byte values are big-endian; floats are IEEE-754. A read that
 * would run past the end fails with Error::BufferUnderrun and leaves
 * the position unchanged.
 */

#ifndef MPDECODE_BYTE_READER_HPP
#define MPDECODE_BYTE_READER_HPP

#include "config.hpp"
#include "error.hpp"

#include <bit>
#include <span>
#include <type_traits>

namespace mpdecode {

/**
 * @brief Sequential reader over a borrowed, read-only byte buffer.
 *
 * Does not take ownership: the buffer must outlive the reader.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to source data buffer
     * @param size Number of valid bytes in buffer
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Look at the next byte without consuming it.
     *
     * @param[out] value Next byte
     * @return Error::Ok, or Error::BufferUnderrun at end of buffer
     */
    Error peek_u8(std::uint8_t& value) const noexcept {
        if (pos_ >= size_) [[unlikely]] {
            return Error::BufferUnderrun;
        }
        value = data_[pos_];
        return Error::Ok;
    }

    Error read_u8(std::uint8_t& value) noexcept {
        return read_be(value);
    }

    Error read_u16(std::uint16_t& value) noexcept {
        return read_be(value);
    }

    Error read_u32(std::uint32_t& value) noexcept {
        return read_be(value);
    }

    Error read_u64(std::uint64_t& value) noexcept {
        return read_be(value);
    }

    Error read_i8(std::int8_t& value) noexcept {
        return read_signed<std::uint8_t>(value);
    }

    Error read_i16(std::int16_t& value) noexcept {
        return read_signed<std::uint16_t>(value);
    }

    Error read_i32(std::int32_t& value) noexcept {
        return read_signed<std::uint32_t>(value);
    }

    Error read_i64(std::int64_t& value) noexcept {
        return read_signed<std::uint64_t>(value);
    }

    Error read_f32(float& value) noexcept {
        std::uint32_t bits = 0;
        auto status = read_be(bits);
        if (status == Error::Ok) {
            value = std::bit_cast<float>(bits);
        }
        return status;
    }

    Error read_f64(double& value) noexcept {
        std::uint64_t bits = 0;
        auto status = read_be(bits);
        if (status == Error::Ok) {
            value = std::bit_cast<double>(bits);
        }
        return status;
    }

    /**
     * @brief Read a slice of raw bytes.
     *
     * The slice points into the underlying buffer (no copy).
     *
     * @param count Number of bytes
     * @param[out] bytes Slice of @p count bytes
     * @return Error::Ok, or Error::BufferUnderrun if fewer bytes remain
     */
    Error read_bytes(std::size_t count, std::span<const std::uint8_t>& bytes) noexcept {
        if (count > remaining()) [[unlikely]] {
            return Error::BufferUnderrun;
        }
        bytes = std::span<const std::uint8_t>(data_ + pos_, count);
        pos_ += count;
        return Error::Ok;
    }

    /**
     * @brief Advance past @p count bytes.
     *
     * @return Error::Ok, or Error::BufferUnderrun if fewer bytes remain
     */
    Error discard(std::size_t count) noexcept {
        if (count > remaining()) [[unlikely]] {
            return Error::BufferUnderrun;
        }
        pos_ += count;
        return Error::Ok;
    }

    /**
     * @brief Get current byte position.
     *
     * @return Number of bytes already consumed
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     *
     * @return Number of bytes remaining to read
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return size_ - pos_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

    [[nodiscard]] bool at_end() const noexcept {
        return pos_ >= size_;
    }

private:
    template <typename U> Error read_be(U& value) noexcept {
        static_assert(std::is_unsigned_v<U>, "big-endian reads are unsigned");

        if (sizeof(U) > remaining()) [[unlikely]] {
            return Error::BufferUnderrun;
        }

        U result = 0;
        for (std::size_t i = 0; i < sizeof(U); ++i) {
            result = static_cast<U>((static_cast<std::uint64_t>(result) << 8) | data_[pos_ + i]);
        }
        pos_ += sizeof(U);
        value = result;
        return Error::Ok;
    }

    template <typename U, typename S> Error read_signed(S& value) noexcept {
        U raw = 0;
        auto status = read_be(raw);
        if (status == Error::Ok) {
            value = static_cast<S>(raw);
        }
        return status;
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace mpdecode

#endif // MPDECODE_BYTE_READER_HPP
