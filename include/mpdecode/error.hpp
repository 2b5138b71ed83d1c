/**
 * @file error.hpp
 * @brief mpdecode error handling.
 *
 * Provides both error-code-based and exception-based error handling.
 * The fallible decoding layer only ever reports error codes; exceptions
 * are thrown by the unwrapping Decoder and can be compiled out for
 * embedded targets (-fno-exceptions).
 */

#ifndef MPDECODE_ERROR_HPP
#define MPDECODE_ERROR_HPP

#include "config.hpp"

#include <string>
#include <utility>

#if !MPDECODE_NO_EXCEPTIONS
#include <stdexcept>
#endif

namespace mpdecode {

/**
 * @brief Error codes reported by every decoding operation.
 */
enum class Error {
    Ok = 0,                ///< Success
    BadTag = -1,           ///< Tag not accepted by the requested operation
    IntegerOverflow = -2,  ///< Decoded integer above the target maximum
    IntegerUnderflow = -3, ///< Decoded integer below the target minimum
    FloatOverflow = -4,    ///< float64 value outside the float32 range
    InvalidLength = -5,    ///< Tag is not a length source for str/bin/array/map
    BufferUnderrun = -6,   ///< Read past the end of the buffer
    DepthExceeded = -7     ///< Nesting deeper than a traversal limit
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::BadTag:
        return "Bad tag";
    case Error::IntegerOverflow:
        return "Integer overflow";
    case Error::IntegerUnderflow:
        return "Integer underflow";
    case Error::FloatOverflow:
        return "Float overflow";
    case Error::InvalidLength:
        return "Invalid length";
    case Error::BufferUnderrun:
        return "Buffer underrun";
    case Error::DepthExceeded:
        return "Depth limit exceeded";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Failure payload of a Result: error code plus a descriptive message.
 */
struct DecodeError {
    Error code = Error::Ok;
    std::string message;

    DecodeError() = default;
    DecodeError(Error c, std::string msg) : code(c), message(std::move(msg)) {}
};

#if !MPDECODE_NO_EXCEPTIONS

/**
 * @brief Base exception for mpdecode errors.
 */
class MpdecodeException : public std::runtime_error {
public:
    explicit MpdecodeException(const std::string& message, Error code = Error::BadTag)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Thrown by the unwrapping Decoder when the input is malformed.
 */
class DecodeException : public MpdecodeException {
public:
    explicit DecodeException(const DecodeError& error)
        : MpdecodeException(error.message, error.code) {}
};

#endif // !MPDECODE_NO_EXCEPTIONS

} // namespace mpdecode

#endif // MPDECODE_ERROR_HPP
