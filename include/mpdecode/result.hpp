/**
 * @file result.hpp
 * @brief Success-or-failure return type of the fallible decoder.
 */

#ifndef MPDECODE_RESULT_HPP
#define MPDECODE_RESULT_HPP

#include "error.hpp"

#include <string>
#include <utility>
#include <variant>

namespace mpdecode {

/**
 * @brief Holds either a decoded value of type T or a DecodeError.
 *
 * Exactly one alternative is populated. Accessing the wrong alternative
 * is a precondition violation; check is_ok() first.
 *
 * @tparam T Decoded value type
 */
template <typename T> class [[nodiscard]] Result {
public:
    using value_type = T;

    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result err(DecodeError error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    static Result err(Error code, std::string message) {
        return err(DecodeError(code, std::move(message)));
    }

    bool is_ok() const noexcept {
        return storage_.index() == 0;
    }

    bool is_err() const noexcept {
        return storage_.index() == 1;
    }

    explicit operator bool() const noexcept {
        return is_ok();
    }

    T& value() & noexcept {
        return *std::get_if<0>(&storage_);
    }

    const T& value() const& noexcept {
        return *std::get_if<0>(&storage_);
    }

    T&& value() && noexcept {
        return std::move(*std::get_if<0>(&storage_));
    }

    const DecodeError& error() const noexcept {
        return *std::get_if<1>(&storage_);
    }

    /// Error code, Error::Ok on success
    Error code() const noexcept {
        return is_ok() ? Error::Ok : error().code;
    }

    T value_or(T default_value) const& {
        if (is_ok()) {
            return value();
        }
        return default_value;
    }

    T& operator*() & noexcept {
        return value();
    }

    const T& operator*() const& noexcept {
        return value();
    }

    T* operator->() noexcept {
        return &value();
    }

    const T* operator->() const noexcept {
        return &value();
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& v) : storage_(index, std::forward<V>(v)) {}

    std::variant<T, DecodeError> storage_;
};

} // namespace mpdecode

#endif // MPDECODE_RESULT_HPP
