/**
 * @file safe_decoder.cpp
 * @brief Fallible MessagePack decoder implementation.
 */

#include <mpdecode/safe_decoder.hpp>

#include <cfloat>
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <limits>

namespace mpdecode {

namespace {

std::string bad_tag_message(const char* kind, std::uint8_t prefix) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "bad prefix for %s: prefix = 0x%02x; type = %s", kind,
                  static_cast<unsigned>(prefix), format_name(prefix));
    return buf;
}

std::string invalid_length_message(std::uint8_t prefix) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "invalid length: prefix = 0x%02x; type = %s",
                  static_cast<unsigned>(prefix), format_name(prefix));
    return buf;
}

std::string overflow_message(std::uint64_t value, int bits) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "integer overflow: value = %" PRIu64 "; bits = %d", value,
                  bits);
    return buf;
}

std::string overflow_message(std::int64_t value, int bits) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "integer overflow: value = %" PRId64 "; bits = %d", value,
                  bits);
    return buf;
}

std::string underflow_message(std::int64_t value, int bits) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "integer underflow: value = %" PRId64 "; bits = %d", value,
                  bits);
    return buf;
}

std::string float_overflow_message(double value) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "float overflow: value = %g; bits = 32", value);
    return buf;
}

template <typename Narrow> Result<Narrow> narrow_signed(Result<std::int64_t> wide) {
    using R = Result<Narrow>;
    constexpr int bits = std::numeric_limits<Narrow>::digits + 1;

    if (wide.is_err()) {
        return R::err(wide.error());
    }

    const std::int64_t value = *wide;
    if (value > static_cast<std::int64_t>(std::numeric_limits<Narrow>::max())) {
        return R::err(Error::IntegerOverflow, overflow_message(value, bits));
    }
    if (value < static_cast<std::int64_t>(std::numeric_limits<Narrow>::min())) {
        return R::err(Error::IntegerUnderflow, underflow_message(value, bits));
    }
    return R::ok(static_cast<Narrow>(value));
}

template <typename Narrow> Result<Narrow> narrow_unsigned(Result<std::uint64_t> wide) {
    using R = Result<Narrow>;
    constexpr int bits = std::numeric_limits<Narrow>::digits;

    if (wide.is_err()) {
        return R::err(wide.error());
    }

    const std::uint64_t value = *wide;
    if (value > static_cast<std::uint64_t>(std::numeric_limits<Narrow>::max())) {
        return R::err(Error::IntegerOverflow, overflow_message(value, bits));
    }
    return R::ok(static_cast<Narrow>(value));
}

} // namespace

template <typename T> Result<T> SafeDecoder::underrun(std::size_t needed) const {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "buffer underrun: need %zu bytes at offset %zu, %zu remaining",
                  needed, reader_.position(), reader_.remaining());
    return Result<T>::err(Error::BufferUnderrun, buf);
}

template <typename V, typename T> Result<T> SafeDecoder::read_as() {
    V value{};
    Error status = Error::Ok;

    if constexpr (std::is_same_v<V, std::uint8_t>) {
        status = reader_.read_u8(value);
    } else if constexpr (std::is_same_v<V, std::uint16_t>) {
        status = reader_.read_u16(value);
    } else if constexpr (std::is_same_v<V, std::uint32_t>) {
        status = reader_.read_u32(value);
    } else if constexpr (std::is_same_v<V, std::uint64_t>) {
        status = reader_.read_u64(value);
    } else if constexpr (std::is_same_v<V, std::int8_t>) {
        status = reader_.read_i8(value);
    } else if constexpr (std::is_same_v<V, std::int16_t>) {
        status = reader_.read_i16(value);
    } else if constexpr (std::is_same_v<V, std::int32_t>) {
        status = reader_.read_i32(value);
    } else if constexpr (std::is_same_v<V, std::int64_t>) {
        status = reader_.read_i64(value);
    } else if constexpr (std::is_same_v<V, float>) {
        status = reader_.read_f32(value);
    } else {
        static_assert(std::is_same_v<V, double>, "unsupported payload type");
        status = reader_.read_f64(value);
    }

    if (status != Error::Ok) {
        return underrun<T>(sizeof(V));
    }
    return Result<T>::ok(static_cast<T>(value));
}

bool SafeDecoder::is_next_nil() noexcept {
    std::uint8_t prefix = 0;
    if (reader_.peek_u8(prefix) != Error::Ok || !is_nil(prefix)) {
        return false;
    }
    // Cannot fail: the byte was just peeked
    return reader_.discard(1) == Error::Ok;
}

Result<std::uint8_t> SafeDecoder::peek_tag() const {
    std::uint8_t prefix = 0;
    if (reader_.peek_u8(prefix) != Error::Ok) {
        return underrun<std::uint8_t>(1);
    }
    return Result<std::uint8_t>::ok(prefix);
}

Result<bool> SafeDecoder::read_bool() {
    auto prefix = read_as<std::uint8_t, std::uint8_t>();
    if (prefix.is_err()) {
        return Result<bool>::err(prefix.error());
    }

    if (*prefix == tag::BOOL_TRUE) {
        return Result<bool>::ok(true);
    }
    if (*prefix == tag::BOOL_FALSE) {
        return Result<bool>::ok(false);
    }
    return Result<bool>::err(Error::BadTag, bad_tag_message("bool", *prefix));
}

Result<std::int8_t> SafeDecoder::read_int8() {
    return narrow_signed<std::int8_t>(read_int64());
}

Result<std::int16_t> SafeDecoder::read_int16() {
    return narrow_signed<std::int16_t>(read_int64());
}

Result<std::int32_t> SafeDecoder::read_int32() {
    return narrow_signed<std::int32_t>(read_int64());
}

Result<std::int64_t> SafeDecoder::read_int64() {
    using R = Result<std::int64_t>;

    auto prefix = read_as<std::uint8_t, std::uint8_t>();
    if (prefix.is_err()) {
        return R::err(prefix.error());
    }

    const std::uint8_t lead = *prefix;
    if (is_fixed_int(lead)) {
        return R::ok(fixed_int_value(lead));
    }
    if (is_negative_fixed_int(lead)) {
        return R::ok(negative_fixed_int_value(lead));
    }

    switch (lead) {
    case tag::INT8:
        return read_as<std::int8_t, std::int64_t>();
    case tag::INT16:
        return read_as<std::int16_t, std::int64_t>();
    case tag::INT32:
        return read_as<std::int32_t, std::int64_t>();
    case tag::INT64:
        return read_as<std::int64_t, std::int64_t>();
    case tag::UINT8:
        return read_as<std::uint8_t, std::int64_t>();
    case tag::UINT16:
        return read_as<std::uint16_t, std::int64_t>();
    case tag::UINT32:
        return read_as<std::uint32_t, std::int64_t>();
    case tag::UINT64: {
        auto value = read_as<std::uint64_t, std::uint64_t>();
        if (value.is_err()) {
            return R::err(value.error());
        }
        if (*value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return R::err(Error::IntegerOverflow, overflow_message(*value, 64));
        }
        return R::ok(static_cast<std::int64_t>(*value));
    }
    default:
        return R::err(Error::BadTag, bad_tag_message("int", lead));
    }
}

Result<std::uint8_t> SafeDecoder::read_uint8() {
    return narrow_unsigned<std::uint8_t>(read_uint64());
}

Result<std::uint16_t> SafeDecoder::read_uint16() {
    return narrow_unsigned<std::uint16_t>(read_uint64());
}

Result<std::uint32_t> SafeDecoder::read_uint32() {
    return narrow_unsigned<std::uint32_t>(read_uint64());
}

Result<std::uint64_t> SafeDecoder::read_uint64() {
    using R = Result<std::uint64_t>;

    auto prefix = read_as<std::uint8_t, std::uint8_t>();
    if (prefix.is_err()) {
        return R::err(prefix.error());
    }

    const std::uint8_t lead = *prefix;
    if (is_fixed_int(lead)) {
        return R::ok(static_cast<std::uint64_t>(fixed_int_value(lead)));
    }
    if (is_negative_fixed_int(lead)) {
        return R::err(Error::BadTag, bad_tag_message("unsigned int", lead));
    }

    auto value = Result<std::int64_t>::ok(0);
    switch (lead) {
    case tag::UINT8:
        return read_as<std::uint8_t, std::uint64_t>();
    case tag::UINT16:
        return read_as<std::uint16_t, std::uint64_t>();
    case tag::UINT32:
        return read_as<std::uint32_t, std::uint64_t>();
    case tag::UINT64:
        return read_as<std::uint64_t, std::uint64_t>();
    case tag::INT8:
        value = read_as<std::int8_t, std::int64_t>();
        break;
    case tag::INT16:
        value = read_as<std::int16_t, std::int64_t>();
        break;
    case tag::INT32:
        value = read_as<std::int32_t, std::int64_t>();
        break;
    case tag::INT64:
        value = read_as<std::int64_t, std::int64_t>();
        break;
    default:
        return R::err(Error::BadTag, bad_tag_message("unsigned int", lead));
    }

    if (value.is_err()) {
        return R::err(value.error());
    }
    if (*value < 0) {
        return R::err(Error::IntegerUnderflow, underflow_message(*value, 64));
    }
    return R::ok(static_cast<std::uint64_t>(*value));
}

Result<float> SafeDecoder::read_float32() {
    using R = Result<float>;

    auto prefix = read_as<std::uint8_t, std::uint8_t>();
    if (prefix.is_err()) {
        return R::err(prefix.error());
    }

    if (is_float32(*prefix)) {
        return read_as<float, float>();
    }
    if (!is_float64(*prefix)) {
        return R::err(Error::BadTag, bad_tag_message("float", *prefix));
    }

    auto wide = read_as<double, double>();
    if (wide.is_err()) {
        return R::err(wide.error());
    }

    const double value = *wide;
    const double diff = static_cast<double>(FLT_MAX) - value;
    if (std::fabs(diff) <= static_cast<double>(FLT_EPSILON)) {
        return R::ok(FLT_MAX);
    }
    if (diff < 0) {
        return R::err(Error::FloatOverflow, float_overflow_message(value));
    }
    // Out-of-range conversion is undefined; spell out the IEEE result
    if (value < -static_cast<double>(FLT_MAX)) {
        return R::ok(-std::numeric_limits<float>::infinity());
    }
    return R::ok(static_cast<float>(value));
}

Result<double> SafeDecoder::read_float64() {
    using R = Result<double>;

    auto prefix = read_as<std::uint8_t, std::uint8_t>();
    if (prefix.is_err()) {
        return R::err(prefix.error());
    }

    if (is_float64(*prefix)) {
        return read_as<double, double>();
    }
    if (is_float32(*prefix)) {
        return read_as<float, double>();
    }
    return R::err(Error::BadTag, bad_tag_message("float", *prefix));
}

Result<std::uint32_t> SafeDecoder::read_length(std::uint8_t prefix, std::uint8_t tag8,
                                               std::uint8_t tag16, std::uint8_t tag32) {
    if (prefix == tag8) {
        return read_as<std::uint8_t, std::uint32_t>();
    }
    if (prefix == tag16) {
        return read_as<std::uint16_t, std::uint32_t>();
    }
    if (prefix == tag32) {
        return read_as<std::uint32_t, std::uint32_t>();
    }
    return Result<std::uint32_t>::err(Error::InvalidLength, invalid_length_message(prefix));
}

Result<std::uint32_t> SafeDecoder::read_string_length() {
    using R = Result<std::uint32_t>;

    auto prefix = read_as<std::uint8_t, std::uint8_t>();
    if (prefix.is_err()) {
        return R::err(prefix.error());
    }

    if (is_fixed_string(*prefix)) {
        return R::ok(fixed_string_length(*prefix));
    }
    if (options_.fixarray_length_compat && is_fixed_array(*prefix)) {
        return R::ok(fixed_container_size(*prefix));
    }
    return read_length(*prefix, tag::STR8, tag::STR16, tag::STR32);
}

Result<std::string_view> SafeDecoder::read_string_view() {
    using R = Result<std::string_view>;

    auto length = read_string_length();
    if (length.is_err()) {
        return R::err(length.error());
    }

    std::span<const std::uint8_t> bytes;
    if (reader_.read_bytes(*length, bytes) != Error::Ok) {
        return underrun<std::string_view>(*length);
    }
    return R::ok(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

Result<std::string> SafeDecoder::read_string() {
    auto view = read_string_view();
    if (view.is_err()) {
        return Result<std::string>::err(view.error());
    }
    return Result<std::string>::ok(std::string(*view));
}

Result<std::uint32_t> SafeDecoder::read_bin_length() {
    using R = Result<std::uint32_t>;

    if (is_next_nil()) {
        return R::ok(0);
    }

    auto prefix = read_as<std::uint8_t, std::uint8_t>();
    if (prefix.is_err()) {
        return R::err(prefix.error());
    }

    if (options_.fixarray_length_compat && is_fixed_array(*prefix)) {
        return R::ok(fixed_container_size(*prefix));
    }
    return read_length(*prefix, tag::BIN8, tag::BIN16, tag::BIN32);
}

Result<std::span<const std::uint8_t>> SafeDecoder::read_bytes_view() {
    using R = Result<std::span<const std::uint8_t>>;

    auto length = read_bin_length();
    if (length.is_err()) {
        return R::err(length.error());
    }

    std::span<const std::uint8_t> bytes;
    if (reader_.read_bytes(*length, bytes) != Error::Ok) {
        return underrun<std::span<const std::uint8_t>>(*length);
    }
    return R::ok(bytes);
}

Result<std::vector<std::uint8_t>> SafeDecoder::read_byte_array() {
    using R = Result<std::vector<std::uint8_t>>;

    auto view = read_bytes_view();
    if (view.is_err()) {
        return R::err(view.error());
    }
    return R::ok(std::vector<std::uint8_t>(view->begin(), view->end()));
}

Result<std::uint32_t> SafeDecoder::read_array_size() {
    using R = Result<std::uint32_t>;

    auto prefix = read_as<std::uint8_t, std::uint8_t>();
    if (prefix.is_err()) {
        return R::err(prefix.error());
    }

    if (is_fixed_array(*prefix)) {
        return R::ok(fixed_container_size(*prefix));
    }
    if (is_nil(*prefix)) {
        return R::ok(0);
    }
    switch (*prefix) {
    case tag::ARRAY16:
        return read_as<std::uint16_t, std::uint32_t>();
    case tag::ARRAY32:
        return read_as<std::uint32_t, std::uint32_t>();
    default:
        return R::err(Error::InvalidLength, invalid_length_message(*prefix));
    }
}

Result<std::uint32_t> SafeDecoder::read_map_size() {
    using R = Result<std::uint32_t>;

    auto prefix = read_as<std::uint8_t, std::uint8_t>();
    if (prefix.is_err()) {
        return R::err(prefix.error());
    }

    if (is_fixed_map(*prefix)) {
        return R::ok(fixed_container_size(*prefix));
    }
    switch (*prefix) {
    case tag::MAP16:
        return read_as<std::uint16_t, std::uint32_t>();
    case tag::MAP32:
        return read_as<std::uint32_t, std::uint32_t>();
    default:
        return R::err(Error::InvalidLength, invalid_length_message(*prefix));
    }
}

Result<std::uint64_t> SafeDecoder::get_size() {
    using R = Result<std::uint64_t>;

    auto prefix = read_as<std::uint8_t, std::uint8_t>();
    if (prefix.is_err()) {
        return R::err(prefix.error());
    }

    const std::uint8_t lead = *prefix;
    std::uint64_t payload = 0;  // bytes to discard after the tag
    std::uint64_t children = 0; // objects the caller still has to skip

    if (is_fixed_int(lead) || is_negative_fixed_int(lead)) {
        // Value lives in the tag
    } else if (is_fixed_string(lead)) {
        payload = fixed_string_length(lead);
    } else if (is_fixed_array(lead)) {
        children = fixed_container_size(lead);
    } else if (is_fixed_map(lead)) {
        children = 2ULL * fixed_container_size(lead);
    } else {
        auto length = Result<std::uint32_t>::ok(0);
        switch (lead) {
        case tag::NIL:
        case tag::BOOL_TRUE:
        case tag::BOOL_FALSE:
            break;
        case tag::UINT8:
        case tag::INT8:
            payload = 1;
            break;
        case tag::UINT16:
        case tag::INT16:
            payload = 2;
            break;
        case tag::UINT32:
        case tag::INT32:
        case tag::FLOAT32:
            payload = 4;
            break;
        case tag::UINT64:
        case tag::INT64:
        case tag::FLOAT64:
            payload = 8;
            break;
        case tag::FIXEXT1:
            payload = 2;
            break;
        case tag::FIXEXT2:
            payload = 3;
            break;
        case tag::FIXEXT4:
            payload = 5;
            break;
        case tag::FIXEXT8:
            payload = 9;
            break;
        case tag::FIXEXT16:
            payload = 17;
            break;
        case tag::BIN8:
        case tag::STR8:
            length = read_as<std::uint8_t, std::uint32_t>();
            break;
        case tag::BIN16:
        case tag::STR16:
            length = read_as<std::uint16_t, std::uint32_t>();
            break;
        case tag::BIN32:
        case tag::STR32:
            length = read_as<std::uint32_t, std::uint32_t>();
            break;
        case tag::EXT8:
            length = read_as<std::uint8_t, std::uint32_t>();
            payload = 1; // type byte
            break;
        case tag::EXT16:
            length = read_as<std::uint16_t, std::uint32_t>();
            payload = 1;
            break;
        case tag::EXT32:
            length = read_as<std::uint32_t, std::uint32_t>();
            payload = 1;
            break;
        case tag::ARRAY16:
            length = read_as<std::uint16_t, std::uint32_t>();
            break;
        case tag::ARRAY32:
            length = read_as<std::uint32_t, std::uint32_t>();
            break;
        case tag::MAP16:
            length = read_as<std::uint16_t, std::uint32_t>();
            break;
        case tag::MAP32:
            length = read_as<std::uint32_t, std::uint32_t>();
            break;
        default:
            return R::err(Error::BadTag, bad_tag_message("value", lead));
        }

        if (length.is_err()) {
            return R::err(length.error());
        }

        switch (lead) {
        case tag::ARRAY16:
        case tag::ARRAY32:
            children = *length;
            break;
        case tag::MAP16:
        case tag::MAP32:
            children = 2ULL * *length;
            break;
        default:
            payload += *length;
            break;
        }
    }

    if (payload > reader_.remaining() || reader_.discard(payload) != Error::Ok) {
        return underrun<std::uint64_t>(payload);
    }
    return R::ok(children);
}

Result<std::size_t> SafeDecoder::skip() {
    using R = Result<std::size_t>;

    const std::size_t start = reader_.position();
    std::uint64_t pending = 1;

    while (pending > 0) {
        auto children = get_size();
        if (children.is_err()) {
            return R::err(children.error());
        }
        pending = pending - 1 + *children;

        // Every pending object needs at least one more byte
        if (pending > reader_.remaining()) {
            return underrun<std::size_t>(pending);
        }
    }
    return R::ok(reader_.position() - start);
}

} // namespace mpdecode
