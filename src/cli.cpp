/**
 * @file cli.cpp
 * @brief mpdump command line interface.
 *
 * Prints the values of a MessagePack file as an indented tree, or only
 * counts the top-level values.
 */

#include <mpdecode/mpdecode.hpp>

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace mpdecode;

static void print_version() {
    std::printf("mpdump %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("MessagePack inspector (v%s)\n", version());
    std::printf("===========================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <input>\n", prog_name);
    std::printf("  %s -c <input>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -c             Count top-level values only (no decoding)\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  input          File holding one or more concatenated values\n\n");
    std::printf("Examples:\n");
    std::printf("  %s message.bin        # print values\n", prog_name);
    std::printf("  %s -c message.bin     # count values\n\n", prog_name);
}

static std::vector<std::uint8_t> read_file(const std::string& path, bool& ok) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    ok = false;
    if (!file) {
        return {};
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        // Not a regular file (e.g. a directory)
        return {};
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return {};
    }

    ok = true;
    return buffer;
}

static void indent(std::size_t depth) {
    for (std::size_t i = 0; i < depth; ++i) {
        std::printf("  ");
    }
}

/// Print one value and its children; false with @p error set on failure.
static bool dump_value(SafeDecoder& decoder, std::size_t depth, DecodeError& error) {
    if (depth > MAX_DUMP_DEPTH) {
        error = DecodeError(Error::DepthExceeded,
                            "nesting deeper than " + std::to_string(MAX_DUMP_DEPTH));
        return false;
    }

    auto peeked = decoder.peek_tag();
    if (peeked.is_err()) {
        error = peeked.error();
        return false;
    }
    const std::uint8_t lead = *peeked;

    indent(depth);

    if (decoder.is_next_nil()) {
        std::printf("nil\n");
        return true;
    }

    if (is_bool(lead)) {
        auto value = decoder.read_bool();
        if (value.is_err()) {
            error = value.error();
            return false;
        }
        std::printf("%s\n", *value ? "true" : "false");
        return true;
    }

    if (is_fixed_int(lead) || (lead >= tag::UINT8 && lead <= tag::UINT64)) {
        auto value = decoder.read_uint64();
        if (value.is_err()) {
            error = value.error();
            return false;
        }
        std::printf("%" PRIu64 "\n", *value);
        return true;
    }

    if (is_negative_fixed_int(lead) || (lead >= tag::INT8 && lead <= tag::INT64)) {
        auto value = decoder.read_int64();
        if (value.is_err()) {
            error = value.error();
            return false;
        }
        std::printf("%" PRId64 "\n", *value);
        return true;
    }

    if (is_float32(lead) || is_float64(lead)) {
        auto value = decoder.read_float64();
        if (value.is_err()) {
            error = value.error();
            return false;
        }
        std::printf("%g\n", *value);
        return true;
    }

    if (is_fixed_string(lead) || (lead >= tag::STR8 && lead <= tag::STR32)) {
        auto value = decoder.read_string_view();
        if (value.is_err()) {
            error = value.error();
            return false;
        }
        std::printf("\"%.*s\"\n", static_cast<int>(value->size()), value->data());
        return true;
    }

    if (lead >= tag::BIN8 && lead <= tag::BIN32) {
        auto value = decoder.read_bytes_view();
        if (value.is_err()) {
            error = value.error();
            return false;
        }
        std::printf("<bin %zu bytes>\n", value->size());
        return true;
    }

    if (is_fixed_array(lead) || lead == tag::ARRAY16 || lead == tag::ARRAY32) {
        auto size = decoder.read_array_size();
        if (size.is_err()) {
            error = size.error();
            return false;
        }
        std::printf("array (%" PRIu32 ")\n", *size);
        for (std::uint32_t i = 0; i < *size; ++i) {
            if (!dump_value(decoder, depth + 1, error)) {
                return false;
            }
        }
        return true;
    }

    if (is_fixed_map(lead) || lead == tag::MAP16 || lead == tag::MAP32) {
        auto size = decoder.read_map_size();
        if (size.is_err()) {
            error = size.error();
            return false;
        }
        std::printf("map (%" PRIu32 ")\n", *size);
        for (std::uint32_t i = 0; i < *size; ++i) {
            if (!dump_value(decoder, depth + 1, error) ||
                !dump_value(decoder, depth + 2, error)) {
                return false;
            }
        }
        return true;
    }

    // Extensions and anything unknown: get_size() consumes the payload or
    // reports the bad tag
    auto children = decoder.get_size();
    if (children.is_err()) {
        error = children.error();
        return false;
    }
    std::printf("<%s>\n", format_name(lead));
    return true;
}

static int do_dump(const char* input_path) {
    bool ok = false;
    auto input_data = read_file(input_path, ok);
    if (!ok) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    SafeDecoder decoder(input_data);
    std::size_t count = 0;
    DecodeError error;

    while (!decoder.at_end()) {
        if (!dump_value(decoder, 0, error)) {
            std::fprintf(stderr, "Error: %s (%s, at offset %zu)\n", error.message.c_str(),
                         error_string(error.code), decoder.position());
            return 1;
        }
        ++count;
    }

    std::printf("\nValues:      %zu\n", count);
    std::printf("Bytes:       %zu\n", input_data.size());
    return 0;
}

static int do_count(const char* input_path) {
    bool ok = false;
    auto input_data = read_file(input_path, ok);
    if (!ok) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    auto count = count_values(input_data);
    if (count.is_err()) {
        std::fprintf(stderr, "Error: %s\n", count.error().message.c_str());
        return 1;
    }

    std::printf("Input:       %s (%zu bytes)\n", input_path, input_data.size());
    std::printf("Values:      %zu\n", *count);
    return 0;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    if (std::strcmp(argv[1], "-c") == 0) {
        if (argc != 3) {
            std::fprintf(stderr, "Error: Count requires 1 argument after -c\n");
            std::fprintf(stderr, "Usage: %s -c <input>\n", argv[0]);
            return 1;
        }
        return do_count(argv[2]);
    }

    if (argc != 2) {
        std::fprintf(stderr, "Error: Dump requires 1 argument\n");
        std::fprintf(stderr, "Usage: %s <input>\n", argv[0]);
        return 1;
    }
    return do_dump(argv[1]);
}
