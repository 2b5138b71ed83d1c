/**
 * @file bench.cpp
 * @brief Performance benchmarks for mpdecode.
 *
 * Measures skip and full-decode throughput over a synthetic document for
 * regression testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/bench              # Run with default 100 iterations
 *   ./build/bench 1000         # Run with custom iteration count
 */

#include <mpdecode/mpdecode.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace mpdecode;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::uint32_t RECORDS = 4096;

static void put_be32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 24));
    out.push_back(static_cast<std::uint8_t>(value >> 16));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value));
}

/// array32 of fixmap records {"id": uint32, "temp": float64, "tags": [fixint x3]}
static std::vector<std::uint8_t> make_document() {
    std::vector<std::uint8_t> out;
    out.push_back(tag::ARRAY32);
    put_be32(out, RECORDS);

    for (std::uint32_t i = 0; i < RECORDS; ++i) {
        out.push_back(0x83); // fixmap, 3 pairs

        out.insert(out.end(), {0xa2, 'i', 'd'});
        out.push_back(tag::UINT32);
        put_be32(out, i);

        out.insert(out.end(), {0xa4, 't', 'e', 'm', 'p'});
        out.insert(out.end(), {tag::FLOAT64, 0x40, 0x37, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00});

        out.insert(out.end(), {0xa4, 't', 'a', 'g', 's'});
        out.insert(out.end(), {0x93, 0x01, 0x02, 0x03});
    }
    return out;
}

struct Record {
    std::uint32_t id = 0;
    double temp = 0.0;
    std::vector<std::int64_t> tags;
};

static Record decode_record(Decoder& decoder) {
    Record record;
    const std::uint32_t pairs = decoder.read_map_size();
    for (std::uint32_t i = 0; i < pairs; ++i) {
        auto key = decoder.read_string_view();
        if (key == "id") {
            record.id = decoder.read_uint32();
        } else if (key == "temp") {
            record.temp = decoder.read_float64();
        } else if (key == "tags") {
            record.tags = decoder.read_array([](Decoder& d) { return d.read_int64(); });
        } else {
            decoder.skip();
        }
    }
    return record;
}

static void report(const char* name, std::size_t bytes, int iterations,
                   std::chrono::steady_clock::duration elapsed) {
    double seconds = std::chrono::duration<double>(elapsed).count();
    double mb = static_cast<double>(bytes) * iterations / (1024.0 * 1024.0);
    std::printf("%-20s %8.2f ms  %8.1f MB/s\n", name, seconds * 1000.0 / iterations,
                seconds > 0 ? mb / seconds : 0.0);
}

int main(int argc, char** argv) {
    int iterations = DEFAULT_ITERATIONS;
    if (argc > 1) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            std::fprintf(stderr, "Error: iterations must be positive\n");
            return 1;
        }
    }

    const auto document = make_document();
    std::printf("mpdecode %s benchmark: %zu bytes, %d iterations\n\n", version(),
                document.size(), iterations);

    // Warmup run
    auto warm = count_values(document);
    if (warm.is_err() || *warm != 1) {
        std::fprintf(stderr, "Error: benchmark document does not decode\n");
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < iterations; ++i) {
        SafeDecoder decoder(document);
        auto skipped = decoder.skip();
        if (skipped.is_err()) {
            std::fprintf(stderr, "Error: %s\n", skipped.error().message.c_str());
            return 1;
        }
    }
    report("skip", document.size(), iterations, std::chrono::steady_clock::now() - start);

    std::uint64_t checksum = 0;
    start = std::chrono::steady_clock::now();
    for (int i = 0; i < iterations; ++i) {
        Decoder decoder(document);
        auto records = decoder.read_array(decode_record);
        checksum += records.back().id;
    }
    report("decode", document.size(), iterations, std::chrono::steady_clock::now() - start);

    std::printf("\nchecksum: %llu\n", static_cast<unsigned long long>(checksum));
    return 0;
}
