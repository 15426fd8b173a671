/**
 * @file bench.cpp
 * @brief Throughput benchmarks for VLESS header decoding.
 *
 * Measures decode throughput for regression testing during development.
 * Use for relative comparisons only.
 *
 * Usage:
 *   ./build/vless_bench              # Run with default iteration count
 *   ./build/vless_bench 5000000      # Run with custom iteration count
 */

#include <vless/vless.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace vless;

static constexpr int DEFAULT_ITERATIONS = 1000000;

static std::vector<std::uint8_t> make_frame(std::uint8_t address_type,
                                            const std::vector<std::uint8_t>& address) {
    std::vector<std::uint8_t> frame;
    frame.push_back(0x00); // version
    for (std::uint8_t i = 0; i < UUID_BYTES; ++i) {
        frame.push_back(static_cast<std::uint8_t>(0x10U + i));
    }
    frame.push_back(0x00); // no addons
    frame.push_back(static_cast<std::uint8_t>(Command::Tcp));
    frame.push_back(0x01); // port 443
    frame.push_back(0xBB);
    frame.push_back(address_type);
    frame.insert(frame.end(), address.begin(), address.end());
    // Some payload bytes the decoder must ignore
    frame.insert(frame.end(), 64, 0xAA);
    return frame;
}

static void bench_decode(const char* name, const std::vector<std::uint8_t>& frame,
                         int iterations) {
    HeaderDecoder decoder;
    DecodedHeader header;
    std::size_t checksum = 0;

    // Warmup run
    Error warmup = decoder.decode(frame.data(), frame.size(), header);
    if (warmup != Error::Ok) {
        std::printf("%-12s FAIL (%s)\n", name, error_string(warmup));
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        if (decoder.decode(frame.data(), frame.size(), header) == Error::Ok) {
            checksum += header.address.size();
        }
    }
    auto end = std::chrono::high_resolution_clock::now();

    double elapsed_ns =
        static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    double per_decode = elapsed_ns / static_cast<double>(iterations);
    double mb_per_s = (static_cast<double>(header.payload_offset) * iterations) / (elapsed_ns / 1e3);

    std::printf("%-12s %8.1f ns/decode  %8.1f MB/s  (checksum %zu)\n", name, per_decode, mb_per_s,
                checksum);
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

    std::printf("VLESS header decode benchmark (%d iterations)\n\n", iterations);

    bench_decode("ipv4", make_frame(1, {192, 168, 0, 1}), iterations);

    std::vector<std::uint8_t> domain = {11};
    const char* host = "example.com";
    domain.insert(domain.end(), host, host + 11);
    bench_decode("domain", make_frame(2, domain), iterations);

    bench_decode("ipv6", make_frame(3, {0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1}),
                 iterations);

    return 0;
}
