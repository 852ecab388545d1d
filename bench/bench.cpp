/**
 * @file bench.cpp
 * @brief Performance benchmarks for ADC decoding.
 *
 * Measures decoding throughput for regression testing during development.
 * The input is a synthetic stream mixing literal and run chunks, so no
 * data files are needed.
 *
 * Usage:
 *   ./build/adc-bench          # Run with default 100 iterations
 *   ./build/adc-bench 1000     # Run with custom iteration count
 */

#include <adc/adc.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace adc;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t TARGET_OUTPUT = 4U * 1024U * 1024U;

/**
 * @brief Build a valid ADC stream of roughly TARGET_OUTPUT decoded bytes.
 *
 * Cycles through a literal chunk, a short two-byte run and a long
 * three-byte run reaching far back into the window.
 */
static std::vector<std::uint8_t> make_stream(std::size_t& decoded_size) {
    std::vector<std::uint8_t> stream;
    std::size_t produced = 0;
    std::uint32_t seed = 0x2545F491U;

    while (produced < TARGET_OUTPUT) {
        // Plain chunk, 128 bytes of xorshift noise
        stream.push_back(0x80U | 0x7FU);
        for (int i = 0; i < 128; ++i) {
            seed ^= seed << 13;
            seed ^= seed >> 17;
            seed ^= seed << 5;
            stream.push_back(static_cast<std::uint8_t>(seed));
        }
        produced += 128;

        // Two-byte run: 18 bytes from offset 100
        std::size_t offset = 100;
        stream.push_back(static_cast<std::uint8_t>((15U << 2) | (offset >> 8)));
        stream.push_back(static_cast<std::uint8_t>(offset & 0xFFU));
        produced += 18;

        // Three-byte run: 67 bytes from as far back as the window allows
        offset = (produced > WINDOW_SIZE) ? MAX_OFFSET : produced - 1U;
        stream.push_back(static_cast<std::uint8_t>(0x40U | 0x3FU));
        stream.push_back(static_cast<std::uint8_t>(offset >> 8));
        stream.push_back(static_cast<std::uint8_t>(offset & 0xFFU));
        produced += 67;
    }

    decoded_size = produced;
    return stream;
}

static void bench_decode(const char* name, const std::vector<std::uint8_t>& input,
                         std::size_t decoded_size, std::size_t block_size, int iterations) {
    std::vector<std::uint8_t> block(block_size);
    std::uint64_t checksum = 0;

    auto run_once = [&]() -> bool {
        MemorySource source(input.data(), input.size());
        Decoder decoder(source);
        for (;;) {
            std::size_t n = 0;
            if (decoder.produce(block.data(), block.size(), n) != Error::Ok) {
                return false;
            }
            if (n == 0) {
                return true;
            }
            checksum += block[n - 1];
        }
    };

    // Warmup run
    if (!run_once()) {
        std::printf("%-20s FAIL (decode error)\n", name);
        return;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        if (!run_once()) {
            std::printf("%-20s FAIL (decode error)\n", name);
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(decoded_size) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %8.1f MB/s  (checksum %llu)\n", name, per_iter_us,
                throughput_mbps, static_cast<unsigned long long>(checksum));
}

static void bench_whole_buffer(const std::vector<std::uint8_t>& input, std::size_t decoded_size,
                               int iterations) {
    std::vector<std::uint8_t> output(decoded_size);
    std::size_t output_size = 0;

    if (decompress(input.data(), input.size(), output.data(), output.size(), output_size) !=
        Error::Ok) {
        std::printf("%-20s FAIL (decode error)\n", "whole buffer");
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        if (decompress(input.data(), input.size(), output.data(), output.size(), output_size) !=
            Error::Ok) {
            std::printf("%-20s FAIL (decode error)\n", "whole buffer");
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(decoded_size) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %8.1f MB/s\n", "whole buffer", per_iter_us,
                throughput_mbps);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::size_t decoded_size = 0;
    std::vector<std::uint8_t> input = make_stream(decoded_size);

    std::printf("ADC Decoder Benchmarks (v%s)\n", version());
    std::printf("============================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Stream:     %zu bytes -> %zu bytes\n\n", input.size(), decoded_size);

    std::printf("%-20s %16s  %11s\n", "Test", "Time", "Throughput");
    std::printf("%-20s %16s  %11s\n", "----", "----", "----------");

    bench_decode("produce 64 B", input, decoded_size, 64, iterations);
    bench_decode("produce 64 KiB", input, decoded_size, 64U * 1024U, iterations);
    bench_whole_buffer(input, decoded_size, iterations);

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
