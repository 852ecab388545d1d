/**
 * @file cli.cpp
 * @brief ADC command line decoder.
 *
 * Streams an ADC-compressed file through the decoder into an output file
 * using fixed-size blocks, so memory use does not depend on file size.
 */

#include <adc/adc.hpp>
#include <adc/log.hpp>

#include "cli_args.hpp"

#include <spdlog/cfg/env.h>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace adc;

static void print_version() {
    std::printf("adc-decode %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("Apple Data Compression (ADC) decoder v%s\n", version());
    std::printf("=======================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] <input> [output]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -n <size>      Expect exactly <size> decoded bytes\n");
    std::printf("  -v             Verbose logging (debug level)\n");
    std::printf("  -q             Only log errors\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  --version      Show version information\n\n");
    std::printf("Output:\n");
    std::printf("  <output>, or <input> without .adc, or <input>.out\n\n");
    std::printf("Environment:\n");
    std::printf("  SPDLOG_LEVEL   Log level override (e.g. debug, trace)\n\n");
    std::printf("Examples:\n");
    std::printf("  %s block.adc               # writes block\n", prog_name);
    std::printf("  %s -n 262144 block.bin out # exact-size sector run\n\n", prog_name);
}

static std::string make_output_filename(const std::string& input) {
    if (input.size() > 4 && input.substr(input.size() - 4) == ".adc") {
        return input.substr(0, input.size() - 4);
    }
    return input + ".out";
}

static int do_decode(const std::string& input_path, const std::string& output_path,
                     bool exact, std::size_t expected) {
    std::ifstream in(input_path, std::ios::binary);
    if (!in) {
        log::error("Cannot read input file: {}", input_path);
        return 1;
    }

    std::ofstream out(output_path, std::ios::binary);
    if (!out) {
        log::error("Cannot write output file: {}", output_path);
        return 1;
    }

    log::info("Decoding {} -> {}", input_path, output_path);

    StreamSource source(in);
    Decoder decoder(source);

    std::uint64_t output_size = 0;
    Error status = exact ? decode_exact(decoder, out, expected, output_size)
                         : decode_stream(decoder, out, output_size);
    if (status == Error::Io && !out) {
        log::error("Cannot write output file: {}", output_path);
        return 1;
    }
    if (status != Error::Ok) {
        log::error("Decoding failed: {} ({} bytes decoded, {} bytes read)", error_string(status),
                   output_size, source.bytes_read());
        if (exact && status == Error::BufferTooSmall) {
            log::error("Decoded {} of {} expected bytes", output_size, expected);
        }
        if (is_corruption(status)) {
            log::error("Input is not a valid ADC stream");
        }
        return 1;
    }

    if (exact) {
        std::uint8_t extra = 0;
        std::size_t n = 0;
        status = decoder.produce(&extra, 1, n);
        if (status != Error::Ok) {
            log::warn("Input past {} decoded bytes is not valid: {}", expected,
                      error_string(status));
        } else if (n > 0) {
            log::warn("Input holds more than {} decoded bytes; trailing data ignored", expected);
        }
    }

    out.close();
    if (!out) {
        log::error("Cannot write output file: {}", output_path);
        return 1;
    }

    std::size_t input_size = source.bytes_read();
    double ratio = (input_size > 0)
                       ? static_cast<double>(output_size) / static_cast<double>(input_size)
                       : 0.0;
    std::printf("Input:       %s (%zu bytes)\n", input_path.c_str(), input_size);
    std::printf("Output:      %s (%llu bytes)\n", output_path.c_str(),
                static_cast<unsigned long long>(output_size));
    std::printf("Expansion:   %.2fx\n", ratio);

    return 0;
}

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    if (std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    bool exact = false;
    std::size_t expected = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0) {
            spdlog::set_level(spdlog::level::debug);
        } else if (std::strcmp(argv[i], "-q") == 0) {
            spdlog::set_level(spdlog::level::err);
        } else if (std::strcmp(argv[i], "-n") == 0) {
            if (i + 1 >= argc || !cli::parse_size(argv[i + 1], expected)) {
                log::error("-n requires a byte count");
                return 1;
            }
            exact = true;
            ++i;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            log::error("Unknown option: {}", argv[i]);
            return 1;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        log::error("Expected <input> [output]");
        std::fprintf(stderr, "Usage: %s [options] <input> [output]\n", argv[0]);
        return 1;
    }

    const std::string& input_path = positional[0];
    std::string output_path =
        (positional.size() == 2) ? positional[1] : make_output_filename(input_path);

    return do_decode(input_path, output_path, exact, expected);
}
