/**
 * @file adc.cpp
 * @brief High-level ADC decompression API.
 */

#include <adc/adc.hpp>
#include <adc/log.hpp>

#include <array>

namespace adc {

namespace {

constexpr std::size_t STREAM_BLOCK_SIZE = 16U * 1024U;

bool write_block(std::ostream& out, const std::uint8_t* data, std::size_t size) noexcept {
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return static_cast<bool>(out);
}

} // namespace

Error fill_exact(Decoder& decoder, std::uint8_t* buf, std::size_t len,
                 std::size_t& filled) noexcept {
    filled = 0;
    while (filled < len) {
        std::size_t n = 0;
        Error status = decoder.produce(buf + filled, len - filled, n);
        if (status != Error::Ok) {
            return status;
        }
        if (n == 0) {
            log::debug("stream ended after {} of {} requested bytes", filled, len);
            return Error::BufferTooSmall;
        }
        filled += n;
    }
    return Error::Ok;
}

Error decompress(const std::uint8_t* input_data, std::size_t input_size,
                 std::uint8_t* output_buffer, std::size_t output_buffer_size,
                 std::size_t& output_size) noexcept {
    output_size = 0;
    if ((input_data == nullptr && input_size > 0) ||
        (output_buffer == nullptr && output_buffer_size > 0)) {
        return Error::InvalidArg;
    }

    MemorySource source(input_data, input_size);
    Decoder decoder(source);

    std::size_t total_output = 0;
    while (total_output < output_buffer_size) {
        std::size_t n = 0;
        Error status =
            decoder.produce(&output_buffer[total_output], output_buffer_size - total_output, n);
        if (status != Error::Ok) {
            return status;
        }
        if (n == 0) {
            break;
        }
        total_output += n;
    }

    // Buffer full: any further output means it was too small
    if (!decoder.at_eof()) {
        std::uint8_t extra = 0;
        std::size_t n = 0;
        Error status = decoder.produce(&extra, 1, n);
        if (status != Error::Ok) {
            return status;
        }
        if (n > 0) {
            return Error::Overflow;
        }
    }

    output_size = total_output;
    return Error::Ok;
}

Error decode_stream(Decoder& decoder, std::ostream& out, std::uint64_t& written) noexcept {
    written = 0;
    std::array<std::uint8_t, STREAM_BLOCK_SIZE> block;
    for (;;) {
        std::size_t n = 0;
        Error status = decoder.produce(block.data(), block.size(), n);
        if (status != Error::Ok) {
            return status;
        }
        if (n == 0) {
            return Error::Ok;
        }
        if (!write_block(out, block.data(), n)) {
            return Error::Io;
        }
        written += n;
    }
}

Error decode_exact(Decoder& decoder, std::ostream& out, std::uint64_t expected,
                   std::uint64_t& written) noexcept {
    written = 0;
    std::array<std::uint8_t, STREAM_BLOCK_SIZE> block;
    while (written < expected) {
        std::uint64_t remaining = expected - written;
        std::size_t want = (remaining < block.size()) ? static_cast<std::size_t>(remaining)
                                                      : block.size();
        std::size_t filled = 0;
        Error status = fill_exact(decoder, block.data(), want, filled);

        // Keep what was decoded before a short stream for the caller
        if (filled > 0 && !write_block(out, block.data(), filled)) {
            return Error::Io;
        }
        written += filled;
        if (status != Error::Ok) {
            return status;
        }
    }
    return Error::Ok;
}

#if !ADC_NO_EXCEPTIONS

std::vector<std::uint8_t> decompress(const std::vector<std::uint8_t>& input) {
    MemorySource source(input.data(), input.size());
    Decoder decoder(source);

    std::vector<std::uint8_t> output;
    output.reserve(input.size() * 2);

    std::uint8_t block[4096];
    for (;;) {
        std::size_t n = 0;
        throw_if_error(decoder.produce(block, sizeof(block), n), "ADC decompression failed");
        if (n == 0) {
            break;
        }
        output.insert(output.end(), block, block + n);
    }
    return output;
}

#endif // !ADC_NO_EXCEPTIONS

} // namespace adc
