/**
 * @file chunk.cpp
 * @brief ADC chunk header parsing.
 */

#include <adc/chunk.hpp>
#include <adc/log.hpp>

namespace adc {

const char* chunk_type_name(ChunkType type) noexcept {
    switch (type) {
    case ChunkType::Plain:
        return "plain";
    case ChunkType::TwoByteRun:
        return "two-byte run";
    case ChunkType::ThreeByteRun:
        return "three-byte run";
    }
    return "unknown";
}

Error parse_chunk(ByteSource& source, std::optional<Chunk>& chunk) noexcept {
    chunk.reset();

    std::uint8_t header[MAX_HEADER_BYTES] = {0};
    std::size_t count = 0;

    // No header byte at all is the normal end of the stream
    Error status = source.read(header, 1, count);
    if (status != Error::Ok) {
        return status;
    }
    if (count == 0) {
        return Error::Ok;
    }

    Chunk parsed;
    parsed.type = chunk_type(header[0]);
    parsed.size = chunk_size(header[0]);

    std::size_t extra = header_length(parsed.type) - 1U;
    if (extra > 0) {
        status = read_exact(source, &header[1], extra, count);
        if (status != Error::Ok) {
            log::debug("chunk header 0x{:02x} cut short after {} of {} bytes", header[0],
                       count + 1U, extra + 1U);
            return status;
        }
    }

    switch (parsed.type) {
    case ChunkType::Plain:
        parsed.offset = 0;
        break;
    case ChunkType::TwoByteRun:
        parsed.offset = (static_cast<std::size_t>(header[0] & 0x03U) << 8) | header[1];
        break;
    case ChunkType::ThreeByteRun:
        parsed.offset = (static_cast<std::size_t>(header[1]) << 8) | header[2];
        break;
    }

    log::trace("{} chunk: size={} offset={}", chunk_type_name(parsed.type), parsed.size,
               parsed.offset);

    chunk = parsed;
    return Error::Ok;
}

} // namespace adc
