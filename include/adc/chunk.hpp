/**
 * @file chunk.hpp
 * @brief ADC chunk header parsing.
 *
 * Every chunk starts with a header byte whose two high bits select the
 * chunk type:
 * - 1x: plain chunk, 1-128 literal bytes follow the header
 * - 01: three-byte run, 16-bit big-endian offset, length 4-67
 * - 00: two-byte run, 10-bit offset, length 3-18
 */

#ifndef ADC_CHUNK_HPP
#define ADC_CHUNK_HPP

#include <optional>

#include "config.hpp"
#include "error.hpp"
#include "source.hpp"

namespace adc {

/**
 * @brief Chunk kinds of the ADC wire format.
 */
enum class ChunkType : std::uint8_t {
    Plain,        ///< Literal bytes copied from the input
    TwoByteRun,   ///< Back-reference with a 10-bit offset
    ThreeByteRun  ///< Back-reference with a 16-bit offset
};

/**
 * @brief A parsed chunk header.
 *
 * @c size counts the output bytes the chunk still owes; the decoder
 * decrements it as bytes are produced. @c offset is the back-distance of
 * run chunks (0 = the byte just before the one being written) and is
 * zero for plain chunks.
 */
struct Chunk {
    ChunkType type = ChunkType::Plain;
    std::size_t size = 0;
    std::size_t offset = 0;

    bool is_run() const noexcept {
        return type != ChunkType::Plain;
    }

    bool operator==(const Chunk& other) const noexcept = default;
};

/**
 * @brief Classify a header byte.
 */
constexpr ChunkType chunk_type(std::uint8_t header) noexcept {
    if ((header & 0x80U) != 0) {
        return ChunkType::Plain;
    }
    if ((header & 0x40U) != 0) {
        return ChunkType::ThreeByteRun;
    }
    return ChunkType::TwoByteRun;
}

/**
 * @brief Output length encoded in a header byte.
 */
constexpr std::size_t chunk_size(std::uint8_t header) noexcept {
    switch (chunk_type(header)) {
    case ChunkType::Plain:
        return static_cast<std::size_t>(header & 0x7FU) + 1U;
    case ChunkType::TwoByteRun:
        return static_cast<std::size_t>((header & 0x3FU) >> 2) + 3U;
    case ChunkType::ThreeByteRun:
        return static_cast<std::size_t>(header & 0x3FU) + 4U;
    }
    return 0;
}

/**
 * @brief Number of header bytes (including the first) for a chunk type.
 */
constexpr std::size_t header_length(ChunkType type) noexcept {
    switch (type) {
    case ChunkType::Plain:
        return 1U;
    case ChunkType::TwoByteRun:
        return 2U;
    case ChunkType::ThreeByteRun:
        return 3U;
    }
    return 0;
}

/**
 * @brief Human-readable chunk type name, for diagnostics.
 */
const char* chunk_type_name(ChunkType type) noexcept;

/**
 * @brief Parse the next chunk header from a byte source.
 *
 * Consumes only the header bytes; a plain chunk's literal payload is left
 * in the source for the caller.
 *
 * @param source Byte source positioned at a chunk boundary
 * @param[out] chunk Parsed chunk, or empty if the stream ended cleanly
 *                   before a header byte
 * @return Error::Ok on success or clean end of stream,
 *         Error::TruncatedInput if the stream ended inside the header
 */
Error parse_chunk(ByteSource& source, std::optional<Chunk>& chunk) noexcept;

} // namespace adc

#endif // ADC_CHUNK_HPP
