/**
 * @file adc.hpp
 * @brief High-level ADC decompression API.
 *
 * Convenience operations layered on top of Decoder::produce():
 * - fill_exact() fills a buffer of known size from a decoder
 * - decompress() decodes a whole in-memory stream
 * - decode_stream() and decode_exact() copy decoded data to a std::ostream
 *
 * Both keep the decoder's bounded-memory behavior; only the caller's
 * buffers grow with the output.
 */

#ifndef ADC_HPP
#define ADC_HPP

#include "chunk.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "source.hpp"
#include "window.hpp"

#include <ostream>

#if !ADC_NO_EXCEPTIONS
#include <vector>
#endif

namespace adc {

/**
 * @brief Fill a buffer with exactly @p len decoded bytes.
 *
 * Calls produce() repeatedly until the buffer is full.
 *
 * @param decoder Decoder to read from
 * @param buf Output buffer
 * @param len Number of bytes required
 * @param[out] filled Number of bytes written (equals @p len on success)
 * @return Error::Ok, Error::BufferTooSmall if the stream ended first, or
 *         the decoder's error
 */
Error fill_exact(Decoder& decoder, std::uint8_t* buf, std::size_t len,
                 std::size_t& filled) noexcept;

/**
 * @brief Decompress an in-memory ADC stream.
 *
 * Decodes until the input is exhausted.
 *
 * @param input_data Compressed input bytes
 * @param input_size Compressed input size in bytes
 * @param output_buffer Output buffer for decompressed data
 * @param output_buffer_size Capacity of @p output_buffer
 * @param[out] output_size Actual decompressed size
 * @return Error::Ok on success, Error::Overflow if the decoded data does
 *         not fit, or a decoding error
 */
Error decompress(const std::uint8_t* input_data, std::size_t input_size,
                 std::uint8_t* output_buffer, std::size_t output_buffer_size,
                 std::size_t& output_size) noexcept;

/**
 * @brief Decode until end of stream, writing to @p out.
 *
 * Output is copied through a fixed-size block, so memory use does not
 * depend on the decoded length.
 *
 * @param decoder Decoder to read from
 * @param out Destination stream
 * @param[out] written Number of decoded bytes written to @p out
 * @return Error::Ok, Error::Io if @p out fails, or the decoder's error
 */
Error decode_stream(Decoder& decoder, std::ostream& out, std::uint64_t& written) noexcept;

/**
 * @brief Decode exactly @p expected bytes, writing to @p out.
 *
 * Data after the first @p expected bytes is left in the decoder.
 *
 * @param decoder Decoder to read from
 * @param out Destination stream
 * @param expected Number of decoded bytes required
 * @param[out] written Number of decoded bytes written to @p out
 * @return Error::Ok, Error::BufferTooSmall if the stream ended first,
 *         Error::Io if @p out fails, or the decoder's error
 */
Error decode_exact(Decoder& decoder, std::ostream& out, std::uint64_t expected,
                   std::uint64_t& written) noexcept;

#if !ADC_NO_EXCEPTIONS

/**
 * @brief Decompress an in-memory ADC stream into a new vector.
 *
 * @throws AdcException subclass matching the decoding error
 */
std::vector<std::uint8_t> decompress(const std::vector<std::uint8_t>& input);

#endif // !ADC_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace adc

#endif // ADC_HPP
