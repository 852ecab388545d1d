/**
 * @file config.hpp
 * @brief ADC compile-time configuration.
 *
 * Wire format constants for Apple Data Compression and the switches used
 * to build the library for embedded targets.
 */

#ifndef ADC_CONFIG_HPP
#define ADC_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace adc {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Largest back-distance a run chunk can encode (16-bit offset field)
inline constexpr std::size_t MAX_OFFSET = 0xFFFFU;

/// History kept by the decoder: one more than the largest encodable offset
inline constexpr std::size_t WINDOW_SIZE = MAX_OFFSET + 1U;

/// Chunk output lengths as encoded in the header byte
inline constexpr std::size_t PLAIN_MIN_SIZE = 1U;
inline constexpr std::size_t PLAIN_MAX_SIZE = 128U;
inline constexpr std::size_t TWO_BYTE_MIN_SIZE = 3U;
inline constexpr std::size_t TWO_BYTE_MAX_SIZE = 18U;
inline constexpr std::size_t THREE_BYTE_MIN_SIZE = 4U;
inline constexpr std::size_t THREE_BYTE_MAX_SIZE = 67U;

/// Largest offset of a two-byte run (10-bit field)
inline constexpr std::size_t TWO_BYTE_MAX_OFFSET = 0x3FFU;

/// Longest chunk header in bytes
inline constexpr std::size_t MAX_HEADER_BYTES = 3U;

static_assert((WINDOW_SIZE & (WINDOW_SIZE - 1U)) == 0U, "window size must be a power of two");

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define ADC_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef ADC_NO_EXCEPTIONS
#define ADC_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace adc

#endif // ADC_CONFIG_HPP
