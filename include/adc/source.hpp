/**
 * @file source.hpp
 * @brief Sequential byte sources consumed by the decoder.
 *
 * A byte source is a blocking, pull-based reader. End of stream is a
 * successful read of zero bytes; failures are reported as error codes,
 * so the two can never be confused.
 */

#ifndef ADC_SOURCE_HPP
#define ADC_SOURCE_HPP

#include <cstring>
#include <istream>

#include "config.hpp"
#include "error.hpp"

namespace adc {

/**
 * @brief Abstract sequential byte source.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read up to @p max bytes.
     *
     * May return fewer bytes than requested. For @p max > 0, a result of
     * Error::Ok with @p count == 0 means the stream has ended.
     *
     * @param dst Destination buffer (at least @p max bytes)
     * @param max Maximum number of bytes to read
     * @param[out] count Number of bytes written to @p dst
     * @return Error::Ok on success or end of stream
     */
    virtual Error read(std::uint8_t* dst, std::size_t max, std::size_t& count) noexcept = 0;
};

/**
 * @brief Byte source over a caller-owned memory buffer.
 *
 * Tracks position within the buffer. The buffer must outlive the source.
 */
class MemorySource final : public ByteSource {
public:
    /**
     * @brief Construct a memory source.
     *
     * @param data Pointer to source data buffer
     * @param size Number of valid bytes in buffer
     */
    MemorySource(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    Error read(std::uint8_t* dst, std::size_t max, std::size_t& count) noexcept override {
        count = 0;
        if (max > 0 && dst == nullptr) [[unlikely]] {
            return Error::InvalidArg;
        }

        std::size_t n = (max < remaining()) ? max : remaining();
        if (n > 0) {
            std::memcpy(dst, data_ + pos_, n);
            pos_ += n;
        }
        count = n;
        return Error::Ok;
    }

    /**
     * @brief Get current read position.
     *
     * @return Number of bytes already consumed
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     *
     * @return Number of bytes left to read
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < size_) ? (size_ - pos_) : 0;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

/**
 * @brief Byte source over a std::istream.
 *
 * Reads block until the stream delivers data. A stream whose bad bit is
 * set reports Error::Io; reaching EOF is a clean end of stream.
 */
class StreamSource final : public ByteSource {
public:
    explicit StreamSource(std::istream& stream) noexcept : stream_(stream) {}

    Error read(std::uint8_t* dst, std::size_t max, std::size_t& count) noexcept override;

    /**
     * @brief Total bytes delivered so far.
     */
    [[nodiscard]] std::size_t bytes_read() const noexcept {
        return total_;
    }

private:
    std::istream& stream_;
    std::size_t total_ = 0;
};

/**
 * @brief Read exactly @p len bytes, looping over short reads.
 *
 * @param source Byte source
 * @param dst Destination buffer
 * @param len Number of bytes required
 * @param[out] count Number of bytes actually read (less than @p len on error)
 * @return Error::Ok, Error::TruncatedInput if the stream ended early, or the
 *         source's own error
 */
Error read_exact(ByteSource& source, std::uint8_t* dst, std::size_t len,
                 std::size_t& count) noexcept;

} // namespace adc

#endif // ADC_SOURCE_HPP
