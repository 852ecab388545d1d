/**
 * @file decoder.hpp
 * @brief Incremental ADC decoder.
 *
 * The decoder pulls compressed bytes from a ByteSource and produces
 * decoded bytes into caller buffers, one chunk at a time:
 * - plain chunks are read straight from the source into the caller buffer
 * - run chunks are copied byte by byte through the sliding window, so a
 *   run may reference bytes it has just written itself
 *
 * A chunk larger than the caller's buffer is spread over several calls.
 * The decoder is itself a ByteSource, so it can feed anything that reads
 * from one.
 */

#ifndef ADC_DECODER_HPP
#define ADC_DECODER_HPP

#include <cstdint>

#include "chunk.hpp"
#include "config.hpp"
#include "error.hpp"
#include "source.hpp"
#include "window.hpp"

namespace adc {

/**
 * @brief Pull-based ADC decoder with bounded memory.
 *
 * Not thread-safe; a decoder must have a single owner at a time. The byte
 * source is borrowed and must outlive the decoder.
 */
class Decoder final : public ByteSource {
public:
    /**
     * @brief Decoder lifecycle.
     */
    enum class State : std::uint8_t {
        NoActiveChunk, ///< Between chunks; next call parses a header
        ActiveChunk,   ///< A chunk still owes output bytes
        Eof,           ///< Input ended cleanly; terminal
        Failed         ///< A fatal error occurred; terminal
    };

    /**
     * @brief Construct a decoder reading from @p source.
     */
    explicit Decoder(ByteSource& source) noexcept : source_(source) {}

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    /**
     * @brief Produce decoded bytes.
     *
     * Writes at most @p len bytes and never more than what remains of the
     * current chunk. A result of zero bytes with Error::Ok for @p len > 0
     * means the stream ended; later calls keep returning zero.
     *
     * On error the decoder enters State::Failed, bytes written to @p buf by
     * this call are not part of the output, and every later call returns
     * the same error.
     *
     * @param buf Output buffer
     * @param len Capacity of @p buf
     * @param[out] produced Number of decoded bytes written
     * @return Error::Ok, Error::TruncatedInput, Error::InvalidOffset,
     *         or an error from the source
     */
    Error produce(std::uint8_t* buf, std::size_t len, std::size_t& produced) noexcept;

    /**
     * @brief ByteSource interface; same as produce().
     */
    Error read(std::uint8_t* dst, std::size_t max, std::size_t& count) noexcept override {
        return produce(dst, max, count);
    }

    [[nodiscard]] State state() const noexcept {
        return state_;
    }

    [[nodiscard]] bool at_eof() const noexcept {
        return state_ == State::Eof;
    }

    /**
     * @brief Error that poisoned the decoder, Error::Ok if none.
     */
    [[nodiscard]] Error failure() const noexcept {
        return failure_;
    }

    /**
     * @brief Total decoded bytes delivered so far.
     */
    [[nodiscard]] std::uint64_t total_produced() const noexcept {
        return total_;
    }

    /**
     * @brief Output bytes the active chunk still owes (0 between chunks).
     */
    [[nodiscard]] std::size_t chunk_remaining() const noexcept {
        return state_ == State::ActiveChunk ? chunk_.size : 0;
    }

    [[nodiscard]] const SlidingWindow& window() const noexcept {
        return window_;
    }

private:
    Error copy_literal(std::uint8_t* buf, std::size_t n) noexcept;
    Error copy_run(std::uint8_t* buf, std::size_t n) noexcept;
    Error fail(Error error) noexcept;

    ByteSource& source_;
    SlidingWindow window_;
    Chunk chunk_;
    State state_ = State::NoActiveChunk;
    Error failure_ = Error::Ok;
    std::uint64_t total_ = 0;
};

} // namespace adc

#endif // ADC_DECODER_HPP
