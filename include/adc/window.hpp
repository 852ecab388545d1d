/**
 * @file window.hpp
 * @brief Fixed-capacity history of decoded bytes.
 *
 * The sliding window holds the most recent WINDOW_SIZE output bytes in a
 * ring buffer. Bytes are addressed by back-distance: offset 0 is the byte
 * most recently appended. Memory use is constant regardless of how much
 * output the decoder produces.
 */

#ifndef ADC_WINDOW_HPP
#define ADC_WINDOW_HPP

#include <array>
#include <optional>

#include "config.hpp"

namespace adc {

/**
 * @brief Ring buffer of the last WINDOW_SIZE produced bytes.
 *
 * All storage is statically allocated inside the object.
 */
class SlidingWindow {
public:
    static constexpr std::size_t CAPACITY = WINDOW_SIZE;

    SlidingWindow() noexcept = default;

    /**
     * @brief Append bytes to the history, evicting the oldest ones.
     *
     * When @p len exceeds the capacity only the last CAPACITY bytes of
     * @p data are kept.
     *
     * @param data Bytes in output order (oldest first)
     * @param len Number of bytes
     */
    void extend(const std::uint8_t* data, std::size_t len) noexcept;

    /**
     * @brief Append a single byte.
     */
    void push(std::uint8_t byte) noexcept {
        buffer_[head_] = byte;
        head_ = (head_ + 1U) & MASK;
        if (size_ < CAPACITY) {
            ++size_;
        }
    }

    /**
     * @brief Look up a byte by back-distance.
     *
     * @param offset Distance from the newest byte (0 = newest)
     * @return The byte, or std::nullopt if fewer than offset + 1 bytes are held
     */
    [[nodiscard]] std::optional<std::uint8_t> get(std::size_t offset) const noexcept {
        if (!contains(offset)) {
            return std::nullopt;
        }
        return get_unchecked(offset);
    }

    /**
     * @brief Look up a byte without bounds check.
     *
     * @pre contains(offset)
     */
    [[nodiscard]] std::uint8_t get_unchecked(std::size_t offset) const noexcept {
        return buffer_[(head_ - 1U - offset) & MASK];
    }

    /**
     * @brief Whether a back-distance can be resolved.
     */
    [[nodiscard]] bool contains(std::size_t offset) const noexcept {
        return offset < size_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept {
        return CAPACITY;
    }

    [[nodiscard]] bool empty() const noexcept {
        return size_ == 0;
    }

    /**
     * @brief Forget all history.
     */
    void clear() noexcept {
        head_ = 0;
        size_ = 0;
    }

private:
    static constexpr std::size_t MASK = CAPACITY - 1U;

    std::array<std::uint8_t, CAPACITY> buffer_{};
    std::size_t head_ = 0; // next write position
    std::size_t size_ = 0; // valid bytes, saturates at CAPACITY
};

} // namespace adc

#endif // ADC_WINDOW_HPP
