/**
 * @file window.cpp
 * @brief Sliding window bulk append.
 */

#include <adc/window.hpp>

#include <cstring>

namespace adc {

void SlidingWindow::extend(const std::uint8_t* data, std::size_t len) noexcept {
    if (len == 0) {
        return;
    }

    // Older bytes of an oversized block would be evicted immediately
    if (len > CAPACITY) {
        data += len - CAPACITY;
        len = CAPACITY;
    }

    // At most two copies: up to the end of the ring, then from its start
    std::size_t first = CAPACITY - head_;
    if (first > len) {
        first = len;
    }
    std::memcpy(buffer_.data() + head_, data, first);
    if (len > first) {
        std::memcpy(buffer_.data(), data + first, len - first);
    }

    head_ = (head_ + len) & MASK;
    size_ = (size_ + len > CAPACITY) ? CAPACITY : size_ + len;
}

} // namespace adc
