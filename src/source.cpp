/**
 * @file source.cpp
 * @brief Stream-backed byte source and exact-read helper.
 */

#include <adc/source.hpp>

namespace adc {

Error StreamSource::read(std::uint8_t* dst, std::size_t max, std::size_t& count) noexcept {
    count = 0;
    if (max == 0) {
        return Error::Ok;
    }
    if (dst == nullptr) {
        return Error::InvalidArg;
    }
    if (stream_.bad()) {
        return Error::Io;
    }

    // istream::read sets failbit together with eofbit on a short read; only
    // badbit signals a real failure.
    stream_.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(max));
    std::streamsize got = stream_.gcount();
    if (stream_.bad()) {
        return Error::Io;
    }

    count = static_cast<std::size_t>(got);
    total_ += count;
    return Error::Ok;
}

Error read_exact(ByteSource& source, std::uint8_t* dst, std::size_t len,
                 std::size_t& count) noexcept {
    count = 0;
    while (count < len) {
        std::size_t got = 0;
        Error status = source.read(dst + count, len - count, got);
        if (status != Error::Ok) {
            return status;
        }
        if (got == 0) {
            return Error::TruncatedInput;
        }
        count += got;
    }
    return Error::Ok;
}

} // namespace adc
