/**
 * @file decoder.cpp
 * @brief Incremental ADC decoder.
 */

#include <adc/decoder.hpp>
#include <adc/log.hpp>

namespace adc {

Error Decoder::produce(std::uint8_t* buf, std::size_t len, std::size_t& produced) noexcept {
    produced = 0;

    switch (state_) {
    case State::Eof:
        return Error::Ok;
    case State::Failed:
        return failure_;
    default:
        break;
    }

    // An empty request must not consume a header: a zero result would be
    // mistaken for end of stream
    if (len == 0) {
        return Error::Ok;
    }
    if (buf == nullptr) {
        return Error::InvalidArg;
    }

    if (state_ == State::NoActiveChunk) {
        std::optional<Chunk> next;
        Error status = parse_chunk(source_, next);
        if (status != Error::Ok) {
            return fail(status);
        }
        if (!next) {
            state_ = State::Eof;
            log::trace("end of stream after {} bytes", total_);
            return Error::Ok;
        }
        chunk_ = *next;
        state_ = State::ActiveChunk;
    }

    std::size_t n = (chunk_.size < len) ? chunk_.size : len;

    Error status = chunk_.is_run() ? copy_run(buf, n) : copy_literal(buf, n);
    if (status != Error::Ok) {
        return fail(status);
    }

    chunk_.size -= n;
    if (chunk_.size == 0) {
        state_ = State::NoActiveChunk;
    }

    total_ += n;
    produced = n;
    return Error::Ok;
}

Error Decoder::copy_literal(std::uint8_t* buf, std::size_t n) noexcept {
    std::size_t count = 0;
    Error status = read_exact(source_, buf, n, count);
    if (status != Error::Ok) {
        return status;
    }
    window_.extend(buf, n);
    return Error::Ok;
}

Error Decoder::copy_run(std::uint8_t* buf, std::size_t n) noexcept {
    // History only grows while copying, so checking the first byte covers
    // the whole run
    if (!window_.contains(chunk_.offset)) {
        log::debug("{} at output byte {}: offset {} exceeds {} bytes of history",
                   chunk_type_name(chunk_.type), total_, chunk_.offset, window_.size());
        return Error::InvalidOffset;
    }

    // Push each byte before reading the next: overlapping runs read what
    // they just wrote
    for (std::size_t i = 0; i < n; ++i) {
        std::uint8_t byte = window_.get_unchecked(chunk_.offset);
        buf[i] = byte;
        window_.push(byte);
    }
    return Error::Ok;
}

Error Decoder::fail(Error error) noexcept {
    log::debug("decode failed at output byte {}: {}", total_, error_string(error));
    state_ = State::Failed;
    failure_ = error;
    return error;
}

} // namespace adc
