/**
 * @file test_decoder.cpp
 * @brief Unit tests for the incremental Decoder.
 */

#include <adc/decoder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace adc;

namespace {

// Plain, two-byte run and three-byte run in one stream
const std::vector<std::uint8_t> ALL_TYPES = {0x83, 0xFE, 0xED, 0xFA, 0xCE,
                                             0x00, 0x00, 0x40, 0x00, 0x06};
const std::vector<std::uint8_t> ALL_TYPES_DECODED = {0xFE, 0xED, 0xFA, 0xCE, 0xCE, 0xCE,
                                                     0xCE, 0xFE, 0xED, 0xFA, 0xCE};

/// Drain a decoder with a fixed block size; stops at end of stream or error
Error drain(Decoder& decoder, std::size_t block_size, std::vector<std::uint8_t>& out) {
    std::vector<std::uint8_t> block(block_size);
    for (;;) {
        std::size_t n = 0;
        Error status = decoder.produce(block.data(), block.size(), n);
        if (status != Error::Ok) {
            return status;
        }
        if (n == 0) {
            return Error::Ok;
        }
        out.insert(out.end(), block.begin(), block.begin() + static_cast<std::ptrdiff_t>(n));
    }
}

} // namespace

TEST_CASE("Decoder decodes all chunk types", "[decoder]") {
    MemorySource source(ALL_TYPES.data(), ALL_TYPES.size());
    Decoder decoder(source);

    std::vector<std::uint8_t> out;
    REQUIRE(drain(decoder, 64, out) == Error::Ok);
    REQUIRE(out == ALL_TYPES_DECODED);
    REQUIRE(decoder.total_produced() == 11);
    REQUIRE(decoder.at_eof());
}

TEST_CASE("Decoder returns at most one chunk per call", "[decoder]") {
    MemorySource source(ALL_TYPES.data(), ALL_TYPES.size());
    Decoder decoder(source);

    std::uint8_t buf[64] = {0};
    std::size_t n = 0;

    REQUIRE(decoder.state() == Decoder::State::NoActiveChunk);

    REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::Ok);
    REQUIRE(n == 4);
    REQUIRE(decoder.state() == Decoder::State::NoActiveChunk);

    REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::Ok);
    REQUIRE(n == 3);

    REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::Ok);
    REQUIRE(n == 4);
    REQUIRE(buf[0] == 0xFE);
    REQUIRE(buf[3] == 0xCE);

    REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::Ok);
    REQUIRE(n == 0);
    REQUIRE(decoder.state() == Decoder::State::Eof);
}

TEST_CASE("Decoder splits chunks across small buffers", "[decoder]") {
    MemorySource source(ALL_TYPES.data(), ALL_TYPES.size());
    Decoder decoder(source);

    SECTION("one byte at a time") {
        std::uint8_t byte = 0;
        std::size_t n = 0;
        REQUIRE(decoder.produce(&byte, 1, n) == Error::Ok);
        REQUIRE(n == 1);
        REQUIRE(byte == 0xFE);
        REQUIRE(decoder.state() == Decoder::State::ActiveChunk);
        REQUIRE(decoder.chunk_remaining() == 3);

        std::vector<std::uint8_t> out{byte};
        REQUIRE(drain(decoder, 1, out) == Error::Ok);
        REQUIRE(out == ALL_TYPES_DECODED);
    }

    SECTION("odd block size") {
        std::vector<std::uint8_t> out;
        REQUIRE(drain(decoder, 3, out) == Error::Ok);
        REQUIRE(out == ALL_TYPES_DECODED);
    }
}

TEST_CASE("Decoder on empty input", "[decoder]") {
    MemorySource source(nullptr, 0);
    Decoder decoder(source);

    std::uint8_t buf[16] = {0};
    std::size_t n = 99;
    REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::Ok);
    REQUIRE(n == 0);
    REQUIRE(decoder.at_eof());
}

TEST_CASE("Decoder end of stream is idempotent", "[decoder]") {
    MemorySource source(ALL_TYPES.data(), ALL_TYPES.size());
    Decoder decoder(source);

    std::vector<std::uint8_t> out;
    REQUIRE(drain(decoder, 64, out) == Error::Ok);

    std::uint8_t buf[16] = {0};
    for (int i = 0; i < 3; ++i) {
        std::size_t n = 99;
        REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::Ok);
        REQUIRE(n == 0);
        REQUIRE(decoder.state() == Decoder::State::Eof);
    }
    REQUIRE(decoder.total_produced() == 11);
}

TEST_CASE("Decoder rejects back-references without history", "[decoder]") {
    std::uint8_t buf[16] = {0};
    std::size_t n = 0;

    SECTION("run as first chunk") {
        std::uint8_t data[] = {0x00, 0x00};
        MemorySource source(data, sizeof(data));
        Decoder decoder(source);
        REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::InvalidOffset);
        REQUIRE(n == 0);
        REQUIRE(decoder.state() == Decoder::State::Failed);
        REQUIRE(decoder.failure() == Error::InvalidOffset);
    }

    SECTION("offset larger than output so far") {
        std::uint8_t data[] = {0x83, 0xFE, 0xED, 0xFA, 0xCE, 0x00, 0xFF};
        MemorySource source(data, sizeof(data));
        Decoder decoder(source);
        REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::Ok);
        REQUIRE(n == 4);
        REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::InvalidOffset);
        REQUIRE(n == 0);
        REQUIRE(decoder.total_produced() == 4);
    }

    SECTION("offset exactly one past the history") {
        // 4 bytes produced: offsets 0-3 valid, 4 is not
        std::uint8_t data[] = {0x83, 1, 2, 3, 4, 0x00, 0x04};
        MemorySource source(data, sizeof(data));
        Decoder decoder(source);
        REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::Ok);
        REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::InvalidOffset);
    }

    SECTION("offset reaching the first byte is valid") {
        std::uint8_t data[] = {0x83, 1, 2, 3, 4, 0x00, 0x03};
        MemorySource source(data, sizeof(data));
        Decoder decoder(source);
        std::vector<std::uint8_t> out;
        REQUIRE(drain(decoder, 16, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{1, 2, 3, 4, 1, 2, 3});
    }
}

TEST_CASE("Decoder reports truncated input", "[decoder]") {
    std::uint8_t buf[16] = {0};
    std::size_t n = 0;

    SECTION("missing second byte of a two-byte run") {
        std::uint8_t data[] = {0x83, 0xFE, 0xED, 0xFA, 0xCE, 0x00};
        MemorySource source(data, sizeof(data));
        Decoder decoder(source);
        REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::Ok);
        REQUIRE(n == 4);
        REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::TruncatedInput);
        REQUIRE_FALSE(decoder.at_eof());
    }

    SECTION("missing offset bytes of a three-byte run") {
        std::uint8_t data[] = {0x83, 0xFE, 0xED, 0xFA, 0xCE, 0x40, 0x00};
        MemorySource source(data, sizeof(data));
        Decoder decoder(source);
        REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::Ok);
        REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::TruncatedInput);
    }

    SECTION("literal payload cut short") {
        std::uint8_t data[] = {0x83, 0xFE, 0xED};
        MemorySource source(data, sizeof(data));
        Decoder decoder(source);
        REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::TruncatedInput);
        REQUIRE(n == 0);
    }

    SECTION("literal payload cut short in a later call") {
        std::uint8_t data[] = {0x83, 0xFE, 0xED};
        MemorySource source(data, sizeof(data));
        Decoder decoder(source);
        REQUIRE(decoder.produce(buf, 2, n) == Error::Ok);
        REQUIRE(n == 2);
        REQUIRE(decoder.produce(buf, 2, n) == Error::TruncatedInput);
    }
}

TEST_CASE("Decoder stays failed after an error", "[decoder]") {
    std::uint8_t data[] = {0x00, 0x00, 0x83, 0xFE, 0xED, 0xFA, 0xCE};
    MemorySource source(data, sizeof(data));
    Decoder decoder(source);

    std::uint8_t buf[16] = {0};
    std::size_t n = 0;
    REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::InvalidOffset);
    std::size_t position = source.position();

    REQUIRE(decoder.produce(buf, sizeof(buf), n) == Error::InvalidOffset);
    REQUIRE(n == 0);
    REQUIRE(source.position() == position);
}

TEST_CASE("Decoder ignores empty requests", "[decoder]") {
    MemorySource source(ALL_TYPES.data(), ALL_TYPES.size());
    Decoder decoder(source);

    std::size_t n = 99;
    REQUIRE(decoder.produce(nullptr, 0, n) == Error::Ok);
    REQUIRE(n == 0);
    REQUIRE(decoder.state() == Decoder::State::NoActiveChunk);
    REQUIRE(source.position() == 0);

    std::vector<std::uint8_t> out;
    REQUIRE(drain(decoder, 64, out) == Error::Ok);
    REQUIRE(out == ALL_TYPES_DECODED);
}

TEST_CASE("Decoder rejects null buffer", "[decoder]") {
    MemorySource source(ALL_TYPES.data(), ALL_TYPES.size());
    Decoder decoder(source);

    std::size_t n = 0;
    REQUIRE(decoder.produce(nullptr, 4, n) == Error::InvalidArg);
    REQUIRE(decoder.state() == Decoder::State::NoActiveChunk);
}

TEST_CASE("Decoder resolves self-overlapping runs", "[decoder]") {
    SECTION("offset 0 repeats the last byte") {
        std::uint8_t data[] = {0x80, 0x41, 0x00, 0x00};
        MemorySource source(data, sizeof(data));
        Decoder decoder(source);
        std::vector<std::uint8_t> out;
        REQUIRE(drain(decoder, 16, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{0x41, 0x41, 0x41, 0x41});
    }

    SECTION("offset 1 repeats a pair") {
        std::uint8_t data[] = {0x81, 0x01, 0x02, 0x08, 0x01};
        MemorySource source(data, sizeof(data));
        Decoder decoder(source);
        std::vector<std::uint8_t> out;
        REQUIRE(drain(decoder, 16, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{1, 2, 1, 2, 1, 2, 1});
    }
}

TEST_CASE("Decoder works over a slow source", "[decoder]") {
    class TrickleSource final : public ByteSource {
    public:
        TrickleSource(const std::uint8_t* data, std::size_t size) : inner_(data, size) {}

        Error read(std::uint8_t* dst, std::size_t max, std::size_t& count) noexcept override {
            return inner_.read(dst, max > 0 ? 1 : 0, count);
        }

    private:
        MemorySource inner_;
    };

    TrickleSource source(ALL_TYPES.data(), ALL_TYPES.size());
    Decoder decoder(source);
    std::vector<std::uint8_t> out;
    REQUIRE(drain(decoder, 64, out) == Error::Ok);
    REQUIRE(out == ALL_TYPES_DECODED);
}

TEST_CASE("Decoder is a byte source", "[decoder]") {
    // The inner stream is a single plain chunk carrying ALL_TYPES
    std::vector<std::uint8_t> nested = {static_cast<std::uint8_t>(0x80U | (ALL_TYPES.size() - 1U))};
    nested.insert(nested.end(), ALL_TYPES.begin(), ALL_TYPES.end());

    MemorySource source(nested.data(), nested.size());
    Decoder inner(source);
    ByteSource& inner_source = inner;
    Decoder outer(inner_source);

    std::vector<std::uint8_t> out;
    REQUIRE(drain(outer, 5, out) == Error::Ok);
    REQUIRE(out == ALL_TYPES_DECODED);
    REQUIRE(inner.at_eof());
}

TEST_CASE("Decoder window tracks output", "[decoder]") {
    MemorySource source(ALL_TYPES.data(), ALL_TYPES.size());
    Decoder decoder(source);

    std::vector<std::uint8_t> out;
    REQUIRE(drain(decoder, 64, out) == Error::Ok);
    REQUIRE(decoder.window().size() == 11);
    REQUIRE(decoder.window().get(0) == std::optional<std::uint8_t>(0xCE));
    REQUIRE(decoder.window().get(10) == std::optional<std::uint8_t>(0xFE));
}
