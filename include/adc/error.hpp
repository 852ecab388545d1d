/**
 * @file error.hpp
 * @brief ADC error handling.
 *
 * Provides both exception-based and error-code-based error handling
 * for embedded compatibility (-fno-exceptions).
 */

#ifndef ADC_ERROR_HPP
#define ADC_ERROR_HPP

#include "config.hpp"

#if !ADC_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace adc {

/**
 * @brief Error codes returned by every decoding operation.
 *
 * Clean end of stream is not an error: it is reported as Error::Ok with
 * zero bytes produced.
 */
enum class Error {
    Ok = 0,              ///< Success
    InvalidArg = -1,     ///< Invalid argument
    Overflow = -2,       ///< Decoded data does not fit the output buffer
    TruncatedInput = -3, ///< Input ended inside a chunk header or literal payload
    InvalidOffset = -4,  ///< Back-reference points before the start of the output
    BufferTooSmall = -5, ///< Stream ended before the requested length was produced
    Io = -6              ///< Byte source read failure
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Output buffer overflow";
    case Error::TruncatedInput:
        return "Truncated input";
    case Error::InvalidOffset:
        return "Invalid back-reference offset";
    case Error::BufferTooSmall:
        return "Stream ended before buffer was filled";
    case Error::Io:
        return "I/O error";
    default:
        return "Unknown error";
    }
}

/**
 * @brief True for errors that mean the compressed data itself is corrupt.
 */
inline bool is_corruption(Error error) noexcept {
    return error == Error::TruncatedInput || error == Error::InvalidOffset;
}

#if !ADC_NO_EXCEPTIONS

/**
 * @brief Base exception for ADC errors.
 */
class AdcException : public std::runtime_error {
public:
    explicit AdcException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public AdcException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : AdcException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for output buffer overflow.
 */
class OverflowException : public AdcException {
public:
    explicit OverflowException(const std::string& message)
        : AdcException(message, Error::Overflow) {}
};

/**
 * @brief Exception for input that ends inside a chunk.
 */
class TruncatedInputException : public AdcException {
public:
    explicit TruncatedInputException(const std::string& message)
        : AdcException(message, Error::TruncatedInput) {}
};

/**
 * @brief Exception for back-references without history.
 */
class InvalidOffsetException : public AdcException {
public:
    explicit InvalidOffsetException(const std::string& message)
        : AdcException(message, Error::InvalidOffset) {}
};

/**
 * @brief Exception for a stream shorter than the requested output.
 */
class BufferTooSmallException : public AdcException {
public:
    explicit BufferTooSmallException(const std::string& message)
        : AdcException(message, Error::BufferTooSmall) {}
};

/**
 * @brief Exception for byte source failures.
 */
class IoException : public AdcException {
public:
    explicit IoException(const std::string& message) : AdcException(message, Error::Io) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code to check
 * @param context Prefix for the exception message
 */
inline void throw_if_error(Error error, const std::string& context) {
    if (error == Error::Ok) {
        return;
    }

    std::string message = context + ": " + error_string(error);
    switch (error) {
    case Error::Overflow:
        throw OverflowException(message);
    case Error::TruncatedInput:
        throw TruncatedInputException(message);
    case Error::InvalidOffset:
        throw InvalidOffsetException(message);
    case Error::BufferTooSmall:
        throw BufferTooSmallException(message);
    case Error::Io:
        throw IoException(message);
    default:
        throw InvalidArgumentException(message);
    }
}

#endif // !ADC_NO_EXCEPTIONS

} // namespace adc

#endif // ADC_ERROR_HPP
