/**
 * @file cli_args.hpp
 * @brief Command line argument helpers for adc-decode.
 */

#ifndef ADC_CLI_ARGS_HPP
#define ADC_CLI_ARGS_HPP

#include <cerrno>
#include <cstddef>
#include <cstdlib>

namespace adc {
namespace cli {

/**
 * @brief Parse a non-negative decimal byte count.
 *
 * Rejects empty text, signs, trailing characters and values that do not
 * fit in a size_t.
 */
inline bool parse_size(const char* text, std::size_t& value) {
    if (text == nullptr || text[0] < '0' || text[0] > '9') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) {
        return false;
    }
    auto narrowed = static_cast<std::size_t>(parsed);
    if (narrowed != parsed) {
        return false;
    }
    value = narrowed;
    return true;
}

} // namespace cli
} // namespace adc

#endif // ADC_CLI_ARGS_HPP
