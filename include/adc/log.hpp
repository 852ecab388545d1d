/**
 * @file log.hpp
 * @brief Logging for the ADC library and tools.
 *
 * The library logs through spdlog's default logger. Library code only
 * emits trace and debug messages, so nothing is printed unless the
 * application lowers the log level.
 */

#ifndef ADC_LOG_HPP
#define ADC_LOG_HPP

#include <spdlog/common.h> // IWYU pragma: export
#include <spdlog/spdlog.h> // IWYU pragma: export

namespace adc {

namespace log = spdlog;

} // namespace adc

#endif // ADC_LOG_HPP
