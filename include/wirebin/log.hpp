/**
 * @file log.hpp
 * @brief Diagnostic logging.
 *
 * printf-style logging to a configurable sink (stderr by default).
 * Trace output for individual reads and engine steps is gated by a
 * runtime switch so that disabled tracing costs a single branch.
 */

#ifndef WIREBIN_LOG_HPP
#define WIREBIN_LOG_HPP

#include "config.hpp"

#include <cstdio>

namespace wirebin::log {

void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void error(const char* fmt, ...);

/// Redirect all output; nullptr restores stderr
void set_sink(std::FILE* sink) noexcept;

void set_trace_enabled(bool enabled) noexcept;
[[nodiscard]] bool trace_enabled() noexcept;

} // namespace wirebin::log

#define WIREBIN_LOG_TRACE(fmt, ...)                                                                \
    do {                                                                                           \
        if (::wirebin::log::trace_enabled()) {                                                     \
            ::wirebin::log::debug(fmt, ##__VA_ARGS__);                                             \
        }                                                                                          \
    } while (0)
#define WIREBIN_LOG_INFO(fmt, ...) ::wirebin::log::info(fmt, ##__VA_ARGS__)
#define WIREBIN_LOG_ERROR(fmt, ...) ::wirebin::log::error(fmt, ##__VA_ARGS__)

#endif // WIREBIN_LOG_HPP
