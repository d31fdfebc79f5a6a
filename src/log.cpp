/**
 * @file log.cpp
 * @brief Diagnostic logging implementation.
 */

#include <wirebin/log.hpp>

#include <atomic>
#include <cstdarg>

namespace {

std::atomic<std::FILE*> g_sink{nullptr};
std::atomic<bool> g_trace{WIREBIN_TRACE != 0};

void vprint(const char* prefix, const char* fmt, va_list args) {
    std::FILE* f = g_sink.load(std::memory_order_relaxed);
    if (f == nullptr) {
        f = stderr;
    }
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}

} // namespace

namespace wirebin::log {

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint("[TRACE] ", fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint("", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint("[ERROR] ", fmt, args);
    va_end(args);
}

void set_sink(std::FILE* sink) noexcept {
    g_sink.store(sink, std::memory_order_relaxed);
}

void set_trace_enabled(bool enabled) noexcept {
    g_trace.store(enabled, std::memory_order_relaxed);
}

bool trace_enabled() noexcept {
    return g_trace.load(std::memory_order_relaxed);
}

} // namespace wirebin::log
