#pragma once

#include <cstdlib>
#include <format>
#include <string>

#include <spdlog/spdlog.h>

namespace SnAPI::StateSync::detail
{
/**
 * @brief Handler for failed debug assertions.
 * @remarks Reports through spdlog's default logger, flushes, then aborts.
 * Only reached from DEBUG_ASSERT in debug builds; runtime failures are
 * reported through TExpected instead.
 */
[[noreturn]] inline void DebugAssertFail(const char* File, int Line, const char* Condition, const std::string& Message)
{
    spdlog::critical("DEBUG_ASSERT failed: {} ({}:{}) {}", Condition, File, Line, Message);
    spdlog::default_logger()->flush();
    std::abort();
}
} // namespace SnAPI::StateSync::detail

#ifndef NDEBUG
/**
 * @brief Debug-only assertion with a std::format message.
 * @note Compiled out when NDEBUG is defined.
 */
    #define DEBUG_ASSERT(condition, fmt, ...) \
        do { \
            if (!(condition)) { \
                ::SnAPI::StateSync::detail::DebugAssertFail( \
                    __FILE__, __LINE__, #condition, std::format((fmt) __VA_OPT__(,) __VA_ARGS__)); \
            } \
        } while (0)
#else
    #define DEBUG_ASSERT(condition, fmt, ...) do { (void)sizeof(condition); } while (0)
#endif
