#pragma once

#include "bundl/core/types.hpp"

namespace bundl::core {

    enum class LogLevel : u8 {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4,
    };

    // Process-wide threshold, Info by default. Lines below it are dropped.
    void log_set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;

    // printf-style, one line per call on stderr, prefixed "error: ", "warn: ",
    // "info: " or "debug: ". Safe to call from several threads.
    void log_error(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_warn(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_info(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_debug(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));

} // namespace bundl::core
