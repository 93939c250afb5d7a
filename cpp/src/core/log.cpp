#include "bundl/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace bundl::core {
    namespace {
        std::atomic<LogLevel> g_level{LogLevel::Info};
        std::mutex g_log_mutex;

        void log_v(LogLevel level, const char* prefix, const char* fmt, va_list args) noexcept {
            if (static_cast<u8>(level) < static_cast<u8>(g_level.load(std::memory_order_relaxed))) {
                return;
            }
            if (fmt == nullptr) {
                return;
            }

            char line[1024];
            const int n = std::vsnprintf(line, sizeof(line), fmt, args);
            if (n < 0) {
                return;
            }

            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::fprintf(stderr, "%s: %s\n", prefix, line);
        }
    } // namespace

    void log_set_level(LogLevel level) noexcept {
        g_level.store(level, std::memory_order_relaxed);
    }

    LogLevel log_level() noexcept {
        return g_level.load(std::memory_order_relaxed);
    }

    void log_error(const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_v(LogLevel::Error, "error", fmt, args);
        va_end(args);
    }

    void log_warn(const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_v(LogLevel::Warn, "warn", fmt, args);
        va_end(args);
    }

    void log_info(const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_v(LogLevel::Info, "info", fmt, args);
        va_end(args);
    }

    void log_debug(const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_v(LogLevel::Debug, "debug", fmt, args);
        va_end(args);
    }

} // namespace bundl::core
