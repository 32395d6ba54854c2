#pragma once

#include <cstdio>
#include <cstdint>
#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

/**
 * Diagnostic logging for taskprobe.
 *
 * Log lines are operator diagnostics (connection attempts, parser errors,
 * configuration problems). They go to stderr by default and never mix with
 * the report written to stdout.
 *
 * Usage:
 *   LOG_DEBUG("HTTP", "GET %s -> %d", path.c_str(), status);
 *   LOG_INFO("Suite", "Probing %s", base_url.c_str());
 *   LOG_WARN("Config", "Ignoring invalid TASKPROBE_TIMEOUT_MS=%s", value);
 *   LOG_ERROR("Net", "connect() failed: %s", strerror(errno));
 *
 * Build-time control:
 *   Define TASKPROBE_ENABLE_LOGGING to enable logging.
 *   If undefined, all LOG_* macros compile to nothing.
 */

namespace taskprobe {
namespace core {

enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    NONE = 255
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "none" (case-insensitive).
 *
 * @return true and sets out on success, false for anything else
 */
bool parse_log_level(std::string_view text, LogLevel& out) noexcept;

/**
 * Process-wide logger.
 */
class Logger {
public:
    static Logger& instance() noexcept {
        static Logger logger;
        return logger;
    }

    /**
     * Log a message (called by macros, not meant for direct use)
     *
     * @param level Log level
     * @param tag Subsystem tag (e.g., "HTTP", "Suite")
     * @param file Source file name
     * @param line Source line number
     * @param fmt Printf-style format string
     */
    void log(LogLevel level, const char* tag, const char* file, int line,
             const char* fmt, ...) noexcept __attribute__((format(printf, 6, 7)));

    void set_level(LogLevel level) noexcept {
        min_level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    LogLevel get_level() const noexcept {
        return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
    }

    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<uint8_t>(level) >= min_level_.load(std::memory_order_relaxed);
    }

    /**
     * Enable/disable a specific tag. Tags not mentioned are enabled.
     */
    void set_tag_enabled(const char* tag, bool enabled);

    bool is_tag_enabled(const char* tag) const;

    /**
     * Append log output to a file instead of stderr.
     *
     * @param path File path (nullptr reverts to stderr)
     * @return true on success, false if the file could not be opened
     */
    bool set_output_file(const char* path) noexcept;

    /**
     * Redirect output to an already-open stream the logger does not own.
     * Used by tests to capture log lines with tmpfile().
     */
    void set_output_stream(FILE* stream) noexcept;

    void close_output_file() noexcept;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

private:
    Logger() noexcept = default;
    ~Logger() noexcept;

    std::atomic<uint8_t> min_level_{static_cast<uint8_t>(LogLevel::WARN)};
    mutable std::mutex mutex_;
    FILE* output_file_{stderr};
    bool owns_file_{false};
    std::unordered_map<std::string, bool> tag_filters_;

    static const char* level_to_string(LogLevel level) noexcept;
    static void format_timestamp(char* buf, size_t size) noexcept;
    void release_output_locked() noexcept;
};

} // namespace core
} // namespace taskprobe

// ============================================================================
// Logging Macros
// ============================================================================

#ifdef TASKPROBE_ENABLE_LOGGING

#define LOG_DEBUG(tag, fmt, ...) \
    ::taskprobe::core::Logger::instance().log( \
        ::taskprobe::core::LogLevel::DEBUG, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_INFO(tag, fmt, ...) \
    ::taskprobe::core::Logger::instance().log( \
        ::taskprobe::core::LogLevel::INFO, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_WARN(tag, fmt, ...) \
    ::taskprobe::core::Logger::instance().log( \
        ::taskprobe::core::LogLevel::WARN, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_ERROR(tag, fmt, ...) \
    ::taskprobe::core::Logger::instance().log( \
        ::taskprobe::core::LogLevel::ERROR, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#else

#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#define LOG_INFO(tag, fmt, ...)  ((void)0)
#define LOG_WARN(tag, fmt, ...)  ((void)0)
#define LOG_ERROR(tag, fmt, ...) ((void)0)

#endif // TASKPROBE_ENABLE_LOGGING
