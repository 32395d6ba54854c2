#include "logger.h"
#include <cstdarg>
#include <cstring>
#include <cctype>
#include <chrono>
#include <ctime>
#include <new>

namespace taskprobe {
namespace core {

bool parse_log_level(std::string_view text, LogLevel& out) noexcept {
    char buf[16];
    if (text.empty() || text.size() >= sizeof(buf)) {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        buf[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
    }
    std::string_view lower(buf, text.size());

    if (lower == "debug") {
        out = LogLevel::DEBUG;
    } else if (lower == "info") {
        out = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        out = LogLevel::WARN;
    } else if (lower == "error") {
        out = LogLevel::ERROR;
    } else if (lower == "none" || lower == "off") {
        out = LogLevel::NONE;
    } else {
        return false;
    }
    return true;
}

Logger::~Logger() noexcept {
    close_output_file();
}

const char* Logger::level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default:              return "?????";
    }
}

void Logger::format_timestamp(char* buf, size_t size) noexcept {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    struct tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<int>(ms.count()));
}

void Logger::log(LogLevel level, const char* tag, const char* file, int line,
                 const char* fmt, ...) noexcept {
    if (level == LogLevel::NONE || !is_enabled(level)) {
        return;
    }

    char message_buf[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message_buf, sizeof(message_buf), fmt, args);
    va_end(args);

    char timestamp_buf[32];
    format_timestamp(timestamp_buf, sizeof(timestamp_buf));

    const char* filename = strrchr(file, '/');
    filename = filename ? filename + 1 : file;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!tag_filters_.empty()) {
        try {
            auto it = tag_filters_.find(tag);
            if (it != tag_filters_.end() && !it->second) {
                return;
            }
        } catch (const std::bad_alloc&) {
            // Building the lookup key failed; log the line unfiltered.
        }
    }

    fprintf(output_file_, "%s [%s] [%s] %s (%s:%d)\n",
            timestamp_buf,
            level_to_string(level),
            tag,
            message_buf,
            filename,
            line);
    fflush(output_file_);
}

void Logger::set_tag_enabled(const char* tag, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    tag_filters_[tag] = enabled;
}

bool Logger::is_tag_enabled(const char* tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tag_filters_.find(tag);
    return it == tag_filters_.end() || it->second;
}

bool Logger::set_output_file(const char* path) noexcept {
    if (!path) {
        close_output_file();
        return true;
    }

    FILE* new_file = fopen(path, "a");
    if (!new_file) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    release_output_locked();
    output_file_ = new_file;
    owns_file_ = true;
    return true;
}

void Logger::set_output_stream(FILE* stream) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    release_output_locked();
    output_file_ = stream ? stream : stderr;
    owns_file_ = false;
}

void Logger::close_output_file() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    release_output_locked();
    output_file_ = stderr;
}

void Logger::release_output_locked() noexcept {
    if (owns_file_ && output_file_ != stderr) {
        fclose(output_file_);
    }
    owns_file_ = false;
}

} // namespace core
} // namespace taskprobe
