#include "harness_config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <new>

namespace taskprobe {
namespace harness {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

bool parse_timeout_ms(const std::string& text, uint32_t& out) noexcept {
    uint32_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty()) {
        return false;
    }
    if (value == 0 || value > HarnessConfig::MAX_TIMEOUT_MS) {
        return false;
    }
    out = value;
    return true;
}

bool parse_flag(const std::string& text, bool& out) noexcept {
    std::string lower;
    try {
        lower = lowercase(text);
    } catch (const std::bad_alloc&) {
        return false;
    }

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

HarnessConfig HarnessConfig::from_environment() {
    return from_environment([](const char* name) -> const char* {
        return std::getenv(name);
    });
}

HarnessConfig HarnessConfig::from_environment(const EnvLookup& lookup) {
    HarnessConfig config;

    if (const char* value = lookup("TASKPROBE_BASE_URL"); value && *value) {
        config.base_url = value;
    }

    if (const char* value = lookup("TASKPROBE_TIMEOUT_MS"); value) {
        if (!parse_timeout_ms(value, config.request_timeout_ms)) {
            LOG_WARN("Config", "Ignoring invalid TASKPROBE_TIMEOUT_MS=%s (using %u)",
                     value, config.request_timeout_ms);
        }
    }

    if (const char* value = lookup("TASKPROBE_PROBE_TIMEOUT_MS"); value) {
        if (!parse_timeout_ms(value, config.probe_timeout_ms)) {
            LOG_WARN("Config", "Ignoring invalid TASKPROBE_PROBE_TIMEOUT_MS=%s (using %u)",
                     value, config.probe_timeout_ms);
        }
    }

    if (const char* value = lookup("TASKPROBE_TABLE_STYLE"); value && *value) {
        TableStyle style;
        if (parse_table_style(value, style)) {
            config.table_style = style;
        } else {
            LOG_WARN("Config", "Ignoring invalid TASKPROBE_TABLE_STYLE=%s (expected grid or plain)", value);
        }
    }

    if (const char* value = lookup("TASKPROBE_RECORD_SKIPS"); value) {
        if (!parse_flag(value, config.record_skipped_dependents)) {
            LOG_WARN("Config", "Ignoring invalid TASKPROBE_RECORD_SKIPS=%s", value);
        }
    }

    if (const char* value = lookup("TASKPROBE_LOG_LEVEL"); value && *value) {
        core::LogLevel level;
        if (core::parse_log_level(value, level)) {
            config.log_level = level;
        } else {
            LOG_WARN("Config", "Ignoring invalid TASKPROBE_LOG_LEVEL=%s", value);
        }
    }

    if (const char* value = lookup("TASKPROBE_LOG_FILE"); value) {
        config.log_file = value;
    }

    return config;
}

TableStyle HarnessConfig::resolved_table_style() const {
    if (table_style) {
        return *table_style;
    }
    return rich_table_available() ? TableStyle::GRID : TableStyle::PLAIN;
}

core::LogLevel HarnessConfig::resolved_log_level() const noexcept {
    if (log_level) {
        return *log_level;
    }
    return verbose ? core::LogLevel::INFO : core::LogLevel::WARN;
}

bool HarnessConfig::apply_logging() const {
    auto& logger = core::Logger::instance();
    logger.set_level(resolved_log_level());

    if (log_file.empty()) {
        return true;
    }
    return logger.set_output_file(log_file.c_str());
}

} // namespace harness
} // namespace taskprobe
