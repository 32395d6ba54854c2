#pragma once

#include "report_renderer.h"
#include "../core/logger.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace taskprobe {
namespace harness {

/**
 * Run configuration for one suite invocation.
 *
 * Defaults are in-class; from_environment() overrides them from
 * TASKPROBE_* variables. The command line only contributes `verbose`.
 */
struct HarnessConfig {
    std::string base_url = "http://localhost:8080";
    uint32_t request_timeout_ms = 5000;
    uint32_t probe_timeout_ms = 2000;
    bool verbose = false;

    // Unset = decide by rich_table_available()
    std::optional<TableStyle> table_style;

    // Record dependents that could not run as SKIP instead of omitting them
    bool record_skipped_dependents = false;

    // Unset = WARN, or INFO with --verbose
    std::optional<core::LogLevel> log_level;
    std::string log_file;

    /**
     * Variable lookup, std::getenv by default. Returns nullptr when unset.
     */
    using EnvLookup = std::function<const char*(const char*)>;

    /**
     * Build a configuration from the process environment.
     *
     * Invalid values are logged under "Config" and leave the default in
     * place. The base URL is copied as-is; it is validated when the client
     * is built.
     */
    static HarnessConfig from_environment();

    static HarnessConfig from_environment(const EnvLookup& lookup);

    /**
     * The table style to render with (explicit choice, else capability check).
     */
    TableStyle resolved_table_style() const;

    /**
     * The log level to run with (explicit choice, else derived from verbose).
     */
    core::LogLevel resolved_log_level() const noexcept;

    /**
     * Point the process logger at the configured level and sink.
     *
     * @return false if the log file could not be opened (stderr is kept)
     */
    bool apply_logging() const;

    static constexpr uint32_t MAX_TIMEOUT_MS = 600000;
};

/**
 * Parse a millisecond timeout in [1, HarnessConfig::MAX_TIMEOUT_MS].
 */
bool parse_timeout_ms(const std::string& text, uint32_t& out) noexcept;

/**
 * Parse 1/0, true/false, yes/no, on/off (case-insensitive).
 */
bool parse_flag(const std::string& text, bool& out) noexcept;

} // namespace harness
} // namespace taskprobe
