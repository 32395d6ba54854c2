#pragma once

#include "result_log.h"
#include "../core/result.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace taskprobe {
namespace harness {

/**
 * Aggregate numbers for one result log.
 */
struct SuiteStatistics {
    size_t total{0};
    size_t passed{0};
    size_t failed{0};
    size_t skipped{0};
    double success_rate{0.0};          // percent, 100 * passed / total
    double total_duration_ms{0.0};
    double average_duration_ms{0.0};
};

/**
 * Compute statistics for a log.
 *
 * @return empty_log for a log without results; the rates are undefined then
 */
core::result<SuiteStatistics> compute_statistics(const ResultLog& log);

enum class TableStyle : uint8_t {
    GRID,   // bordered, one rule per row
    PLAIN   // space padded columns joined by " | "
};

const char* table_style_name(TableStyle style) noexcept;

/**
 * Parse "grid" or "plain" (case-insensitive).
 */
bool parse_table_style(std::string_view text, TableStyle& out) noexcept;

/**
 * Whether the bordered grid can be shown: standard output is a terminal
 * that is not TERM=dumb. Checked once at startup.
 */
bool rich_table_available() noexcept;

enum class Align : uint8_t {
    LEFT,
    RIGHT
};

struct Column {
    std::string title;
    Align align{Align::LEFT};
};

using TableRow = std::vector<std::string>;

/**
 * Table layout strategy. Both implementations take the same input; widths
 * are the maximum cell length per column over header and rows.
 */
class TableFormatter {
public:
    virtual ~TableFormatter() = default;

    virtual std::string format(const std::vector<Column>& columns,
                               const std::vector<TableRow>& rows) const = 0;

    /**
     * Two-column name/value block for summary numbers.
     */
    virtual std::string format_pairs(const std::vector<std::pair<std::string, std::string>>& pairs) const = 0;
};

/**
 * +-----+----------+
 * | #   | Category |
 * +=====+==========+
 * |   1 | CREATE   |
 * +-----+----------+
 */
class GridTableFormatter : public TableFormatter {
public:
    std::string format(const std::vector<Column>& columns,
                       const std::vector<TableRow>& rows) const override;

    std::string format_pairs(const std::vector<std::pair<std::string, std::string>>& pairs) const override;
};

/**
 * # | Category | ...
 * ------------------
 * 1 | CREATE   | ...
 *
 * Every cell is left-justified regardless of the column's alignment.
 */
class PlainTableFormatter : public TableFormatter {
public:
    std::string format(const std::vector<Column>& columns,
                       const std::vector<TableRow>& rows) const override;

    std::string format_pairs(const std::vector<std::pair<std::string, std::string>>& pairs) const override;
};

std::unique_ptr<TableFormatter> make_table_formatter(TableStyle style);

/**
 * Formats a finished result log as the final report, and single results as
 * live trace blocks.
 *
 * Rendering reads the log only; the same log always renders to the same text.
 */
class ReportRenderer {
public:
    explicit ReportRenderer(TableStyle style);

    TableStyle style() const noexcept { return style_; }

    /**
     * Summary banner, results table, statistics and the failure list.
     */
    std::string render(const ResultLog& log) const;

    std::string render_table(const ResultLog& log) const;

    std::string render_statistics(const SuiteStatistics& stats) const;

    /**
     * "ALL TESTS PASSED!" or the failure count and the list of FAIL entries.
     */
    static std::string render_verdict(const ResultLog& log);

    /**
     * Verbose trace block for one result.
     */
    static std::string render_trace(const TestResult& result);

    static const std::vector<Column>& table_columns();

    static std::vector<TableRow> table_rows(const ResultLog& log);

    /**
     * printf("%.{precision}f")
     */
    static std::string format_fixed(double value, int precision);

    static constexpr size_t RULE_WIDTH = 120;
    static constexpr size_t TRACE_RULE_WIDTH = 70;

private:
    TableStyle style_;
    std::unique_ptr<TableFormatter> formatter_;
};

} // namespace harness
} // namespace taskprobe
