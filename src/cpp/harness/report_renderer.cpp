#include "report_renderer.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace taskprobe {
namespace harness {

using core::error_code;
using core::result;

// ============================================================================
// Statistics
// ============================================================================

result<SuiteStatistics> compute_statistics(const ResultLog& log) {
    if (log.empty()) {
        return {error_code::empty_log, "No results to summarize"};
    }

    SuiteStatistics stats;
    stats.total = log.size();
    for (const auto& r : log) {
        switch (r.outcome) {
            case Outcome::PASS: stats.passed++; break;
            case Outcome::FAIL: stats.failed++; break;
            case Outcome::SKIP: stats.skipped++; break;
        }
        stats.total_duration_ms += r.duration_ms;
    }

    stats.success_rate = 100.0 * static_cast<double>(stats.passed) / static_cast<double>(stats.total);
    stats.average_duration_ms = stats.total_duration_ms / static_cast<double>(stats.total);
    return stats;
}

// ============================================================================
// Table style selection
// ============================================================================

const char* table_style_name(TableStyle style) noexcept {
    switch (style) {
        case TableStyle::GRID:  return "grid";
        case TableStyle::PLAIN: return "plain";
    }
    return "unknown";
}

bool parse_table_style(std::string_view text, TableStyle& out) noexcept {
    auto eq_ci = [](std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != b[i]) {
                return false;
            }
        }
        return true;
    };

    if (eq_ci(text, "grid")) {
        out = TableStyle::GRID;
        return true;
    }
    if (eq_ci(text, "plain")) {
        out = TableStyle::PLAIN;
        return true;
    }
    return false;
}

bool rich_table_available() noexcept {
    if (!isatty(STDOUT_FILENO)) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::strcmp(term, "dumb") != 0;
}

// ============================================================================
// Formatters
// ============================================================================

namespace {

std::vector<size_t> column_widths(const std::vector<Column>& columns,
                                  const std::vector<TableRow>& rows) {
    std::vector<size_t> widths(columns.size());
    for (size_t i = 0; i < columns.size(); ++i) {
        widths[i] = columns[i].title.size();
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < columns.size() && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    return widths;
}

const std::string& cell_at(const TableRow& row, size_t i) {
    static const std::string empty;
    return i < row.size() ? row[i] : empty;
}

void append_padded(std::string& out, const std::string& text, size_t width, Align align) {
    size_t pad = width > text.size() ? width - text.size() : 0;
    if (align == Align::RIGHT) {
        out.append(pad, ' ');
        out += text;
    } else {
        out += text;
        out.append(pad, ' ');
    }
}

void append_grid_rule(std::string& out, const std::vector<size_t>& widths, char fill) {
    out += '+';
    for (size_t w : widths) {
        out.append(w + 2, fill);
        out += '+';
    }
    out += '\n';
}

} // namespace

std::string GridTableFormatter::format(const std::vector<Column>& columns,
                                       const std::vector<TableRow>& rows) const {
    auto widths = column_widths(columns, rows);
    std::string out;

    append_grid_rule(out, widths, '-');

    out += '|';
    for (size_t i = 0; i < columns.size(); ++i) {
        out += ' ';
        append_padded(out, columns[i].title, widths[i], Align::LEFT);
        out += " |";
    }
    out += '\n';

    append_grid_rule(out, widths, '=');

    for (const auto& row : rows) {
        out += '|';
        for (size_t i = 0; i < columns.size(); ++i) {
            out += ' ';
            append_padded(out, cell_at(row, i), widths[i], columns[i].align);
            out += " |";
        }
        out += '\n';
        append_grid_rule(out, widths, '-');
    }

    return out;
}

std::string GridTableFormatter::format_pairs(
        const std::vector<std::pair<std::string, std::string>>& pairs) const {
    size_t name_width = 0;
    size_t value_width = 0;
    for (const auto& [name, value] : pairs) {
        name_width = std::max(name_width, name.size());
        value_width = std::max(value_width, value.size());
    }

    std::string rule(name_width, '-');
    rule += "  ";
    rule.append(value_width, '-');
    rule += '\n';

    std::string out = rule;
    for (const auto& [name, value] : pairs) {
        append_padded(out, name, name_width, Align::LEFT);
        out += "  ";
        out += value;
        out += '\n';
    }
    out += rule;
    return out;
}

std::string PlainTableFormatter::format(const std::vector<Column>& columns,
                                        const std::vector<TableRow>& rows) const {
    auto widths = column_widths(columns, rows);

    auto format_line = [&widths, &columns](auto cell) {
        std::string line;
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) {
                line += " | ";
            }
            append_padded(line, cell(i), widths[i], Align::LEFT);
        }
        return line;
    };

    std::string header = format_line([&columns](size_t i) -> const std::string& {
        return columns[i].title;
    });

    std::string out = header;
    out += '\n';
    out.append(header.size(), '-');
    out += '\n';

    for (const auto& row : rows) {
        out += format_line([&row](size_t i) -> const std::string& {
            return cell_at(row, i);
        });
        out += '\n';
    }
    return out;
}

std::string PlainTableFormatter::format_pairs(
        const std::vector<std::pair<std::string, std::string>>& pairs) const {
    std::string out;
    for (const auto& [name, value] : pairs) {
        out += "  ";
        append_padded(out, name, 20, Align::LEFT);
        out += ' ';
        out += value;
        out += '\n';
    }
    return out;
}

std::unique_ptr<TableFormatter> make_table_formatter(TableStyle style) {
    if (style == TableStyle::GRID) {
        return std::make_unique<GridTableFormatter>();
    }
    return std::make_unique<PlainTableFormatter>();
}

// ============================================================================
// ReportRenderer
// ============================================================================

ReportRenderer::ReportRenderer(TableStyle style)
    : style_(style), formatter_(make_table_formatter(style)) {
}

std::string ReportRenderer::format_fixed(double value, int precision) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return buf;
}

const std::vector<Column>& ReportRenderer::table_columns() {
    static const std::vector<Column> columns = {
        {"#", Align::RIGHT},
        {"Category", Align::LEFT},
        {"Test Name", Align::LEFT},
        {"Method", Align::LEFT},
        {"Endpoint", Align::LEFT},
        {"Status", Align::LEFT},
        {"Code", Align::LEFT},
        {"Time(ms)", Align::RIGHT},
    };
    return columns;
}

std::vector<TableRow> ReportRenderer::table_rows(const ResultLog& log) {
    std::vector<TableRow> rows;
    rows.reserve(log.size());

    size_t index = 1;
    for (const auto& r : log) {
        rows.push_back({
            std::to_string(index++),
            r.category,
            r.name,
            r.method,
            r.path,
            outcome_label(r.outcome),
            std::to_string(r.actual_status) + "/" + std::to_string(r.expected_status),
            format_fixed(r.duration_ms, 2),
        });
    }
    return rows;
}

std::string ReportRenderer::render_table(const ResultLog& log) const {
    return formatter_->format(table_columns(), table_rows(log));
}

std::string ReportRenderer::render_statistics(const SuiteStatistics& stats) const {
    std::vector<std::pair<std::string, std::string>> pairs;
    pairs.emplace_back("Total Tests", std::to_string(stats.total));
    pairs.emplace_back("Passed", std::to_string(stats.passed));
    pairs.emplace_back("Failed", std::to_string(stats.failed));
    if (stats.skipped > 0) {
        pairs.emplace_back("Skipped", std::to_string(stats.skipped));
    }
    pairs.emplace_back("Success Rate", format_fixed(stats.success_rate, 1) + "%");
    pairs.emplace_back("Total Duration", format_fixed(stats.total_duration_ms, 2) + "ms");
    pairs.emplace_back("Average Duration", format_fixed(stats.average_duration_ms, 2) + "ms");
    return formatter_->format_pairs(pairs);
}

std::string ReportRenderer::render_verdict(const ResultLog& log) {
    if (log.all_passed()) {
        return "ALL TESTS PASSED!\n";
    }

    std::string out;
    size_t failed = log.failed_count();
    size_t skipped = log.skipped_count();

    if (failed > 0) {
        out += std::to_string(failed) + " TEST(S) FAILED\n";
    }
    if (skipped > 0) {
        out += std::to_string(skipped) + " TEST(S) SKIPPED\n";
    }

    if (failed > 0) {
        out += "\nFailed tests:\n";
        size_t index = 1;
        for (const auto& r : log) {
            if (r.outcome == Outcome::FAIL) {
                out += "  " + std::to_string(index) + ". " + r.category + " - " + r.name + "\n";
                if (!r.error_detail.empty()) {
                    out += "     Error: " + r.error_detail + "\n";
                }
            }
            ++index;
        }
    }
    return out;
}

std::string ReportRenderer::render(const ResultLog& log) const {
    auto stats = compute_statistics(log);
    if (stats.is_err()) {
        return "No tests were run.\n";
    }

    const std::string rule(RULE_WIDTH, '=');
    std::string out;

    out += "\n" + rule + "\n";
    out += "TEST RESULTS SUMMARY\n";
    out += rule + "\n";
    out += render_table(log);

    out += "\n" + rule + "\n";
    out += "STATISTICS\n";
    out += rule + "\n";
    out += render_statistics(stats.value());
    out += rule + "\n\n";

    out += render_verdict(log);
    return out;
}

std::string ReportRenderer::render_trace(const TestResult& result) {
    const std::string rule(TRACE_RULE_WIDTH, '=');
    std::string out;

    out += "\n" + rule + "\n";
    out += std::string(outcome_label(result.outcome)) + " " + result.category + " - " + result.name + "\n";
    out += "  Method:   " + result.method + " " + result.path + "\n";
    out += "  Expected: " + std::to_string(result.expected_status) +
           ", Got: " + std::to_string(result.actual_status) + "\n";
    if (!result.error_detail.empty()) {
        out += "  Error:    " + result.error_detail + "\n";
    }
    out += "  Duration: " + format_fixed(result.duration_ms, 2) + "ms\n";
    out += rule + "\n";
    return out;
}

} // namespace harness
} // namespace taskprobe
