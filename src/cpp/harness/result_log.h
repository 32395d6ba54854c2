#pragma once

#include "test_result.h"

#include <cstddef>
#include <vector>

namespace taskprobe {
namespace harness {

/**
 * Append-only record of test results in execution order.
 *
 * Nothing is ever removed, reordered or merged. Readers get const access
 * only; the runner that owns the log is its single writer.
 */
class ResultLog {
public:
    using const_iterator = std::vector<TestResult>::const_iterator;

    ResultLog() = default;

    // Non-copyable, movable
    ResultLog(const ResultLog&) = delete;
    ResultLog& operator=(const ResultLog&) = delete;
    ResultLog(ResultLog&&) noexcept = default;
    ResultLog& operator=(ResultLog&&) noexcept = default;

    /**
     * Append a result and return a reference to the stored copy.
     * The reference stays valid until the next append().
     */
    const TestResult& append(TestResult result);

    const std::vector<TestResult>& entries() const noexcept { return entries_; }

    const TestResult& at(size_t index) const { return entries_.at(index); }

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    size_t count(Outcome outcome) const noexcept;

    size_t passed_count() const noexcept { return count(Outcome::PASS); }
    size_t failed_count() const noexcept { return count(Outcome::FAIL); }
    size_t skipped_count() const noexcept { return count(Outcome::SKIP); }

    /**
     * True when every recorded result is PASS (vacuously true when empty).
     */
    bool all_passed() const noexcept;

private:
    std::vector<TestResult> entries_;
};

} // namespace harness
} // namespace taskprobe
