#pragma once

#include <cstdint>
#include <string>

namespace taskprobe {
namespace harness {

enum class Outcome : uint8_t {
    PASS,
    FAIL,
    SKIP
};

/**
 * "PASS", "FAIL" or "SKIP"
 */
const char* outcome_label(Outcome outcome) noexcept;

/**
 * Outcome of executing one test case.
 *
 * actual_status is 0 when no response was received. error_detail is empty
 * for PASS.
 */
struct TestResult {
    std::string category;
    std::string name;
    std::string method;
    std::string path;
    int actual_status{0};
    int expected_status{0};
    Outcome outcome{Outcome::FAIL};
    double duration_ms{0.0};
    std::string error_detail;

    bool passed() const noexcept { return outcome == Outcome::PASS; }
};

} // namespace harness
} // namespace taskprobe
