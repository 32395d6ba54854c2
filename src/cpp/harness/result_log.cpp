#include "result_log.h"

#include <algorithm>

namespace taskprobe {
namespace harness {

const char* outcome_label(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::PASS: return "PASS";
        case Outcome::FAIL: return "FAIL";
        case Outcome::SKIP: return "SKIP";
    }
    return "????";
}

const TestResult& ResultLog::append(TestResult result) {
    entries_.push_back(std::move(result));
    return entries_.back();
}

size_t ResultLog::count(Outcome outcome) const noexcept {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [outcome](const TestResult& r) { return r.outcome == outcome; }));
}

bool ResultLog::all_passed() const noexcept {
    return std::all_of(entries_.begin(), entries_.end(),
        [](const TestResult& r) { return r.passed(); });
}

} // namespace harness
} // namespace taskprobe
