#pragma once

#include "test_case.h"
#include "test_runner.h"
#include "report_renderer.h"
#include "../http/http_client.h"
#include "../http/json_parser.h"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace taskprobe {
namespace harness {

/**
 * Identifiers captured during the create phase.
 *
 * Slot A (primary) is used by the GET and UPDATE checks, slot B (secondary)
 * by the DELETE checks. Only the two capturing create cases write them.
 */
struct ScenarioContext {
    std::optional<int64_t> primary_task_id;
    std::optional<int64_t> secondary_task_id;

    bool ready() const noexcept {
        return primary_task_id.has_value() && secondary_task_id.has_value();
    }
};

/**
 * Sends one request and reports its status. No body decoding.
 */
class RequestAction : public HttpAction {
public:
    RequestAction(http::HttpTransport& transport, http::ClientRequest request);

    core::result<ActionOutcome> perform() const override;

private:
    http::HttpTransport& transport_;
    http::ClientRequest request_;
};

/**
 * POST /tasks and capture the new task's id into a context slot.
 *
 * The slot is written only for a 201 response whose body carries a
 * positive integer `id`. A 201 without one is a decode failure.
 */
class CreateTaskAction : public HttpAction {
public:
    CreateTaskAction(http::HttpTransport& transport,
                     http::JsonParser& parser,
                     std::string body,
                     std::optional<int64_t>* slot);

    core::result<ActionOutcome> perform() const override;

private:
    http::HttpTransport& transport_;
    http::JsonParser& parser_;
    http::ClientRequest request_;
    std::optional<int64_t>* slot_;
};

/**
 * The five create checks, in execution order. Cases a and b capture into
 * the context's primary and secondary slots.
 */
std::vector<TestCase> build_create_cases(http::HttpTransport& transport,
                                         http::JsonParser& parser,
                                         ScenarioContext& context);

/**
 * The thirteen checks that need both identifiers (LIST, GET, UPDATE,
 * DELETE), in execution order. Paths of missing identifiers show a
 * placeholder, which only matters when the cases are recorded as skipped.
 */
std::vector<TestCase> build_dependent_cases(http::HttpTransport& transport,
                                            const ScenarioContext& context);

/**
 * What one suite run amounted to.
 */
struct SuiteReport {
    enum class Status : uint8_t {
        PASSED,
        FAILED,
        ENVIRONMENT_ERROR
    };

    Status status{Status::FAILED};
    bool dependency_failed{false};
    size_t unexecuted_dependents{0};
    std::string diagnostic;

    /**
     * 0 only for PASSED; every other status is 1.
     */
    int exit_code() const noexcept {
        return status == Status::PASSED ? 0 : 1;
    }
};

const char* suite_status_name(SuiteReport::Status status) noexcept;

/**
 * Runs the fixed task scenario against one service and prints the report.
 *
 * Sequence: banner, reachability probe, create phase, dependent phase
 * (only when both identifiers were captured), final report. Everything
 * user-facing goes to `out`; the probe failure diagnostic goes to `err`.
 *
 * A TaskSuite runs once.
 */
class TaskSuite {
public:
    struct Config {
        std::string base_url = "http://localhost:8080";
        bool verbose = false;
        bool record_skipped_dependents = false;
        TableStyle table_style = TableStyle::PLAIN;
    };

    /**
     * @param config Suite options
     * @param transport Transport for the scenario requests
     * @param probe Transport for the reachability probe (shorter timeout)
     * @param out Report and trace stream
     * @param err Diagnostic stream for environment failures
     */
    TaskSuite(Config config,
              http::HttpTransport& transport,
              http::HttpTransport& probe,
              std::ostream& out,
              std::ostream& err);

    TaskSuite(const TaskSuite&) = delete;
    TaskSuite& operator=(const TaskSuite&) = delete;

    SuiteReport run();

    const ResultLog& log() const noexcept { return runner_.log(); }

    const ScenarioContext& context() const noexcept { return context_; }

    static constexpr const char* SKIP_REASON = "Skipped: task creation did not yield identifiers";

private:
    void print_banner();
    core::result<void> probe_service();

    Config config_;
    http::HttpTransport& transport_;
    http::HttpTransport& probe_;
    std::ostream& out_;
    std::ostream& err_;
    http::JsonParser parser_;
    ScenarioContext context_;
    TestRunner runner_;
};

} // namespace harness
} // namespace taskprobe
