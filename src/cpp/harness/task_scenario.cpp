#include "task_scenario.h"
#include "../core/logger.h"

#include <iterator>
#include <memory>
#include <ostream>
#include <utility>

namespace taskprobe {
namespace harness {

using core::error_code;
using core::result;

// ============================================================================
// Actions
// ============================================================================

RequestAction::RequestAction(http::HttpTransport& transport, http::ClientRequest request)
    : transport_(transport), request_(std::move(request)) {
}

result<ActionOutcome> RequestAction::perform() const {
    auto response = transport_.send(request_);
    if (response.is_err()) {
        return {response.error(), response.message()};
    }

    ActionOutcome outcome;
    outcome.status = response.value().status;
    return outcome;
}

CreateTaskAction::CreateTaskAction(http::HttpTransport& transport,
                                   http::JsonParser& parser,
                                   std::string body,
                                   std::optional<int64_t>* slot)
    : transport_(transport),
      parser_(parser),
      request_{"POST", "/tasks", std::move(body)},
      slot_(slot) {
}

result<ActionOutcome> CreateTaskAction::perform() const {
    auto response = transport_.send(request_);
    if (response.is_err()) {
        return {response.error(), response.message()};
    }

    ActionOutcome outcome;
    outcome.status = response.value().status;
    if (outcome.status != 201 || slot_ == nullptr) {
        return outcome;
    }

    auto id = http::decode_task_id(parser_, response.value().body);
    if (id.is_err()) {
        return {id.error(), id.message()};
    }

    outcome.id = id.value();
    *slot_ = id.value();
    return outcome;
}

// ============================================================================
// Scenario
// ============================================================================

namespace {

TestCase make_case(std::string category, std::string name, int expected,
                   http::HttpTransport& transport, http::ClientRequest request) {
    TestCase tc;
    tc.category = std::move(category);
    tc.name = std::move(name);
    tc.method = request.method;
    tc.path = request.path;
    tc.expected_status = expected;
    tc.action = std::make_unique<RequestAction>(transport, std::move(request));
    return tc;
}

std::string task_path(const std::optional<int64_t>& id, const char* placeholder) {
    if (id) {
        return "/tasks/" + std::to_string(*id);
    }
    return std::string("/tasks/") + placeholder;
}

} // namespace

std::vector<TestCase> build_create_cases(http::HttpTransport& transport,
                                         http::JsonParser& parser,
                                         ScenarioContext& context) {
    struct CreateDef {
        const char* name;
        const char* body;
        int expected;
        std::optional<int64_t>* slot;
    };

    const CreateDef defs[] = {
        {"Valid task with description",
         R"({"title": "Complete project documentation", "description": "Write comprehensive API documentation"})",
         201, &context.primary_task_id},
        {"Valid task without description",
         R"({"title": "Review pull requests"})",
         201, &context.secondary_task_id},
        {"Missing title (validation)",
         R"({"description": "No title"})",
         400, nullptr},
        {"Empty title (validation)",
         R"({"title": "   ", "description": "Empty"})",
         400, nullptr},
        {"Malformed JSON",
         "invalid json",
         400, nullptr},
    };

    std::vector<TestCase> cases;
    cases.reserve(std::size(defs));
    for (const auto& def : defs) {
        TestCase tc;
        tc.category = "CREATE";
        tc.name = def.name;
        tc.method = "POST";
        tc.path = "/tasks";
        tc.expected_status = def.expected;
        tc.action = std::make_unique<CreateTaskAction>(transport, parser, def.body, def.slot);
        cases.push_back(std::move(tc));
    }
    return cases;
}

std::vector<TestCase> build_dependent_cases(http::HttpTransport& transport,
                                            const ScenarioContext& context) {
    const std::string primary = task_path(context.primary_task_id, "{primary_task_id}");
    const std::string secondary = task_path(context.secondary_task_id, "{secondary_task_id}");

    std::vector<TestCase> cases;
    cases.reserve(13);

    cases.push_back(make_case("LIST", "Get all tasks", 200, transport, {"GET", "/tasks", ""}));

    cases.push_back(make_case("GET", "Get existing task", 200, transport, {"GET", primary, ""}));
    cases.push_back(make_case("GET", "Get non-existent task", 404, transport, {"GET", "/tasks/9999", ""}));
    cases.push_back(make_case("GET", "Invalid task ID", 400, transport, {"GET", "/tasks/abc", ""}));

    cases.push_back(make_case("UPDATE", "Update task to done", 200, transport,
        {"PUT", primary, R"({"title": "Updated task", "description": "Updated desc", "status": "done"})"}));
    cases.push_back(make_case("UPDATE", "Update task to todo", 200, transport,
        {"PUT", primary, R"({"title": "Updated task", "description": "Back to todo", "status": "todo"})"}));
    cases.push_back(make_case("UPDATE", "Invalid status (validation)", 400, transport,
        {"PUT", primary, R"({"title": "Test", "status": "in-progress"})"}));
    cases.push_back(make_case("UPDATE", "Missing title (validation)", 400, transport,
        {"PUT", primary, R"({"description": "No title", "status": "done"})"}));
    cases.push_back(make_case("UPDATE", "Update non-existent task", 404, transport,
        {"PUT", "/tasks/9999", R"({"title": "Test", "status": "done"})"}));

    cases.push_back(make_case("DELETE", "Delete existing task", 204, transport, {"DELETE", secondary, ""}));
    cases.push_back(make_case("DELETE", "Verify task deleted", 404, transport, {"GET", secondary, ""}));
    cases.push_back(make_case("DELETE", "Delete non-existent task", 404, transport, {"DELETE", "/tasks/9999", ""}));
    cases.push_back(make_case("DELETE", "Invalid task ID", 400, transport, {"DELETE", "/tasks/abc", ""}));

    return cases;
}

// ============================================================================
// TaskSuite
// ============================================================================

const char* suite_status_name(SuiteReport::Status status) noexcept {
    switch (status) {
        case SuiteReport::Status::PASSED:            return "passed";
        case SuiteReport::Status::FAILED:            return "failed";
        case SuiteReport::Status::ENVIRONMENT_ERROR: return "environment_error";
    }
    return "unknown";
}

TaskSuite::TaskSuite(Config config,
                     http::HttpTransport& transport,
                     http::HttpTransport& probe,
                     std::ostream& out,
                     std::ostream& err)
    : config_(std::move(config)),
      transport_(transport),
      probe_(probe),
      out_(out),
      err_(err),
      runner_(TestRunner::Config{config_.verbose}, out) {
}

void TaskSuite::print_banner() {
    const std::string rule(ReportRenderer::RULE_WIDTH, '=');
    out_ << rule << "\n";
    out_ << "TASK MANAGEMENT API - TEST SUITE\n";
    out_ << rule << "\n";
    out_ << "Base URL: " << config_.base_url << "\n";
    out_ << "Mode: " << (config_.verbose ? "Verbose" : "Summary") << "\n";
    if (config_.table_style == TableStyle::PLAIN) {
        out_ << "Note: plain table output (set TASKPROBE_TABLE_STYLE=grid for bordered tables)\n";
    }
    out_ << rule << "\n";
}

result<void> TaskSuite::probe_service() {
    LOG_INFO("Suite", "Probing %s", config_.base_url.c_str());

    auto response = probe_.send(http::ClientRequest{"GET", "/tasks", ""});
    if (response.is_err()) {
        return {response.error(), response.message()};
    }

    LOG_DEBUG("Suite", "Probe answered %d", response.value().status);
    return core::ok();
}

SuiteReport TaskSuite::run() {
    SuiteReport report;

    print_banner();

    auto reachable = probe_service();
    if (reachable.is_err()) {
        report.status = SuiteReport::Status::ENVIRONMENT_ERROR;
        report.diagnostic = reachable.message();

        err_ << "\nERROR: Cannot connect to API server\n";
        err_ << "Please ensure the server is running on " << config_.base_url << "\n";
        err_ << "Details: " << report.diagnostic << "\n";
        err_.flush();

        LOG_ERROR("Suite", "Service unreachable (%s): %s",
                  core::error_code_name(reachable.error()), report.diagnostic.c_str());
        return report;
    }
    out_ << "Server is reachable\n";
    out_.flush();

    for (const auto& tc : build_create_cases(transport_, parser_, context_)) {
        runner_.execute(tc);
    }

    auto dependents = build_dependent_cases(transport_, context_);
    if (context_.ready()) {
        LOG_INFO("Suite", "Created tasks %lld and %lld",
                 static_cast<long long>(*context_.primary_task_id),
                 static_cast<long long>(*context_.secondary_task_id));
        for (const auto& tc : dependents) {
            runner_.execute(tc);
        }
    } else {
        report.dependency_failed = true;
        report.unexecuted_dependents = dependents.size();

        out_ << "\nDEPENDENCY FAILURE: task creation did not yield identifiers; "
             << dependents.size() << " dependent checks were not executed\n";
        LOG_WARN("Suite", "Dependency failure: %zu dependent checks not executed (primary %s, secondary %s)",
                 dependents.size(),
                 context_.primary_task_id ? "captured" : "missing",
                 context_.secondary_task_id ? "captured" : "missing");

        if (config_.record_skipped_dependents) {
            for (const auto& tc : dependents) {
                runner_.skip(tc, SKIP_REASON);
            }
        }
    }

    ReportRenderer renderer(config_.table_style);
    out_ << renderer.render(runner_.log());
    if (report.dependency_failed) {
        out_ << "\nDependency failure: " << report.unexecuted_dependents
             << " dependent checks were not executed\n";
    }
    out_.flush();

    const auto& log = runner_.log();
    report.status = (log.all_passed() && !report.dependency_failed)
                        ? SuiteReport::Status::PASSED
                        : SuiteReport::Status::FAILED;

    LOG_INFO("Suite", "Finished: %s (%zu passed, %zu failed, %zu skipped)",
             suite_status_name(report.status),
             log.passed_count(), log.failed_count(), log.skipped_count());
    return report;
}

} // namespace harness
} // namespace taskprobe
