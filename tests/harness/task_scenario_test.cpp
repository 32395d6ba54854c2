/**
 * taskprobe Task Scenario Tests
 *
 * The suite runs against an in-process task service that answers the way a
 * conforming server does, plus variants that break task creation, answer
 * individual checks wrongly, or fail the reachability probe.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "../../src/cpp/harness/task_scenario.h"

#include <charconv>
#include <cstdint>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace taskprobe::harness;
using taskprobe::core::error_code;
using taskprobe::core::result;
using taskprobe::http::ClientRequest;
using taskprobe::http::ClientResponse;
using taskprobe::http::HttpTransport;
using taskprobe::http::JsonParser;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {

/**
 * In-memory task service with the routing and validation rules of the
 * real one. Ids start at 1.
 */
class FakeTaskService : public HttpTransport {
public:
    // Answer 500 to otherwise valid creates
    bool fail_creates = false;

    // Creates past this count answer 201 without an id
    size_t creates_with_id = std::numeric_limits<size_t>::max();

    // Status for a non-numeric id in the path
    int non_numeric_id_status = 400;

    // Answer 204 to deletes but keep the task
    bool delete_keeps_task = false;

    result<ClientResponse> send(const ClientRequest& request) override {
        requests.push_back(request);

        if (request.path == "/tasks") {
            if (request.method == "GET") return list();
            if (request.method == "POST") return create(request.body);
            return reply(405, R"({"error":"method not allowed"})");
        }

        constexpr std::string_view prefix = "/tasks/";
        if (request.path.compare(0, prefix.size(), prefix) != 0) {
            return reply(404, R"({"error":"not found"})");
        }

        std::string_view id_text = std::string_view(request.path).substr(prefix.size());
        int64_t id = 0;
        auto [ptr, ec] = std::from_chars(id_text.data(), id_text.data() + id_text.size(), id);
        if (ec != std::errc() || ptr != id_text.data() + id_text.size()) {
            return reply(non_numeric_id_status, R"({"error":"invalid task id"})");
        }

        if (request.method == "GET") return get(id);
        if (request.method == "PUT") return update(id, request.body);
        if (request.method == "DELETE") return remove(id);
        return reply(405, R"({"error":"method not allowed"})");
    }

    std::vector<ClientRequest> requests;

private:
    struct Task {
        std::string title;
        std::string description;
        std::string status;
    };

    static ClientResponse reply(int status, std::string body) {
        ClientResponse response;
        response.status = status;
        response.reason = status < 300 ? "OK" : "Error";
        response.headers.emplace_back("Content-Type", "application/json");
        response.body = std::move(body);
        return response;
    }

    static std::string trim(const std::string& text) {
        size_t first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return {};
        }
        size_t last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    static std::string encode(int64_t id, const Task& task, bool with_id = true) {
        std::string body = "{";
        if (with_id) {
            body += "\"id\":" + std::to_string(id) + ",";
        }
        body += "\"title\":\"" + task.title + "\",\"description\":\"" + task.description +
                "\",\"status\":\"" + task.status + "\"}";
        return body;
    }

    // Title is required after trimming; description defaults to empty
    bool read_task(const std::string& body, Task& task) {
        auto title = parser_.get_string_field(body, "title");
        if (title.is_err()) {
            return false;
        }
        task.title = trim(title.value());
        if (task.title.empty()) {
            return false;
        }
        auto description = parser_.get_string_field(body, "description");
        task.description = description.is_ok() ? description.value() : "";
        return true;
    }

    result<ClientResponse> list() {
        std::string body = "[";
        for (const auto& [id, task] : tasks_) {
            if (body.size() > 1) body += ",";
            body += encode(id, task);
        }
        return reply(200, body + "]");
    }

    result<ClientResponse> create(const std::string& body) {
        Task task;
        if (!read_task(body, task)) {
            return reply(400, R"({"error":"title is required"})");
        }
        if (fail_creates) {
            return reply(500, R"({"error":"database unavailable"})");
        }
        task.status = "todo";
        int64_t id = next_id_++;
        tasks_[id] = task;
        bool with_id = created_++ < creates_with_id;
        return reply(201, encode(id, task, with_id));
    }

    result<ClientResponse> get(int64_t id) {
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return reply(404, R"({"error":"task not found"})");
        }
        return reply(200, encode(id, it->second));
    }

    result<ClientResponse> update(int64_t id, const std::string& body) {
        Task task;
        if (!read_task(body, task)) {
            return reply(400, R"({"error":"title is required"})");
        }
        auto status = parser_.get_string_field(body, "status");
        if (status.is_err() || (status.value() != "todo" && status.value() != "done")) {
            return reply(400, R"({"error":"status must be todo or done"})");
        }
        task.status = status.value();

        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return reply(404, R"({"error":"task not found"})");
        }
        it->second = task;
        return reply(200, encode(id, task));
    }

    result<ClientResponse> remove(int64_t id) {
        if (delete_keeps_task) {
            return reply(tasks_.count(id) ? 204 : 404, "");
        }
        if (tasks_.erase(id) == 0) {
            return reply(404, R"({"error":"task not found"})");
        }
        return reply(204, "");
    }

    JsonParser parser_;
    std::map<int64_t, Task> tasks_;
    int64_t next_id_{1};
    size_t created_{0};
};

class RefusingTransport : public HttpTransport {
public:
    result<ClientResponse> send(const ClientRequest&) override {
        ++calls;
        return result<ClientResponse>(error_code::connect_failed, "Connection refused (localhost:8080)");
    }

    int calls = 0;
};

} // namespace

class TaskScenarioTest : public TaskProbeTest {
protected:
    SuiteReport run_suite(TaskSuite::Config config, HttpTransport& probe) {
        TaskSuite suite(config, service_, probe, out_, err_);
        SuiteReport report = suite.run();
        results_ = suite.log().entries();
        context_ = suite.context();
        return report;
    }

    SuiteReport run_suite(TaskSuite::Config config = {}) {
        return run_suite(config, service_);
    }

    FakeTaskService service_;
    std::ostringstream out_;
    std::ostringstream err_;
    std::vector<TestResult> results_;
    ScenarioContext context_;
};

// =============================================================================
// Case construction
// =============================================================================

TEST_F(TaskScenarioTest, CreateCasesInOrder) {
    JsonParser parser;
    ScenarioContext context;
    auto cases = build_create_cases(service_, parser, context);

    ASSERT_EQ(cases.size(), 5u);
    const char* names[] = {
        "Valid task with description",
        "Valid task without description",
        "Missing title (validation)",
        "Empty title (validation)",
        "Malformed JSON",
    };
    const int expected[] = {201, 201, 400, 400, 400};

    for (size_t i = 0; i < cases.size(); ++i) {
        EXPECT_EQ(cases[i].category, "CREATE");
        EXPECT_EQ(cases[i].name, names[i]);
        EXPECT_EQ(cases[i].method, "POST");
        EXPECT_EQ(cases[i].path, "/tasks");
        EXPECT_EQ(cases[i].expected_status, expected[i]);
        ASSERT_NE(cases[i].action, nullptr);
    }
}

TEST_F(TaskScenarioTest, CreateBodiesAreSentVerbatim) {
    JsonParser parser;
    ScenarioContext context;
    for (const auto& tc : build_create_cases(service_, parser, context)) {
        auto outcome = tc.action->perform();
        ASSERT_TRUE(outcome.is_ok()) << outcome.message();
    }

    ASSERT_EQ(service_.requests.size(), 5u);
    EXPECT_EQ(service_.requests[0].body,
              R"({"title": "Complete project documentation", "description": "Write comprehensive API documentation"})");
    EXPECT_EQ(service_.requests[1].body, R"({"title": "Review pull requests"})");
    EXPECT_EQ(service_.requests[2].body, R"({"description": "No title"})");
    EXPECT_EQ(service_.requests[3].body, R"({"title": "   ", "description": "Empty"})");
    EXPECT_EQ(service_.requests[4].body, "invalid json");

    ASSERT_TRUE(context.ready());
    EXPECT_EQ(*context.primary_task_id, 1);
    EXPECT_EQ(*context.secondary_task_id, 2);
}

TEST_F(TaskScenarioTest, DependentCasesUseCapturedIds) {
    ScenarioContext context;
    context.primary_task_id = rng_.random_task_id();
    context.secondary_task_id = rng_.random_task_id();
    const std::string primary = "/tasks/" + std::to_string(*context.primary_task_id);
    const std::string secondary = "/tasks/" + std::to_string(*context.secondary_task_id);

    auto cases = build_dependent_cases(service_, context);
    ASSERT_EQ(cases.size(), 13u);

    struct Expected {
        const char* category;
        const char* name;
        const char* method;
        std::string path;
        int status;
    };
    const Expected expected[] = {
        {"LIST", "Get all tasks", "GET", "/tasks", 200},
        {"GET", "Get existing task", "GET", primary, 200},
        {"GET", "Get non-existent task", "GET", "/tasks/9999", 404},
        {"GET", "Invalid task ID", "GET", "/tasks/abc", 400},
        {"UPDATE", "Update task to done", "PUT", primary, 200},
        {"UPDATE", "Update task to todo", "PUT", primary, 200},
        {"UPDATE", "Invalid status (validation)", "PUT", primary, 400},
        {"UPDATE", "Missing title (validation)", "PUT", primary, 400},
        {"UPDATE", "Update non-existent task", "PUT", "/tasks/9999", 404},
        {"DELETE", "Delete existing task", "DELETE", secondary, 204},
        {"DELETE", "Verify task deleted", "GET", secondary, 404},
        {"DELETE", "Delete non-existent task", "DELETE", "/tasks/9999", 404},
        {"DELETE", "Invalid task ID", "DELETE", "/tasks/abc", 400},
    };

    for (size_t i = 0; i < cases.size(); ++i) {
        EXPECT_EQ(cases[i].category, expected[i].category) << i;
        EXPECT_EQ(cases[i].name, expected[i].name) << i;
        EXPECT_EQ(cases[i].method, expected[i].method) << i;
        EXPECT_EQ(cases[i].path, expected[i].path) << i;
        EXPECT_EQ(cases[i].expected_status, expected[i].status) << i;
    }
}

TEST_F(TaskScenarioTest, DependentCasesShowPlaceholdersForMissingIds) {
    ScenarioContext context;
    auto cases = build_dependent_cases(service_, context);

    EXPECT_EQ(cases[1].path, "/tasks/{primary_task_id}");
    EXPECT_EQ(cases[9].path, "/tasks/{secondary_task_id}");
    EXPECT_EQ(cases[2].path, "/tasks/9999");
}

// =============================================================================
// CreateTaskAction
// =============================================================================

TEST_F(TaskScenarioTest, CreatedWithoutIdIsADecodeFailure) {
    service_.creates_with_id = 0;
    JsonParser parser;
    std::optional<int64_t> slot;

    CreateTaskAction action(service_, parser, R"({"title": "Review pull requests"})", &slot);
    auto outcome = action.perform();

    ASSERT_TRUE(outcome.is_err());
    EXPECT_EQ(outcome.error(), error_code::decode_error);
    EXPECT_FALSE(slot.has_value());
}

TEST_F(TaskScenarioTest, RejectedCreateLeavesSlotEmpty) {
    JsonParser parser;
    std::optional<int64_t> slot;

    CreateTaskAction action(service_, parser, R"({"description": "No title"})", &slot);
    auto outcome = action.perform();

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().status, 400);
    EXPECT_FALSE(slot.has_value());
}

TEST_F(TaskScenarioTest, RequestActionForwardsTransportError) {
    RefusingTransport refusing;
    RequestAction action(refusing, ClientRequest{"GET", "/tasks", ""});

    auto outcome = action.perform();
    ASSERT_TRUE(outcome.is_err());
    EXPECT_EQ(outcome.error(), error_code::connect_failed);
    EXPECT_EQ(refusing.calls, 1);
}

// =============================================================================
// Suite runs
// =============================================================================

TEST_F(TaskScenarioTest, ConformingServicePassesEverything) {
    SuiteReport report = run_suite();

    EXPECT_EQ(report.status, SuiteReport::Status::PASSED);
    EXPECT_EQ(report.exit_code(), 0);
    EXPECT_FALSE(report.dependency_failed);

    ASSERT_EQ(results_.size(), 18u);
    for (const auto& r : results_) {
        EXPECT_EQ(r.outcome, Outcome::PASS) << r.name << ": " << r.error_detail;
    }
    EXPECT_EQ(*context_.primary_task_id, 1);
    EXPECT_EQ(*context_.secondary_task_id, 2);

    // probe + 18 checks, all on one service
    EXPECT_EQ(service_.requests.size(), 19u);

    std::string out = out_.str();
    EXPECT_THAT(out, HasSubstr("TASK MANAGEMENT API - TEST SUITE\n"));
    EXPECT_THAT(out, HasSubstr("Base URL: http://localhost:8080\n"));
    EXPECT_THAT(out, HasSubstr("Mode: Summary\n"));
    EXPECT_THAT(out, HasSubstr("Server is reachable\n"));
    EXPECT_THAT(out, HasSubstr("ALL TESTS PASSED!\n"));
    EXPECT_THAT(out, Not(HasSubstr("DEPENDENCY FAILURE")));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(TaskScenarioTest, ResultsFollowExecutionOrder) {
    run_suite();

    ASSERT_EQ(results_.size(), 18u);
    EXPECT_EQ(results_[0].name, "Valid task with description");
    EXPECT_EQ(results_[4].name, "Malformed JSON");
    EXPECT_EQ(results_[5].category, "LIST");
    EXPECT_EQ(results_[15].name, "Verify task deleted");
    EXPECT_EQ(results_[15].method, "GET");
    EXPECT_EQ(results_[15].category, "DELETE");
    EXPECT_EQ(results_[17].path, "/tasks/abc");
}

TEST_F(TaskScenarioTest, VerboseTracesEveryCheck) {
    TaskSuite::Config config;
    config.verbose = true;
    run_suite(config);

    std::string out = out_.str();
    EXPECT_THAT(out, HasSubstr("Mode: Verbose\n"));
    EXPECT_THAT(out, HasSubstr("PASS CREATE - Valid task with description\n"));
    EXPECT_THAT(out, HasSubstr("PASS DELETE - Verify task deleted\n"));
    EXPECT_THAT(out, HasSubstr("  Method:   GET /tasks/2\n"));

    // Traces come before the summary table
    EXPECT_LT(out.find("PASS LIST - Get all tasks"), out.find("TEST RESULTS SUMMARY"));
}

TEST_F(TaskScenarioTest, GridStyleIsUsedForTheTable) {
    TaskSuite::Config config;
    config.table_style = TableStyle::GRID;
    run_suite(config);

    std::string out = out_.str();
    EXPECT_THAT(out, HasSubstr("\n+=="));
    EXPECT_THAT(out, Not(HasSubstr("Note: plain table output")));
}

TEST_F(TaskScenarioTest, PlainStyleAddsNote) {
    run_suite();
    EXPECT_THAT(out_.str(), HasSubstr("Note: plain table output"));
}

TEST_F(TaskScenarioTest, WrongDependentAnswersFailButSuiteContinues) {
    service_.non_numeric_id_status = 404;
    SuiteReport report = run_suite();

    EXPECT_EQ(report.status, SuiteReport::Status::FAILED);
    EXPECT_EQ(report.exit_code(), 1);
    EXPECT_FALSE(report.dependency_failed);
    EXPECT_EQ(report.unexecuted_dependents, 0u);

    ASSERT_EQ(results_.size(), 18u);
    for (size_t i = 0; i < results_.size(); ++i) {
        bool bad_id_case = results_[i].path == "/tasks/abc";
        EXPECT_EQ(results_[i].outcome, bad_id_case ? Outcome::FAIL : Outcome::PASS) << results_[i].name;
    }

    // GET /tasks/abc is the ninth check; everything after it still ran
    EXPECT_EQ(results_[8].name, "Invalid task ID");
    EXPECT_EQ(results_[8].actual_status, 404);
    EXPECT_EQ(results_[8].error_detail, "Expected 400, got 404");
    EXPECT_EQ(results_[17].actual_status, 404);
    EXPECT_EQ(service_.requests.size(), 19u);

    std::string out = out_.str();
    EXPECT_THAT(out, HasSubstr("2 TEST(S) FAILED\n"));
    EXPECT_THAT(out, HasSubstr("  9. GET - Invalid task ID\n     Error: Expected 400, got 404\n"));
    EXPECT_THAT(out, HasSubstr("  18. DELETE - Invalid task ID\n"));
    EXPECT_THAT(out, Not(HasSubstr("DEPENDENCY FAILURE")));
    EXPECT_THAT(out, Not(HasSubstr("ALL TESTS PASSED!")));
}

TEST_F(TaskScenarioTest, DeleteThatKeepsTheTaskIsCaught) {
    service_.delete_keeps_task = true;
    SuiteReport report = run_suite();

    EXPECT_EQ(report.exit_code(), 1);
    EXPECT_FALSE(report.dependency_failed);
    ASSERT_EQ(results_.size(), 18u);

    EXPECT_EQ(results_[14].name, "Delete existing task");
    EXPECT_EQ(results_[14].outcome, Outcome::PASS);
    EXPECT_EQ(results_[15].name, "Verify task deleted");
    EXPECT_EQ(results_[15].outcome, Outcome::FAIL);
    EXPECT_EQ(results_[15].error_detail, "Expected 404, got 200");
    EXPECT_EQ(results_[16].outcome, Outcome::PASS);
    EXPECT_EQ(results_[17].outcome, Outcome::PASS);
}

TEST_F(TaskScenarioTest, FailedCreationStopsDependents) {
    service_.fail_creates = true;
    SuiteReport report = run_suite();

    EXPECT_EQ(report.status, SuiteReport::Status::FAILED);
    EXPECT_EQ(report.exit_code(), 1);
    EXPECT_TRUE(report.dependency_failed);
    EXPECT_EQ(report.unexecuted_dependents, 13u);

    ASSERT_EQ(results_.size(), 5u);
    EXPECT_EQ(results_[0].outcome, Outcome::FAIL);
    EXPECT_EQ(results_[0].actual_status, 500);
    EXPECT_EQ(results_[1].outcome, Outcome::FAIL);
    for (size_t i = 2; i < results_.size(); ++i) {
        EXPECT_EQ(results_[i].outcome, Outcome::PASS) << results_[i].name;
    }
    EXPECT_FALSE(context_.primary_task_id.has_value());

    // probe + 5 creates, nothing else reached the service
    EXPECT_EQ(service_.requests.size(), 6u);

    std::string out = out_.str();
    EXPECT_THAT(out, HasSubstr("DEPENDENCY FAILURE: task creation did not yield identifiers; "
                               "13 dependent checks were not executed\n"));
    EXPECT_THAT(out, HasSubstr("\nDependency failure: 13 dependent checks were not executed\n"));
    EXPECT_THAT(out, HasSubstr("2 TEST(S) FAILED\n"));
}

TEST_F(TaskScenarioTest, OneMissingIdIsEnoughToStop) {
    service_.creates_with_id = 1;
    SuiteReport report = run_suite();

    EXPECT_TRUE(report.dependency_failed);
    EXPECT_EQ(report.exit_code(), 1);
    ASSERT_EQ(results_.size(), 5u);

    EXPECT_EQ(results_[0].outcome, Outcome::PASS);
    EXPECT_EQ(results_[1].outcome, Outcome::FAIL);
    EXPECT_EQ(results_[1].actual_status, 0);
    EXPECT_EQ(results_[1].error_detail, "Response body has no 'id' field");

    EXPECT_TRUE(context_.primary_task_id.has_value());
    EXPECT_FALSE(context_.secondary_task_id.has_value());
}

TEST_F(TaskScenarioTest, SkippedDependentsCanBeRecorded) {
    service_.fail_creates = true;
    TaskSuite::Config config;
    config.record_skipped_dependents = true;
    SuiteReport report = run_suite(config);

    EXPECT_EQ(report.exit_code(), 1);
    ASSERT_EQ(results_.size(), 18u);

    size_t skipped = 0;
    for (size_t i = 5; i < results_.size(); ++i) {
        EXPECT_EQ(results_[i].outcome, Outcome::SKIP) << results_[i].name;
        EXPECT_EQ(results_[i].actual_status, 0);
        EXPECT_EQ(results_[i].error_detail, TaskSuite::SKIP_REASON);
        ++skipped;
    }
    EXPECT_EQ(skipped, 13u);
    EXPECT_EQ(results_[6].path, "/tasks/{primary_task_id}");
    EXPECT_EQ(results_[15].path, "/tasks/{secondary_task_id}");
    EXPECT_THAT(out_.str(), HasSubstr("13 TEST(S) SKIPPED\n"));
}

TEST_F(TaskScenarioTest, UnreachableServiceIsAnEnvironmentError) {
    RefusingTransport probe;
    SuiteReport report = run_suite({}, probe);

    EXPECT_EQ(report.status, SuiteReport::Status::ENVIRONMENT_ERROR);
    EXPECT_EQ(report.exit_code(), 1);
    EXPECT_EQ(report.diagnostic, "Connection refused (localhost:8080)");
    EXPECT_TRUE(results_.empty());
    EXPECT_TRUE(service_.requests.empty());
    EXPECT_EQ(probe.calls, 1);

    std::string err = err_.str();
    EXPECT_THAT(err, HasSubstr("ERROR: Cannot connect to API server\n"));
    EXPECT_THAT(err, HasSubstr("Please ensure the server is running on http://localhost:8080\n"));
    EXPECT_THAT(err, HasSubstr("Details: Connection refused (localhost:8080)\n"));
    EXPECT_THAT(out_.str(), Not(HasSubstr("TEST RESULTS SUMMARY")));
}

TEST_F(TaskScenarioTest, ProbeErrorStatusStillCountsAsReachable) {
    // Any HTTP answer proves the service is up; a 500 on GET /tasks is not fatal
    struct BrokenList : HttpTransport {
        result<ClientResponse> send(const ClientRequest&) override {
            ClientResponse response;
            response.status = 500;
            return response;
        }
    } probe;

    run_suite({}, probe);
    EXPECT_THAT(out_.str(), HasSubstr("Server is reachable\n"));
    EXPECT_EQ(results_.size(), 18u);
}

TEST_F(TaskScenarioTest, SuiteStatusNames) {
    EXPECT_STREQ(suite_status_name(SuiteReport::Status::PASSED), "passed");
    EXPECT_STREQ(suite_status_name(SuiteReport::Status::FAILED), "failed");
    EXPECT_STREQ(suite_status_name(SuiteReport::Status::ENVIRONMENT_ERROR), "environment_error");
}
