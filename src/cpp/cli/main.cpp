/**
 * @file main.cpp
 * @brief taskprobe command line entry point
 *
 * Usage:
 *   taskprobe [-v | --verbose]
 *
 * Environment:
 *   TASKPROBE_BASE_URL, TASKPROBE_TIMEOUT_MS, TASKPROBE_PROBE_TIMEOUT_MS,
 *   TASKPROBE_TABLE_STYLE, TASKPROBE_RECORD_SKIPS, TASKPROBE_LOG_LEVEL,
 *   TASKPROBE_LOG_FILE
 *
 * Exit status: 0 when every check passed, 1 otherwise, 2 on bad usage.
 */

#include "../harness/harness_config.h"
#include "../harness/task_scenario.h"
#include "../http/http_client.h"
#include "../core/logger.h"

#include <cstring>
#include <iostream>

using namespace taskprobe;

namespace {

constexpr int EXIT_USAGE = 2;

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [-v | --verbose]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "taskprobe: unrecognized argument '" << argv[i] << "'\n";
            print_usage(argv[0]);
            return EXIT_USAGE;
        }
    }

    auto config = harness::HarnessConfig::from_environment();
    config.verbose = verbose;
    if (!config.apply_logging()) {
        std::cerr << "taskprobe: cannot open log file '" << config.log_file
                  << "', logging to stderr\n";
    }

    auto endpoint = http::parse_base_url(config.base_url);
    if (endpoint.is_err()) {
        std::cerr << "ERROR: Invalid base URL '" << config.base_url << "'\n";
        std::cerr << "Details: " << endpoint.message() << "\n";
        LOG_ERROR("Config", "Invalid TASKPROBE_BASE_URL: %s", endpoint.message().c_str());
        return 1;
    }

    http::HttpClient::Config client_config;
    client_config.endpoint = endpoint.value();
    client_config.timeout_ms = config.request_timeout_ms;
    http::HttpClient client(client_config);

    http::HttpClient::Config probe_config = client_config;
    probe_config.timeout_ms = config.probe_timeout_ms;
    http::HttpClient probe(probe_config);

    harness::TaskSuite::Config suite_config;
    suite_config.base_url = endpoint.value().url();
    suite_config.verbose = config.verbose;
    suite_config.record_skipped_dependents = config.record_skipped_dependents;
    suite_config.table_style = config.resolved_table_style();

    LOG_INFO("Suite", "Running against %s (timeout %ums, probe %ums, %s tables)",
             suite_config.base_url.c_str(), config.request_timeout_ms,
             config.probe_timeout_ms, harness::table_style_name(suite_config.table_style));

    harness::TaskSuite suite(suite_config, client, probe, std::cout, std::cerr);
    auto report = suite.run();

    core::Logger::instance().close_output_file();
    return report.exit_code();
}
