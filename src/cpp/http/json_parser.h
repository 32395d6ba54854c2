#pragma once

#include "../core/result.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace taskprobe {
namespace http {

/**
 * Field reader for JSON response bodies, backed by simdjson On-Demand.
 *
 * Only top-level object fields are read; the harness never needs more than
 * a task's `id`. Each call parses the body afresh, so one parser can be
 * reused across responses (not across threads).
 */
class JsonParser {
public:
    JsonParser();
    ~JsonParser();

    JsonParser(const JsonParser&) = delete;
    JsonParser& operator=(const JsonParser&) = delete;
    JsonParser(JsonParser&&) noexcept;
    JsonParser& operator=(JsonParser&&) noexcept;

    /**
     * Read an integer field from a JSON object.
     *
     * @return the value, or decode_error naming what went wrong
     *         (invalid JSON, not an object, missing field, wrong type)
     */
    core::result<int64_t> get_int64_field(std::string_view json, std::string_view key);

    /**
     * Read a string field from a JSON object (unescaped).
     */
    core::result<std::string> get_string_field(std::string_view json, std::string_view key);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Extract the task identifier from a create/fetch response body.
 * Fails unless `id` is present and a positive integer.
 */
core::result<int64_t> decode_task_id(JsonParser& parser, std::string_view body);

} // namespace http
} // namespace taskprobe
