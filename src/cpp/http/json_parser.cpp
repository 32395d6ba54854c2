#include "json_parser.h"
#include "../core/logger.h"

#include <simdjson.h>

namespace taskprobe {
namespace http {

using core::error_code;
using core::result;

struct JsonParser::Impl {
    simdjson::ondemand::parser parser;
};

JsonParser::JsonParser()
    : impl_(std::make_unique<Impl>()) {
}

JsonParser::~JsonParser() = default;

JsonParser::JsonParser(JsonParser&&) noexcept = default;

JsonParser& JsonParser::operator=(JsonParser&&) noexcept = default;

namespace {

std::string describe(std::string msg, simdjson::error_code error) {
    msg += ": ";
    msg += simdjson::error_message(error);
    return msg;
}

std::string field_label(std::string_view key) {
    return "Field '" + std::string(key) + "'";
}

} // namespace

result<int64_t> JsonParser::get_int64_field(std::string_view json, std::string_view key) {
    simdjson::padded_string padded(json.data(), json.size());

    simdjson::ondemand::document doc;
    auto error = impl_->parser.iterate(padded).get(doc);
    if (error) {
        return {error_code::decode_error, describe("Invalid JSON response body", error)};
    }

    simdjson::ondemand::object obj;
    error = doc.get_object().get(obj);
    if (error) {
        return {error_code::decode_error, describe("Response body is not a JSON object", error)};
    }

    simdjson::ondemand::value field;
    error = obj.find_field_unordered(key).get(field);
    if (error == simdjson::NO_SUCH_FIELD) {
        return {error_code::decode_error, "Response body has no '" + std::string(key) + "' field"};
    }
    if (error) {
        return {error_code::decode_error, describe("Cannot read " + field_label(key), error)};
    }

    int64_t value = 0;
    error = field.get_int64().get(value);
    if (error) {
        return {error_code::decode_error, describe(field_label(key) + " is not an integer", error)};
    }

    return value;
}

result<std::string> JsonParser::get_string_field(std::string_view json, std::string_view key) {
    simdjson::padded_string padded(json.data(), json.size());

    simdjson::ondemand::document doc;
    auto error = impl_->parser.iterate(padded).get(doc);
    if (error) {
        return {error_code::decode_error, describe("Invalid JSON response body", error)};
    }

    simdjson::ondemand::object obj;
    error = doc.get_object().get(obj);
    if (error) {
        return {error_code::decode_error, describe("Response body is not a JSON object", error)};
    }

    simdjson::ondemand::value field;
    error = obj.find_field_unordered(key).get(field);
    if (error == simdjson::NO_SUCH_FIELD) {
        return {error_code::decode_error, "Response body has no '" + std::string(key) + "' field"};
    }
    if (error) {
        return {error_code::decode_error, describe("Cannot read " + field_label(key), error)};
    }

    std::string_view text;
    error = field.get_string().get(text);
    if (error) {
        return {error_code::decode_error, describe(field_label(key) + " is not a string", error)};
    }

    return std::string(text);
}

result<int64_t> decode_task_id(JsonParser& parser, std::string_view body) {
    auto id = parser.get_int64_field(body, "id");
    if (id.is_err()) {
        LOG_DEBUG("HTTP", "Cannot decode task id: %s", id.message().c_str());
        return id;
    }
    if (id.value() <= 0) {
        return {error_code::decode_error,
                "Task id must be a positive integer, got " + std::to_string(id.value())};
    }
    return id;
}

} // namespace http
} // namespace taskprobe
