#include "http1_response_parser.h"
#include <cctype>
#include <cstring>
#include <charconv>

namespace taskprobe {
namespace http {

// ============================================================================
// HTTP1Response Implementation
// ============================================================================

std::string_view HTTP1Response::get_header(std::string_view name) const noexcept {
    for (size_t i = 0; i < header_count; ++i) {
        if (HTTP1ResponseParser::str_eq_ci(headers[i].name, name)) {
            return headers[i].value;
        }
    }
    return {};
}

bool HTTP1Response::has_header(std::string_view name) const noexcept {
    for (size_t i = 0; i < header_count; ++i) {
        if (HTTP1ResponseParser::str_eq_ci(headers[i].name, name)) {
            return true;
        }
    }
    return false;
}

void HTTP1Response::reset() noexcept {
    version = HTTP1Version::UNKNOWN;
    status_code = 0;
    reason = {};
    header_count = 0;
    body = {};
    decoded_body.clear();
    content_length = 0;
    has_content_length = false;
    chunked = false;
    keep_alive = false;
}

// ============================================================================
// HTTP1ResponseParser Implementation
// ============================================================================

HTTP1ResponseParser::HTTP1ResponseParser()
    : state_(HTTP1ResponseState::START), pos_(0), mark_(0), error_reason_("") {
}

void HTTP1ResponseParser::reset() noexcept {
    state_ = HTTP1ResponseState::START;
    pos_ = 0;
    mark_ = 0;
    error_reason_ = "";
}

int HTTP1ResponseParser::fail(const char* reason) noexcept {
    state_ = HTTP1ResponseState::ERROR;
    error_reason_ = reason;
    return 1;
}

int HTTP1ResponseParser::parse(
    const uint8_t* data,
    size_t len,
    HTTP1Response& out_response,
    size_t& out_consumed,
    bool at_eof
) {
    reset();
    out_response.reset();
    out_consumed = 0;

    if (!data || len == 0) {
        return at_eof ? fail("connection closed before any response bytes") : -1;
    }

    // 1. Status line: HTTP-version SP status-code SP reason-phrase CRLF
    int rc = parse_status_line(data, len, out_response);
    if (rc != 0) {
        if (rc < 0 && at_eof) {
            return fail("connection closed inside status line");
        }
        return rc;
    }

    // 2. Headers
    while (true) {
        if (pos_ + 1 >= len) {
            return at_eof ? fail("connection closed inside headers") : -1;
        }

        if (data[pos_] == '\r' && data[pos_ + 1] == '\n') {
            pos_ += 2;
            state_ = HTTP1ResponseState::BODY;
            break;
        }

        rc = parse_header_field(data, len, out_response);
        if (rc == 0) {
            rc = parse_header_value(data, len, out_response);
        }
        if (rc != 0) {
            if (rc < 0 && at_eof) {
                return fail("connection closed inside headers");
            }
            return rc;
        }
    }

    // 3. Framing headers
    auto transfer_enc = out_response.get_header("transfer-encoding");
    if (!transfer_enc.empty() && transfer_enc.find("chunked") != std::string_view::npos) {
        out_response.chunked = true;
    }

    auto content_len = out_response.get_header("content-length");
    if (!content_len.empty()) {
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(content_len.data(), content_len.data() + content_len.size(), value);
        if (ec != std::errc() || ptr != content_len.data() + content_len.size()) {
            return fail("invalid Content-Length");
        }
        out_response.content_length = value;
        out_response.has_content_length = true;
    }

    auto connection = out_response.get_header("connection");
    if (out_response.version == HTTP1Version::HTTP_1_1) {
        out_response.keep_alive = !str_eq_ci(connection, "close");
    } else {
        out_response.keep_alive = str_eq_ci(connection, "keep-alive");
    }

    // 4. Body
    if (has_no_body(out_response.status_code)) {
        // nothing to read
    } else if (out_response.chunked) {
        rc = parse_chunked_body(data, len, out_response);
        if (rc != 0) {
            if (rc < 0 && at_eof) {
                return fail("connection closed inside chunked body");
            }
            return rc;
        }
        out_response.body = out_response.decoded_body;
    } else if (out_response.has_content_length) {
        size_t available = len - pos_;
        if (available < out_response.content_length) {
            return at_eof ? fail("connection closed before Content-Length bytes arrived") : -1;
        }
        out_response.body = std::string_view(
            reinterpret_cast<const char*>(data + pos_),
            static_cast<size_t>(out_response.content_length)
        );
        pos_ += static_cast<size_t>(out_response.content_length);
    } else {
        // Delimited by connection close
        if (!at_eof) {
            return -1;
        }
        out_response.body = std::string_view(
            reinterpret_cast<const char*>(data + pos_),
            len - pos_
        );
        pos_ = len;
    }

    state_ = HTTP1ResponseState::COMPLETE;
    out_consumed = pos_;
    return 0;
}

int HTTP1ResponseParser::parse_status_line(
    const uint8_t* data,
    size_t len,
    HTTP1Response& resp
) noexcept {
    state_ = HTTP1ResponseState::STATUS_LINE;

    // "HTTP/1.x " + 3 digits
    if (pos_ + 12 > len) {
        if (len >= 5 && std::memcmp(data, "HTTP/", 5) != 0) {
            return fail("response does not start with HTTP/");
        }
        return -1;
    }

    if (std::memcmp(data + pos_, "HTTP/1.1 ", 9) == 0) {
        resp.version = HTTP1Version::HTTP_1_1;
    } else if (std::memcmp(data + pos_, "HTTP/1.0 ", 9) == 0) {
        resp.version = HTTP1Version::HTTP_1_0;
    } else {
        return fail("unsupported HTTP version in status line");
    }
    pos_ += 9;

    int code = 0;
    for (int i = 0; i < 3; ++i) {
        uint8_t c = data[pos_ + i];
        if (c < '0' || c > '9') {
            return fail("malformed status code");
        }
        code = code * 10 + (c - '0');
    }
    pos_ += 3;

    if (code < 100 || code > 599) {
        return fail("status code out of range");
    }
    resp.status_code = code;

    // Reason phrase is optional ("HTTP/1.1 200\r\n" is accepted)
    if (pos_ < len && data[pos_] == ' ') {
        pos_++;
    } else if (pos_ < len && data[pos_] != '\r') {
        return fail("malformed status code");
    }
    mark_ = pos_;

    while (pos_ + 1 < len && !(data[pos_] == '\r' && data[pos_ + 1] == '\n')) {
        pos_++;
    }
    if (pos_ + 1 >= len) {
        return -1;
    }

    resp.reason = std::string_view(
        reinterpret_cast<const char*>(data + mark_),
        pos_ - mark_
    );
    pos_ += 2;

    state_ = HTTP1ResponseState::HEADER_FIELD;
    return 0;
}

int HTTP1ResponseParser::parse_header_field(
    const uint8_t* data,
    size_t len,
    HTTP1Response& resp
) noexcept {
    if (resp.header_count >= HTTP1Response::MAX_HEADERS) {
        return fail("too many headers");
    }

    mark_ = pos_;

    while (pos_ < len && data[pos_] != ':') {
        if (!is_token_char(data[pos_])) {
            return fail("invalid character in header name");
        }
        pos_++;
    }

    if (pos_ >= len) {
        return -1;
    }
    if (pos_ == mark_) {
        return fail("empty header name");
    }

    auto& header = resp.headers[resp.header_count];
    header.name = std::string_view(
        reinterpret_cast<const char*>(data + mark_),
        pos_ - mark_
    );

    pos_++;  // Skip colon

    while (pos_ < len && (data[pos_] == ' ' || data[pos_] == '\t')) {
        pos_++;
    }

    state_ = HTTP1ResponseState::HEADER_VALUE;
    return 0;
}

int HTTP1ResponseParser::parse_header_value(
    const uint8_t* data,
    size_t len,
    HTTP1Response& resp
) noexcept {
    mark_ = pos_;

    while (pos_ + 1 < len && !(data[pos_] == '\r' && data[pos_ + 1] == '\n')) {
        pos_++;
    }

    if (pos_ + 1 >= len) {
        return -1;
    }

    size_t value_end = pos_;
    while (value_end > mark_ && is_whitespace(data[value_end - 1])) {
        value_end--;
    }

    auto& header = resp.headers[resp.header_count];
    header.value = std::string_view(
        reinterpret_cast<const char*>(data + mark_),
        value_end - mark_
    );

    resp.header_count++;
    pos_ += 2;

    state_ = HTTP1ResponseState::HEADER_FIELD;
    return 0;
}

int HTTP1ResponseParser::parse_chunked_body(
    const uint8_t* data,
    size_t len,
    HTTP1Response& resp
) {
    const char* chars = reinterpret_cast<const char*>(data);

    while (true) {
        // chunk-size [ chunk-ext ] CRLF
        mark_ = pos_;
        while (pos_ + 1 < len && !(data[pos_] == '\r' && data[pos_ + 1] == '\n')) {
            pos_++;
        }
        if (pos_ + 1 >= len) {
            return -1;
        }

        size_t size_end = mark_;
        while (size_end < pos_ && std::isxdigit(data[size_end])) {
            size_end++;
        }
        if (size_end == mark_) {
            return fail("malformed chunk size");
        }

        uint64_t chunk_size = 0;
        auto [ptr, ec] = std::from_chars(chars + mark_, chars + size_end, chunk_size, 16);
        if (ec != std::errc() || ptr != chars + size_end) {
            return fail("malformed chunk size");
        }
        pos_ += 2;

        if (chunk_size == 0) {
            // Trailer section, terminated by an empty line
            while (true) {
                mark_ = pos_;
                while (pos_ + 1 < len && !(data[pos_] == '\r' && data[pos_ + 1] == '\n')) {
                    pos_++;
                }
                if (pos_ + 1 >= len) {
                    return -1;
                }
                bool empty_line = (pos_ == mark_);
                pos_ += 2;
                if (empty_line) {
                    return 0;
                }
            }
        }

        if (chunk_size > MAX_CHUNK_SIZE) {
            return fail("chunk size too large");
        }
        if (chunk_size > len - pos_ || len - pos_ - chunk_size < 2) {
            return -1;
        }
        if (data[pos_ + chunk_size] != '\r' || data[pos_ + chunk_size + 1] != '\n') {
            return fail("chunk not terminated by CRLF");
        }

        resp.decoded_body.append(chars + pos_, static_cast<size_t>(chunk_size));
        pos_ += static_cast<size_t>(chunk_size) + 2;
    }
}

bool HTTP1ResponseParser::has_no_body(int status_code) noexcept {
    return (status_code >= 100 && status_code < 200) || status_code == 204 || status_code == 304;
}

bool HTTP1ResponseParser::is_token_char(uint8_t c) noexcept {
    // RFC 7230: token characters
    return std::isalnum(c) || c == '!' || c == '#' || c == '$' || c == '%' ||
           c == '&' || c == '\'' || c == '*' || c == '+' || c == '-' ||
           c == '.' || c == '^' || c == '_' || c == '`' || c == '|' || c == '~';
}

bool HTTP1ResponseParser::is_whitespace(uint8_t c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool HTTP1ResponseParser::str_eq_ci(std::string_view a, std::string_view b) noexcept {
    if (a.length() != b.length()) {
        return false;
    }

    for (size_t i = 0; i < a.length(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }

    return true;
}

} // namespace http
} // namespace taskprobe
