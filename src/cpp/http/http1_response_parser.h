#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <array>

namespace taskprobe {
namespace http {

/**
 * HTTP/1.0 and HTTP/1.1 response parser.
 *
 * Same shape as a request parser: no callbacks, direct return codes,
 * string_views into the caller's buffer. The only copy made is for
 * chunked bodies, which have to be reassembled.
 *
 * Body framing (RFC 7230 section 3.3.3):
 * - 1xx, 204 and 304 responses never carry a body
 * - Transfer-Encoding: chunked
 * - Content-Length
 * - otherwise the body runs until the server closes the connection
 */

enum class HTTP1Version : uint8_t {
    HTTP_1_0 = 0,
    HTTP_1_1 = 1,
    UNKNOWN = 255
};

enum class HTTP1ResponseState : uint8_t {
    START,
    STATUS_LINE,
    HEADER_FIELD,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    ERROR
};

/**
 * Parsed HTTP/1.x response.
 *
 * Views point into the buffer given to HTTP1ResponseParser::parse(), or into
 * decoded_body for chunked responses. Copying a response that holds a
 * chunked body leaves `body` pointing at the source object; copy what you
 * need into owned strings instead.
 */
struct HTTP1Response {
    HTTP1Version version{HTTP1Version::UNKNOWN};
    int status_code{0};
    std::string_view reason;

    static constexpr size_t MAX_HEADERS = 64;
    struct Header {
        std::string_view name;
        std::string_view value;
    };
    std::array<Header, MAX_HEADERS> headers;
    size_t header_count{0};

    std::string_view body;
    std::string decoded_body;

    uint64_t content_length{0};
    bool has_content_length{false};
    bool chunked{false};
    bool keep_alive{false};

    /**
     * Get header value by name (case-insensitive).
     */
    std::string_view get_header(std::string_view name) const noexcept;

    bool has_header(std::string_view name) const noexcept;

    void reset() noexcept;
};

class HTTP1ResponseParser {
public:
    // Larger chunks are rejected as malformed
    static constexpr uint64_t MAX_CHUNK_SIZE = 64 * 1024 * 1024;

    HTTP1ResponseParser();

    /**
     * Parse a response from the bytes received so far.
     *
     * The parser is re-entrant on a growing buffer: call it again with the
     * whole accumulated buffer after every read until it stops returning -1.
     *
     * @param data Input buffer (must stay valid while the response is used)
     * @param len Buffer length
     * @param out_response Parsed response
     * @param out_consumed Bytes belonging to this response
     * @param at_eof True once the peer has closed the connection; completes
     *        responses whose body is delimited by connection close
     * @return 0 on success, 1 on error, -1 if need more data
     */
    int parse(
        const uint8_t* data,
        size_t len,
        HTTP1Response& out_response,
        size_t& out_consumed,
        bool at_eof = false
    );

    void reset() noexcept;

    HTTP1ResponseState get_state() const noexcept { return state_; }

    bool is_complete() const noexcept { return state_ == HTTP1ResponseState::COMPLETE; }

    bool has_error() const noexcept { return state_ == HTTP1ResponseState::ERROR; }

    /**
     * Why the last parse() returned 1. Empty otherwise.
     */
    const char* error_reason() const noexcept { return error_reason_; }

    /**
     * Case-insensitive string compare (public for HTTP1Response::get_header).
     */
    static bool str_eq_ci(std::string_view a, std::string_view b) noexcept;

private:
    HTTP1ResponseState state_;
    size_t pos_;
    size_t mark_;
    const char* error_reason_;

    int parse_status_line(const uint8_t* data, size_t len, HTTP1Response& resp) noexcept;

    int parse_header_field(const uint8_t* data, size_t len, HTTP1Response& resp) noexcept;

    int parse_header_value(const uint8_t* data, size_t len, HTTP1Response& resp) noexcept;

    /**
     * Reassemble a chunked body into resp.decoded_body.
     */
    int parse_chunked_body(const uint8_t* data, size_t len, HTTP1Response& resp);

    int fail(const char* reason) noexcept;

    static bool has_no_body(int status_code) noexcept;

    static bool is_token_char(uint8_t c) noexcept;

    static bool is_whitespace(uint8_t c) noexcept;
};

} // namespace http
} // namespace taskprobe
