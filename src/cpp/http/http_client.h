#pragma once

#include "../core/result.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace taskprobe {
namespace http {

/**
 * Host and port of the service under test.
 */
struct Endpoint {
    std::string host;
    uint16_t port{80};

    /**
     * "http://host:port"
     */
    std::string url() const;

    /**
     * "host:port", also used as the Host header
     */
    std::string authority() const;
};

/**
 * Parse "http://host:port", "http://host" or "host:port".
 * A trailing slash is ignored; any other path, and https://, are rejected.
 */
core::result<Endpoint> parse_base_url(std::string_view url);

/**
 * Whole milliseconds left before `deadline`, 0 once it has passed.
 * Socket timeouts treat 0 as "no timeout", so callers must check for it.
 */
uint32_t remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept;

/**
 * One outgoing request. The body is sent as-is; content_type is only
 * written when the body is non-empty.
 */
struct ClientRequest {
    std::string method;
    std::string path;
    std::string body;
    std::string content_type{"application/json"};
};

/**
 * A fully received response, owning its data.
 */
struct ClientResponse {
    int status{0};
    std::string reason;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /**
     * Get header value by name (case-insensitive). Empty if absent.
     */
    std::string_view get_header(std::string_view name) const noexcept;
};

/**
 * Request/response seam between the harness and the network.
 *
 * HttpClient is the real implementation; tests substitute an in-process
 * fake so the harness runs without sockets.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * Perform one request.
     *
     * @return the response for any HTTP status, or a transport error
     *         (connect_failed, timeout, send_failed, recv_failed,
     *         connection_closed, parse_error)
     */
    virtual core::result<ClientResponse> send(const ClientRequest& request) = 0;
};

/**
 * Blocking HTTP/1.1 client.
 *
 * One TCP connection per request with "Connection: close"; the response is
 * read until the parser reports it complete or the peer closes. The timeout
 * is a deadline for the whole exchange (connect, write, read).
 */
class HttpClient : public HttpTransport {
public:
    struct Config {
        Endpoint endpoint{"localhost", 8080};
        uint32_t timeout_ms = 5000;
        std::string user_agent = "taskprobe/1.0";
        size_t max_response_size = 8 * 1024 * 1024;  // 8MB
    };

    explicit HttpClient(Config config);

    core::result<ClientResponse> send(const ClientRequest& request) override;

    core::result<ClientResponse> get(const std::string& path);

    core::result<ClientResponse> post(const std::string& path, std::string body,
                                      std::string content_type = "application/json");

    core::result<ClientResponse> put(const std::string& path, std::string body,
                                     std::string content_type = "application/json");

    core::result<ClientResponse> del(const std::string& path);

    const Config& config() const noexcept { return config_; }

    /**
     * Serialize a request exactly as it goes on the wire.
     */
    static std::string serialize_request(const ClientRequest& request,
                                         const Endpoint& endpoint,
                                         std::string_view user_agent);

private:
    Config config_;
};

} // namespace http
} // namespace taskprobe
