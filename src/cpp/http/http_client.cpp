#include "http_client.h"
#include "http1_response_parser.h"
#include "../net/tcp_socket.h"
#include "../core/logger.h"

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>

namespace taskprobe {
namespace http {

using core::error_code;
using core::result;

// ============================================================================
// Endpoint
// ============================================================================

std::string Endpoint::url() const {
    return "http://" + authority();
}

std::string Endpoint::authority() const {
    return host + ":" + std::to_string(port);
}

result<Endpoint> parse_base_url(std::string_view url) {
    std::string_view rest = url;

    auto starts_with_ci = [](std::string_view s, std::string_view prefix) {
        return s.size() >= prefix.size() &&
               HTTP1ResponseParser::str_eq_ci(s.substr(0, prefix.size()), prefix);
    };

    bool had_scheme = false;
    if (starts_with_ci(rest, "https://")) {
        return {error_code::unsupported, "https is not supported: " + std::string(url)};
    }
    if (starts_with_ci(rest, "http://")) {
        rest.remove_prefix(7);
        had_scheme = true;
    } else if (rest.find("://") != std::string_view::npos) {
        return {error_code::invalid_argument, "Unsupported URL scheme: " + std::string(url)};
    }

    while (!rest.empty() && rest.back() == '/') {
        rest.remove_suffix(1);
    }
    if (rest.find('/') != std::string_view::npos) {
        return {error_code::invalid_argument, "Base URL must not contain a path: " + std::string(url)};
    }

    Endpoint endpoint;
    size_t colon = rest.rfind(':');
    if (colon == std::string_view::npos) {
        endpoint.host = std::string(rest);
        endpoint.port = 80;
    } else {
        endpoint.host = std::string(rest.substr(0, colon));
        std::string_view port_text = rest.substr(colon + 1);

        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (port_text.empty() || ec != std::errc() ||
            ptr != port_text.data() + port_text.size() || port == 0 || port > 65535) {
            return {error_code::invalid_argument, "Invalid port in base URL: " + std::string(url)};
        }
        endpoint.port = static_cast<uint16_t>(port);
    }

    if (endpoint.host.empty()) {
        return {error_code::invalid_argument, "Missing host in base URL: " + std::string(url)};
    }
    if (!had_scheme && colon == std::string_view::npos) {
        LOG_DEBUG("Config", "No scheme or port in '%s', assuming http on port 80",
                  std::string(url).c_str());
    }

    return endpoint;
}

// ============================================================================
// ClientResponse
// ============================================================================

std::string_view ClientResponse::get_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (HTTP1ResponseParser::str_eq_ci(header.first, name)) {
            return header.second;
        }
    }
    return {};
}

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(Config config)
    : config_(std::move(config)) {
}

result<ClientResponse> HttpClient::get(const std::string& path) {
    return send(ClientRequest{"GET", path, {}, {}});
}

result<ClientResponse> HttpClient::post(const std::string& path, std::string body,
                                        std::string content_type) {
    return send(ClientRequest{"POST", path, std::move(body), std::move(content_type)});
}

result<ClientResponse> HttpClient::put(const std::string& path, std::string body,
                                       std::string content_type) {
    return send(ClientRequest{"PUT", path, std::move(body), std::move(content_type)});
}

result<ClientResponse> HttpClient::del(const std::string& path) {
    return send(ClientRequest{"DELETE", path, {}, {}});
}

std::string HttpClient::serialize_request(const ClientRequest& request,
                                          const Endpoint& endpoint,
                                          std::string_view user_agent) {
    std::string out;
    out.reserve(256 + request.body.size());

    out += request.method;
    out += ' ';
    out += request.path.empty() ? std::string("/") : request.path;
    out += " HTTP/1.1\r\n";

    out += "Host: ";
    out += endpoint.authority();
    out += "\r\n";

    out += "User-Agent: ";
    out += user_agent;
    out += "\r\n";

    out += "Accept: application/json\r\n";
    out += "Connection: close\r\n";

    // POST/PUT always carry a length so the server never waits for a body
    bool wants_length = !request.body.empty() || request.method == "POST" || request.method == "PUT";
    if (!request.body.empty() && !request.content_type.empty()) {
        out += "Content-Type: ";
        out += request.content_type;
        out += "\r\n";
    }
    if (wants_length) {
        out += "Content-Length: ";
        out += std::to_string(request.body.size());
        out += "\r\n";
    }

    out += "\r\n";
    out += request.body;
    return out;
}

using Clock = std::chrono::steady_clock;

uint32_t remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<uint32_t>(left) : 0;
}

result<ClientResponse> HttpClient::send(const ClientRequest& request) {
    const Endpoint& endpoint = config_.endpoint;
    const std::string target = endpoint.authority();
    const auto deadline = Clock::now() + std::chrono::milliseconds(config_.timeout_ms);

    LOG_DEBUG("HTTP", "%s %s (host %s)", request.method.c_str(), request.path.c_str(), target.c_str());

    net::TcpSocket socket;
    if (!socket.is_valid()) {
        return {error_code::connect_failed,
                std::string("Cannot create socket: ") + std::strerror(errno)};
    }

    if (socket.connect(endpoint.host, endpoint.port, config_.timeout_ms) < 0) {
        int err = errno;
        LOG_DEBUG("Net", "connect(%s) failed: %s", target.c_str(), std::strerror(err));
        if (err == ETIMEDOUT) {
            return {error_code::timeout,
                    "Connection to " + target + " timed out after " +
                    std::to_string(config_.timeout_ms) + "ms"};
        }
        if (err == ECONNREFUSED) {
            return {error_code::connect_failed, "Connection refused (" + target + ")"};
        }
        if (err == EHOSTUNREACH) {
            return {error_code::connect_failed, "Cannot resolve or reach host " + endpoint.host};
        }
        return {error_code::connect_failed,
                "Cannot connect to " + target + ": " + std::strerror(err)};
    }
    if (socket.set_nodelay() < 0) {
        LOG_DEBUG("Net", "TCP_NODELAY on %s failed: %s", target.c_str(), std::strerror(errno));
    }

    std::string wire = serialize_request(request, endpoint, config_.user_agent);

    uint32_t send_left = remaining_ms(deadline);
    if (send_left == 0) {
        return {error_code::timeout,
                "Connection to " + target + " used the whole " +
                std::to_string(config_.timeout_ms) + "ms deadline"};
    }
    if (socket.set_io_timeout(send_left) < 0 ||
        socket.send_all(wire.data(), wire.size()) < 0) {
        int err = errno;
        if (err == EAGAIN || err == EWOULDBLOCK) {
            return {error_code::timeout,
                    "Sending request to " + target + " timed out after " +
                    std::to_string(config_.timeout_ms) + "ms"};
        }
        return {error_code::send_failed,
                std::string("Failed to send request: ") + std::strerror(err)};
    }

    std::string buffer;
    buffer.reserve(4096);
    char chunk[4096];

    HTTP1ResponseParser parser;
    HTTP1Response parsed;
    size_t consumed = 0;

    while (true) {
        uint32_t left = remaining_ms(deadline);
        if (left == 0) {
            return {error_code::timeout,
                    "No complete response from " + target + " within " +
                    std::to_string(config_.timeout_ms) + "ms"};
        }
        if (socket.set_io_timeout(left) < 0) {
            return {error_code::recv_failed,
                    std::string("Cannot set read deadline: ") + std::strerror(errno)};
        }

        ssize_t n = socket.recv(chunk, sizeof(chunk));
        if (n < 0) {
            int err = errno;
            if (err == EAGAIN || err == EWOULDBLOCK) {
                return {error_code::timeout,
                        "Read from " + target + " timed out after " +
                        std::to_string(config_.timeout_ms) + "ms"};
            }
            return {error_code::recv_failed,
                    std::string("Failed to read response: ") + std::strerror(err)};
        }

        bool at_eof = (n == 0);
        if (!at_eof) {
            buffer.append(chunk, static_cast<size_t>(n));
            if (buffer.size() > config_.max_response_size) {
                return {error_code::parse_error,
                        "Response exceeds " + std::to_string(config_.max_response_size) + " bytes"};
            }
        }

        int rc = parser.parse(reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size(),
                              parsed, consumed, at_eof);
        if (rc == 0) {
            break;
        }
        if (rc > 0) {
            LOG_DEBUG("HTTP", "Response parse error from %s: %s", target.c_str(), parser.error_reason());
            if (at_eof) {
                return {error_code::connection_closed,
                        std::string("Connection closed: ") + parser.error_reason()};
            }
            return {error_code::parse_error,
                    std::string("Malformed HTTP response: ") + parser.error_reason()};
        }
        // rc < 0: need more data; at_eof always completes or fails above
    }

    ClientResponse response;
    response.status = parsed.status_code;
    response.reason = std::string(parsed.reason);
    response.headers.reserve(parsed.header_count);
    for (size_t i = 0; i < parsed.header_count; ++i) {
        response.headers.emplace_back(std::string(parsed.headers[i].name),
                                      std::string(parsed.headers[i].value));
    }
    response.body = std::string(parsed.body);

    LOG_DEBUG("HTTP", "%s %s -> %d (%zu body bytes)",
              request.method.c_str(), request.path.c_str(), response.status, response.body.size());
    return response;
}

} // namespace http
} // namespace taskprobe
