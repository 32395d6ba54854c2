/**
 * taskprobe TCP Socket - blocking TCP with deadlines
 *
 * Features:
 * - RAII wrapper around raw sockets
 * - Connect with timeout (non-blocking connect + poll)
 * - Per-call send/receive deadlines (SO_SNDTIMEO / SO_RCVTIMEO)
 * - Listener helpers used by loopback servers in tests
 *
 * Calls return 0 (or a byte count) on success and -1 on failure with errno
 * set, like the system calls they wrap.
 */

#pragma once

#include <cstdint>
#include <string>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>

namespace taskprobe {
namespace net {

class TcpSocket {
public:
    /**
     * Create a TCP socket from an existing file descriptor
     * Takes ownership of the fd.
     */
    explicit TcpSocket(int fd);

    /**
     * Create a new IPv4 TCP socket
     */
    TcpSocket();

    ~TcpSocket();

    // Non-copyable, movable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    int fd() const { return fd_; }

    bool is_valid() const { return fd_ >= 0; }

    void close();

    int set_nonblocking(bool enable = true);

    /**
     * Disable Nagle's algorithm (set TCP_NODELAY)
     */
    int set_nodelay();

    int set_reuseaddr();

    /**
     * Apply the same deadline to every subsequent send() and recv().
     * A blocked call then fails with EAGAIN/EWOULDBLOCK.
     *
     * @param timeout_ms Deadline in milliseconds (0 = block forever)
     */
    int set_io_timeout(uint32_t timeout_ms);

    /**
     * Connect to a remote address, waiting at most timeout_ms.
     * The socket is left in blocking mode.
     *
     * @param host Hostname or IPv4 address
     * @param port Port number
     * @param timeout_ms Connect deadline (0 = system default)
     * @return 0 on success, -1 on error (errno: ETIMEDOUT on deadline,
     *         EHOSTUNREACH when the name does not resolve)
     */
    int connect(const std::string& host, uint16_t port, uint32_t timeout_ms = 0);

    /**
     * Bind to local address
     * @param host Local IP address (or "0.0.0.0" for any)
     * @param port Local port (0 = ephemeral)
     */
    int bind(const std::string& host, uint16_t port);

    int listen(int backlog = 128);

    /**
     * Accept a new connection
     * @return New TcpSocket for the connection, or invalid socket on error
     */
    TcpSocket accept(struct sockaddr_in* client_addr = nullptr);

    /**
     * Send data
     * @return Number of bytes sent, or -1 on error
     */
    ssize_t send(const void* data, size_t len, int flags = 0);

    /**
     * Send the whole buffer, retrying on short writes and EINTR.
     * @return 0 once everything is written, -1 on error
     */
    int send_all(const void* data, size_t len);

    /**
     * Receive data
     * @return Number of bytes received, 0 on EOF, -1 on error
     */
    ssize_t recv(void* buffer, size_t len, int flags = 0);

    /**
     * Shut down the write side (half-close)
     */
    int shutdown_write();

    bool get_local_address(std::string& ip, uint16_t& port) const;

    /**
     * Release ownership of the file descriptor
     * Returns the fd and sets internal fd to -1
     */
    int release();

private:
    int fd_;
};

} // namespace net
} // namespace taskprobe
