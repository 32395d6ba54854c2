/**
 * taskprobe TCP Socket - Implementation
 */

#include "tcp_socket.h"
#include "../core/logger.h"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/time.h>
#include <cstring>
#include <errno.h>

namespace taskprobe {
namespace net {

TcpSocket::TcpSocket(int fd)
    : fd_(fd)
{
}

TcpSocket::TcpSocket()
    : fd_(-1)
{
    fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : fd_(other.fd_)
{
    other.fd_ = -1;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void TcpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

int TcpSocket::set_nonblocking(bool enable) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    int flags = fcntl(fd_, F_GETFL, 0);
    if (flags < 0) {
        return -1;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd_, F_SETFL, flags) < 0 ? -1 : 0;
}

int TcpSocket::set_nodelay() {
    int val = 1;
    if (setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &val, sizeof(val)) < 0) {
        return -1;
    }
    return 0;
}

int TcpSocket::set_reuseaddr() {
    int val = 1;
    if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &val, sizeof(val)) < 0) {
        return -1;
    }
    return 0;
}

int TcpSocket::set_io_timeout(uint32_t timeout_ms) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);

    if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        return -1;
    }
    if (setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        return -1;
    }
    return 0;
}

int TcpSocket::connect(const std::string& host, uint16_t port, uint32_t timeout_ms) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    // Resolve hostname
    struct addrinfo hints, *resolved;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    int ret = getaddrinfo(host.c_str(), nullptr, &hints, &resolved);
    if (ret != 0) {
        LOG_DEBUG("Net", "getaddrinfo(%s) failed: %s", host.c_str(), gai_strerror(ret));
        errno = EHOSTUNREACH;
        return -1;
    }

    struct sockaddr_in addr;
    std::memcpy(&addr, resolved->ai_addr, sizeof(addr));
    addr.sin_port = htons(port);
    freeaddrinfo(resolved);

    if (timeout_ms == 0) {
        return ::connect(fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0 ? -1 : 0;
    }

    if (set_nonblocking(true) < 0) {
        return -1;
    }

    if (::connect(fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            int saved = errno;
            set_nonblocking(false);
            errno = saved;
            return -1;
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int n;
        do {
            n = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        } while (n < 0 && errno == EINTR);

        if (n == 0) {
            set_nonblocking(false);
            errno = ETIMEDOUT;
            return -1;
        }
        if (n < 0) {
            int saved = errno;
            set_nonblocking(false);
            errno = saved;
            return -1;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            so_error = errno;
        }
        if (so_error != 0) {
            set_nonblocking(false);
            errno = so_error;
            return -1;
        }
    }

    return set_nonblocking(false);
}

int TcpSocket::bind(const std::string& host, uint16_t port) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (host == "0.0.0.0" || host.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        errno = EINVAL;
        return -1;
    }

    if (::bind(fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        return -1;
    }
    return 0;
}

int TcpSocket::listen(int backlog) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }
    return ::listen(fd_, backlog) < 0 ? -1 : 0;
}

TcpSocket TcpSocket::accept(struct sockaddr_in* client_addr) {
    if (fd_ < 0) {
        errno = EBADF;
        return TcpSocket(-1);
    }

    struct sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);

    int client_fd = ::accept(fd_, (struct sockaddr*)&addr, &addr_len);

    if (client_addr && client_fd >= 0) {
        *client_addr = addr;
    }

    return TcpSocket(client_fd);
}

ssize_t TcpSocket::send(const void* data, size_t len, int flags) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }
    return ::send(fd_, data, len, flags | MSG_NOSIGNAL);
}

int TcpSocket::send_all(const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    size_t remaining = len;

    while (remaining > 0) {
        ssize_t n = send(p, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }
    return 0;
}

ssize_t TcpSocket::recv(void* buffer, size_t len, int flags) {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    ssize_t n;
    do {
        n = ::recv(fd_, buffer, len, flags);
    } while (n < 0 && errno == EINTR);
    return n;
}

int TcpSocket::shutdown_write() {
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }
    return ::shutdown(fd_, SHUT_WR) < 0 ? -1 : 0;
}

bool TcpSocket::get_local_address(std::string& ip, uint16_t& port) const {
    if (fd_ < 0) {
        return false;
    }

    struct sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);

    if (getsockname(fd_, (struct sockaddr*)&addr, &addr_len) < 0) {
        return false;
    }

    char ip_str[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr.sin_addr, ip_str, sizeof(ip_str)) == nullptr) {
        return false;
    }

    ip = ip_str;
    port = ntohs(addr.sin_port);
    return true;
}

int TcpSocket::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

} // namespace net
} // namespace taskprobe
