#include "console/TcpConnector.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <sys/time.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

TcpConnection::~TcpConnection() {
    close();
}

bool TcpConnection::write(const uint8_t* data, size_t len) {
    if (sockFd_ < 0) return false;

    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(sockFd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("Console: write failed: {}", strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::vector<uint8_t> TcpConnection::receive(std::chrono::milliseconds timeout) {
    std::vector<uint8_t> out;
    if (sockFd_ < 0) return out;

    struct pollfd pfd{};
    pfd.fd     = sockFd_;
    pfd.events = POLLIN;
    if (poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0)
        return out;

    uint8_t buf[1024];
    ssize_t n = ::recv(sockFd_, buf, sizeof(buf), MSG_DONTWAIT);
    if (n > 0) out.assign(buf, buf + n);
    return out;
}

void TcpConnection::close() {
    if (sockFd_ >= 0) {
        ::shutdown(sockFd_, SHUT_RDWR);
        ::close(sockFd_);
        sockFd_ = -1;
    }
}

// ── Connector ────────────────────────────────────────────────────────────

ConnectError TcpConnector::classifyErrno(int err) {
    switch (err) {
        case ETIMEDOUT:
            return ConnectError::Timeout;
        case ECONNREFUSED:
        case ECONNRESET:
            return ConnectError::Refused;
        default:
            return ConnectError::Unreachable;
    }
}

ConnectResult TcpConnector::connect(const ControllerAddress& address,
                                    std::chrono::milliseconds timeout) {
    ConnectResult result;

    struct addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* info = nullptr;
    std::string port = std::to_string(address.port);
    int rc = getaddrinfo(address.host.c_str(), port.c_str(), &hints, &info);
    if (rc != 0 || info == nullptr) {
        spdlog::error("Console: cannot resolve {}: {}", address.host, gai_strerror(rc));
        result.error = ConnectError::Unreachable;
        return result;
    }

    int fd = socket(info->ai_family, SOCK_STREAM, 0);
    if (fd < 0) {
        spdlog::error("Console: failed to create TCP socket: {}", strerror(errno));
        freeaddrinfo(info);
        result.error = ConnectError::Unreachable;
        return result;
    }

    // Non-blocking connect so the attempt is bounded by the timeout
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    rc = ::connect(fd, info->ai_addr, info->ai_addrlen);
    freeaddrinfo(info);

    int err = 0;
    if (rc < 0 && errno != EINPROGRESS) {
        err = errno;
    } else if (rc < 0) {
        struct pollfd pfd{};
        pfd.fd     = fd;
        pfd.events = POLLOUT;
        int ready;
        do {
            ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            err = ETIMEDOUT;
        } else if (ready < 0) {
            err = errno;
        } else {
            socklen_t len = sizeof(err);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0)
                err = errno;
        }
    }

    if (err != 0) {
        ::close(fd);
        result.error = classifyErrno(err);
        spdlog::warn("Console: connect to {} failed ({}): {}",
                     address.str(), toString(result.error), strerror(err));
        return result;
    }

    // Back to blocking writes; frames go out immediately
    fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    struct timeval tv{};
    tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    result.connection = std::make_unique<TcpConnection>(fd);
    return result;
}
