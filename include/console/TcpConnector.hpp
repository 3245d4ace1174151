#pragma once
#include "IStreamConnection.hpp"
#include <string>
#include <vector>

// Blocking TCP stream to the console. Owns the socket descriptor.
class TcpConnection : public IStreamConnection {
public:
    explicit TcpConnection(int fd) : sockFd_(fd) {}
    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    bool write(const uint8_t* data, size_t len) override;
    void close() override;
    bool isOpen() const override { return sockFd_ >= 0; }

    // Whatever the console sent within `timeout`; empty on silence or error.
    // The bridge never reads; this is for diagnostics.
    std::vector<uint8_t> receive(std::chrono::milliseconds timeout);

private:
    int sockFd_ = -1;
};

// Opens TCP connections with a bounded connect time.
class TcpConnector : public IConnector {
public:
    ConnectResult connect(const ControllerAddress& address,
                          std::chrono::milliseconds timeout) override;

    static ConnectError classifyErrno(int err);
};
