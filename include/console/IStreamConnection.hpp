#pragma once
#include "ConnectionTypes.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

// One open byte stream to the console. Implementations: TcpConnection.
// Not thread-safe; ConsoleSession serializes every call.
class IStreamConnection {
public:
    virtual ~IStreamConnection() = default;

    // Writes all bytes or returns false. A false return leaves the stream unusable.
    virtual bool write(const uint8_t* data, size_t len) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

struct ConnectResult {
    std::unique_ptr<IStreamConnection> connection;
    ConnectError error = ConnectError::None;

    bool ok() const { return connection != nullptr; }
};

// Opens stream connections. Implementations: TcpConnector.
class IConnector {
public:
    virtual ~IConnector() = default;

    virtual ConnectResult connect(const ControllerAddress& address,
                                  std::chrono::milliseconds timeout) = 0;
};
