#pragma once
#include "config/BridgeConfig.hpp"
#include "console/IConsoleTransport.hpp"
#include "console/IStreamConnection.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

// Everything written to fake connections, with arrival times
struct WireLog {
    struct Write {
        std::vector<uint8_t> bytes;
        std::chrono::steady_clock::time_point at;
    };

    void record(const uint8_t* data, size_t len) {
        std::lock_guard lock(mtx);
        writes.push_back({{data, data + len}, std::chrono::steady_clock::now()});
    }

    std::vector<Write> all() const {
        std::lock_guard lock(mtx);
        return writes;
    }

    std::vector<Write> matching(const std::vector<uint8_t>& bytes) const {
        std::lock_guard lock(mtx);
        std::vector<Write> out;
        for (auto& w : writes)
            if (w.bytes == bytes) out.push_back(w);
        return out;
    }

    std::vector<Write> excluding(const std::vector<uint8_t>& bytes) const {
        std::lock_guard lock(mtx);
        std::vector<Write> out;
        for (auto& w : writes)
            if (w.bytes != bytes) out.push_back(w);
        return out;
    }

    std::atomic<bool> failWrites{false};
    mutable std::mutex mtx;
    std::vector<Write> writes;
};

class FakeConnection : public IStreamConnection {
public:
    explicit FakeConnection(std::shared_ptr<WireLog> log) : log_(std::move(log)) {}

    bool write(const uint8_t* data, size_t len) override {
        if (!open_ || log_->failWrites) return false;
        log_->record(data, len);
        return true;
    }
    void close() override { open_ = false; }
    bool isOpen() const override { return open_; }

private:
    std::shared_ptr<WireLog> log_;
    bool open_ = true;
};

// Fails the first `failures` attempts, then hands out FakeConnections
class FakeConnector : public IConnector {
public:
    explicit FakeConnector(int failures = 0,
                           ConnectError error = ConnectError::Refused)
        : failuresLeft_(failures), error_(error) {}

    ConnectResult connect(const ControllerAddress&,
                          std::chrono::milliseconds) override {
        std::lock_guard lock(mtx_);
        attemptTimes_.push_back(std::chrono::steady_clock::now());
        ConnectResult r;
        if (failuresLeft_ > 0) {
            failuresLeft_--;
            r.error = error_;
            return r;
        }
        r.connection = std::make_unique<FakeConnection>(log);
        return r;
    }

    void failNext(int n) {
        std::lock_guard lock(mtx_);
        failuresLeft_ = n;
    }

    std::vector<std::chrono::steady_clock::time_point> attempts() const {
        std::lock_guard lock(mtx_);
        return attemptTimes_;
    }

    std::shared_ptr<WireLog> log = std::make_shared<WireLog>();

private:
    mutable std::mutex mtx_;
    int          failuresLeft_;
    ConnectError error_;
    std::vector<std::chrono::steady_clock::time_point> attemptTimes_;
};

// Records what the dispatcher sends; status is scripted
class FakeTransport : public IConsoleTransport {
public:
    SendStatus send(const FrameSequence& frames) override {
        sent.push_back(frames);
        return nextStatus;
    }
    SessionState state() const override {
        return nextStatus == SendStatus::Ok ? SessionState::Connected
                                            : SessionState::Disconnected;
    }

    SendStatus nextStatus = SendStatus::Ok;
    std::vector<FrameSequence> sent;
};

inline TransportTiming fastTiming() {
    TransportTiming t;
    t.livenessInterval = std::chrono::milliseconds(10000);
    t.frameDelay       = std::chrono::milliseconds(1);
    t.keyPulseGap      = std::chrono::milliseconds(5);
    t.connectTimeout   = std::chrono::milliseconds(500);
    t.reconnectBackoff = std::chrono::milliseconds(50);
    return t;
}

// The four-button layout of the stock config
inline BridgeConfig testConfig() {
    BridgeConfig c;
    c.console = {"127.0.0.1", 51325};
    c.timing  = fastTiming();

    c.addresses.add("recording",      ParameterAddress::softKey(0x30));
    c.addresses.add("aux_send_level", ParameterAddress::parameter(0x40, 0x00));
    for (int g = 1; g <= 4; g++)
        c.addresses.add(AddressTable::muteGroupName(g),
                        ParameterAddress::parameter(0x04, static_cast<uint8_t>(g - 1)));

    c.buttons = {
        {20, "recording"},
        {21, "monitor_level"},
        {22, "fx_mute"},
        {23, "break_mode"},
    };

    c.behaviors.monitorAddress = "aux_send_level";
    c.behaviors.monitorLow     = 60;
    c.behaviors.monitorHigh    = 100;
    c.behaviors.fxMuteGroup    = 1;
    c.behaviors.breakActive    = {{1, 2, 4}, {3}};
    c.behaviors.breakInactive  = {{3}, {1, 2, 4}};
    return c;
}
