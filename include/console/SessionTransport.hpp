#pragma once
#include "IConsoleTransport.hpp"
#include "IStreamConnection.hpp"
#include "ConsoleSession.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

// Keeps exactly one live ConsoleSession to the console.
//
// State machine:
//   Disconnected --connect ok--> Connected --write failure--> Disconnected
//   (Connecting is visible only while an attempt is in flight)
//
// start() runs a supervisor thread that reconnects whenever no live session
// exists, sleeping reconnectBackoff between failed attempts. A new session
// replaces the old one under mtx_; send() copies the pointer for the length of
// one call, so nothing holds a session across a swap. Nothing is queued or
// replayed: sends during an outage fail with NotConnected.
class SessionTransport : public IConsoleTransport {
public:
    SessionTransport(IConnector& connector,
                     const ControllerAddress& address,
                     const TransportTiming& timing,
                     uint8_t livenessByte);
    ~SessionTransport() override;

    SessionTransport(const SessionTransport&) = delete;
    SessionTransport& operator=(const SessionTransport&) = delete;

    // Single connect attempt. Installs the new session on success.
    // Returns ConnectError::None if a session is (already) live.
    ConnectError connect();

    // Reconnect supervisor lifecycle
    void start();
    void stop();
    bool isRunning() const { return running_; }

    SendStatus   send(const FrameSequence& frames) override;
    SessionState state() const override;

    // Blocks until the state equals `s` or the timeout passes
    bool waitForState(SessionState s, std::chrono::milliseconds timeout) const;

    int connectAttempts() const { return attempts_; }

    // Invoked on every state change, from whichever thread caused it
    std::function<void(SessionState)> onStateChange;

private:
    void reconnectLoop();
    void onSessionLost(uint64_t sessionId);
    void setState(SessionState s);
    void retireSession();

    IConnector&       connector_;
    ControllerAddress address_;
    TransportTiming   timing_;
    uint8_t           livenessByte_;

    mutable std::mutex              mtx_;
    mutable std::condition_variable cv_;
    std::shared_ptr<ConsoleSession> active_;
    SessionState                    state_ = SessionState::Disconnected;
    bool                            stopRequested_ = false;

    std::mutex        connectMtx_;   // one attempt in flight at a time
    std::thread       supervisor_;
    std::atomic<bool> running_{false};
    std::atomic<int>  attempts_{0};
    uint64_t          nextSessionId_ = 1;
};
