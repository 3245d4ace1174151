#pragma once
#include "ConnectionTypes.hpp"
#include "IStreamConnection.hpp"
#include "protocol/ProtocolTypes.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

// One live connection to the console plus its liveness pulse.
//
// Two writers share the socket: send() from the event path and the liveness
// thread. Both take writeMtx_, held for exactly one frame sequence or one
// liveness byte. The first failed write closes the socket, flips the session
// to disconnected for good and fires onLost. A session is never revived;
// the transport replaces it with a new one.
class ConsoleSession {
public:
    using LostCallback = std::function<void(uint64_t sessionId)>;

    ConsoleSession(uint64_t id,
                   std::unique_ptr<IStreamConnection> connection,
                   const TransportTiming& timing,
                   uint8_t livenessByte,
                   LostCallback onLost);
    ~ConsoleSession();

    ConsoleSession(const ConsoleSession&) = delete;
    ConsoleSession& operator=(const ConsoleSession&) = delete;

    // Starts the liveness thread. First pulse goes out one interval from now.
    void start();

    // Stops the liveness thread and closes the socket. Does not fire onLost.
    // Must not be called from the liveness thread.
    void close();

    SendStatus send(const FrameSequence& frames);

    bool     isConnected() const { return connected_; }
    uint64_t id() const { return id_; }

private:
    void livenessLoop();
    bool pulseOnce();

    // Caller holds writeMtx_. Returns true if this call did the transition.
    bool markLostLocked(const char* reason);

    std::chrono::milliseconds gapFor(FrameGap gap) const;

    const uint64_t  id_;
    std::unique_ptr<IStreamConnection> connection_;
    TransportTiming timing_;
    uint8_t         livenessByte_;
    LostCallback    onLost_;

    std::atomic<bool> connected_{true};
    std::mutex        writeMtx_;

    std::mutex              stopMtx_;
    std::condition_variable stopCv_;
    bool                    stopping_ = false;
    std::thread             livenessThread_;
};
