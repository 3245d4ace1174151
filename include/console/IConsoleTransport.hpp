#pragma once
#include "ConnectionTypes.hpp"
#include "protocol/ProtocolTypes.hpp"

// What the dispatcher sees of the console link: a send operation and a state.
// Implementations: SessionTransport.
class IConsoleTransport {
public:
    virtual ~IConsoleTransport() = default;

    // Transmits the frames in order with pacing. Never queues: a send while
    // not connected fails immediately with SendStatus::NotConnected.
    virtual SendStatus send(const FrameSequence& frames) = 0;

    virtual SessionState state() const = 0;
};
