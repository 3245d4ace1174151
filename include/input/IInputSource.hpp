#pragma once
#include "InputEvent.hpp"
#include <chrono>
#include <optional>
#include <string>

// Source of normalized foot controller events.
// Implementations: MidiPortInput (system MIDI ports),
// RawMidiInput (device node or FIFO).
class IInputSource {
public:
    virtual ~IInputSource() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Waits up to `timeout` for the next event. Returns nullopt on timeout
    // or when the device went away (check isOpen()).
    virtual std::optional<InputEvent> next(std::chrono::milliseconds timeout) = 0;

    // Name for logging
    virtual std::string describe() const = 0;
};
