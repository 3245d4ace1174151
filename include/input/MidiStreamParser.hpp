#pragma once
#include "InputEvent.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

// Incremental decoder for a raw MIDI byte stream.
// Emits Control Change (controller, value) and Note On (note, velocity) as
// InputEvents; Note On with velocity 0 comes out as value 0. Everything else
// is consumed and dropped. Handles running status, realtime bytes interleaved
// anywhere and SysEx blocks.
class MidiStreamParser {
public:
    explicit MidiStreamParser(int channelFilter = -1)
        : channelFilter_(channelFilter) {}

    // Feed one byte; returns an event when a message completes
    std::optional<InputEvent> feed(uint8_t byte) {
        if (byte >= 0xF8)            // realtime: no effect on parser state
            return std::nullopt;

        if (byte & 0x80) {
            startStatus(byte);
            return std::nullopt;
        }

        if (inSysEx_ || status_ == 0)
            return std::nullopt;     // stray data byte

        data_[count_++] = byte;
        if (count_ < expected_)
            return std::nullopt;

        count_ = 0;
        if (status_ >= 0xF0) {       // system common complete, no running status
            status_ = 0;
            return std::nullopt;
        }
        return complete();
    }

    void reset() {
        status_   = 0;
        count_    = 0;
        expected_ = 0;
        inSysEx_  = false;
    }

private:
    void startStatus(uint8_t byte) {
        count_ = 0;
        if (byte == 0xF0) { inSysEx_ = true; status_ = 0; return; }
        inSysEx_ = false;
        if (byte == 0xF7) { status_ = 0; return; }

        status_ = byte;
        switch (byte & 0xF0) {
            case 0xC0:
            case 0xD0: expected_ = 1; break;
            case 0xF0:
                switch (byte) {
                    case 0xF1:
                    case 0xF3: expected_ = 1; break;
                    case 0xF2: expected_ = 2; break;
                    default:   status_ = 0; expected_ = 0; break;   // F6 etc.
                }
                break;
            default:   expected_ = 2; break;
        }
    }

    std::optional<InputEvent> complete() {
        int kind    = status_ & 0xF0;
        int channel = status_ & 0x0F;
        if (channelFilter_ >= 0 && channel != channelFilter_)
            return std::nullopt;

        if (kind == 0xB0 || kind == 0x90) {
            InputEvent ev;
            ev.sourceCode = data_[0];
            ev.value      = data_[1];
            ev.receivedAt = std::chrono::steady_clock::now();
            return ev;
        }
        return std::nullopt;
    }

    int     channelFilter_;
    uint8_t status_   = 0;
    uint8_t data_[2]  = {0, 0};
    size_t  count_    = 0;
    size_t  expected_ = 0;
    bool    inSysEx_  = false;
};
