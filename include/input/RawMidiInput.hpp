#pragma once
#include "IInputSource.hpp"
#include "MidiStreamParser.hpp"
#include <deque>
#include <optional>
#include <string>
#include <vector>

// Reads raw MIDI bytes from a character device (/dev/snd/midiC*D*) or a FIFO.
//
// With no explicit device the first raw MIDI node whose ALSA card id
// (/proc/asound/cardN/id) contains one of the name patterns is used, so a
// USB controller is found again after it re-enumerates under a new card
// number. BLE-MIDI pedals have no such node; they go through MidiPortInput.
class RawMidiInput : public IInputSource {
public:
    RawMidiInput(std::string device,
                 std::vector<std::string> namePatterns,
                 int channelFilter = -1);
    ~RawMidiInput() override;

    RawMidiInput(const RawMidiInput&) = delete;
    RawMidiInput& operator=(const RawMidiInput&) = delete;

    bool open() override;
    void close() override;
    bool isOpen() const override { return fd_ >= 0; }

    std::optional<InputEvent> next(std::chrono::milliseconds timeout) override;

    std::string describe() const override;

    // First /dev/snd/midiC*D* whose card id matches a pattern (case-insensitive)
    static std::optional<std::string> findDevice(const std::vector<std::string>& patterns,
                                                 const std::string& devDir  = "/dev/snd",
                                                 const std::string& procDir = "/proc/asound");

private:
    std::string              device_;
    std::vector<std::string> patterns_;
    std::string              openedPath_;
    int                      fd_ = -1;
    MidiStreamParser         parser_;
    std::deque<InputEvent>   pending_;
};
