#pragma once
#include "IInputSource.hpp"
#include "MidiStreamParser.hpp"
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class RtMidiIn;

// Foot controller input through the system MIDI port list (ALSA sequencer on
// Linux, via RtMidi). This is where a BLE-MIDI pedal paired through BlueZ
// shows up; it never gets a /dev/snd/midiC*D* node.
//
// The port is chosen by exact name when one is configured and present,
// otherwise by the first port whose name contains one of the patterns.
// Messages arrive on RtMidi's thread and are queued for next().
class MidiPortInput : public IInputSource {
public:
    MidiPortInput(std::string portName,
                  std::vector<std::string> namePatterns,
                  int channelFilter = -1);
    ~MidiPortInput() override;

    MidiPortInput(const MidiPortInput&) = delete;
    MidiPortInput& operator=(const MidiPortInput&) = delete;

    bool open() override;
    void close() override;
    bool isOpen() const override { return midi_ != nullptr; }

    std::optional<InputEvent> next(std::chrono::milliseconds timeout) override;

    std::string describe() const override;

    // Index into `ports` of the port to open, or nullopt
    static std::optional<size_t> choosePort(const std::vector<std::string>& ports,
                                            const std::string& portName,
                                            const std::vector<std::string>& patterns);

private:
    static void onMessage(double timeStamp, std::vector<unsigned char>* message,
                          void* self);
    bool portStillListed();

    std::string              portName_;
    std::vector<std::string> patterns_;
    std::string              openedName_;
    std::unique_ptr<RtMidiIn> midi_;

    std::mutex                mtx_;
    std::condition_variable   cv_;
    MidiStreamParser          parser_;
    std::deque<InputEvent>    pending_;

    std::chrono::steady_clock::time_point lastPresenceCheck_;
};
