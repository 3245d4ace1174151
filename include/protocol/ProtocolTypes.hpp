#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// MIDI status nibbles and controller numbers used on the console link
namespace midi {
constexpr uint8_t kControlChange = 0xB0;
constexpr uint8_t kNoteOn        = 0x90;
constexpr uint8_t kNoteOff       = 0x80;

constexpr uint8_t kNrpnMsb       = 0x63;
constexpr uint8_t kNrpnLsb       = 0x62;
constexpr uint8_t kDataEntryMsb  = 0x06;
constexpr uint8_t kDataEntryLsb  = 0x26;

constexpr uint8_t kFullVelocity  = 0x7F;
constexpr uint8_t kActiveSensing = 0xFE;
}  // namespace midi

// Pause that must elapse after a frame before the next one is written
enum class FrameGap {
    InterFrame,   // standard pacing between frames of one sequence
    KeyPulse      // between a key activate and its release
};

struct Frame {
    std::vector<uint8_t> bytes;
    FrameGap gapAfter = FrameGap::InterFrame;

    bool operator==(const Frame& o) const { return bytes == o.bytes; }
};

using FrameSequence = std::vector<Frame>;

// Protocol coordinates for one controllable, taken verbatim from config
struct ParameterAddress {
    enum class Kind { Parameter, Key } kind = Kind::Parameter;
    uint8_t msb = 0;   // NRPN coordinate high
    uint8_t lsb = 0;   // NRPN coordinate low
    uint8_t key = 0;   // soft key note

    static ParameterAddress parameter(uint8_t msb, uint8_t lsb) {
        ParameterAddress a;
        a.kind = Kind::Parameter;
        a.msb  = msb;
        a.lsb  = lsb;
        return a;
    }

    static ParameterAddress softKey(uint8_t note) {
        ParameterAddress a;
        a.kind = Kind::Key;
        a.key  = note;
        return a;
    }
};

// Name -> address lookup. Mute groups live under "mute_group_<N>".
class AddressTable {
public:
    static std::string muteGroupName(int group) {
        return "mute_group_" + std::to_string(group);
    }

    void add(const std::string& name, const ParameterAddress& addr) {
        entries_[name] = addr;
    }

    std::optional<ParameterAddress> find(const std::string& name) const {
        auto it = entries_.find(name);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    size_t size() const { return entries_.size(); }

private:
    std::map<std::string, ParameterAddress> entries_;
};

// Per-console protocol settings shared by every built message
struct ProtocolSettings {
    uint8_t midiChannel  = 0;     // 0..15, ORed into status bytes
    uint8_t muteOnValue  = 127;
    uint8_t muteOffValue = 0;
    uint8_t livenessByte = midi::kActiveSensing;
};
