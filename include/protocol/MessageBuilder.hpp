#pragma once
#include "ProtocolTypes.hpp"
#include "LogicalOperation.hpp"
#include <string>

// Turns logical operations into the ordered MIDI frames the console expects.
// Pure: no I/O and no state beyond the address table it was given.
//
//   NRPN parameter change (4 frames):
//     [B0|ch 63 msb] [B0|ch 62 lsb] [B0|ch 06 value>>7] [B0|ch 26 value&7F]
//   Soft key pulse (2 frames):
//     [90|ch key 7F] --key pulse gap--> [80|ch key 00]
//   Scene: one NRPN change per group, mutes ascending then unmutes ascending.
class MessageBuilder {
public:
    MessageBuilder(const AddressTable& addresses, const ProtocolSettings& settings)
        : addresses_(addresses), settings_(settings) {}

    // Throws MissingAddressError if the operation names an unknown address
    FrameSequence build(const LogicalOperation& op) const;

    // Low-level frame helpers, usable without an address table
    static FrameSequence nrpn(uint8_t channel, uint8_t paramMsb, uint8_t paramLsb,
                              int value);
    static FrameSequence keyPulse(uint8_t channel, uint8_t key);
    static Frame liveness(uint8_t byte);

private:
    FrameSequence buildPulse(const PulseKey& op) const;
    FrameSequence buildGroup(int group, bool muted) const;
    FrameSequence buildLevel(const SetLevel& op) const;
    FrameSequence buildScene(const ApplyScene& op) const;

    ParameterAddress parameterAddress(const std::string& name) const;

    AddressTable     addresses_;
    ProtocolSettings settings_;
};
