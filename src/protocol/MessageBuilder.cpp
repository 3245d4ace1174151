#include "protocol/MessageBuilder.hpp"
#include "config/ConfigError.hpp"
#include <algorithm>

FrameSequence MessageBuilder::build(const LogicalOperation& op) const {
    if (auto* k = std::get_if<PulseKey>(&op))
        return buildPulse(*k);
    if (auto* g = std::get_if<SetGroupState>(&op))
        return buildGroup(g->groupId, g->muted);
    if (auto* l = std::get_if<SetLevel>(&op))
        return buildLevel(*l);
    return buildScene(std::get<ApplyScene>(op));
}

FrameSequence MessageBuilder::nrpn(uint8_t channel, uint8_t paramMsb,
                                   uint8_t paramLsb, int value) {
    const uint8_t status = midi::kControlChange | (channel & 0x0F);
    value = std::clamp(value, 0, 127);

    // Values here always fit in 7 bits; the MSB/LSB split is still sent
    return {
        {{status, midi::kNrpnMsb,      static_cast<uint8_t>(paramMsb & 0x7F)}},
        {{status, midi::kNrpnLsb,      static_cast<uint8_t>(paramLsb & 0x7F)}},
        {{status, midi::kDataEntryMsb, static_cast<uint8_t>(value >> 7)}},
        {{status, midi::kDataEntryLsb, static_cast<uint8_t>(value & 0x7F)}},
    };
}

FrameSequence MessageBuilder::keyPulse(uint8_t channel, uint8_t key) {
    const uint8_t ch = channel & 0x0F;
    key &= 0x7F;
    return {
        {{static_cast<uint8_t>(midi::kNoteOn | ch), key, midi::kFullVelocity},
         FrameGap::KeyPulse},
        {{static_cast<uint8_t>(midi::kNoteOff | ch), key, 0x00}},
    };
}

Frame MessageBuilder::liveness(uint8_t byte) {
    return {{byte}};
}

// ── Private ──────────────────────────────────────────────────────────────

FrameSequence MessageBuilder::buildPulse(const PulseKey& op) const {
    return keyPulse(settings_.midiChannel, op.code);
}

FrameSequence MessageBuilder::buildGroup(int group, bool muted) const {
    auto addr = parameterAddress(AddressTable::muteGroupName(group));
    return nrpn(settings_.midiChannel, addr.msb, addr.lsb,
                muted ? settings_.muteOnValue : settings_.muteOffValue);
}

FrameSequence MessageBuilder::buildLevel(const SetLevel& op) const {
    auto addr = parameterAddress(op.channelRef);
    return nrpn(settings_.midiChannel, addr.msb, addr.lsb, op.value);
}

FrameSequence MessageBuilder::buildScene(const ApplyScene& op) const {
    // Mute before unmute so old and new paths are never open together.
    // std::set iterates in ascending group order.
    FrameSequence out;
    for (int g : op.muteGroups) {
        auto part = buildGroup(g, true);
        out.insert(out.end(), part.begin(), part.end());
    }
    for (int g : op.unmuteGroups) {
        if (op.muteGroups.count(g)) continue;  // mute wins
        auto part = buildGroup(g, false);
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

ParameterAddress MessageBuilder::parameterAddress(const std::string& name) const {
    auto addr = addresses_.find(name);
    if (!addr || addr->kind != ParameterAddress::Kind::Parameter)
        throw MissingAddressError(name);
    return *addr;
}
