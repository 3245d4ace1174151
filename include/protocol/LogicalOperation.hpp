#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <set>
#include <string>
#include <variant>

// Semantic intents the dispatcher can fire. Never carries raw bytes.
struct PulseKey {
    uint8_t code = 0;
};

struct SetGroupState {
    int  groupId = 0;
    bool muted   = false;
};

struct SetLevel {
    std::string channelRef;   // address table name, e.g. "aux_send_level"
    int         value = 0;    // 0..127
};

struct ApplyScene {
    std::set<int> muteGroups;
    std::set<int> unmuteGroups;
};

using LogicalOperation = std::variant<PulseKey, SetGroupState, SetLevel, ApplyScene>;

namespace detail {
inline std::string joinGroups(const std::set<int>& groups) {
    std::string out;
    for (int g : groups) {
        if (!out.empty()) out += ",";
        out += std::to_string(g);
    }
    return out;
}
}  // namespace detail

// For log lines
inline std::string describe(const LogicalOperation& op) {
    struct Visitor {
        std::string operator()(const PulseKey& k) const {
            return "Pulse soft key " + std::to_string(k.code);
        }
        std::string operator()(const SetGroupState& g) const {
            return std::string(g.muted ? "Mute" : "Unmute") +
                   " group " + std::to_string(g.groupId);
        }
        std::string operator()(const SetLevel& l) const {
            return "Set " + l.channelRef + " to " + std::to_string(l.value);
        }
        std::string operator()(const ApplyScene& s) const {
            return "Scene mute [" + detail::joinGroups(s.muteGroups) +
                   "] unmute [" + detail::joinGroups(s.unmuteGroups) + "]";
        }
    };
    return std::visit(Visitor{}, op);
}

inline nlohmann::json toJson(const LogicalOperation& op) {
    struct Visitor {
        nlohmann::json operator()(const PulseKey& k) const {
            return {{"op", "pulse_key"}, {"code", k.code}};
        }
        nlohmann::json operator()(const SetGroupState& g) const {
            return {{"op", "set_group"}, {"group", g.groupId}, {"muted", g.muted}};
        }
        nlohmann::json operator()(const SetLevel& l) const {
            return {{"op", "set_level"}, {"ref", l.channelRef}, {"value", l.value}};
        }
        nlohmann::json operator()(const ApplyScene& s) const {
            return {{"op", "apply_scene"},
                    {"mute", s.muteGroups},
                    {"unmute", s.unmuteGroups}};
        }
    };
    auto j = std::visit(Visitor{}, op);
    j["description"] = describe(op);
    return j;
}
