#include "config/BridgeConfig.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>

std::optional<ControllableKind> controllableKind(const std::string& id) {
    if (id == "recording")     return ControllableKind::Recording;
    if (id == "monitor_level") return ControllableKind::MonitorLevel;
    if (id == "fx_mute")       return ControllableKind::FxMute;
    if (id == "break_mode")    return ControllableKind::BreakMode;
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> logLevelFromName(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (n == "trace")                    return spdlog::level::trace;
    if (n == "debug")                    return spdlog::level::debug;
    if (n == "info")                     return spdlog::level::info;
    if (n == "warn" || n == "warning")   return spdlog::level::warn;
    if (n == "error" || n == "err")      return spdlog::level::err;
    if (n == "critical" || n == "fatal") return spdlog::level::critical;
    if (n == "off")                      return spdlog::level::off;
    return std::nullopt;
}

namespace {

// Accepts 48 as well as "0x30" so addresses can be copied from the
// console's MIDI protocol sheet as written
int readInt(const nlohmann::json& j, const std::string& key, int def,
            const std::string& where) {
    if (!j.contains(key)) return def;
    const auto& v = j.at(key);
    if (v.is_number_integer()) return v.get<int>();
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        try {
            size_t used = 0;
            int out = std::stoi(s, &used, 0);
            if (used == s.size()) return out;
        } catch (const std::exception&) {
        }
    }
    throw ConfigError(where + "." + key + ": expected an integer");
}

int readRanged(const nlohmann::json& j, const std::string& key, int def,
               int lo, int hi, const std::string& where) {
    int v = readInt(j, key, def, where);
    if (v < lo || v > hi)
        throw ConfigError(where + "." + key + ": " + std::to_string(v) +
                          " outside " + std::to_string(lo) + ".." +
                          std::to_string(hi));
    return v;
}

std::chrono::milliseconds readMs(const nlohmann::json& j, const std::string& key,
                                 std::chrono::milliseconds def,
                                 const std::string& where, int minMs = 1) {
    int v = readInt(j, key, static_cast<int>(def.count()), where);
    if (v < minMs)
        throw ConfigError(where + "." + key + ": must be at least " +
                          std::to_string(minMs) + "ms");
    return std::chrono::milliseconds(v);
}

const nlohmann::json& section(const nlohmann::json& j, const std::string& key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(key)) return empty;
    const auto& s = j.at(key);
    if (!s.is_object())
        throw ConfigError(key + ": expected an object");
    return s;
}

InputBackend parseBackend(const std::string& s) {
    if (s == "sequencer") return InputBackend::Sequencer;
    if (s == "rawmidi")   return InputBackend::RawMidi;
    throw ConfigError("input.backend: must be \"sequencer\" or \"rawmidi\", got \"" +
                      s + "\"");
}

TriggerPolarity parseTrigger(const std::string& s, const std::string& where) {
    if (s == "press")   return TriggerPolarity::Press;
    if (s == "release") return TriggerPolarity::Release;
    throw ConfigError(where + ": trigger must be \"press\" or \"release\", got \"" +
                      s + "\"");
}

std::set<int> readGroups(const nlohmann::json& j, const std::string& key,
                         const std::string& where) {
    std::set<int> out;
    if (!j.contains(key)) return out;
    const auto& arr = j.at(key);
    if (!arr.is_array())
        throw ConfigError(where + "." + key + ": expected a list of group numbers");
    for (const auto& g : arr) {
        if (!g.is_number_integer() || g.get<int>() < 1)
            throw ConfigError(where + "." + key + ": group numbers must be >= 1");
        out.insert(g.get<int>());
    }
    return out;
}

SceneGroups readScene(const nlohmann::json& j, const std::string& where) {
    SceneGroups s;
    s.muteGroups   = readGroups(j, "mute_groups", where);
    s.unmuteGroups = readGroups(j, "unmute_groups", where);
    return s;
}

ParameterAddress readAddress(const nlohmann::json& j, const std::string& name) {
    const std::string where = "addresses." + name;
    if (!j.is_object())
        throw ConfigError(where + ": expected an object");
    if (j.contains("soft_key_note"))
        return ParameterAddress::softKey(
            static_cast<uint8_t>(readRanged(j, "soft_key_note", 0, 0, 127, where)));
    if (!j.contains("msb") || !j.contains("lsb"))
        throw ConfigError(where + ": needs msb and lsb, or soft_key_note");
    return ParameterAddress::parameter(
        static_cast<uint8_t>(readRanged(j, "msb", 0, 0, 127, where)),
        static_cast<uint8_t>(readRanged(j, "lsb", 0, 0, 127, where)));
}

std::vector<ButtonBinding> defaultButtons() {
    return {
        {20, "recording"},
        {21, "monitor_level"},
        {22, "fx_mute"},
        {23, "break_mode"},
    };
}

}  // namespace

BridgeConfig BridgeConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object())
        throw ConfigError("config root must be an object");

    BridgeConfig c;
    try {
        // ── Network ──
        const auto& net = section(j, "network");
        if (!net.contains("mixer_ip") || !net.at("mixer_ip").is_string())
            throw ConfigError("network.mixer_ip: required");
        c.console.host = net.at("mixer_ip").get<std::string>();
        c.console.port = readRanged(net, "mixer_port", 51325, 1, 65535, "network");
        c.timing.livenessInterval = readMs(net, "keepalive_interval_ms",
                                           c.timing.livenessInterval, "network");
        c.timing.connectTimeout   = readMs(net, "connection_timeout_ms",
                                           c.timing.connectTimeout, "network");
        c.timing.reconnectBackoff = readMs(net, "reconnect_delay_ms",
                                           c.timing.reconnectBackoff, "network");

        // ── Protocol ──
        const auto& proto = section(j, "protocol");
        c.protocol.midiChannel  = static_cast<uint8_t>(
            readRanged(proto, "midi_channel", 0, 0, 15, "protocol"));
        c.protocol.livenessByte = static_cast<uint8_t>(
            readRanged(proto, "liveness_byte", midi::kActiveSensing, 0, 255, "protocol"));
        c.protocol.muteOnValue  = static_cast<uint8_t>(
            readRanged(proto, "mute_on_value", 127, 0, 127, "protocol"));
        c.protocol.muteOffValue = static_cast<uint8_t>(
            readRanged(proto, "mute_off_value", 0, 0, 127, "protocol"));
        c.timing.frameDelay  = readMs(proto, "frame_delay_ms",
                                      c.timing.frameDelay, "protocol", 0);
        c.timing.keyPulseGap = readMs(proto, "key_pulse_gap_ms",
                                      c.timing.keyPulseGap, "protocol", 0);

        // ── Addresses ──
        const auto& addrs = section(j, "addresses");
        for (auto it = addrs.begin(); it != addrs.end(); ++it)
            c.addresses.add(it.key(), readAddress(it.value(), it.key()));

        // ── Input ──
        const auto& in = section(j, "input");
        c.input.device      = in.value("device", std::string{});
        c.input.port        = in.value("port", std::string{});
        // A configured device path means raw MIDI unless told otherwise
        c.input.backend     = in.contains("backend")
            ? parseBackend(in.at("backend").get<std::string>())
            : (c.input.device.empty() ? InputBackend::Sequencer : InputBackend::RawMidi);
        c.input.midiChannel = readRanged(in, "midi_channel", -1, -1, 15, "input");
        c.input.debounceWindow = readMs(in, "debounce_ms", c.input.debounceWindow,
                                        "input", 0);
        c.input.reopenDelay    = readMs(in, "reopen_delay_ms", c.input.reopenDelay,
                                        "input");
        if (in.contains("device_name_patterns"))
            c.input.deviceNamePatterns =
                in.at("device_name_patterns").get<std::vector<std::string>>();

        auto defaultTrigger   = parseTrigger(in.value("default_trigger", std::string("press")),
                                             "input.default_trigger");
        int  defaultThreshold = readRanged(in, "default_threshold", 0, 0, 127, "input");

        // ── Buttons ──
        if (j.contains("buttons")) {
            const auto& arr = j.at("buttons");
            if (!arr.is_array())
                throw ConfigError("buttons: expected a list");
            for (size_t i = 0; i < arr.size(); i++) {
                const auto& b = arr[i];
                std::string where = "buttons[" + std::to_string(i) + "]";
                if (!b.is_object())
                    throw ConfigError(where + ": expected an object");
                ButtonBinding bb;
                bb.code         = readRanged(b, "code", -1, 0, 127, where);
                bb.controllable = b.value("controllable", std::string{});
                bb.trigger      = b.contains("trigger")
                    ? parseTrigger(b.at("trigger").get<std::string>(), where)
                    : defaultTrigger;
                bb.threshold    = readRanged(b, "threshold", defaultThreshold,
                                             0, 127, where);
                c.buttons.push_back(bb);
            }
        } else {
            c.buttons = defaultButtons();
            for (auto& b : c.buttons) {
                b.trigger   = defaultTrigger;
                b.threshold = defaultThreshold;
            }
        }

        // ── Behaviors ──
        const auto& beh = section(j, "behaviors");
        const auto& rec = section(beh, "recording");
        c.behaviors.recordingAddress = rec.value("address", c.behaviors.recordingAddress);

        const auto& mon = section(beh, "monitor_level");
        c.behaviors.monitorAddress = mon.value("address", c.behaviors.monitorAddress);
        c.behaviors.monitorLow  = readRanged(mon, "low", c.behaviors.monitorLow,
                                             0, 127, "behaviors.monitor_level");
        c.behaviors.monitorHigh = readRanged(mon, "high", c.behaviors.monitorHigh,
                                             0, 127, "behaviors.monitor_level");

        const auto& fx = section(beh, "fx_mute");
        c.behaviors.fxMuteGroup = readRanged(fx, "group", c.behaviors.fxMuteGroup,
                                             1, 127, "behaviors.fx_mute");

        const auto& brk = section(beh, "break_mode");
        c.behaviors.breakActive   = readScene(section(brk, "active_state"),
                                              "behaviors.break_mode.active_state");
        c.behaviors.breakInactive = readScene(section(brk, "inactive_state"),
                                              "behaviors.break_mode.inactive_state");

        // ── Logging ──
        const auto& log = section(j, "logging");
        c.logging.level       = log.value("level", c.logging.level);
        c.logging.file        = log.value("file", c.logging.file);
        c.logging.maxFileSize = log.value("max_file_size", c.logging.maxFileSize);
        c.logging.backupCount = log.value("backup_count", c.logging.backupCount);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("malformed config: ") + e.what());
    }

    c.validate();
    return c;
}

BridgeConfig BridgeConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw ConfigError("cannot open config file: " + path);

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }

    auto c = fromJson(j);
    spdlog::debug("Config: {} buttons, {} addresses from {}",
                  c.buttons.size(), c.addresses.size(), path);
    return c;
}

void BridgeConfig::validate() const {
    if (console.host.empty())
        throw ConfigError("network.mixer_ip: must not be empty");

    if (!logLevelFromName(logging.level))
        throw ConfigError("logging.level: unknown level \"" + logging.level + "\"");

    auto requireParam = [this](const std::string& name, const std::string& user) {
        auto a = addresses.find(name);
        if (!a)
            throw ConfigError(user + " needs address \"" + name + "\"");
        if (a->kind != ParameterAddress::Kind::Parameter)
            throw ConfigError(user + ": address \"" + name +
                              "\" must have msb/lsb");
    };

    std::set<int> codes;
    for (const auto& b : buttons) {
        if (!codes.insert(b.code).second)
            throw ConfigError("buttons: code " + std::to_string(b.code) +
                              " bound more than once");

        auto kind = controllableKind(b.controllable);
        if (!kind)
            throw ConfigError("buttons: unknown controllable \"" +
                              b.controllable + "\"");

        switch (*kind) {
            case ControllableKind::Recording: {
                auto a = addresses.find(behaviors.recordingAddress);
                if (!a || a->kind != ParameterAddress::Kind::Key)
                    throw ConfigError("recording needs address \"" +
                                      behaviors.recordingAddress +
                                      "\" with soft_key_note");
                break;
            }
            case ControllableKind::MonitorLevel:
                requireParam(behaviors.monitorAddress, "monitor_level");
                break;
            case ControllableKind::FxMute:
                requireParam(AddressTable::muteGroupName(behaviors.fxMuteGroup),
                             "fx_mute");
                break;
            case ControllableKind::BreakMode:
                for (const auto* scene : {&behaviors.breakActive, &behaviors.breakInactive}) {
                    for (int g : scene->muteGroups)
                        requireParam(AddressTable::muteGroupName(g), "break_mode");
                    for (int g : scene->unmuteGroups)
                        requireParam(AddressTable::muteGroupName(g), "break_mode");
                }
                break;
        }
    }
}
