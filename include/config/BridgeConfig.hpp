#pragma once
#include "ConfigError.hpp"
#include "console/ConnectionTypes.hpp"
#include "protocol/ProtocolTypes.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

// What a button drives
enum class ControllableKind {
    Recording,      // soft key pulse, every press
    MonitorLevel,   // aux send level, low/high preset
    FxMute,         // one mute group on/off
    BreakMode       // scene switch between two mute-group sets
};

std::optional<ControllableKind> controllableKind(const std::string& id);

enum class TriggerPolarity {
    Press,     // fires when value > threshold
    Release    // fires when value <= threshold
};

struct ButtonBinding {
    int              code = 0;        // CC number or note
    std::string      controllable;    // "recording", "fx_mute", ...
    TriggerPolarity  trigger   = TriggerPolarity::Press;
    int              threshold = 0;
};

struct SceneGroups {
    std::set<int> muteGroups;
    std::set<int> unmuteGroups;
};

struct BehaviorConfig {
    std::string recordingAddress = "recording";
    std::string monitorAddress   = "aux_send_level";
    int         monitorLow  = 60;
    int         monitorHigh = 100;
    int         fxMuteGroup = 1;
    SceneGroups breakActive;
    SceneGroups breakInactive;
};

// Where foot controller MIDI is read from
enum class InputBackend {
    Sequencer,   // system MIDI port list (BLE-MIDI, USB), matched by port name
    RawMidi      // a raw MIDI node or FIFO, explicit or found by ALSA card id
};

struct InputConfig {
    InputBackend             backend = InputBackend::Sequencer;
    std::string              port;                // exact sequencer port name
    std::string              device;              // explicit device node or FIFO
    std::vector<std::string> deviceNamePatterns;  // port names or card ids
    int                      midiChannel = -1;    // -1 = any channel
    std::chrono::milliseconds debounceWindow{0};  // 0 = every event counts
    std::chrono::milliseconds reopenDelay{2000};
};

// spdlog level for a config or environment name, any case.
// "warning" and "fatal" are accepted alongside spdlog's own names.
std::optional<spdlog::level::level_enum> logLevelFromName(const std::string& name);

struct LoggingConfig {
    std::string level = "info";        // validated with logLevelFromName
    std::string file;                  // empty = console only
    size_t      maxFileSize = 10485760;
    size_t      backupCount = 3;
};

// Fully resolved bridge configuration. fromJson() validates; anything wrong
// is a ConfigError and the process must not start.
struct BridgeConfig {
    ControllerAddress          console;
    TransportTiming            timing;
    ProtocolSettings           protocol;
    AddressTable               addresses;
    std::vector<ButtonBinding> buttons;
    BehaviorConfig             behaviors;
    InputConfig                input;
    LoggingConfig              logging;

    static BridgeConfig fromJson(const nlohmann::json& j);
    static BridgeConfig load(const std::string& path);

    // Throws ConfigError naming the first problem found
    void validate() const;
};
