#include "input/MidiPortInput.hpp"
#include <RtMidi.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace {

constexpr auto kPresenceCheckInterval = std::chrono::seconds(1);

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> portNames(RtMidiIn& midi) {
    std::vector<std::string> ports;
    unsigned count = midi.getPortCount();
    for (unsigned i = 0; i < count; i++)
        ports.push_back(midi.getPortName(i));
    return ports;
}

std::string joined(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out.empty() ? "none" : out;
}

}  // namespace

MidiPortInput::MidiPortInput(std::string portName,
                             std::vector<std::string> namePatterns,
                             int channelFilter)
    : portName_(std::move(portName))
    , patterns_(std::move(namePatterns))
    , parser_(channelFilter)
{
}

MidiPortInput::~MidiPortInput() {
    close();
}

std::optional<size_t> MidiPortInput::choosePort(const std::vector<std::string>& ports,
                                                const std::string& portName,
                                                const std::vector<std::string>& patterns) {
    if (!portName.empty()) {
        auto it = std::find(ports.begin(), ports.end(), portName);
        if (it != ports.end())
            return static_cast<size_t>(it - ports.begin());
    }

    for (size_t i = 0; i < ports.size(); i++) {
        for (const auto& p : patterns) {
            if (!p.empty() && lower(ports[i]).find(lower(p)) != std::string::npos)
                return i;
        }
    }
    return std::nullopt;
}

bool MidiPortInput::open() {
    close();

    std::unique_ptr<RtMidiIn> midi;
    std::vector<std::string>  ports;
    try {
        midi  = std::make_unique<RtMidiIn>(RtMidi::UNSPECIFIED, "footbridge");
        ports = portNames(*midi);
    } catch (const RtMidiError& e) {
        spdlog::error("MIDI: cannot create input client: {}", e.getMessage());
        return false;
    }
    spdlog::info("MIDI: available ports: {}", joined(ports));

    auto index = choosePort(ports, portName_, patterns_);
    if (!index) {
        spdlog::error("MIDI: no port matches; check pairing and input.device_name_patterns");
        return false;
    }

    {
        std::lock_guard lock(mtx_);
        parser_.reset();
        pending_.clear();
    }

    try {
        midi->ignoreTypes(true, true, true);   // SysEx, clock, active sensing
        midi->setCallback(&MidiPortInput::onMessage, this);
        midi->openPort(static_cast<unsigned>(*index), "footbridge in");
    } catch (const RtMidiError& e) {
        spdlog::error("MIDI: cannot open {}: {}", ports[*index], e.getMessage());
        return false;
    }

    openedName_        = ports[*index];
    midi_              = std::move(midi);
    lastPresenceCheck_ = std::chrono::steady_clock::now();
    spdlog::info("MIDI: listening on {}", openedName_);
    return true;
}

void MidiPortInput::close() {
    if (!midi_) return;

    // Stops RtMidi's thread; no callback runs after this
    try {
        midi_->cancelCallback();
        midi_->closePort();
    } catch (const RtMidiError& e) {
        spdlog::warn("MIDI: closing {}: {}", openedName_, e.getMessage());
    }
    midi_.reset();
    spdlog::debug("MIDI: closed {}", openedName_);
}

std::optional<InputEvent> MidiPortInput::next(std::chrono::milliseconds timeout) {
    {
        std::unique_lock lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return !pending_.empty(); });
        if (!pending_.empty()) {
            InputEvent ev = pending_.front();
            pending_.pop_front();
            return ev;
        }
    }

    // Quiet: make sure the controller is still there
    auto now = std::chrono::steady_clock::now();
    if (midi_ && now - lastPresenceCheck_ >= kPresenceCheckInterval) {
        lastPresenceCheck_ = now;
        if (!portStillListed()) {
            spdlog::warn("MIDI: {} went away", openedName_);
            close();
        }
    }
    return std::nullopt;
}

std::string MidiPortInput::describe() const {
    if (!openedName_.empty()) return openedName_;
    if (!portName_.empty()) return portName_;
    return "auto-detect";
}

// ── Private ──────────────────────────────────────────────────────────────

// Runs on RtMidi's input thread, one complete message per call
void MidiPortInput::onMessage(double /*timeStamp*/, std::vector<unsigned char>* message,
                              void* self) {
    auto* input = static_cast<MidiPortInput*>(self);
    if (message == nullptr) return;

    bool queued = false;
    {
        std::lock_guard lock(input->mtx_);
        for (unsigned char b : *message) {
            if (auto ev = input->parser_.feed(b)) {
                input->pending_.push_back(*ev);
                queued = true;
            }
        }
    }
    if (queued) input->cv_.notify_one();
}

bool MidiPortInput::portStillListed() {
    try {
        auto ports = portNames(*midi_);
        return std::find(ports.begin(), ports.end(), openedName_) != ports.end();
    } catch (const RtMidiError& e) {
        spdlog::warn("MIDI: cannot list ports: {}", e.getMessage());
        return false;
    }
}
