#include "control/OperationDispatcher.hpp"
#include <spdlog/spdlog.h>

namespace {

const std::string& idFor(ControllableKind kind) {
    switch (kind) {
        case ControllableKind::Recording:    return controllable::kRecording;
        case ControllableKind::MonitorLevel: return controllable::kMonitorLevel;
        case ControllableKind::FxMute:       return controllable::kFxMute;
        case ControllableKind::BreakMode:    return controllable::kBreakMode;
    }
    return controllable::kRecording;
}

}  // namespace

const char* toString(OperationDispatcher::Outcome::Kind kind) {
    using Kind = OperationDispatcher::Outcome::Kind;
    switch (kind) {
        case Kind::Unmapped:     return "unmapped";
        case Kind::NotTriggered: return "not_triggered";
        case Kind::Debounced:    return "debounced";
        case Kind::Sent:         return "sent";
        case Kind::SendFailed:   return "send_failed";
        case Kind::BuildFailed:  return "build_failed";
    }
    return "unknown";
}

OperationDispatcher::OperationDispatcher(const BridgeConfig& config,
                                         ToggleState& state,
                                         IConsoleTransport& transport)
    : state_(state)
    , transport_(transport)
    , builder_(config.addresses, config.protocol)
    , behaviors_(config.behaviors)
    , debounceWindow_(config.input.debounceWindow)
{
    config.validate();

    for (const auto& b : config.buttons) {
        auto kind = controllableKind(b.controllable);
        bindings_[b.code] = Binding{b, *kind};   // validate() rejected unknown ids
    }

    if (auto key = config.addresses.find(behaviors_.recordingAddress))
        recordingKey_ = key->key;

    spdlog::info("Dispatcher: {} buttons bound, debounce {}ms",
                 bindings_.size(), debounceWindow_.count());
}

OperationDispatcher::Outcome OperationDispatcher::handle(const InputEvent& event) {
    Outcome out;

    auto it = bindings_.find(event.sourceCode);
    if (it == bindings_.end()) {
        spdlog::debug("Unmapped control {} (value {})", event.sourceCode, event.value);
        out.kind = Outcome::Kind::Unmapped;
        return out;
    }
    const Binding& binding = it->second;

    if (!triggers(binding, event.value)) {
        out.kind = Outcome::Kind::NotTriggered;
        return out;
    }

    if (debounced(event)) {
        spdlog::debug("Control {} repeated within {}ms, ignored",
                      event.sourceCode, debounceWindow_.count());
        out.kind = Outcome::Kind::Debounced;
        return out;
    }

    bool newValue = state_.toggle(idFor(binding.kind));
    auto op = operationFor(binding.kind, newValue);
    out.operation = op;

    FrameSequence frames;
    try {
        frames = builder_.build(op);
    } catch (const ConfigError& e) {
        spdlog::error("Cannot build '{}': {}", describe(op), e.what());
        out.kind  = Outcome::Kind::BuildFailed;
        out.error = e.what();
        return out;
    }

    spdlog::debug("Dispatch {} -> {} frames: {}",
                  event.sourceCode, frames.size(), toJson(op).dump());

    out.sendStatus = transport_.send(frames);
    if (out.sendStatus != SendStatus::Ok) {
        spdlog::warn("Console send failed ({}): {} dropped",
                     toString(out.sendStatus), describe(op));
        out.kind = Outcome::Kind::SendFailed;
    } else {
        out.kind = Outcome::Kind::Sent;
    }

    logTransition(binding.kind, newValue);
    return out;
}

LogicalOperation OperationDispatcher::operationFor(ControllableKind kind,
                                                   bool newValue) const {
    switch (kind) {
        case ControllableKind::Recording:
            // The console owns the recorder; the key is momentary and every
            // press toggles it, whatever we think the state is
            return PulseKey{recordingKey_};

        case ControllableKind::MonitorLevel:
            return SetLevel{behaviors_.monitorAddress,
                            newValue ? behaviors_.monitorHigh : behaviors_.monitorLow};

        case ControllableKind::FxMute:
            return SetGroupState{behaviors_.fxMuteGroup, newValue};

        case ControllableKind::BreakMode: {
            const auto& scene = newValue ? behaviors_.breakActive
                                         : behaviors_.breakInactive;
            return ApplyScene{scene.muteGroups, scene.unmuteGroups};
        }
    }
    return PulseKey{recordingKey_};
}

// ── Private ──────────────────────────────────────────────────────────────

bool OperationDispatcher::triggers(const Binding& b, int value) const {
    switch (b.button.trigger) {
        case TriggerPolarity::Press:   return value > b.button.threshold;
        case TriggerPolarity::Release: return value <= b.button.threshold;
    }
    return false;
}

bool OperationDispatcher::debounced(const InputEvent& event) {
    if (debounceWindow_.count() <= 0) return false;

    auto it = lastFired_.find(event.sourceCode);
    if (it != lastFired_.end() && event.receivedAt - it->second < debounceWindow_)
        return true;

    lastFired_[event.sourceCode] = event.receivedAt;
    return false;
}

void OperationDispatcher::logTransition(ControllableKind kind, bool newValue) const {
    switch (kind) {
        case ControllableKind::Recording:
            spdlog::info("Recording: {}", newValue ? "STARTED" : "STOPPED");
            break;
        case ControllableKind::MonitorLevel:
            spdlog::info("Monitor level: {}", newValue ? "HIGH" : "LOW");
            break;
        case ControllableKind::FxMute:
            spdlog::info("FX mute group {}: {}", behaviors_.fxMuteGroup,
                         newValue ? "ON" : "OFF");
            break;
        case ControllableKind::BreakMode:
            spdlog::info("Break mode: {}", newValue ? "ACTIVE" : "INACTIVE");
            break;
    }
}
