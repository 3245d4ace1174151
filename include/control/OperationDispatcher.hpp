#pragma once
#include "ToggleState.hpp"
#include "config/BridgeConfig.hpp"
#include "console/IConsoleTransport.hpp"
#include "input/InputEvent.hpp"
#include "protocol/LogicalOperation.hpp"
#include "protocol/MessageBuilder.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

// The button-event state machine. Interprets each input event, flips the
// matching toggle and fires at most one logical operation to the console.
//
// Toggle state follows operator intent: a failed send does not roll back
// the flip, since there is no way to read the console's actual state.
// Events are handled one at a time on the caller's thread.
class OperationDispatcher {
public:
    struct Outcome {
        enum class Kind {
            Unmapped,       // no binding for the source code
            NotTriggered,   // wrong edge for the binding's polarity
            Debounced,      // repeat within the debounce window
            Sent,           // operation transmitted
            SendFailed,     // operation built, transport refused or failed
            BuildFailed     // address lookup failed (config problem)
        } kind = Kind::Unmapped;

        std::optional<LogicalOperation> operation;
        SendStatus  sendStatus = SendStatus::NotConnected;
        std::string error;
    };

    // Throws ConfigError if the configuration cannot drive every binding
    OperationDispatcher(const BridgeConfig& config,
                        ToggleState& state,
                        IConsoleTransport& transport);

    Outcome handle(const InputEvent& event);

    // Operation for a controllable that has just flipped to `newValue`
    LogicalOperation operationFor(ControllableKind kind, bool newValue) const;

private:
    struct Binding {
        ButtonBinding    button;
        ControllableKind kind;
    };

    bool triggers(const Binding& b, int value) const;
    bool debounced(const InputEvent& event);
    void logTransition(ControllableKind kind, bool newValue) const;

    ToggleState&       state_;
    IConsoleTransport& transport_;
    MessageBuilder     builder_;
    BehaviorConfig     behaviors_;
    uint8_t            recordingKey_ = 0;
    std::chrono::milliseconds debounceWindow_;

    std::unordered_map<int, Binding> bindings_;
    std::unordered_map<int, std::chrono::steady_clock::time_point> lastFired_;
};

const char* toString(OperationDispatcher::Outcome::Kind kind);
