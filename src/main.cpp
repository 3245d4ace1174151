#include "config/BridgeConfig.hpp"
#include "console/SessionTransport.hpp"
#include "console/TcpConnector.hpp"
#include "control/OperationDispatcher.hpp"
#include "control/ToggleState.hpp"
#include "input/MidiPortInput.hpp"
#include "input/RawMidiInput.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <thread>

static std::atomic<bool> g_running{true};

static void signalHandler(int) {
    g_running = false;
}

static std::string getEnv(const std::string& key,
                          const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

static void setupLogging(const LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!cfg.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.file, cfg.maxFileSize, cfg.backupCount));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Could not open log file {}: {}", cfg.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("footbridge",
                                                   sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    std::string name  = getEnv("FOOTBRIDGE_LOG_LEVEL", cfg.level);
    auto        level = logLevelFromName(name);
    if (!level) {
        spdlog::warn("Unknown log level \"{}\", using info", name);
        level = spdlog::level::info;
    }
    spdlog::set_level(*level);
}

static std::unique_ptr<IInputSource> makeInput(const InputConfig& cfg) {
    if (cfg.backend == InputBackend::RawMidi)
        return std::make_unique<RawMidiInput>(cfg.device, cfg.deviceNamePatterns,
                                              cfg.midiChannel);
    return std::make_unique<MidiPortInput>(cfg.port, cfg.deviceNamePatterns,
                                           cfg.midiChannel);
}

int main(int argc, char* argv[]) {
    std::string configPath = "config/footbridge.json";
    if (argc > 1) configPath = argv[1];

    BridgeConfig config;
    try {
        config = BridgeConfig::load(configPath);
    } catch (const ConfigError& e) {
        spdlog::error("Config: {}", e.what());
        return 1;
    }

    setupLogging(config.logging);

    spdlog::info("Footbridge v1.0.0 starting");
    spdlog::info("Config: {}", configPath);
    spdlog::info("Console: {}", config.console.str());

    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    TcpConnector     connector;
    SessionTransport transport(connector, config.console, config.timing,
                               config.protocol.livenessByte);
    transport.onStateChange = [](SessionState s) {
        if (s == SessionState::Connected)
            spdlog::info("Console link up");
        else if (s == SessionState::Disconnected)
            spdlog::warn("Console link down");
    };

    ToggleState state;
    std::unique_ptr<OperationDispatcher> dispatcher;
    try {
        dispatcher = std::make_unique<OperationDispatcher>(config, state, transport);
    } catch (const ConfigError& e) {
        spdlog::error("Config: {}", e.what());
        return 1;
    }

    // Supervisor makes the first attempt right away and keeps retrying
    transport.start();
    while (g_running &&
           !transport.waitForState(SessionState::Connected, std::chrono::seconds(1))) {
    }

    auto input = makeInput(config.input);

    spdlog::info("Listening for footswitch presses");
    while (g_running) {
        if (!input->isOpen() && !input->open()) {
            std::this_thread::sleep_for(config.input.reopenDelay);
            continue;
        }

        auto event = input->next(std::chrono::milliseconds(200));
        if (!event) continue;

        auto out = dispatcher->handle(*event);
        spdlog::trace("Control {}={} -> {}", event->sourceCode, event->value,
                      toString(out.kind));
    }

    spdlog::info("Shutting down");
    input->close();
    transport.stop();

    spdlog::info("Footbridge exited cleanly");
    return 0;
}
