// footbridge-linkcheck: checks the console link without touching any mixer state.
// Connects, sends one liveness byte and reports whatever the console answers.
#include "config/BridgeConfig.hpp"
#include "console/TcpConnector.hpp"
#include "protocol/MessageBuilder.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <string>

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

    spdlog::info("Probing console at {}", config.console.str());

    TcpConnector connector;
    auto result = connector.connect(config.console, config.timing.connectTimeout);
    if (!result.ok()) {
        switch (result.error) {
            case ConnectError::Timeout:
                spdlog::error("Connection timeout: console not answering on port {}",
                              config.console.port);
                break;
            case ConnectError::Refused:
                spdlog::error("Connection refused: port {} not open on the console",
                              config.console.port);
                break;
            default:
                spdlog::error("Console unreachable: check power, network and mixer_ip");
                break;
        }
        return 1;
    }
    spdlog::info("Connected");

    auto pulse = MessageBuilder::liveness(config.protocol.livenessByte);
    if (!result.connection->write(pulse.bytes.data(), pulse.bytes.size())) {
        spdlog::error("Liveness write failed");
        return 1;
    }
    spdlog::info("Liveness byte 0x{:02X} sent", config.protocol.livenessByte);

    if (auto* tcp = dynamic_cast<TcpConnection*>(result.connection.get())) {
        auto reply = tcp->receive(std::chrono::seconds(1));
        if (reply.empty()) {
            spdlog::info("No immediate response (normal for this console)");
        } else {
            std::string hex;
            for (uint8_t b : reply) hex += fmt::format("{:02X} ", b);
            spdlog::info("Received {} bytes: {}", reply.size(), hex);
        }
    }

    result.connection->close();
    spdlog::info("Connection test passed");
    return 0;
}
