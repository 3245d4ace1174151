#include "input/RawMidiInput.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <regex>
#include <tuple>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

RawMidiInput::RawMidiInput(std::string device,
                           std::vector<std::string> namePatterns,
                           int channelFilter)
    : device_(std::move(device))
    , patterns_(std::move(namePatterns))
    , parser_(channelFilter)
{
}

RawMidiInput::~RawMidiInput() {
    close();
}

bool RawMidiInput::open() {
    close();

    std::string path = device_;
    if (path.empty()) {
        auto found = findDevice(patterns_);
        if (!found) {
            spdlog::error("MIDI: no raw MIDI device matches the configured name patterns");
            return false;
        }
        path = *found;
    }

    fd_ = ::open(path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd_ < 0) {
        spdlog::error("MIDI: cannot open {}: {}", path, strerror(errno));
        return false;
    }

    openedPath_ = path;
    parser_.reset();
    pending_.clear();
    spdlog::info("MIDI: listening on {}", path);
    return true;
}

void RawMidiInput::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
        spdlog::debug("MIDI: closed {}", openedPath_);
    }
}

std::optional<InputEvent> RawMidiInput::next(std::chrono::milliseconds timeout) {
    if (pending_.empty() && fd_ >= 0) {
        struct pollfd pfd{};
        pfd.fd     = fd_;
        pfd.events = POLLIN;

        int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready > 0) {
            uint8_t buf[256];
            ssize_t n = ::read(fd_, buf, sizeof(buf));
            if (n > 0) {
                for (ssize_t i = 0; i < n; i++) {
                    if (auto ev = parser_.feed(buf[i]))
                        pending_.push_back(*ev);
                }
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                spdlog::warn("MIDI: {} went away{}{}", openedPath_,
                             n == 0 ? "" : ": ", n == 0 ? "" : strerror(errno));
                close();
            }
        } else if (ready < 0 && errno != EINTR) {
            spdlog::warn("MIDI: poll failed: {}", strerror(errno));
            close();
        }
    }

    if (pending_.empty()) return std::nullopt;
    InputEvent ev = pending_.front();
    pending_.pop_front();
    return ev;
}

std::string RawMidiInput::describe() const {
    if (!openedPath_.empty()) return openedPath_;
    if (!device_.empty()) return device_;
    return "auto-detect";
}

std::optional<std::string> RawMidiInput::findDevice(
    const std::vector<std::string>& patterns,
    const std::string& devDir,
    const std::string& procDir)
{
    std::error_code ec;
    if (!fs::is_directory(devDir, ec)) return std::nullopt;

    static const std::regex nodeRe(R"(midiC(\d+)D(\d+))");

    struct Node {
        int      card;
        int      device;
        fs::path path;
    };

    std::vector<Node> nodes;
    for (const auto& entry : fs::directory_iterator(devDir, ec)) {
        std::smatch m;
        std::string name = entry.path().filename().string();
        if (std::regex_match(name, m, nodeRe))
            nodes.push_back({std::stoi(m[1].str()), std::stoi(m[2].str()), entry.path()});
    }
    // Card then device number: midiC2D0 before midiC10D0
    std::sort(nodes.begin(), nodes.end(), [](const Node& a, const Node& b) {
        return std::tie(a.card, a.device) < std::tie(b.card, b.device);
    });

    for (const auto& n : nodes) {
        const auto& node = n.path;
        std::ifstream idFile(procDir + "/card" + std::to_string(n.card) + "/id");
        std::string cardId;
        std::getline(idFile, cardId);
        spdlog::debug("MIDI: found {} (card id '{}')", node.string(), cardId);

        for (const auto& p : patterns) {
            if (!p.empty() && lower(cardId).find(lower(p)) != std::string::npos)
                return node.string();
        }
    }
    return std::nullopt;
}
