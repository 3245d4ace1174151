#include "console/SessionTransport.hpp"
#include <spdlog/spdlog.h>

SessionTransport::SessionTransport(IConnector& connector,
                                   const ControllerAddress& address,
                                   const TransportTiming& timing,
                                   uint8_t livenessByte)
    : connector_(connector)
    , address_(address)
    , timing_(timing)
    , livenessByte_(livenessByte)
{
}

SessionTransport::~SessionTransport() {
    stop();
}

ConnectError SessionTransport::connect() {
    std::lock_guard attempt(connectMtx_);

    if (state() == SessionState::Connected)
        return ConnectError::None;

    retireSession();
    setState(SessionState::Connecting);
    attempts_++;

    spdlog::info("Console: connecting to {}", address_.str());
    auto result = connector_.connect(address_, timing_.connectTimeout);
    if (!result.ok()) {
        setState(SessionState::Disconnected);
        return result.error;
    }

    uint64_t id;
    {
        std::lock_guard lock(mtx_);
        id = nextSessionId_++;
    }

    auto session = std::make_shared<ConsoleSession>(
        id, std::move(result.connection), timing_, livenessByte_,
        [this](uint64_t lostId) { onSessionLost(lostId); });

    // Installed and Connected in one step before the first liveness write,
    // so a loss reported by that write always finds this session
    {
        std::lock_guard lock(mtx_);
        active_ = session;
        state_  = SessionState::Connected;
    }
    cv_.notify_all();
    spdlog::info("Console: connected to {} (session {})", address_.str(), id);
    if (onStateChange) onStateChange(SessionState::Connected);

    session->start();
    return ConnectError::None;
}

void SessionTransport::start() {
    if (running_) return;
    {
        std::lock_guard lock(mtx_);
        stopRequested_ = false;
    }
    running_ = true;
    supervisor_ = std::thread(&SessionTransport::reconnectLoop, this);
}

void SessionTransport::stop() {
    {
        std::lock_guard lock(mtx_);
        stopRequested_ = true;
    }
    cv_.notify_all();
    if (supervisor_.joinable())
        supervisor_.join();
    running_ = false;

    std::lock_guard attempt(connectMtx_);
    retireSession();
    if (state() != SessionState::Disconnected)
        setState(SessionState::Disconnected);
}

SendStatus SessionTransport::send(const FrameSequence& frames) {
    std::shared_ptr<ConsoleSession> session;
    {
        std::lock_guard lock(mtx_);
        if (state_ != SessionState::Connected || !active_)
            return SendStatus::NotConnected;
        session = active_;
    }
    return session->send(frames);
}

SessionState SessionTransport::state() const {
    std::lock_guard lock(mtx_);
    return state_;
}

bool SessionTransport::waitForState(SessionState s,
                                    std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mtx_);
    return cv_.wait_for(lock, timeout, [&] { return state_ == s; });
}

// ── Supervisor ───────────────────────────────────────────────────────────

void SessionTransport::reconnectLoop() {
    spdlog::debug("Console: reconnect supervisor started");

    while (true) {
        {
            std::unique_lock lock(mtx_);
            cv_.wait(lock, [this] {
                return stopRequested_ || state_ != SessionState::Connected;
            });
            if (stopRequested_) break;
        }

        auto err = connect();
        if (err == ConnectError::None) continue;

        spdlog::warn("Console: connection failed ({}), retrying in {}ms",
                     toString(err), timing_.reconnectBackoff.count());

        std::unique_lock lock(mtx_);
        if (cv_.wait_for(lock, timing_.reconnectBackoff,
                         [this] { return stopRequested_; }))
            break;
    }

    spdlog::debug("Console: reconnect supervisor stopped");
}

// Called from the thread whose write failed (event path or liveness)
void SessionTransport::onSessionLost(uint64_t sessionId) {
    {
        std::lock_guard lock(mtx_);
        if (!active_ || active_->id() != sessionId) return;
    }
    spdlog::warn("Console: connection to {} lost, reconnecting", address_.str());
    setState(SessionState::Disconnected);
}

// ── Private ──────────────────────────────────────────────────────────────

void SessionTransport::setState(SessionState s) {
    {
        std::lock_guard lock(mtx_);
        if (state_ == s) return;
        state_ = s;
    }
    cv_.notify_all();
    spdlog::debug("Console: state -> {}", toString(s));
    if (onStateChange) onStateChange(s);
}

// Drops the current session. Never called from a liveness thread.
void SessionTransport::retireSession() {
    std::shared_ptr<ConsoleSession> old;
    {
        std::lock_guard lock(mtx_);
        old = std::move(active_);
        active_.reset();
    }
    if (old) old->close();
}
