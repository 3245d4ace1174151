#include "console/ConsoleSession.hpp"
#include <spdlog/spdlog.h>

ConsoleSession::ConsoleSession(uint64_t id,
                               std::unique_ptr<IStreamConnection> connection,
                               const TransportTiming& timing,
                               uint8_t livenessByte,
                               LostCallback onLost)
    : id_(id)
    , connection_(std::move(connection))
    , timing_(timing)
    , livenessByte_(livenessByte)
    , onLost_(std::move(onLost))
{
}

ConsoleSession::~ConsoleSession() {
    close();
}

void ConsoleSession::start() {
    livenessThread_ = std::thread(&ConsoleSession::livenessLoop, this);
}

void ConsoleSession::close() {
    {
        std::lock_guard lock(stopMtx_);
        stopping_ = true;
    }
    stopCv_.notify_all();
    if (livenessThread_.joinable())
        livenessThread_.join();

    std::lock_guard lock(writeMtx_);
    connected_ = false;
    if (connection_) connection_->close();
}

SendStatus ConsoleSession::send(const FrameSequence& frames) {
    bool lost = false;
    {
        std::lock_guard lock(writeMtx_);
        if (!connected_) return SendStatus::NotConnected;

        for (size_t i = 0; i < frames.size(); i++) {
            const auto& bytes = frames[i].bytes;
            if (!connection_->write(bytes.data(), bytes.size())) {
                lost = markLostLocked("frame write failed");
                break;
            }
            if (i + 1 < frames.size())
                std::this_thread::sleep_for(gapFor(frames[i].gapAfter));
        }
    }

    if (lost) {
        if (onLost_) onLost_(id_);
        return SendStatus::WriteFailed;
    }
    return SendStatus::Ok;
}

// ── Liveness ─────────────────────────────────────────────────────────────

void ConsoleSession::livenessLoop() {
    spdlog::debug("Console: session {} liveness every {}ms",
                  id_, timing_.livenessInterval.count());

    // Fixed schedule: user sends never push the next pulse back
    auto next = std::chrono::steady_clock::now() + timing_.livenessInterval;

    std::unique_lock lock(stopMtx_);
    while (!stopping_) {
        if (stopCv_.wait_until(lock, next, [this] { return stopping_; }))
            break;

        lock.unlock();
        bool alive = pulseOnce();
        lock.lock();
        if (!alive) break;

        next += timing_.livenessInterval;
        auto now = std::chrono::steady_clock::now();
        while (next <= now)
            next += timing_.livenessInterval;
    }
}

bool ConsoleSession::pulseOnce() {
    bool lost = false;
    {
        std::lock_guard lock(writeMtx_);
        if (!connected_) return false;
        if (!connection_->write(&livenessByte_, 1))
            lost = markLostLocked("liveness write failed");
    }
    if (lost) {
        if (onLost_) onLost_(id_);
        return false;
    }
    return true;
}

// ── Private ──────────────────────────────────────────────────────────────

bool ConsoleSession::markLostLocked(const char* reason) {
    if (!connected_) return false;
    connected_ = false;
    connection_->close();
    spdlog::warn("Console: session {} lost: {}", id_, reason);
    return true;
}

std::chrono::milliseconds ConsoleSession::gapFor(FrameGap gap) const {
    switch (gap) {
        case FrameGap::KeyPulse:   return timing_.keyPulseGap;
        case FrameGap::InterFrame: return timing_.frameDelay;
    }
    return timing_.frameDelay;
}
