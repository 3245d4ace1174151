#pragma once
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

// Single-client TCP listener on 127.0.0.1 that records every byte received,
// standing in for the console.
class LoopbackServer {
public:
    struct Chunk {
        std::vector<uint8_t> bytes;
        std::chrono::steady_clock::time_point at;
    };

    LoopbackServer() {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family      = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port        = 0;
        ::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listenFd_, 4);

        socklen_t len = sizeof(addr);
        getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { run(); });
    }

    ~LoopbackServer() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
        if (clientFd_ >= 0) ::close(clientFd_);
        ::close(listenFd_);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    int port() const { return port_; }
    int accepted() const { return accepted_; }

    std::vector<Chunk> chunks() const {
        std::lock_guard lock(mtx_);
        return chunks_;
    }

    // All bytes so far as one stream
    std::vector<uint8_t> stream() const {
        std::lock_guard lock(mtx_);
        std::vector<uint8_t> out;
        for (auto& c : chunks_)
            out.insert(out.end(), c.bytes.begin(), c.bytes.end());
        return out;
    }

    // Polls until at least `n` bytes have arrived
    bool waitForBytes(size_t n, std::chrono::milliseconds timeout) const {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (stream().size() >= n) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return stream().size() >= n;
    }

    // Sends bytes back to the connected client
    void reply(const std::vector<uint8_t>& bytes) {
        std::lock_guard lock(mtx_);
        if (clientFd_ >= 0)
            ::send(clientFd_, bytes.data(), bytes.size(), MSG_NOSIGNAL);
    }

private:
    void run() {
        while (!stop_) {
            pollfd fds[2]{};
            fds[0].fd     = listenFd_;
            fds[0].events = POLLIN;
            int client;
            {
                std::lock_guard lock(mtx_);
                client = clientFd_;
            }
            fds[1].fd     = client;
            fds[1].events = POLLIN;

            if (poll(fds, client >= 0 ? 2 : 1, 20) <= 0) continue;

            if (fds[0].revents & POLLIN) {
                int fd = ::accept(listenFd_, nullptr, nullptr);
                if (fd >= 0) {
                    std::lock_guard lock(mtx_);
                    if (clientFd_ >= 0) ::close(clientFd_);
                    clientFd_ = fd;
                    accepted_++;
                }
                continue;
            }

            if (client >= 0 && (fds[1].revents & (POLLIN | POLLHUP))) {
                uint8_t buf[512];
                ssize_t n = ::recv(client, buf, sizeof(buf), 0);
                auto now = std::chrono::steady_clock::now();
                std::lock_guard lock(mtx_);
                if (n > 0) {
                    chunks_.push_back({{buf, buf + n}, now});
                } else if (clientFd_ == client) {
                    ::close(clientFd_);
                    clientFd_ = -1;
                }
            }
        }
    }

    int               listenFd_ = -1;
    int               clientFd_ = -1;
    int               port_     = 0;
    std::atomic<int>  accepted_{0};
    std::atomic<bool> stop_{false};
    mutable std::mutex mtx_;
    std::vector<Chunk> chunks_;
    std::thread       thread_;
};
