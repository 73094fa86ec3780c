// Scripted upstream application for proxy tests

#pragma once

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/socket.hpp"

/// Listens on an ephemeral 127.0.0.1 port and answers each request it reads
/// (head plus Content-Length body) with the next scripted response. An empty script entry means "read
/// the request and never answer".
class MockBackend {
public:
    explicit MockBackend(std::vector<std::string> responses, bool close_after_response = false)
        : responses_(std::move(responses)), close_after_response_(close_after_response) {
        listen_fd_ = hopstrip::core::create_listening_socket("127.0.0.1", 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("Failed to create mock backend listener");
        }
        port_ = hopstrip::core::local_port(listen_fd_);
        thread_ = std::thread([this] { serve(); });
    }

    ~MockBackend() {
        stop_.store(true);
        thread_.join();
        hopstrip::core::close_fd(listen_fd_);
    }

    MockBackend(const MockBackend&) = delete;
    MockBackend& operator=(const MockBackend&) = delete;

    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    [[nodiscard]] std::vector<std::string> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] int connections_accepted() const noexcept { return accepted_.load(); }

private:
    // Wait for fd to become readable, giving up when the backend is stopped
    bool wait_readable(int fd) {
        while (!stop_.load()) {
            pollfd pfd{fd, POLLIN, 0};
            int rc = poll(&pfd, 1, 50);
            if (rc > 0) {
                return true;
            }
        }
        return false;
    }

    int accept_one() {
        if (!wait_readable(listen_fd_)) {
            return -1;
        }
        int fd = accept(listen_fd_, nullptr, nullptr);
        if (fd >= 0) {
            accepted_.fetch_add(1);
        }
        return fd;
    }

    // Content-Length of a request head, 0 when absent
    static size_t content_length(const std::string& head) {
        std::string lower;
        for (char c : head) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        auto pos = lower.find("\r\ncontent-length:");
        if (pos == std::string::npos) {
            return 0;
        }
        return std::stoul(lower.substr(pos + 17));
    }

    // Read one request head and its Content-Length body; false when the peer closed first
    bool read_request(int fd) {
        std::string data;
        char buffer[4096];
        size_t expected = std::string::npos;
        while (data.size() < expected) {
            if (!wait_readable(fd)) {
                return false;
            }
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return false;
            }
            data.append(buffer, static_cast<size_t>(n));
            if (expected == std::string::npos) {
                auto head_end = data.find("\r\n\r\n");
                if (head_end != std::string::npos) {
                    expected = head_end + 4 + content_length(data.substr(0, head_end));
                }
            }
        }
        std::lock_guard lock(mutex_);
        requests_.push_back(std::move(data));
        return true;
    }

    void serve() {
        size_t next = 0;
        int fd = -1;
        while (next < responses_.size() && !stop_.load()) {
            if (fd < 0) {
                fd = accept_one();
                if (fd < 0) {
                    return;
                }
            }

            if (!read_request(fd)) {
                close(fd);
                fd = -1;
                continue;
            }

            const std::string& response = responses_[next++];
            if (!response.empty()) {
                (void)send(fd, response.data(), response.size(), MSG_NOSIGNAL);
            }

            if (close_after_response_ && !response.empty()) {
                close(fd);
                fd = -1;
            }
        }

        // Script exhausted: hold the connection until the client or the test lets go
        if (fd >= 0) {
            char buffer[256];
            while (wait_readable(fd) && recv(fd, buffer, sizeof(buffer), 0) > 0) {
            }
            close(fd);
        }
    }

    std::vector<std::string> responses_;
    bool close_after_response_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;

    std::atomic<bool> stop_{false};
    std::atomic<int> accepted_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
    std::thread thread_;
};
