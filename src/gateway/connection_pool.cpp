/*
 * Copyright 2025 Hopstrip Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Hopstrip Gateway - Upstream Connection Pool Implementation

#include "connection_pool.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>

#include "../core/logging.hpp"
#include "../core/socket.hpp"

using hopstrip::core::close_fd;

namespace hopstrip::gateway {

bool PooledConnection::is_healthy() const noexcept {
    if (fd < 0)
        return false;

    // recv() with MSG_PEEK|MSG_DONTWAIT returns:
    // - 0: remote end closed (FIN received, CLOSE-WAIT)
    // - >0: bytes arrived while idle, the stream is out of sync with our requests
    // - <0 with EAGAIN/EWOULDBLOCK: idle and alive
    char buf[1];
    ssize_t result = recv(fd, buf, 1, MSG_PEEK | MSG_DONTWAIT);

    if (result >= 0) {
        return false;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
}

BackendConnectionPool::BackendConnectionPool(size_t max_size, std::chrono::seconds max_idle,
                                             size_t max_requests_per_conn)
    : max_size_(max_size), max_idle_(max_idle), max_requests_per_conn_(max_requests_per_conn) {
    pool_.reserve(max_size);
}

BackendConnectionPool::~BackendConnectionPool() {
    clear();
}

int BackendConnectionPool::acquire(const std::string& host, uint16_t port) {
    // Walk from the top of the stack (most recently used first)
    size_t index = pool_.size();
    while (index > 0) {
        --index;
        PooledConnection& conn = pool_[index];
        if (conn.host != host || conn.port != port) {
            continue;
        }

        int fd = conn.fd;
        bool stale = conn.is_stale(max_idle_);
        bool healthy = !stale && conn.is_healthy();

        pool_.erase(pool_.begin() + static_cast<std::ptrdiff_t>(index));

        if (healthy) {
            ++hits_;
            return fd;
        }

        // Stale or dead - close and keep searching
        close_fd(fd);
        fd_request_counts_.erase(fd);
        if (!stale) {
            ++health_fails_;
        }
    }

    ++misses_;
    return -1;
}

void BackendConnectionPool::release(int fd, const std::string& host, uint16_t port) {
    if (fd < 0)
        return;

    PooledConnection conn;
    conn.fd = fd;
    conn.host = host;
    conn.port = port;
    conn.last_used = std::chrono::steady_clock::now();
    conn.request_count = ++fd_request_counts_[fd];

    if (conn.needs_recycling(max_requests_per_conn_)) {
        close_fd(fd);
        fd_request_counts_.erase(fd);
        ++evictions_;
        return;
    }

    if (pool_.size() >= max_size_) {
        close_fd(fd);
        fd_request_counts_.erase(fd);
        ++pool_full_closes_;
        return;
    }

    if (!conn.is_healthy()) {
        close_fd(fd);
        fd_request_counts_.erase(fd);
        ++health_fails_;
        return;
    }

    // Add to pool (LIFO - push to back)
    pool_.push_back(std::move(conn));
}

void BackendConnectionPool::discard(int fd) {
    if (fd < 0)
        return;
    close_fd(fd);
    fd_request_counts_.erase(fd);
}

size_t BackendConnectionPool::cleanup_stale() {
    return std::erase_if(pool_, [this](const PooledConnection& conn) {
        if (conn.is_stale(max_idle_)) {
            close_fd(conn.fd);
            fd_request_counts_.erase(conn.fd);
            return true;
        }
        return false;
    });
}

void BackendConnectionPool::clear() {
    for (const auto& conn : pool_) {
        if (conn.fd >= 0) {
            close_fd(conn.fd);
        }
    }
    pool_.clear();
    fd_request_counts_.clear();
}

void BackendConnectionPool::log_stats() const {
    auto* logger = logging::get_current_logger();
    if (!logger) {
        return;
    }

    auto total_requests = hits_ + misses_;
    if (total_requests == 0) {
        LOG_INFO(logger, "[POOL] No requests processed yet");
        return;
    }

    LOG_INFO(logger,
             "[POOL] Stats: size={}/{}, hits={}, misses={}, hit_rate={:.2f}%, "
             "health_fails={}, pool_full_closes={}, evictions={}, max_requests_per_conn={}",
             pool_.size(), max_size_, hits_, misses_, hit_rate() * 100.0, health_fails_,
             pool_full_closes_, evictions_, max_requests_per_conn_);
}

}  // namespace hopstrip::gateway
