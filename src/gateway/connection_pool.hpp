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

// Hopstrip Gateway - Upstream Connection Pool
// Per-worker pool of idle keep-alive connections to the upstream application

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "../core/containers.hpp"  // fast_map

namespace hopstrip::gateway {

/// Pooled upstream connection with metadata
struct PooledConnection {
    int fd = -1;
    std::string host;
    uint16_t port = 0;
    std::chrono::steady_clock::time_point last_used;
    size_t request_count = 0;  // Number of requests served by this connection

    /// Check if connection has been idle too long
    [[nodiscard]] bool is_stale(std::chrono::seconds max_idle) const noexcept {
        auto now = std::chrono::steady_clock::now();
        return (now - last_used) > max_idle;
    }

    /// Check if connection has served too many requests (needs recycling)
    [[nodiscard]] bool needs_recycling(size_t max_requests) const noexcept {
        return max_requests > 0 && request_count >= max_requests;
    }

    /// Non-blocking MSG_PEEK check: false once the upstream closed or sent unsolicited bytes
    [[nodiscard]] bool is_healthy() const noexcept;
};

/// Upstream connection pool (LIFO stack, no locking - thread-local)
///
/// Each worker thread owns one pool. LIFO reuse keeps the most recently used
/// (least likely to have timed out upstream) connection on top.
class BackendConnectionPool {
public:
    /// @param max_size Maximum number of pooled connections
    /// @param max_idle Maximum idle time before connection is evicted
    /// @param max_requests_per_conn Maximum requests per connection before recycling (0 = unlimited)
    explicit BackendConnectionPool(size_t max_size = 32,
                                   std::chrono::seconds max_idle = std::chrono::seconds(60),
                                   size_t max_requests_per_conn = 0);

    BackendConnectionPool(const BackendConnectionPool&) = delete;
    BackendConnectionPool& operator=(const BackendConnectionPool&) = delete;

    BackendConnectionPool(BackendConnectionPool&&) noexcept = default;
    BackendConnectionPool& operator=(BackendConnectionPool&&) noexcept = default;

    ~BackendConnectionPool();

    /// Try to acquire an idle connection to host:port
    /// Returns -1 if no healthy connection is pooled
    [[nodiscard]] int acquire(const std::string& host, uint16_t port);

    /// Return a connection after a complete keep-alive exchange
    /// Closes it instead when the pool is full, it is unhealthy or it needs recycling
    void release(int fd, const std::string& host, uint16_t port);

    /// Close a connection that must not be reused (error, close-delimited response)
    void discard(int fd);

    /// Remove stale connections (idle > max_idle_time)
    /// Returns number of connections closed
    size_t cleanup_stale();

    /// Clear all connections in pool
    void clear();

    // Statistics
    [[nodiscard]] size_t size() const noexcept { return pool_.size(); }
    [[nodiscard]] size_t max_size() const noexcept { return max_size_; }
    [[nodiscard]] size_t max_requests_per_conn() const noexcept { return max_requests_per_conn_; }
    [[nodiscard]] size_t hits() const noexcept { return hits_; }
    [[nodiscard]] size_t misses() const noexcept { return misses_; }
    [[nodiscard]] size_t health_fails() const noexcept { return health_fails_; }
    [[nodiscard]] size_t pool_full_closes() const noexcept { return pool_full_closes_; }
    [[nodiscard]] size_t evictions() const noexcept { return evictions_; }
    [[nodiscard]] double hit_rate() const noexcept {
        auto total = hits_ + misses_;
        return total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
    }

    /// Log pool statistics
    void log_stats() const;

private:
    std::vector<PooledConnection> pool_;  // LIFO stack (back = top)
    size_t max_size_;
    std::chrono::seconds max_idle_;
    size_t max_requests_per_conn_;

    // Request count per fd (persists across acquire/release cycles)
    hopstrip::core::fast_map<int, size_t> fd_request_counts_;

    // Statistics
    size_t hits_ = 0;              // Pool hit (reused connection)
    size_t misses_ = 0;            // Pool miss (caller opens a new connection)
    size_t health_fails_ = 0;      // Health check failures
    size_t pool_full_closes_ = 0;  // Closes due to pool being full
    size_t evictions_ = 0;         // Connections recycled after max_requests_per_conn
};

}  // namespace hopstrip::gateway
