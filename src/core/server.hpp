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

// Hopstrip Server - Header
// HTTP/1.1 front end: client connections, request framing, response writer

#pragma once

#include <quill/Logger.h>

#include <chrono>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "../control/config.hpp"
#include "../gateway/pipeline.hpp"
#include "../gateway/upstream.hpp"
#include "../http/parser.hpp"
#include "containers.hpp"

// Forward declaration for test access
class ProxyTestFixture;

namespace hopstrip::core {

/// Active client connection
struct Connection {
    int fd = -1;
    std::string remote_ip;
    uint16_t remote_port = 0;

    std::vector<uint8_t> recv_buffer;
    size_t recv_cursor = 0;  // Start of the first unprocessed request in recv_buffer

    // State of the request starting at recv_cursor, kept across reads
    http::Parser parser;
    http::Request request;
    http::Response response;

    std::chrono::steady_clock::time_point last_activity;
};

/// HTTP server for one worker
///
/// Requests are handled synchronously: each complete request is forwarded to
/// the upstream, the response runs through the pipeline (sanitizer included)
/// and is written before the next pipelined request is looked at.
class Server {
    // Allow test fixture to access private methods
    friend class ::ProxyTestFixture;

public:
    /// Create server with configuration snapshot and pre-built components
    Server(std::shared_ptr<const control::Config> config,
           std::unique_ptr<gateway::Pipeline> pipeline,
           std::unique_ptr<gateway::UpstreamClient> upstream);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Start server (bind and listen)
    [[nodiscard]] std::error_code start();

    /// Stop server (closes the listener and every client connection)
    void stop();

    /// Close the listening socket only (graceful shutdown)
    void stop_accepting();

    [[nodiscard]] int listen_fd() const noexcept { return listen_fd_; }

    /// Set logger for this worker
    void set_logger(quill::Logger* logger) noexcept { logger_ = logger; }

    /// Swap in a new configuration snapshot with its pipeline and upstream
    /// client (hot reload). Listener settings keep their startup values.
    void apply_config(std::shared_ptr<const control::Config> config,
                      std::unique_ptr<gateway::Pipeline> pipeline,
                      std::unique_ptr<gateway::UpstreamClient> upstream);

    /// Register an accepted connection.
    /// Returns false (and closes client_fd) when max_connections is reached.
    bool handle_accept(int client_fd, std::string_view remote_ip, uint16_t remote_port);

    /// Process data from connection (reads from socket internally)
    void handle_read(int client_fd);

    /// Handle connection close
    void handle_close(int client_fd);

    /// Close connections idle for longer than server.read_timeout, and pooled
    /// upstream connections idle for longer than upstream.pool_idle_timeout
    /// Returns number of client connections closed
    size_t close_idle_connections();

    /// Log upstream pool statistics (worker shutdown)
    void log_upstream_stats() const { upstream_->pool().log_stats(); }

    /// Close connections with no partially received request (shutdown drain)
    /// Returns number of connections closed
    size_t close_quiescent_connections();

    [[nodiscard]] size_t connection_count() const noexcept { return connections_.size(); }

    [[nodiscard]] const control::Config& config() const noexcept { return *config_; }

private:
    std::shared_ptr<const control::Config> config_;
    int listen_fd_ = -1;
    bool running_ = false;
    bool draining_ = false;

    std::unique_ptr<gateway::Pipeline> pipeline_;
    std::unique_ptr<gateway::UpstreamClient> upstream_;

    quill::Logger* logger_ = nullptr;

    fast_map<int, std::unique_ptr<Connection>> connections_;

    void handle_http1(Connection& conn);

    /// Process request and send response
    /// returns false if connection was closed
    bool process_request(Connection& conn);

    /// Reply with a proxy-generated error and close the connection
    void reject(Connection& conn, http::StatusCode status, std::string_view reason);

    /// Run the response phase of the pipeline and write the response.
    /// Returns false if the connection was closed.
    bool finish_response(Connection& conn, const http::Request* request,
                         const std::string& correlation_id, bool keep_alive,
                         std::chrono::steady_clock::time_point start_time);

    /// Serialize and write conn.response, closes the connection when !keep_alive
    bool send_response(Connection& conn, bool keep_alive, bool head_request);
};

/// Serialize a response head and body for the wire.
/// Content-Length is recomputed from the body (HEAD and 304 keep the
/// upstream value, 1xx and 204 carry none). No connection-management field
/// is added: closing is signalled by closing the socket.
[[nodiscard]] std::string serialize_response(const http::Response& response, bool head_request);

}  // namespace hopstrip::core
