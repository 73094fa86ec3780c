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

// Hopstrip Server - Implementation

#include "server.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "logging.hpp"
#include "socket.hpp"

namespace hopstrip::core {

namespace {
constexpr size_t kReadChunkSize = 8192;
constexpr size_t kCompactThreshold = 4096;

// Write everything, waiting for POLLOUT on a full socket buffer
bool send_all(int fd, std::string_view data, std::chrono::milliseconds timeout) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int ready;
            do {
                ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
            } while (ready < 0 && errno == EINTR);
            if (ready <= 0) {
                return false;
            }
            continue;
        }
        return false;
    }
    return true;
}

bool has_no_body(http::StatusCode status) noexcept {
    auto code = static_cast<uint16_t>(status);
    return (code >= 100 && code < 200) || code == 204 || code == 304;
}
}  // anonymous namespace

std::string serialize_response(const http::Response& response, bool head_request) {
    uint16_t code = response.status_code();
    bool no_length = (code >= 100 && code < 200) || code == 204;
    bool keep_upstream_length = head_request || code == 304;
    bool send_body = !head_request && !has_no_body(response.status);

    std::string out;
    size_t estimated = 64 + response.body.size();
    for (const auto& [name, value] : response.headers) {
        estimated += name.size() + value.size() + 4;
    }
    out.reserve(estimated);

    std::string_view reason = response.reason_phrase;
    if (reason.empty()) {
        reason = http::to_reason_phrase(response.status);
    }
    fmt::format_to(std::back_inserter(out), "HTTP/1.1 {} {}\r\n", code, reason);

    std::string_view upstream_length;
    for (const auto& [name, value] : response.headers) {
        // Framing is recomputed below
        if (http::header_name_equals(name, "Content-Length")) {
            if (upstream_length.empty()) {
                upstream_length = value;
            }
            continue;
        }
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }

    if (!no_length) {
        if (keep_upstream_length) {
            if (!upstream_length.empty()) {
                fmt::format_to(std::back_inserter(out), "Content-Length: {}\r\n", upstream_length);
            }
        } else {
            fmt::format_to(std::back_inserter(out), "Content-Length: {}\r\n",
                           send_body ? response.body.size() : 0);
        }
    }

    out += "\r\n";

    if (send_body && !response.body.empty()) {
        out.append(http::as_text(response.body));
    }
    return out;
}

Server::Server(std::shared_ptr<const control::Config> config,
               std::unique_ptr<gateway::Pipeline> pipeline,
               std::unique_ptr<gateway::UpstreamClient> upstream)
    : config_(std::move(config)), pipeline_(std::move(pipeline)), upstream_(std::move(upstream)) {
    if (!config_ || !pipeline_ || !upstream_) {
        throw std::invalid_argument("Server requires a configuration, pipeline and upstream");
    }
}

Server::~Server() {
    stop();
}

std::error_code Server::start() {
    if (running_) {
        return {};
    }

    listen_fd_ = create_listening_socket(config_->server.listen_address,
                                         config_->server.listen_port,
                                         static_cast<int>(config_->server.backlog));

    if (listen_fd_ < 0) {
        return std::error_code(errno, std::system_category());
    }

    running_ = true;
    draining_ = false;
    return {};
}

void Server::stop() {
    if (!running_ && connections_.empty()) {
        return;
    }

    running_ = false;

    // Close all client connections
    for (auto& [fd, conn] : connections_) {
        close_fd(conn->fd);
    }
    connections_.clear();

    stop_accepting();
}

void Server::stop_accepting() {
    draining_ = true;
    if (listen_fd_ >= 0) {
        close_fd(listen_fd_);
        listen_fd_ = -1;
    }
}

void Server::apply_config(std::shared_ptr<const control::Config> config,
                          std::unique_ptr<gateway::Pipeline> pipeline,
                          std::unique_ptr<gateway::UpstreamClient> upstream) {
    if (!config || !pipeline || !upstream) {
        return;
    }
    config_ = std::move(config);
    pipeline_ = std::move(pipeline);
    upstream_ = std::move(upstream);

    if (logger_) {
        LOG_INFO(logger_, "Configuration applied: upstream={}:{}, middleware={}",
                 config_->upstream.host, config_->upstream.port, pipeline_->size());
    }
}

bool Server::handle_accept(int client_fd, std::string_view remote_ip, uint16_t remote_port) {
    if (connections_.size() >= config_->server.max_connections) {
        if (logger_) {
            LOG_WARNING(logger_, "Connection limit reached: max_connections={}, client_ip={}",
                        config_->server.max_connections, remote_ip);
        }
        close_fd(client_fd);
        return false;
    }

    auto conn = std::make_unique<Connection>();
    conn->fd = client_fd;
    conn->remote_ip = remote_ip;
    conn->remote_port = remote_port;
    conn->recv_buffer.reserve(kReadChunkSize);
    conn->last_activity = std::chrono::steady_clock::now();

    connections_[client_fd] = std::move(conn);
    return true;
}

void Server::handle_read(int client_fd) {
    auto it = connections_.find(client_fd);
    if (it == connections_.end()) {
        return;
    }

    Connection& conn = *it->second;

    // Edge-triggered: drain the socket until EAGAIN
    uint8_t buffer[kReadChunkSize];
    bool peer_closed = false;
    bool received = false;
    while (true) {
        ssize_t n = recv(client_fd, buffer, sizeof(buffer), 0);
        if (n > 0) {
            conn.recv_buffer.insert(conn.recv_buffer.end(), buffer, buffer + n);
            received = true;
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        // EOF or error
        peer_closed = true;
        break;
    }

    if (received) {
        conn.last_activity = std::chrono::steady_clock::now();
        handle_http1(conn);
    }

    if (peer_closed) {
        // handle_http1 may already have closed the connection
        handle_close(client_fd);
    }
}

void Server::handle_http1(Connection& conn) {
    // Process multiple pipelined requests if available (HTTP pipelining)
    while (conn.recv_cursor < conn.recv_buffer.size()) {
        auto remaining = std::span<const uint8_t>(conn.recv_buffer.data() + conn.recv_cursor,
                                                  conn.recv_buffer.size() - conn.recv_cursor);

        // A partial request keeps its parser state between reads; only the
        // bytes received since the last attempt are parsed
        auto [result, consumed] = conn.parser.parse_request(remaining, conn.request);

        if (result == http::ParseResult::Error) {
            reject(conn, http::StatusCode::BadRequest, conn.parser.error_message());
            return;
        }

        if (result == http::ParseResult::Incomplete) {
            if (remaining.size() > config_->server.max_request_size) {
                reject(conn, http::StatusCode::PayloadTooLarge, "request exceeds max_request_size");
            }
            return;
        }

        if (consumed > config_->server.max_request_size) {
            reject(conn, http::StatusCode::PayloadTooLarge, "request exceeds max_request_size");
            return;
        }

        if (!process_request(conn)) {
            // Connection closed, conn is gone
            return;
        }

        conn.request = http::Request{};
        conn.parser.reset();
        conn.recv_cursor += consumed;

        // Compact buffer once the processed prefix dominates it
        if (conn.recv_cursor > kCompactThreshold && conn.recv_cursor > conn.recv_buffer.size() / 2) {
            conn.recv_buffer.erase(conn.recv_buffer.begin(),
                                   conn.recv_buffer.begin() + static_cast<ptrdiff_t>(conn.recv_cursor));
            conn.recv_cursor = 0;
        } else if (conn.recv_cursor == conn.recv_buffer.size()) {
            conn.recv_buffer.clear();
            conn.recv_cursor = 0;
        }
    }
}

void Server::handle_close(int client_fd) {
    auto it = connections_.find(client_fd);
    if (it == connections_.end()) {
        return;
    }

    close_fd(it->second->fd);
    connections_.erase(it);
}

size_t Server::close_idle_connections() {
    auto cutoff = std::chrono::steady_clock::now() -
                  std::chrono::milliseconds(config_->server.read_timeout);

    std::vector<int> expired;
    for (const auto& [fd, conn] : connections_) {
        if (conn->last_activity < cutoff) {
            expired.push_back(fd);
        }
    }
    for (int fd : expired) {
        handle_close(fd);
    }

    if (size_t stale = upstream_->pool().cleanup_stale(); stale > 0 && logger_) {
        LOG_DEBUG(logger_, "Closed {} idle upstream connections", stale);
    }
    return expired.size();
}

size_t Server::close_quiescent_connections() {
    std::vector<int> idle;
    for (const auto& [fd, conn] : connections_) {
        if (conn->recv_cursor >= conn->recv_buffer.size()) {
            idle.push_back(fd);
        }
    }
    for (int fd : idle) {
        handle_close(fd);
    }
    return idle.size();
}

bool Server::process_request(Connection& conn) {
    const http::Request& request = conn.request;
    auto start_time = std::chrono::steady_clock::now();
    std::string correlation_id = logging::generate_correlation_id();

    // HTTP/1.0 without keep-alive and "Connection: close" end the connection
    bool keep_alive = request.keep_alive() && !draining_;

    conn.response = http::Response{};

    // Build request context
    gateway::RequestContext ctx;
    ctx.request = &conn.request;
    ctx.response = &conn.response;
    ctx.correlation_id = correlation_id;
    ctx.client_ip = conn.remote_ip;
    ctx.start_time = start_time;

    auto middleware_result = pipeline_->execute_request(ctx);

    if (middleware_result == gateway::MiddlewareResult::Stop) {
        // Middleware produced the response itself
        return finish_response(conn, &request, correlation_id, keep_alive, start_time);
    }

    if (middleware_result == gateway::MiddlewareResult::Error) {
        if (logger_) {
            LOG_ERROR_CTX(logger_, "Request middleware failed", correlation_id, 500,
                          ctx.error_message);
        }
        conn.response = gateway::make_error_response(http::StatusCode::InternalServerError);
        return finish_response(conn, &request, correlation_id, keep_alive, start_time);
    }

    auto error = upstream_->forward(request.raw, request.method, conn.response);
    if (error != gateway::UpstreamError::None) {
        const auto& options = upstream_->options();
        auto status = gateway::to_status_code(error);
        if (logger_) {
            LOG_ERROR_CTX(logger_, fmt::format("Upstream {}:{} failed", options.host, options.port),
                          correlation_id, static_cast<uint16_t>(status), gateway::to_string(error));
        }
        conn.response = gateway::make_error_response(status);
        return finish_response(conn, &request, correlation_id, keep_alive, start_time);
    }

    // No protocol switch is proxied, the connection ends after a 101
    if (conn.response.status == http::StatusCode::SwitchingProtocols) {
        keep_alive = false;
    }

    return finish_response(conn, &request, correlation_id, keep_alive, start_time);
}

bool Server::finish_response(Connection& conn, const http::Request* request,
                             const std::string& correlation_id, bool keep_alive,
                             std::chrono::steady_clock::time_point start_time) {
    gateway::ResponseContext ctx;
    ctx.request = request;
    ctx.response = &conn.response;
    ctx.correlation_id = correlation_id;
    ctx.client_ip = conn.remote_ip;
    ctx.start_time = start_time;

    auto result = pipeline_->execute_response(ctx);
    if (result == gateway::MiddlewareResult::Error) {
        if (logger_) {
            LOG_ERROR_CTX(logger_, "Response middleware failed", correlation_id, 500,
                          "response replaced");
        }
        conn.response = gateway::make_error_response(http::StatusCode::InternalServerError);
    }

    bool head_request = request && request->method == http::Method::HEAD;
    return send_response(conn, keep_alive, head_request);
}

void Server::reject(Connection& conn, http::StatusCode status, std::string_view reason) {
    auto start_time = std::chrono::steady_clock::now();
    std::string correlation_id = logging::generate_correlation_id();

    if (logger_) {
        LOG_WARNING(logger_,
                    "Rejecting request: status={}, reason={}, client_ip={}, client_port={}, "
                    "correlation_id={}",
                    static_cast<uint16_t>(status), reason, conn.remote_ip, conn.remote_port,
                    correlation_id);
    }

    conn.response = gateway::make_error_response(status);
    (void)finish_response(conn, &conn.request, correlation_id, false, start_time);
}

bool Server::send_response(Connection& conn, bool keep_alive, bool head_request) {
    std::string wire = serialize_response(conn.response, head_request);

    int fd = conn.fd;
    if (!send_all(fd, wire, std::chrono::milliseconds(config_->server.read_timeout))) {
        if (logger_) {
            LOG_WARNING(logger_, "Failed to write response: client_ip={}, errno={}", conn.remote_ip,
                        errno);
        }
        handle_close(fd);
        return false;
    }

    // Close connection only if not keep-alive
    if (!keep_alive) {
        handle_close(fd);
        return false;
    }
    return true;
}

}  // namespace hopstrip::core
