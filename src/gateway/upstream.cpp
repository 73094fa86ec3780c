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

// Hopstrip Upstream - Implementation

#include "upstream.hpp"

#include <sys/socket.h>

#include <array>
#include <cerrno>
#include <utility>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../core/socket.hpp"
#include "../http/parser.hpp"

namespace hopstrip::gateway {

std::string_view to_string(UpstreamError error) noexcept {
    switch (error) {
        case UpstreamError::None:
            return "none";
        case UpstreamError::ConnectFailed:
            return "connect_failed";
        case UpstreamError::SendFailed:
            return "send_failed";
        case UpstreamError::ReceiveFailed:
            return "receive_failed";
        case UpstreamError::Timeout:
            return "timeout";
        case UpstreamError::MalformedResponse:
            return "malformed_response";
        case UpstreamError::ResponseTooLarge:
            return "response_too_large";
    }
    return "unknown";
}

http::StatusCode to_status_code(UpstreamError error) noexcept {
    if (error == UpstreamError::Timeout) {
        return http::StatusCode::GatewayTimeout;
    }
    return http::StatusCode::BadGateway;
}

http::Response make_error_response(http::StatusCode status) {
    http::Response response;
    response.status = status;
    response.reason_phrase = std::string(http::to_reason_phrase(status));
    response.set_content_type("text/plain");
    response.set_body(fmt::format("{} {}\n", static_cast<uint16_t>(status),
                                  http::to_reason_phrase(status)));
    return response;
}

UpstreamClient::UpstreamClient(UpstreamOptions options)
    : options_(std::move(options)),
      pool_(options_.pool_size, options_.pool_idle_timeout, options_.max_requests_per_connection) {}

int UpstreamClient::open_connection(UpstreamError& error) {
    if (!cached_addr_.has_value()) {
        sockaddr_in addr{};
        if (auto ec = core::resolve_ipv4(options_.host, options_.port, addr); ec) {
            auto* logger = logging::get_current_logger();
            if (logger) {
                LOG_ERROR(logger, "Upstream resolve failed: backend={}:{}, error={}",
                          options_.host, options_.port, ec.message());
            }
            error = UpstreamError::ConnectFailed;
            return -1;
        }
        cached_addr_ = addr;
    }

    std::error_code ec;
    int fd = core::connect_with_timeout(*cached_addr_, options_.connect_timeout, ec);
    if (fd < 0) {
        auto* logger = logging::get_current_logger();
        if (logger) {
            LOG_ERROR(logger, "Upstream connect failed: backend={}:{}, error={}", options_.host,
                      options_.port, ec.message());
        }
        // Re-resolve on the next attempt
        cached_addr_.reset();
        error = UpstreamError::ConnectFailed;
        return -1;
    }

    if (auto timeout_ec = core::set_socket_timeouts(fd, options_.read_timeout); timeout_ec) {
        core::close_fd(fd);
        error = UpstreamError::ConnectFailed;
        return -1;
    }

    return fd;
}

UpstreamError UpstreamClient::forward(std::span<const uint8_t> request_bytes,
                                      http::Method method,
                                      http::Response& response) {
    // A pooled connection may have been closed by the upstream while idle.
    // Retry once on a fresh connection when nothing came back on it.
    int fd = pool_.acquire(options_.host, options_.port);
    bool from_pool = fd >= 0;

    for (int attempt = 0; attempt < 2; ++attempt) {
        if (fd < 0) {
            UpstreamError error = UpstreamError::None;
            fd = open_connection(error);
            if (fd < 0) {
                return error;
            }
            from_pool = false;
        }

        response = http::Response{};
        bool reusable = false;
        bool nothing_received = false;
        UpstreamError error =
            exchange(fd, request_bytes, method, response, reusable, nothing_received);

        if (error == UpstreamError::None) {
            if (reusable) {
                pool_.release(fd, options_.host, options_.port);
            } else {
                pool_.discard(fd);
            }
            return UpstreamError::None;
        }

        pool_.discard(fd);
        fd = -1;

        bool retry = from_pool && nothing_received &&
                     (error == UpstreamError::SendFailed || error == UpstreamError::ReceiveFailed);
        if (!retry) {
            return error;
        }
    }

    return UpstreamError::ReceiveFailed;
}

UpstreamError UpstreamClient::exchange(int fd, std::span<const uint8_t> request_bytes,
                                       http::Method method, http::Response& response,
                                       bool& reusable, bool& nothing_received) {
    reusable = false;
    nothing_received = true;

    // Send the request verbatim
    size_t sent = 0;
    while (sent < request_bytes.size()) {
        ssize_t n = send(fd, request_bytes.data() + sent, request_bytes.size() - sent,
                         MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return UpstreamError::Timeout;
            }
            return UpstreamError::SendFailed;
        }
        sent += static_cast<size_t>(n);
    }

    // Read and parse the response incrementally
    http::Parser parser;
    std::array<uint8_t, 16384> buffer;
    size_t received = 0;
    bool no_body = method == http::Method::HEAD;

    while (true) {
        ssize_t n = recv(fd, buffer.data(), buffer.size(), 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return UpstreamError::Timeout;
            }
            return UpstreamError::ReceiveFailed;
        }

        if (n == 0) {
            // Upstream closed the connection
            if (received == 0) {
                return UpstreamError::ReceiveFailed;
            }
            // Body delimited by connection close
            if (parser.finish() == http::ParseResult::Complete) {
                return UpstreamError::None;
            }
            return UpstreamError::MalformedResponse;
        }

        nothing_received = false;
        received += static_cast<size_t>(n);
        if (received > options_.max_response_size) {
            return UpstreamError::ResponseTooLarge;
        }

        auto chunk = std::span<const uint8_t>(buffer.data(), static_cast<size_t>(n));
        auto [result, consumed] = parser.parse_response(chunk, response, no_body);

        if (result == http::ParseResult::Error) {
            auto* logger = logging::get_current_logger();
            if (logger) {
                LOG_WARNING(logger, "Malformed upstream response: backend={}:{}, error={}",
                            options_.host, options_.port, parser.error_message());
            }
            return UpstreamError::MalformedResponse;
        }

        if (result == http::ParseResult::Complete) {
            // Trailing bytes mean the stream is out of sync, never reuse it
            reusable = consumed == chunk.size() && response.keep_alive() &&
                       response.status != http::StatusCode::SwitchingProtocols;
            return UpstreamError::None;
        }
    }
}

}  // namespace hopstrip::gateway
