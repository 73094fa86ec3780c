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

// Hopstrip Upstream - Header
// Forwards requests to the single upstream application

#pragma once

#include <netinet/in.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "../http/http.hpp"
#include "connection_pool.hpp"

namespace hopstrip::gateway {

/// Upstream exchange failure
enum class UpstreamError : uint8_t {
    None,
    ConnectFailed,      // DNS, refused, connect timeout
    SendFailed,         // Request could not be written
    ReceiveFailed,      // Connection reset or closed before a response
    Timeout,            // No complete response within read_timeout
    MalformedResponse,  // llhttp rejected the response
    ResponseTooLarge    // Response exceeded max_response_size
};

[[nodiscard]] std::string_view to_string(UpstreamError error) noexcept;

/// Status code of the response synthesized for a failed exchange
/// (504 for Timeout, 502 otherwise)
[[nodiscard]] http::StatusCode to_status_code(UpstreamError error) noexcept;

/// Upstream endpoint and limits
struct UpstreamOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 5000;
    std::chrono::milliseconds connect_timeout{2000};
    std::chrono::milliseconds read_timeout{30000};
    size_t max_response_size = 10485760;  // Whole response as received (head + framed body)

    // Keep-alive pool
    size_t pool_size = 32;
    std::chrono::seconds pool_idle_timeout{60};
    size_t max_requests_per_connection = 0;
};

/// Blocking HTTP/1.1 client for the upstream application (one per worker)
///
/// Requests are written exactly as received from the client. Responses are
/// parsed into an owned http::Response with the body de-chunked.
class UpstreamClient {
public:
    explicit UpstreamClient(UpstreamOptions options);

    UpstreamClient(const UpstreamClient&) = delete;
    UpstreamClient& operator=(const UpstreamClient&) = delete;

    /// Send request_bytes upstream and read one response into 'response'.
    /// 'method' decides whether the response may carry a body (HEAD never does).
    [[nodiscard]] UpstreamError forward(std::span<const uint8_t> request_bytes,
                                        http::Method method,
                                        http::Response& response);

    [[nodiscard]] const UpstreamOptions& options() const noexcept { return options_; }

    [[nodiscard]] BackendConnectionPool& pool() noexcept { return pool_; }

private:
    /// Returns -1 and sets error on failure
    int open_connection(UpstreamError& error);

    UpstreamError exchange(int fd, std::span<const uint8_t> request_bytes, http::Method method,
                           http::Response& response, bool& reusable, bool& nothing_received);

    UpstreamOptions options_;
    BackendConnectionPool pool_;

    // DNS cache (resolved once, dropped after a connect failure)
    std::optional<sockaddr_in> cached_addr_;
};

/// Build the response sent downstream when the upstream exchange failed
[[nodiscard]] http::Response make_error_response(http::StatusCode status);

}  // namespace hopstrip::gateway
