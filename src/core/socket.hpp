// Hopstrip Socket Utilities - Header

#pragma once

#include <netinet/in.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace hopstrip::core {

/// Create non-blocking listening socket (SO_REUSEADDR + SO_REUSEPORT)
/// Returns -1 on failure
[[nodiscard]] int create_listening_socket(
    std::string_view address,
    uint16_t port,
    int backlog = 128);

/// Resolve an IPv4 literal or hostname
[[nodiscard]] std::error_code resolve_ipv4(const std::string& host, uint16_t port, sockaddr_in& out);

/// Blocking-mode TCP connect bounded by timeout (TCP_NODELAY enabled).
/// Returns fd, or -1 with ec set (std::errc::timed_out when the timeout expires)
[[nodiscard]] int connect_with_timeout(const sockaddr_in& addr,
                                       std::chrono::milliseconds timeout,
                                       std::error_code& ec);

/// SO_RCVTIMEO / SO_SNDTIMEO
[[nodiscard]] std::error_code set_socket_timeouts(int fd, std::chrono::milliseconds timeout);

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_reuseaddr(int fd);
[[nodiscard]] std::error_code set_tcp_nodelay(int fd);

/// Port a bound socket is listening on (0 on failure)
[[nodiscard]] uint16_t local_port(int fd);

void close_fd(int fd);

} // namespace hopstrip::core
