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

// Hopstrip Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>

namespace hopstrip::core {

int create_listening_socket(std::string_view address, uint16_t port, int backlog) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }

    // SO_REUSEADDR - allows binding to same address immediately after restart
    if (auto ec = set_reuseaddr(fd); ec) {
        close_fd(fd);
        return -1;
    }

#ifdef SO_REUSEPORT
    // SO_REUSEPORT - one listening socket per worker, the kernel
    // load-balances incoming connections across them
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt)) < 0) {
        close_fd(fd);
        return -1;
    }
#endif

    // Bind
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string addr_str{address};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr.sin_addr) <= 0) {
        close_fd(fd);
        return -1;
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close_fd(fd);
        return -1;
    }

    // Listen
    if (listen(fd, backlog) < 0) {
        close_fd(fd);
        return -1;
    }

    // Non-blocking
    if (auto ec = set_nonblocking(fd); ec) {
        close_fd(fd);
        return -1;
    }

    return fd;
}

std::error_code resolve_ipv4(const std::string& host, uint16_t port, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);

    // Try direct IP first (fastest path)
    if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) {
        return {};
    }

    struct addrinfo hints{}, *result = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
        return std::make_error_code(std::errc::host_unreachable);
    }

    out = *reinterpret_cast<struct sockaddr_in*>(result->ai_addr);
    out.sin_port = htons(port);
    freeaddrinfo(result);
    return {};
}

int connect_with_timeout(const sockaddr_in& addr, std::chrono::milliseconds timeout,
                         std::error_code& ec) {
    ec.clear();

    int sockfd = socket(AF_INET, SOCK_STREAM, 0);
    if (sockfd < 0) {
        ec = std::error_code(errno, std::system_category());
        return -1;
    }

    // Non-blocking connect so the timeout can be enforced with poll()
    int flags = fcntl(sockfd, F_GETFL, 0);
    if (flags < 0 || fcntl(sockfd, F_SETFL, flags | O_NONBLOCK) < 0) {
        ec = std::error_code(errno, std::system_category());
        close_fd(sockfd);
        return -1;
    }

    int result = connect(sockfd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (result < 0) {
        if (errno != EINPROGRESS) {
            ec = std::error_code(errno, std::system_category());
            close_fd(sockfd);
            return -1;
        }

        pollfd pfd{};
        pfd.fd = sockfd;
        pfd.events = POLLOUT;

        int ready;
        do {
            ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            ec = std::make_error_code(std::errc::timed_out);
            close_fd(sockfd);
            return -1;
        }
        if (ready < 0) {
            ec = std::error_code(errno, std::system_category());
            close_fd(sockfd);
            return -1;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            so_error = errno;
        }
        if (so_error != 0) {
            ec = std::error_code(so_error, std::system_category());
            close_fd(sockfd);
            return -1;
        }
    }

    // Back to blocking mode, reads and writes are bounded by SO_RCVTIMEO/SO_SNDTIMEO
    if (fcntl(sockfd, F_SETFL, flags) < 0) {
        ec = std::error_code(errno, std::system_category());
        close_fd(sockfd);
        return -1;
    }

    // Disable Nagle's algorithm (small request/response messages)
    if (auto nodelay_ec = set_tcp_nodelay(sockfd); nodelay_ec) {
        ec = nodelay_ec;
        close_fd(sockfd);
        return -1;
    }

    return sockfd;
}

std::error_code set_socket_timeouts(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

std::error_code set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return std::error_code(errno, std::system_category());
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::error_code(errno, std::system_category());
    }

    return {};
}

std::error_code set_reuseaddr(int fd) {
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

std::error_code set_tcp_nodelay(int fd) {
    int flag = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

uint16_t local_port(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

void close_fd(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

}  // namespace hopstrip::core
