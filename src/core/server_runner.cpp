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

// Hopstrip Server Runner - Implementation

#include "server_runner.hpp"

#include <arpa/inet.h>
#include <pthread.h>
#include <sched.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../gateway/factory.hpp"
#include "logging.hpp"
#include "socket.hpp"

namespace hopstrip::core {

std::atomic<bool> g_server_running{true};
std::atomic<bool> g_graceful_shutdown{false};
std::atomic<bool> g_reload_requested{false};
std::atomic<uint64_t> g_config_generation{0};

namespace {
constexpr int kMaxEvents = 1024;
constexpr int kPollIntervalMs = 100;
constexpr auto kIdleSweepInterval = std::chrono::seconds(1);

// Pin current thread to a CPU core (best effort)
void pin_thread_to_core(uint32_t core_id) {
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(core_id % CPU_SETSIZE, &cpuset);
    int ret = pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
    if (ret != 0) {
        auto* logger = logging::get_current_logger();
        if (logger) {
            LOG_DEBUG(logger, "CPU affinity not applied: core={}, error={}", core_id, ret);
        }
    }
}

struct Components {
    std::unique_ptr<gateway::Pipeline> pipeline;
    std::unique_ptr<gateway::UpstreamClient> upstream;
};

// Denylist validation happens in ConfigLoader::validate, a throw here means
// the snapshot bypassed it
std::optional<Components> build_components(const control::Config& config, quill::Logger* logger) {
    try {
        Components components;
        components.pipeline = gateway::build_pipeline(config);
        components.upstream = gateway::build_upstream_client(config);
        return components;
    } catch (const std::invalid_argument& e) {
        if (logger) {
            LOG_ERROR(logger, "Failed to build gateway components: {}", e.what());
        }
        return std::nullopt;
    }
}

void accept_connections(Server& server, int epoll_fd) {
    int listen_fd = server.listen_fd();
    while (true) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = accept(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);

        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            // EAGAIN: no more pending connections. Anything else (EMFILE...)
            // is retried on the next readiness event.
            break;
        }

        if (auto ec = set_nonblocking(client_fd); ec) {
            close_fd(client_fd);
            continue;
        }

        char ip_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_str, sizeof(ip_str));
        uint16_t port = ntohs(client_addr.sin_port);

        if (!server.handle_accept(client_fd, ip_str, port)) {
            continue;
        }

        // Add client socket to epoll (edge-triggered)
        epoll_event client_ev{};
        client_ev.events = EPOLLIN | EPOLLET | EPOLLRDHUP;
        client_ev.data.fd = client_fd;
        if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, client_fd, &client_ev) != 0) {
            server.handle_close(client_fd);
        }
    }
}

void dispatch_client_event(Server& server, const epoll_event& event) {
    int fd = event.data.fd;
    if (event.events & EPOLLIN) {
        // Reads until EOF, so a request sent just before a half-close is still served
        server.handle_read(fd);
    } else if (event.events & (EPOLLERR | EPOLLHUP | EPOLLRDHUP)) {
        server.handle_close(fd);
    }
}

void drain_connections(Server& server, int epoll_fd, uint32_t worker_id, quill::Logger* logger) {
    if (server.listen_fd() >= 0) {
        epoll_ctl(epoll_fd, EPOLL_CTL_DEL, server.listen_fd(), nullptr);
    }
    server.stop_accepting();
    server.close_quiescent_connections();

    if (server.connection_count() == 0) {
        return;
    }

    auto timeout = std::chrono::milliseconds(server.config().server.shutdown_timeout);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    printf("Worker %u: Draining %zu active connections (timeout: %lldms)...\n", worker_id,
           server.connection_count(), static_cast<long long>(timeout.count()));

    epoll_event events[kMaxEvents];
    while (server.connection_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        int n = epoll_wait(epoll_fd, events, kMaxEvents, kPollIntervalMs);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (int i = 0; i < n; ++i) {
            dispatch_client_event(server, events[i]);
        }
        server.close_quiescent_connections();
    }

    if (server.connection_count() == 0) {
        printf("Worker %u: All connections drained successfully.\n", worker_id);
    } else {
        printf("Worker %u: Shutdown timeout reached, %zu connections still active. Forcing close.\n",
               worker_id, server.connection_count());
        if (logger) {
            LOG_WARNING(logger, "Shutdown timeout reached, closing {} connections",
                        server.connection_count());
        }
    }
}

// Worker event loop: one Server, one epoll instance
std::error_code run_worker(control::ConfigManager& manager, uint32_t worker_id,
                           bool service_reload) {
    auto config = manager.get();
    if (!config) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    auto* logger = logging::init_worker_logger(static_cast<int>(worker_id), config->logging);

    auto components = build_components(*config, logger);
    if (!components) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    Server server(config, std::move(components->pipeline), std::move(components->upstream));
    server.set_logger(logger);

    if (auto ec = server.start(); ec) {
        LOG_ERROR(logger, "Failed to listen on {}:{}: {}", config->server.listen_address,
                  config->server.listen_port, ec.message());
        return ec;
    }

    int epoll_fd = epoll_create1(0);
    if (epoll_fd < 0) {
        return std::error_code(errno, std::system_category());
    }

    // Add listen socket to epoll (edge-triggered)
    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLET;
    ev.data.fd = server.listen_fd();
    if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, server.listen_fd(), &ev) < 0) {
        auto ec = std::error_code(errno, std::system_category());
        close_fd(epoll_fd);
        return ec;
    }

    LOG_INFO(logger, "Worker {} listening on {}:{}, upstream={}:{}", worker_id,
             config->server.listen_address, config->server.listen_port, config->upstream.host,
             config->upstream.port);

    uint64_t generation = g_config_generation.load();
    auto last_sweep = std::chrono::steady_clock::now();
    epoll_event events[kMaxEvents];
    std::error_code result;

    while (g_server_running) {
        if (service_reload && g_reload_requested.exchange(false)) {
            reload_configuration(manager);
        }

        uint64_t current_generation = g_config_generation.load();
        if (current_generation != generation) {
            generation = current_generation;
            auto snapshot = manager.get();
            auto rebuilt = build_components(*snapshot, logger);
            if (rebuilt) {
                logger->set_log_level(logging::parse_log_level(snapshot->logging.level));
                server.apply_config(snapshot, std::move(rebuilt->pipeline),
                                    std::move(rebuilt->upstream));
            }
        }

        int n = epoll_wait(epoll_fd, events, kMaxEvents, kPollIntervalMs);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            result = std::error_code(errno, std::system_category());
            LOG_ERROR(logger, "epoll_wait failed: {}", result.message());
            break;
        }

        for (int i = 0; i < n; ++i) {
            if (events[i].data.fd == server.listen_fd()) {
                accept_connections(server, epoll_fd);
            } else {
                dispatch_client_event(server, events[i]);
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_sweep >= kIdleSweepInterval) {
            last_sweep = now;
            if (size_t closed = server.close_idle_connections(); closed > 0) {
                LOG_DEBUG(logger, "Closed {} idle connections", closed);
            }
        }
    }

    if (g_graceful_shutdown) {
        drain_connections(server, epoll_fd, worker_id, logger);
    }

    server.log_upstream_stats();
    server.stop();
    close_fd(epoll_fd);
    LOG_INFO(logger, "Worker {} stopped", worker_id);
    return result;
}
}  // anonymous namespace

void request_shutdown() noexcept {
    g_graceful_shutdown = true;
    g_server_running = false;
}

void request_reload() noexcept {
    g_reload_requested = true;
}

bool reload_configuration(control::ConfigManager& manager) {
    bool success = manager.reload();
    const auto& validation = manager.last_validation();

    if (success) {
        printf("Configuration reloaded from %s\n", std::string(manager.config_path()).c_str());
        if (!validation.warnings.empty()) {
            printf("Warnings during config reload:\n");
            for (const auto& warning : validation.warnings) {
                printf("  - %s\n", warning.c_str());
            }
        }
        g_config_generation.fetch_add(1);
        return true;
    }

    fprintf(stderr, "ERROR: Failed to reload configuration, keeping current configuration\n");
    for (const auto& error : validation.errors) {
        fprintf(stderr, "  - %s\n", error.c_str());
    }
    return false;
}

uint32_t resolve_worker_count(const control::Config& config) {
    uint32_t num_workers = config.server.worker_threads;
    if (num_workers == 0) {
        num_workers = std::thread::hardware_concurrency();
    }
    return num_workers == 0 ? 1 : num_workers;
}

std::error_code run_simple_server(control::ConfigManager& manager) {
    g_server_running = true;
    return run_worker(manager, 0, true);
}

// Multi-threaded server with SO_REUSEPORT load balancing
std::error_code run_multi_threaded_server(control::ConfigManager& manager) {
    auto config = manager.get();
    if (!config) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    uint32_t num_workers = resolve_worker_count(*config);
    g_server_running = true;

    std::vector<std::error_code> results(num_workers);
    std::vector<std::thread> workers;
    workers.reserve(num_workers);

    for (uint32_t i = 0; i < num_workers; ++i) {
        workers.emplace_back([&manager, &results, i]() {
            pin_thread_to_core(i);
            results[i] = run_worker(manager, i, false);
            if (results[i]) {
                // One worker failing to start takes the process down
                g_server_running = false;
            }
        });
    }

    // The main thread owns reloads, workers only pick up new generations
    while (g_server_running) {
        if (g_reload_requested.exchange(false)) {
            reload_configuration(manager);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    for (const auto& ec : results) {
        if (ec) {
            return ec;
        }
    }
    return {};
}

}  // namespace hopstrip::core
