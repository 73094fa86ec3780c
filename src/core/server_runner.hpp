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

// Hopstrip Server Runner - Header
// Worker event loops, graceful shutdown and configuration reload

#pragma once

#include <atomic>
#include <cstdint>
#include <system_error>

#include "../control/config.hpp"
#include "server.hpp"

namespace hopstrip::core {

// Process-wide run state (written from signal handlers)
extern std::atomic<bool> g_server_running;
extern std::atomic<bool> g_graceful_shutdown;
extern std::atomic<bool> g_reload_requested;

// Bumped after every successful reload, workers rebuild their components
// when they see a new value
extern std::atomic<uint64_t> g_config_generation;

/// Async-signal-safe: stop accepting and drain (SIGINT/SIGTERM)
void request_shutdown() noexcept;

/// Async-signal-safe: reload configuration at the next loop iteration (SIGHUP)
void request_reload() noexcept;

/// Reload the configuration file, report the outcome on stdout/stderr and
/// publish the new generation on success
bool reload_configuration(control::ConfigManager& manager);

/// Run the proxy on the calling thread (one worker)
[[nodiscard]] std::error_code run_simple_server(control::ConfigManager& manager);

/// Run N workers (SO_REUSEPORT, one epoll loop each, 0 = one per CPU core).
/// The calling thread services reload requests until shutdown.
[[nodiscard]] std::error_code run_multi_threaded_server(control::ConfigManager& manager);

/// Number of workers for a configuration (resolves worker_threads = 0)
[[nodiscard]] uint32_t resolve_worker_count(const control::Config& config);

}  // namespace hopstrip::core
