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

// Hopstrip Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "../gateway/header_sanitizer.hpp"

namespace hopstrip::control {

/// Downstream listener configuration
struct ServerConfig {
    uint32_t worker_threads = 0;  // 0 = auto-detect CPU count

    // Network settings
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8080;
    uint32_t backlog = 128;

    // Timeouts (milliseconds)
    uint32_t read_timeout = 60000;      // 60 seconds
    uint32_t shutdown_timeout = 30000;  // 30 seconds

    // Limits
    uint32_t max_connections = 10000;
    uint32_t max_request_size = 1048576;  // 1MB
};

/// The single upstream application
struct UpstreamConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 5000;

    // Timeouts (milliseconds)
    uint32_t connect_timeout = 2000;
    uint32_t read_timeout = 30000;

    uint32_t max_response_size = 10485760;  // 10MB

    // Keep-alive pool (per worker)
    uint32_t pool_size = 32;
    uint32_t pool_idle_timeout = 60;  // seconds
    uint32_t max_requests_per_connection = 0;  // 0 = unlimited
};

/// Response header sanitization
struct SanitizerConfig {
    bool enabled = true;
    std::vector<std::string> denylist = gateway::Denylist::default_names();
    bool log_headers = false;     // Debug-log header lists before/after
    std::string header_dump_dir;  // Empty = no dump files
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";     // debug, info, warning, error
    std::string format = "text";    // json, text
    std::string output = "stdout";  // "stdout" or log directory (worker_N.log appended)
    bool log_requests = true;

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Hopstrip configuration
struct Config {
    ServerConfig server;
    UpstreamConfig upstream;
    SanitizerConfig sanitizer;
    LogConfig logging;
};

// All config types use custom from_json/to_json (no macros - avoids conflicts)

// Custom from_json functions to handle missing fields with defaults
inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.worker_threads = j.value("worker_threads", 0u);
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", uint16_t(8080));
    s.backlog = j.value("backlog", 128u);
    s.read_timeout = j.value("read_timeout", 60000u);
    s.shutdown_timeout = j.value("shutdown_timeout", 30000u);
    s.max_connections = j.value("max_connections", 10000u);
    s.max_request_size = j.value("max_request_size", 1048576u);
}

inline void from_json(const nlohmann::json& j, UpstreamConfig& u) {
    u.host = j.value("host", std::string("127.0.0.1"));
    u.port = j.value("port", uint16_t(5000));
    u.connect_timeout = j.value("connect_timeout", 2000u);
    u.read_timeout = j.value("read_timeout", 30000u);
    u.max_response_size = j.value("max_response_size", 10485760u);
    u.pool_size = j.value("pool_size", 32u);
    u.pool_idle_timeout = j.value("pool_idle_timeout", 60u);
    u.max_requests_per_connection = j.value("max_requests_per_connection", 0u);
}

inline void from_json(const nlohmann::json& j, SanitizerConfig& s) {
    s.enabled = j.value("enabled", true);
    s.denylist = j.value("denylist", gateway::Denylist::default_names());
    s.log_headers = j.value("log_headers", false);
    s.header_dump_dir = j.value("header_dump_dir", std::string());
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("stdout"));
    l.log_requests = j.value("log_requests", true);
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get() instead of value() to avoid infinite recursion
    // when default values trigger to_json() -> from_json() cycles
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("upstream")) {
        j.at("upstream").get_to(c.upstream);
    }
    if (j.contains("sanitizer")) {
        j.at("sanitizer").get_to(c.sanitizer);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
}

// ============================================================================
// to_json functions for all config types
// ============================================================================

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"worker_threads", s.worker_threads},
                       {"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"backlog", s.backlog},
                       {"read_timeout", s.read_timeout},
                       {"shutdown_timeout", s.shutdown_timeout},
                       {"max_connections", s.max_connections},
                       {"max_request_size", s.max_request_size}};
}

inline void to_json(nlohmann::json& j, const UpstreamConfig& u) {
    j = nlohmann::json{{"host", u.host},
                       {"port", u.port},
                       {"connect_timeout", u.connect_timeout},
                       {"read_timeout", u.read_timeout},
                       {"max_response_size", u.max_response_size},
                       {"pool_size", u.pool_size},
                       {"pool_idle_timeout", u.pool_idle_timeout},
                       {"max_requests_per_connection", u.max_requests_per_connection}};
}

inline void to_json(nlohmann::json& j, const SanitizerConfig& s) {
    j = nlohmann::json{{"enabled", s.enabled},
                       {"denylist", s.denylist},
                       {"log_headers", s.log_headers},
                       {"header_dump_dir", s.header_dump_dir}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"log_requests", l.log_requests},
                       {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["server"] = c.server;
    j["upstream"] = c.upstream;
    j["sanitizer"] = c.sanitizer;
    j["logging"] = c.logging;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load and validate configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Parse JSON file without validating (for reporting validation results)
    [[nodiscard]] static std::optional<Config> parse_file(std::string_view path);

    /// Parse JSON string without validating
    [[nodiscard]] static std::optional<Config> parse_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Configuration manager with hot-reload support (RCU pattern)
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration
    [[nodiscard]] bool load(std::string_view path);

    /// Use an already-built configuration (no file backing, reload() fails)
    [[nodiscard]] bool load(Config config);

    /// Reload configuration (hot-reload with RCU)
    /// On failure the current snapshot stays in place
    [[nodiscard]] bool reload();

    /// Get current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    /// Get configuration file path
    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    /// Check if configuration is loaded
    [[nodiscard]] bool is_loaded() const noexcept { return get() != nullptr; }

    /// Get last validation result
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace hopstrip::control
