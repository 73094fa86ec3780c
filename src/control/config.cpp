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

// Hopstrip Configuration - Implementation

#include "config.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "../core/containers.hpp"
#include "../core/logging.hpp"
#include "../http/http.hpp"

namespace hopstrip::control {

static void validate_sanitizer_config(const SanitizerConfig& sanitizer, ValidationResult& result);

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    auto config = parse_json(json);
    if (!config.has_value()) {
        return std::nullopt;
    }

    // Validate configuration
    if (validate(*config).has_errors()) {
        return std::nullopt;
    }

    return config;
}

std::optional<Config> ConfigLoader::parse_file(std::string_view path) {
    // Read file contents
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open config file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return parse_json(json);
}

std::optional<Config> ConfigLoader::parse_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            fprintf(stderr, "JSON parsing error: configuration must be an object\n");
            return std::nullopt;
        }
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Parse error - log detailed error message
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Validate server configuration
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    }

    if (config.server.max_request_size == 0) {
        result.add_error("Server max_request_size must be > 0");
    }

    if (config.server.read_timeout == 0) {
        result.add_error("Server read_timeout must be > 0");
    }

    if (config.server.shutdown_timeout == 0) {
        result.add_error("Server shutdown_timeout must be > 0");
    }

    if (config.server.max_connections == 0) {
        result.add_error("Server max_connections must be > 0");
    }

    // Validate upstream
    if (config.upstream.host.empty()) {
        result.add_error("Upstream host cannot be empty");
    }

    if (config.upstream.port == 0) {
        result.add_error("Upstream port must be > 0");
    }

    if (config.upstream.connect_timeout == 0) {
        result.add_error("Upstream connect_timeout must be > 0");
    }

    if (config.upstream.read_timeout == 0) {
        result.add_error("Upstream read_timeout must be > 0");
    }

    if (config.upstream.max_response_size == 0) {
        result.add_error("Upstream max_response_size must be > 0");
    }

    if (config.upstream.pool_size == 0) {
        result.add_warning("Upstream pool_size is 0 (every request opens a new connection)");
    }

    if (config.upstream.host == config.server.listen_address &&
        config.upstream.port == config.server.listen_port) {
        result.add_error("Upstream address equals the listen address (request loop)");
    }

    validate_sanitizer_config(config.sanitizer, result);

    // Validate logging
    if (!logging::is_valid_log_level(config.logging.level)) {
        result.add_error("Invalid log level: '" + config.logging.level +
                         "' (expected debug, info, warning or error)");
    }

    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Invalid log format: '" + config.logging.format +
                         "' (expected json or text)");
    }

    if (config.logging.output.empty()) {
        result.add_error("Log output cannot be empty (use \"stdout\" or a directory)");
    }

    return result;
}

static void validate_sanitizer_config(const SanitizerConfig& sanitizer, ValidationResult& result) {
    if (!sanitizer.enabled) {
        result.add_warning(
            "Sanitizer is disabled: connection-specific headers will reach the load balancer");
    }

    if (sanitizer.denylist.empty()) {
        result.add_warning("Sanitizer denylist is empty (no headers will be removed)");
    }

    hopstrip::core::fast_string_set seen;
    for (const auto& entry : sanitizer.denylist) {
        std::string error = gateway::Denylist::validate_entry(entry);
        if (!error.empty()) {
            result.add_error("Sanitizer " + error);
            continue;
        }

        std::string lowered = http::to_lower_ascii(entry);
        if (lowered != entry) {
            result.add_warning("Sanitizer denylist entry '" + entry +
                               "' is not lowercase (normalized to '" + lowered + "')");
        }

        if (!seen.insert(lowered).second) {
            result.add_warning("Sanitizer denylist entry '" + entry + "' is a duplicate");
        }
    }

    for (const auto& required : gateway::Denylist::default_names()) {
        if (!seen.contains(required) && !sanitizer.denylist.empty()) {
            result.add_warning("Sanitizer denylist does not contain default entry '" + required +
                               "'");
        }
    }
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;

    auto maybe_config = ConfigLoader::parse_file(path);
    if (!maybe_config.has_value()) {
        return false;
    }

    return load(std::move(*maybe_config));
}

bool ConfigManager::load(Config config) {
    // Validate configuration
    last_validation_ = ConfigLoader::validate(config);
    if (last_validation_.has_errors()) {
        return false;
    }

    // Store configuration (atomic swap)
    std::atomic_store(&current_config_, std::make_shared<const Config>(std::move(config)));

    return true;
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }

    auto maybe_config = ConfigLoader::parse_file(config_path_);
    if (!maybe_config.has_value()) {
        return false;
    }

    // Validate configuration
    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    // RCU pattern: Create new shared_ptr and atomically swap
    // Old config remains valid until all readers release their references
    auto new_config = std::make_shared<const Config>(std::move(*maybe_config));

    // Atomic swap - this is the critical section for hot-reload
    std::atomic_store(&current_config_, new_config);

    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    // Atomic load - safe for concurrent readers
    return std::atomic_load(&current_config_);
}

}  // namespace hopstrip::control
