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

// Gateway Component Factory - Implementation

#include "factory.hpp"

#include "sanitize_middleware.hpp"

namespace hopstrip::gateway {

HeaderSanitizer build_header_sanitizer(const control::SanitizerConfig& config) {
    return HeaderSanitizer(Denylist(config.denylist));
}

std::unique_ptr<Pipeline> build_pipeline(const control::Config& config) {
    auto pipeline = std::make_unique<Pipeline>();

    // Request phase runs in the order added, response phase in reverse:
    // the sanitizer (added last) sees the upstream response first, the
    // access log (added first) sees the final response
    if (config.logging.log_requests) {
        pipeline->use(std::make_unique<LoggingMiddleware>());
    }

    if (config.sanitizer.enabled) {
        SanitizeMiddleware::Config sanitize_config;
        sanitize_config.log_headers = config.sanitizer.log_headers;
        sanitize_config.header_dump_dir = config.sanitizer.header_dump_dir;

        pipeline->use(std::make_unique<SanitizeMiddleware>(
            build_header_sanitizer(config.sanitizer), std::move(sanitize_config)));
    }

    return pipeline;
}

UpstreamOptions build_upstream_options(const control::UpstreamConfig& config) {
    UpstreamOptions options;
    options.host = config.host;
    options.port = config.port;
    options.connect_timeout = std::chrono::milliseconds(config.connect_timeout);
    options.read_timeout = std::chrono::milliseconds(config.read_timeout);
    options.max_response_size = config.max_response_size;
    options.pool_size = config.pool_size;
    options.pool_idle_timeout = std::chrono::seconds(config.pool_idle_timeout);
    options.max_requests_per_connection = config.max_requests_per_connection;
    return options;
}

std::unique_ptr<UpstreamClient> build_upstream_client(const control::Config& config) {
    return std::make_unique<UpstreamClient>(build_upstream_options(config.upstream));
}

}  // namespace hopstrip::gateway
