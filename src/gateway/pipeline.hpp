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

// Hopstrip Pipeline - Header
// Two-phase middleware chain (request phase, response phase)

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../http/http.hpp"

namespace hopstrip::gateway {

/// Request context (passed through middleware chain)
struct RequestContext {
    // Request/Response
    http::Request* request = nullptr;
    http::Response* response = nullptr;

    std::string correlation_id;

    // Connection info
    std::string client_ip;

    // Timing
    std::chrono::steady_clock::time_point start_time;

    // Filled in by a middleware that returns Error
    std::string error_message;
};

/// Response context (passed through response middleware chain)
struct ResponseContext {
    // Request/Response
    const http::Request* request = nullptr;
    http::Response* response = nullptr;

    std::string correlation_id;

    // Connection info
    std::string client_ip;

    // Number of header fields removed by the sanitizer
    size_t headers_stripped = 0;

    // Timing
    std::chrono::steady_clock::time_point start_time;
};

/// Middleware result
enum class MiddlewareResult {
    Continue,  // Continue to next middleware
    Stop,      // Stop pipeline execution
    Error      // Error occurred
};

/// Middleware function signature
using MiddlewareFunc = std::function<MiddlewareResult(RequestContext&)>;

/// Middleware base class (Two-Phase: Request + Response)
class Middleware {
public:
    virtual ~Middleware() = default;

    /// Process request phase (before proxy to upstream)
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_request(RequestContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Process response phase (after upstream responds, before the response is written)
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_response(ResponseContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Get middleware name (for debugging)
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Logging middleware (access log line in response phase with timing)
class LoggingMiddleware : public Middleware {
public:
    MiddlewareResult process_response(ResponseContext& ctx) override;
    std::string_view name() const override { return "LoggingMiddleware"; }
};

/// Middleware pipeline
///
/// Request phase runs in insertion order. Response phase runs in reverse
/// insertion order, so the first middleware added sees the final response.
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline() = default;

    // Non-copyable, movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) noexcept = default;
    Pipeline& operator=(Pipeline&&) noexcept = default;

    /// Add middleware to pipeline
    void use(std::unique_ptr<Middleware> middleware);

    /// Add middleware function to pipeline
    void use(MiddlewareFunc func, std::string_view name = "CustomMiddleware");

    /// Execute request phase (before proxy)
    [[nodiscard]] MiddlewareResult execute_request(RequestContext& ctx);

    /// Execute response phase (after upstream responds)
    [[nodiscard]] MiddlewareResult execute_response(ResponseContext& ctx);

    /// Find middleware by name (nullptr if absent)
    [[nodiscard]] Middleware* find(std::string_view name) const noexcept;

    /// Get middleware count
    [[nodiscard]] size_t size() const noexcept { return middleware_.size(); }

private:
    std::vector<std::unique_ptr<Middleware>> middleware_;
};

/// Pipeline builder (fluent API)
class PipelineBuilder {
public:
    PipelineBuilder() = default;

    PipelineBuilder& use(std::unique_ptr<Middleware> middleware) {
        pipeline_.use(std::move(middleware));
        return *this;
    }

    PipelineBuilder& use(MiddlewareFunc func, std::string_view name = "CustomMiddleware") {
        pipeline_.use(std::move(func), name);
        return *this;
    }

    Pipeline build() && { return std::move(pipeline_); }

private:
    Pipeline pipeline_;
};

/// Function middleware wrapper (request phase only)
class FunctionMiddleware : public Middleware {
public:
    explicit FunctionMiddleware(MiddlewareFunc func, std::string name)
        : func_(std::move(func)), name_(std::move(name)) {}

    MiddlewareResult process_request(RequestContext& ctx) override { return func_(ctx); }

    std::string_view name() const override { return name_; }

private:
    MiddlewareFunc func_;
    std::string name_;
};

}  // namespace hopstrip::gateway
