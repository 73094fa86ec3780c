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

// Hopstrip Sanitize Middleware - Header
// Applies HeaderSanitizer to every response in the response phase

#pragma once

#include <filesystem>
#include <string>
#include <system_error>

#include "header_sanitizer.hpp"
#include "pipeline.hpp"

namespace hopstrip::gateway {

/// Response-phase middleware that strips denylisted fields from
/// ctx.response->headers. The request is never touched.
class SanitizeMiddleware : public Middleware {
public:
    struct Config {
        bool log_headers = false;            // Debug-log header lists before/after
        std::filesystem::path header_dump_dir;  // Empty = no dump files
    };

    explicit SanitizeMiddleware(HeaderSanitizer sanitizer);
    SanitizeMiddleware(HeaderSanitizer sanitizer, Config config);

    MiddlewareResult process_response(ResponseContext& ctx) override;

    std::string_view name() const override { return "SanitizeMiddleware"; }

    [[nodiscard]] const HeaderSanitizer& sanitizer() const noexcept { return sanitizer_; }

    /// "Name: value" per distinct name, repeated names joined with ", "
    [[nodiscard]] static std::string format_headers(const http::HeaderCollection& headers);

    /// Write original_headers.txt and sanitized_headers.txt into dir (overwrites)
    /// Safe to call from several workers: pairs are written one at a time and
    /// each file is replaced by rename, so both files always describe the same
    /// response.
    [[nodiscard]] static std::error_code dump_headers(const std::filesystem::path& dir,
                                                      const http::HeaderCollection& original,
                                                      const http::HeaderCollection& sanitized);

private:
    HeaderSanitizer sanitizer_;
    Config config_;
};

}  // namespace hopstrip::gateway
