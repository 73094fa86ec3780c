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

// Hopstrip Sanitize Middleware - Implementation

#include "sanitize_middleware.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <utility>
#include <vector>

#include "../core/logging.hpp"

namespace hopstrip::gateway {

namespace {

// Workers share the dump files; one pair is written at a time
std::mutex g_dump_mutex;

// Readers see either the previous file or the new one, never a partial write
std::error_code write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out) {
            return std::make_error_code(std::errc::io_error);
        }
        out << content;
        out.flush();
        if (!out) {
            return std::make_error_code(std::errc::io_error);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return ec;
    }
    return {};
}

}  // namespace

SanitizeMiddleware::SanitizeMiddleware(HeaderSanitizer sanitizer)
    : sanitizer_(std::move(sanitizer)) {}

SanitizeMiddleware::SanitizeMiddleware(HeaderSanitizer sanitizer, Config config)
    : sanitizer_(std::move(sanitizer)), config_(std::move(config)) {}

MiddlewareResult SanitizeMiddleware::process_response(ResponseContext& ctx) {
    if (!ctx.response) {
        return MiddlewareResult::Error;
    }

    bool keep_original = config_.log_headers || !config_.header_dump_dir.empty();
    if (!keep_original) {
        ctx.headers_stripped = sanitizer_.sanitize_in_place(ctx.response->headers);
        return MiddlewareResult::Continue;
    }

    http::HeaderCollection original = ctx.response->headers;
    ctx.headers_stripped = sanitizer_.sanitize_in_place(ctx.response->headers);

    auto* logger = logging::get_current_logger();

    if (config_.log_headers && logger) {
        LOG_DEBUG(logger, "Original headers: correlation_id={}, headers=[{}]",
                  ctx.correlation_id, format_headers(original));
        LOG_DEBUG(logger, "Sanitized headers: correlation_id={}, removed={}, headers=[{}]",
                  ctx.correlation_id, ctx.headers_stripped,
                  format_headers(ctx.response->headers));
    }

    if (!config_.header_dump_dir.empty()) {
        std::error_code ec =
            dump_headers(config_.header_dump_dir, original, ctx.response->headers);
        if (ec && logger) {
            LOG_WARNING(logger, "Header dump failed: dir={}, error={}, correlation_id={}",
                        config_.header_dump_dir.string(), ec.message(), ctx.correlation_id);
        }
    }

    return MiddlewareResult::Continue;
}

std::string SanitizeMiddleware::format_headers(const http::HeaderCollection& headers) {
    // Group repeated names (first-seen casing and position), values in order
    std::vector<std::pair<std::string, std::string>> grouped;
    for (const auto& [name, value] : headers) {
        auto it = std::find_if(grouped.begin(), grouped.end(), [&name](const auto& entry) {
            return http::header_name_equals(entry.first, name);
        });
        if (it == grouped.end()) {
            grouped.emplace_back(name, value);
        } else {
            it->second += ", ";
            it->second += value;
        }
    }

    std::string out;
    for (const auto& [name, value] : grouped) {
        out += name;
        out += ": ";
        out += value;
        out += '\n';
    }
    return out;
}

std::error_code SanitizeMiddleware::dump_headers(const std::filesystem::path& dir,
                                                 const http::HeaderCollection& original,
                                                 const http::HeaderCollection& sanitized) {
    std::string original_text = format_headers(original);
    std::string sanitized_text = format_headers(sanitized);

    std::lock_guard lock(g_dump_mutex);

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return ec;
    }

    ec = write_file(dir / "original_headers.txt", original_text);
    if (ec) {
        return ec;
    }
    return write_file(dir / "sanitized_headers.txt", sanitized_text);
}

}  // namespace hopstrip::gateway
