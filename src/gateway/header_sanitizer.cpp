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

// Hopstrip Header Sanitizer - Implementation

#include "header_sanitizer.hpp"

#include <fmt/format.h>

#include <array>
#include <stdexcept>
#include <utility>

namespace hopstrip::gateway {

namespace {

// Lowercase a header name into a stack buffer (no allocation on the hot path).
// Returns an empty view when the name cannot be a denylist entry.
std::string_view lowercase_name(std::string_view name,
                                std::array<char, kMaxDenylistEntryLength>& buffer) noexcept {
    if (name.empty() || name.size() > buffer.size()) {
        return {};
    }
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        buffer[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }
    return {buffer.data(), name.size()};
}

}  // namespace

// Denylist

Denylist::Denylist(const std::vector<std::string>& names) {
    names_.reserve(names.size());
    for (const auto& name : names) {
        std::string error = validate_entry(name);
        if (!error.empty()) {
            throw std::invalid_argument(error);
        }

        std::string lowered = http::to_lower_ascii(name);
        if (lookup_.insert(lowered).second) {
            names_.push_back(std::move(lowered));
        }
    }
}

const std::vector<std::string>& Denylist::default_names() {
    static const std::vector<std::string> names = {
        "connection",
        "keep-alive",
        "proxy-connection",
        "transfer-encoding",
        "upgrade",
    };
    return names;
}

Denylist Denylist::defaults() {
    return Denylist(default_names());
}

bool Denylist::contains(std::string_view name) const noexcept {
    if (lookup_.empty()) {
        return false;
    }

    std::array<char, kMaxDenylistEntryLength> buffer;
    std::string_view lowered = lowercase_name(name, buffer);
    if (lowered.empty()) {
        return false;
    }
    return lookup_.find(lowered) != lookup_.end();
}

std::string Denylist::validate_entry(std::string_view name) {
    if (name.empty()) {
        return "denylist entry must not be empty";
    }
    if (name.size() > kMaxDenylistEntryLength) {
        return fmt::format("denylist entry '{}...' exceeds {} characters", name.substr(0, 32),
                           kMaxDenylistEntryLength);
    }
    if (!http::is_token(name)) {
        return fmt::format("denylist entry '{}' is not a valid header field name", name);
    }
    return {};
}

// HeaderSanitizer

HeaderSanitizer::HeaderSanitizer() : denylist_(Denylist::defaults()) {}

HeaderSanitizer::HeaderSanitizer(Denylist denylist) : denylist_(std::move(denylist)) {}

http::HeaderCollection HeaderSanitizer::sanitize(const http::HeaderCollection& headers) const {
    http::HeaderCollection result;
    result.reserve(headers.size());
    for (const auto& [name, value] : headers) {
        if (!denylist_.contains(name)) {
            result.add(name, value);
        }
    }
    return result;
}

size_t HeaderSanitizer::sanitize_in_place(http::HeaderCollection& headers) const {
    if (denylist_.empty() || headers.empty()) {
        return 0;
    }
    return headers.remove_if([this](std::string_view name) { return denylist_.contains(name); });
}

bool HeaderSanitizer::is_denied(std::string_view name) const noexcept {
    return denylist_.contains(name);
}

}  // namespace hopstrip::gateway
