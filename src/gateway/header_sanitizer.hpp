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

// Hopstrip Header Sanitizer - Header
// Removes connection-specific fields from outbound response headers

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../http/http.hpp"

namespace hopstrip::gateway {

/// Longest header name accepted as a denylist entry
inline constexpr size_t kMaxDenylistEntryLength = 128;

/// Immutable set of header names that must not be relayed downstream.
///
/// Entries are stored lowercase. Construction rejects entries that are empty,
/// longer than kMaxDenylistEntryLength or not RFC 7230 tokens by throwing
/// std::invalid_argument. Duplicates (in any casing) collapse to one entry.
class Denylist {
public:
    /// Empty denylist (removes nothing)
    Denylist() = default;

    explicit Denylist(const std::vector<std::string>& names);

    /// connection, keep-alive, proxy-connection, transfer-encoding, upgrade
    [[nodiscard]] static Denylist defaults();

    /// Default entries, lowercase, in canonical order
    [[nodiscard]] static const std::vector<std::string>& default_names();

    /// Case-insensitive membership test
    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    /// Lowercase entries in first-seen order
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }

    [[nodiscard]] size_t size() const noexcept { return names_.size(); }
    [[nodiscard]] bool empty() const noexcept { return names_.empty(); }

    /// Check a candidate entry; returns an error description or empty string
    [[nodiscard]] static std::string validate_entry(std::string_view name);

private:
    std::vector<std::string> names_;
    core::fast_string_set lookup_;
};

/// Stateless response header filter.
///
/// Every field whose name matches a denylist entry (case-insensitive) is
/// removed; all other fields keep their casing, value, order and multiplicity.
/// Safe to call concurrently from any number of threads.
class HeaderSanitizer {
public:
    /// Uses Denylist::defaults()
    HeaderSanitizer();

    explicit HeaderSanitizer(Denylist denylist);

    /// Filtered copy of headers; the input is not modified
    [[nodiscard]] http::HeaderCollection sanitize(const http::HeaderCollection& headers) const;

    /// Filter headers in place
    /// Returns number of fields removed
    size_t sanitize_in_place(http::HeaderCollection& headers) const;

    [[nodiscard]] bool is_denied(std::string_view name) const noexcept;

    [[nodiscard]] const Denylist& denylist() const noexcept { return denylist_; }

private:
    Denylist denylist_;
};

}  // namespace hopstrip::gateway
