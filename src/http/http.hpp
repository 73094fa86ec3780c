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

// Hopstrip HTTP Protocol - Header
// Request views into the receive buffer, owned response header collection

#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hopstrip::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP version
enum class Version : uint8_t { HTTP_1_0, HTTP_1_1, HTTP_2_0, UNKNOWN };

/// HTTP status codes the proxy produces or inspects.
/// Upstream responses may carry any value in [100, 999]; those are stored as-is.
enum class StatusCode : uint16_t {
    // 1xx Informational
    Continue = 100,
    SwitchingProtocols = 101,

    // 2xx Success
    OK = 200,
    Created = 201,
    Accepted = 202,
    NoContent = 204,

    // 3xx Redirection
    MovedPermanently = 301,
    Found = 302,
    SeeOther = 303,
    NotModified = 304,
    TemporaryRedirect = 307,
    PermanentRedirect = 308,

    // 4xx Client Error
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    PayloadTooLarge = 413,
    URITooLong = 414,
    TooManyRequests = 429,
    RequestHeaderFieldsTooLarge = 431,

    // 5xx Server Error
    InternalServerError = 500,
    NotImplemented = 501,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504,
};

/// HTTP header (name-value pair)
/// Both name and value are views into the request buffer (zero-copy)
struct Header {
    std::string_view name;
    std::string_view value;
};

/// Ordered multi-map of header fields with owned storage.
/// Name lookups are case-insensitive; insertion order, name casing and repeated
/// fields are preserved exactly as added.
class HeaderCollection {
public:
    using Field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Field>::const_iterator;

    HeaderCollection() = default;
    HeaderCollection(std::initializer_list<Field> fields) : fields_(fields) {}

    /// Append a field (never merges with existing fields of the same name)
    void add(std::string_view name, std::string_view value);

    /// First field matching name (case-insensitive), nullptr if absent
    [[nodiscard]] const Field* find(std::string_view name) const noexcept;

    /// Value of the first matching field or default
    [[nodiscard]] std::string_view get(std::string_view name,
                                       std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    /// Number of fields matching name (case-insensitive)
    [[nodiscard]] size_t count(std::string_view name) const noexcept;

    /// Remove every field matching name (case-insensitive)
    /// Returns number of fields removed
    size_t remove(std::string_view name);

    /// Remove every field whose name satisfies pred, preserving the order of the rest
    /// Returns number of fields removed
    template <typename Predicate>
    size_t remove_if(Predicate pred) {
        size_t before = fields_.size();
        std::erase_if(fields_, [&pred](const Field& f) { return pred(std::string_view(f.first)); });
        return before - fields_.size();
    }

    /// Replace the value of the first matching field and drop later duplicates.
    /// Appends the field if it is absent.
    void set(std::string_view name, std::string_view value);

    void clear() noexcept { fields_.clear(); }
    void reserve(size_t n) { fields_.reserve(n); }

    [[nodiscard]] size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return fields_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return fields_.end(); }

    [[nodiscard]] const Field& operator[](size_t index) const { return fields_[index]; }

    bool operator==(const HeaderCollection& other) const = default;

private:
    std::vector<Field> fields_;
};

/// HTTP request (zero-copy, all views into the connection receive buffer)
struct Request {
    Method method = Method::UNKNOWN;
    Version version = Version::HTTP_1_1;

    std::string_view uri;
    std::string_view path;   // URI without query string
    std::string_view query;  // Query string (if present)

    std::vector<Header> headers;

    // Exact bytes of the message as received (request line through end of body)
    std::span<const uint8_t> raw;

    // Helper: Find header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Content-Length helper
    [[nodiscard]] size_t content_length() const noexcept;

    // Connection: keep-alive helper
    [[nodiscard]] bool keep_alive() const noexcept;
};

/// HTTP response (owned storage, outlives the upstream receive buffer)
struct Response {
    Version version = Version::HTTP_1_1;
    StatusCode status = StatusCode::OK;
    std::string reason_phrase;

    HeaderCollection headers;

    std::vector<uint8_t> body;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept {
        return headers.get(name, default_value);
    }

    [[nodiscard]] bool has_header(std::string_view name) const noexcept {
        return headers.contains(name);
    }

    /// Numeric status code
    [[nodiscard]] uint16_t status_code() const noexcept { return static_cast<uint16_t>(status); }

    /// Replace body with a copy of text
    void set_body(std::string_view text);

    // Helper: Set content type
    void set_content_type(std::string_view content_type);

    // Content-Length helper
    [[nodiscard]] size_t content_length() const noexcept;

    // Connection: keep-alive helper (must be evaluated before hop-by-hop headers are stripped)
    [[nodiscard]] bool keep_alive() const noexcept;
};

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert Version to string
[[nodiscard]] std::string_view to_string(Version version) noexcept;

/// Convert StatusCode to reason phrase ("Unknown" for codes outside the enum)
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// ASCII lowercase copy
[[nodiscard]] std::string to_lower_ascii(std::string_view str);

/// RFC 7230 token check (header field names)
[[nodiscard]] bool is_token(std::string_view str) noexcept;

/// Check a comma-separated header value for a token (case-insensitive),
/// e.g. has_token("keep-alive, Upgrade", "upgrade") == true
[[nodiscard]] bool has_token(std::string_view value, std::string_view token) noexcept;

/// Body bytes as text (for logging and tests)
[[nodiscard]] inline std::string_view as_text(std::span<const uint8_t> bytes) noexcept {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace hopstrip::http
