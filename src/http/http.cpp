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

// Hopstrip HTTP Protocol - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace hopstrip::http {

namespace {

bool connection_keep_alive(Version version, std::string_view connection) noexcept {
    // HTTP/1.1 defaults to keep-alive, only close if explicitly requested
    if (version == Version::HTTP_1_1) {
        return !has_token(connection, "close");
    }

    // HTTP/1.0 defaults to close
    return has_token(connection, "keep-alive");
}

size_t parse_content_length(std::string_view value) noexcept {
    size_t length = 0;
    std::from_chars(value.data(), value.data() + value.size(), length);
    return length;
}

}  // namespace

// HeaderCollection

void HeaderCollection::add(std::string_view name, std::string_view value) {
    fields_.emplace_back(std::string(name), std::string(value));
}

const HeaderCollection::Field* HeaderCollection::find(std::string_view name) const noexcept {
    for (const auto& field : fields_) {
        if (header_name_equals(field.first, name)) {
            return &field;
        }
    }
    return nullptr;
}

std::string_view HeaderCollection::get(std::string_view name,
                                       std::string_view default_value) const noexcept {
    const Field* field = find(name);
    return field ? std::string_view(field->second) : default_value;
}

bool HeaderCollection::contains(std::string_view name) const noexcept {
    return find(name) != nullptr;
}

size_t HeaderCollection::count(std::string_view name) const noexcept {
    return static_cast<size_t>(std::count_if(fields_.begin(), fields_.end(), [name](const Field& f) {
        return header_name_equals(f.first, name);
    }));
}

size_t HeaderCollection::remove(std::string_view name) {
    return remove_if([name](std::string_view field_name) {
        return header_name_equals(field_name, name);
    });
}

void HeaderCollection::set(std::string_view name, std::string_view value) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [name](const Field& f) { return header_name_equals(f.first, name); });
    if (it == fields_.end()) {
        add(name, value);
        return;
    }

    it->second = std::string(value);

    // Drop later duplicates so the field ends up single-valued
    auto first_index = static_cast<size_t>(it - fields_.begin());
    size_t index = 0;
    std::erase_if(fields_, [&](const Field& f) {
        bool duplicate = index > first_index && header_name_equals(f.first, name);
        ++index;
        return duplicate;
    });
}

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? header->value : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

size_t Request::content_length() const noexcept {
    return parse_content_length(get_header("Content-Length", "0"));
}

bool Request::keep_alive() const noexcept {
    return connection_keep_alive(version, get_header("Connection"));
}

// Response helper methods

void Response::set_body(std::string_view text) {
    body.assign(text.begin(), text.end());
}

void Response::set_content_type(std::string_view content_type) {
    headers.set("Content-Type", content_type);
}

size_t Response::content_length() const noexcept {
    return parse_content_length(get_header("Content-Length", "0"));
}

bool Response::keep_alive() const noexcept {
    return connection_keep_alive(version, get_header("Connection"));
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (str == "GET")
        return Method::GET;
    if (str == "POST")
        return Method::POST;
    if (str == "PUT")
        return Method::PUT;
    if (str == "DELETE")
        return Method::DELETE;
    if (str == "HEAD")
        return Method::HEAD;
    if (str == "OPTIONS")
        return Method::OPTIONS;
    if (str == "PATCH")
        return Method::PATCH;
    if (str == "CONNECT")
        return Method::CONNECT;
    if (str == "TRACE")
        return Method::TRACE;
    return Method::UNKNOWN;
}

std::string_view to_string(Version version) noexcept {
    switch (version) {
        case Version::HTTP_1_0:
            return "HTTP/1.0";
        case Version::HTTP_1_1:
            return "HTTP/1.1";
        case Version::HTTP_2_0:
            return "HTTP/2.0";
        case Version::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Continue:
            return "Continue";
        case StatusCode::SwitchingProtocols:
            return "Switching Protocols";
        case StatusCode::OK:
            return "OK";
        case StatusCode::Created:
            return "Created";
        case StatusCode::Accepted:
            return "Accepted";
        case StatusCode::NoContent:
            return "No Content";
        case StatusCode::MovedPermanently:
            return "Moved Permanently";
        case StatusCode::Found:
            return "Found";
        case StatusCode::SeeOther:
            return "See Other";
        case StatusCode::NotModified:
            return "Not Modified";
        case StatusCode::TemporaryRedirect:
            return "Temporary Redirect";
        case StatusCode::PermanentRedirect:
            return "Permanent Redirect";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::Forbidden:
            return "Forbidden";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::RequestTimeout:
            return "Request Timeout";
        case StatusCode::PayloadTooLarge:
            return "Payload Too Large";
        case StatusCode::URITooLong:
            return "URI Too Long";
        case StatusCode::TooManyRequests:
            return "Too Many Requests";
        case StatusCode::RequestHeaderFieldsTooLarge:
            return "Request Header Fields Too Large";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::NotImplemented:
            return "Not Implemented";
        case StatusCode::BadGateway:
            return "Bad Gateway";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
        case StatusCode::GatewayTimeout:
            return "Gateway Timeout";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

std::string to_lower_ascii(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_token(std::string_view str) noexcept {
    if (str.empty()) {
        return false;
    }

    // tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." /
    //         "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
    constexpr std::string_view kTokenSymbols = "!#$%&'*+-.^_`|~";
    return std::all_of(str.begin(), str.end(), [kTokenSymbols](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) ||
               kTokenSymbols.find(c) != std::string_view::npos;
    });
}

bool has_token(std::string_view value, std::string_view token) noexcept {
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        std::string_view item = (comma == std::string_view::npos)
                                    ? value.substr(start)
                                    : value.substr(start, comma - start);

        // Trim optional whitespace around list items
        while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) {
            item.remove_prefix(1);
        }
        while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) {
            item.remove_suffix(1);
        }

        if (header_name_equals(item, token)) {
            return true;
        }

        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return false;
}

}  // namespace hopstrip::http
