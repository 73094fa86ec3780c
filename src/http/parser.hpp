// Hopstrip HTTP Parser - Header
// Wrapper around llhttp for requests (zero-copy views) and responses (owned)

#pragma once

#include "http.hpp"

#include <llhttp.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace hopstrip::http {

/// Parse result
enum class ParseResult : uint8_t {
    Complete,      // Message fully parsed
    Incomplete,    // Need more data
    Error          // Parse error
};

/// HTTP/1.x parser (wraps llhttp)
///
/// Parsing stops at the end of the first complete message, so the consumed
/// byte count delimits exactly one message even when the peer pipelines.
/// Requests: incomplete input is not buffered here. The caller keeps the
/// bytes and passes the whole message so far on every call; only bytes not
/// seen before are fed to llhttp. The Request holds views into that buffer, so
/// when the buffer has moved the message is parsed again from its first byte.
/// Call reset() before the next message.
/// Responses: feed each received chunk as it arrives; the Response owns copies.
class Parser {
public:
    Parser();
    ~Parser();

    // Non-copyable, movable
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;
    Parser(Parser&&) noexcept;
    Parser& operator=(Parser&&) noexcept;

    /// Parse HTTP request from buffer ('data' starts at the first byte of the message)
    /// Returns ParseResult and number of bytes consumed, counted from the start of 'data'
    /// On Complete, populates 'request' with zero-copy views into 'data'
    [[nodiscard]] std::pair<ParseResult, size_t> parse_request(
        std::span<const uint8_t> data,
        Request& request);

    /// Parse HTTP response from buffer
    /// 'no_body' must be set when the response answers a HEAD request
    /// On Complete, 'response' owns copies of every header and the decoded body
    [[nodiscard]] std::pair<ParseResult, size_t> parse_response(
        std::span<const uint8_t> data,
        Response& response,
        bool no_body = false);

    /// Signal end of input (peer closed the connection).
    /// Completes responses whose body is delimited by connection close.
    [[nodiscard]] ParseResult finish();

    /// Reset parser state for next request/response
    void reset();

    /// Get last error message
    [[nodiscard]] std::string_view error_message() const noexcept;

    /// Get current parser state
    [[nodiscard]] llhttp_errno_t error_code() const noexcept;

private:
    // llhttp callbacks
    static int on_message_begin(llhttp_t* parser);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_status(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value_complete(llhttp_t* parser);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    [[nodiscard]] std::pair<ParseResult, size_t> execute(std::span<const uint8_t> data);
    void switch_type(llhttp_type_t type);

    // Parser state
    llhttp_t parser_;
    llhttp_settings_t settings_;

    // Parsing context (used by callbacks)
    struct Context {
        Request* request = nullptr;
        Response* response = nullptr;

        // Header being assembled. Requests keep views into the buffer (the
        // whole message is always parsed in one call); responses are parsed
        // incrementally and own their bytes.
        const char* field_start = nullptr;
        size_t field_length = 0;
        const char* value_start = nullptr;
        size_t value_length = 0;
        std::string field_name;
        std::string field_value;

        bool skip_body = false;
        bool informational = false;
        bool headers_complete = false; // later fields are chunked trailers
        bool message_complete = false;
        llhttp_errno_t error = HPE_OK;
    };

    Context ctx_;
    llhttp_type_t parser_type_ = HTTP_REQUEST; // Track current parser type

    // Request bytes already fed for the current message, and where they live
    const uint8_t* request_base_ = nullptr;
    size_t request_fed_ = 0;
};

} // namespace hopstrip::http
