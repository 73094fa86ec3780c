// Hopstrip HTTP Parser Unit Tests
// Request framing (views, pipelining) and upstream response decoding

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "../../src/http/http.hpp"
#include "../../src/http/parser.hpp"

using namespace hopstrip::http;

namespace {
std::span<const uint8_t> bytes_of(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

// Whole response in one buffer; a close-delimited body ends with the buffer
std::optional<Response> parse_whole_response(std::string_view raw) {
    Parser parser;
    Response response;
    auto [result, consumed] = parser.parse_response(bytes_of(raw), response);
    if (result == ParseResult::Incomplete && consumed == raw.size()) {
        result = parser.finish();
    }
    if (result != ParseResult::Complete) {
        return std::nullopt;
    }
    return response;
}
}  // namespace

// ============================================================================
// Requests
// ============================================================================

TEST_CASE("Parse simple GET request", "[http][parser]") {
    std::string_view raw =
        "GET /hello?x=1 HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "User-Agent: test\r\n"
        "\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(bytes_of(raw), request);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == raw.size());
    REQUIRE(request.method == Method::GET);
    REQUIRE(request.version == Version::HTTP_1_1);
    REQUIRE(request.uri == "/hello?x=1");
    REQUIRE(request.path == "/hello");
    REQUIRE(request.query == "x=1");
    REQUIRE(request.headers.size() == 2);
    REQUIRE(request.get_header("host") == "example.com");
    REQUIRE(request.raw.size() == raw.size());
}

TEST_CASE("Parse POST request with chunked body", "[http][parser]") {
    std::string_view raw =
        "POST /upload HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\nhello\r\n"
        "6\r\n world\r\n"
        "0\r\n\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(bytes_of(raw), request);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == raw.size());
    // raw keeps the framing exactly as received
    REQUIRE(as_text(request.raw) == raw);
}

TEST_CASE("Request trailer fields are not headers", "[http][parser]") {
    std::string_view raw =
        "POST /upload HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\nhello\r\n"
        "0\r\n"
        "X-Checksum: abc\r\n"
        "\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(bytes_of(raw), request);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == raw.size());
    REQUIRE(request.headers.size() == 2);
    REQUIRE_FALSE(request.has_header("X-Checksum"));
    REQUIRE(as_text(request.raw) == raw);
}

TEST_CASE("Incomplete request waits for more data", "[http][parser]") {
    std::string_view raw =
        "GET /hello HTTP/1.1\r\n"
        "Host: example.com\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(bytes_of(raw), request);

    REQUIRE(result == ParseResult::Incomplete);
}

TEST_CASE("Malformed request is rejected", "[http][parser]") {
    std::string_view raw = "GET /hello HTTP/1.1\r\nBad Header\r\n\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(bytes_of(raw), request);

    REQUIRE(result == ParseResult::Error);
    REQUIRE_FALSE(parser.error_message().empty());
}

TEST_CASE("Request arriving in pieces is parsed incrementally", "[http][parser]") {
    std::string_view raw =
        "POST /items?page=2 HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "X-Long-Header-Name: some value\r\n"
        "Content-Length: 10\r\n"
        "\r\n"
        "0123456789";

    // Growing buffer that never moves, like a connection receive buffer
    std::string buffer;
    buffer.reserve(raw.size());

    Parser parser;
    Request request;
    ParseResult result = ParseResult::Incomplete;
    size_t consumed = 0;
    for (size_t offset = 0; offset < raw.size(); offset += 3) {
        buffer.append(raw.substr(offset, 3));
        std::tie(result, consumed) = parser.parse_request(bytes_of(buffer), request);
        REQUIRE(result != ParseResult::Error);
        if (result == ParseResult::Incomplete) {
            REQUIRE(consumed == buffer.size());
        }
    }

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == raw.size());
    REQUIRE(request.method == Method::POST);
    REQUIRE(request.path == "/items");
    REQUIRE(request.query == "page=2");
    REQUIRE(request.headers.size() == 3);
    REQUIRE(request.headers[1].name == "X-Long-Header-Name");
    REQUIRE(request.headers[1].value == "some value");
    REQUIRE(request.content_length() == 10);
    REQUIRE(as_text(request.raw) == raw);
    REQUIRE(request.raw.data() == reinterpret_cast<const uint8_t*>(buffer.data()));
}

TEST_CASE("Request buffer that moved is parsed from the start", "[http][parser]") {
    std::string_view raw =
        "GET /moved HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "\r\n";

    std::string first(raw.substr(0, 25));
    Parser parser;
    Request request;
    auto [partial, partial_consumed] = parser.parse_request(bytes_of(first), request);
    REQUIRE(partial == ParseResult::Incomplete);

    // Same bytes plus the rest, at a new address
    std::string moved(raw);
    first.assign(first.size(), 'x');
    auto [result, consumed] = parser.parse_request(bytes_of(moved), request);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == raw.size());
    REQUIRE(request.path == "/moved");
    REQUIRE(request.headers.size() == 1);
    REQUIRE(request.get_header("Host") == "example.com");
    REQUIRE(request.headers[0].name.data() >= moved.data());
    REQUIRE(request.headers[0].name.data() < moved.data() + moved.size());
}

TEST_CASE("Pipelined requests are delimited one at a time", "[http][parser]") {
    std::string_view first = "GET /one HTTP/1.1\r\nHost: a\r\n\r\n";
    std::string_view second = "GET /two HTTP/1.1\r\nHost: a\r\n\r\n";
    std::string buffer = std::string(first) + std::string(second);

    Parser parser;
    Request request;
    auto [result1, consumed1] = parser.parse_request(bytes_of(buffer), request);

    REQUIRE(result1 == ParseResult::Complete);
    REQUIRE(consumed1 == first.size());
    REQUIRE(request.path == "/one");

    parser.reset();
    Request next;
    auto rest = std::string_view(buffer).substr(consumed1);
    auto [result2, consumed2] = parser.parse_request(bytes_of(rest), next);

    REQUIRE(result2 == ParseResult::Complete);
    REQUIRE(consumed2 == second.size());
    REQUIRE(next.path == "/two");
}

TEST_CASE("Empty request header value", "[http][parser]") {
    std::string_view raw = "GET / HTTP/1.1\r\nX-Empty:\r\nHost: a\r\n\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(bytes_of(raw), request);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(request.headers.size() == 2);
    REQUIRE(request.headers[0].name == "X-Empty");
    REQUIRE(request.headers[0].value.empty());
    REQUIRE(request.headers[1].value == "a");
}

// ============================================================================
// Responses
// ============================================================================

TEST_CASE("Parse response with Content-Length", "[http][parser][response]") {
    std::string_view raw =
        "HTTP/1.1 201 Created\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 11\r\n"
        "\r\n"
        "{\"ok\":true}";

    auto response = parse_whole_response(raw);

    REQUIRE(response.has_value());
    REQUIRE(response->status == StatusCode::Created);
    REQUIRE(response->reason_phrase == "Created");
    REQUIRE(response->headers.size() == 2);
    REQUIRE(as_text(response->body) == "{\"ok\":true}");
}

TEST_CASE("Chunked response body is decoded", "[http][parser][response]") {
    std::string_view raw =
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "Connection: keep-alive\r\n"
        "\r\n"
        "4\r\nWiki\r\n"
        "5\r\npedia\r\n"
        "0\r\n\r\n";

    auto response = parse_whole_response(raw);

    REQUIRE(response.has_value());
    REQUIRE(as_text(response->body) == "Wikipedia");
    REQUIRE(response->get_header("transfer-encoding") == "chunked");
    REQUIRE(response->keep_alive());
}

TEST_CASE("Chunked response trailers are dropped", "[http][parser][response]") {
    std::string_view raw =
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "Trailer: X-Trailer\r\n"
        "\r\n"
        "4\r\nWiki\r\n"
        "0\r\n"
        "X-Trailer: v\r\n"
        "Connection: close\r\n"
        "\r\n";

    auto response = parse_whole_response(raw);

    REQUIRE(response.has_value());
    REQUIRE(as_text(response->body) == "Wiki");
    REQUIRE(response->headers.size() == 2);
    REQUIRE_FALSE(response->has_header("X-Trailer"));
    REQUIRE(response->headers.count("Connection") == 0);
}

TEST_CASE("Trailers split across reads are dropped", "[http][parser][response]") {
    std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "2\r\nok\r\n"
        "0\r\n"
        "X-Trailer: v\r\n"
        "\r\n";

    Parser parser;
    Response response;
    ParseResult result = ParseResult::Incomplete;
    for (size_t offset = 0; offset < raw.size(); offset += 2) {
        auto piece = std::string_view(raw).substr(offset, 2);
        auto [chunk_result, consumed] = parser.parse_response(bytes_of(piece), response);
        result = chunk_result;
        REQUIRE(result != ParseResult::Error);
    }

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(response.headers.size() == 1);
    REQUIRE(response.headers[0].first == "Transfer-Encoding");
    REQUIRE(as_text(response.body) == "ok");
}

TEST_CASE("Response fed in small chunks", "[http][parser][response]") {
    std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "X-Long-Header-Name: some value\r\n"
        "Set-Cookie: a=1\r\n"
        "Set-Cookie: b=2\r\n"
        "Content-Length: 10\r\n"
        "\r\n"
        "0123456789";

    Parser parser;
    Response response;
    ParseResult result = ParseResult::Incomplete;

    // Three bytes at a time splits names, values and the body across calls
    for (size_t offset = 0; offset < raw.size(); offset += 3) {
        auto piece = std::string_view(raw).substr(offset, 3);
        auto [chunk_result, consumed] = parser.parse_response(bytes_of(piece), response);
        result = chunk_result;
        REQUIRE(result != ParseResult::Error);
    }

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(response.headers.size() == 4);
    REQUIRE(response.headers[0].first == "X-Long-Header-Name");
    REQUIRE(response.headers[0].second == "some value");
    REQUIRE(response.headers.count("Set-Cookie") == 2);
    REQUIRE(response.headers[2].second == "b=2");
    REQUIRE(as_text(response.body) == "0123456789");
}

TEST_CASE("Response to HEAD carries no body", "[http][parser][response]") {
    std::string_view raw =
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 512\r\n"
        "\r\n";

    Parser parser;
    Response response;
    auto [result, consumed] = parser.parse_response(bytes_of(raw), response, true);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == raw.size());
    REQUIRE(response.body.empty());
    REQUIRE(response.content_length() == 512);
}

TEST_CASE("204 and 304 responses carry no body", "[http][parser][response]") {
    auto no_content = parse_whole_response("HTTP/1.1 204 No Content\r\n\r\n");
    REQUIRE(no_content.has_value());
    REQUIRE(no_content->status == StatusCode::NoContent);

    auto not_modified = parse_whole_response(
        "HTTP/1.1 304 Not Modified\r\nETag: \"abc\"\r\n\r\n");
    REQUIRE(not_modified.has_value());
    REQUIRE(not_modified->body.empty());
}

TEST_CASE("Body delimited by connection close", "[http][parser][response]") {
    std::string_view raw =
        "HTTP/1.0 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "until the end";

    Parser parser;
    Response response;
    auto [result, consumed] = parser.parse_response(bytes_of(raw), response);

    REQUIRE(result == ParseResult::Incomplete);
    REQUIRE(parser.finish() == ParseResult::Complete);
    REQUIRE(as_text(response.body) == "until the end");
    REQUIRE_FALSE(response.keep_alive());
}

TEST_CASE("Interim 1xx responses are skipped", "[http][parser][response]") {
    std::string_view raw =
        "HTTP/1.1 100 Continue\r\n"
        "\r\n"
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 2\r\n"
        "\r\n"
        "ok";

    auto response = parse_whole_response(raw);

    REQUIRE(response.has_value());
    REQUIRE(response->status == StatusCode::OK);
    REQUIRE(response->headers.size() == 1);
    REQUIRE(as_text(response->body) == "ok");
}

TEST_CASE("Empty response header value", "[http][parser][response]") {
    std::string_view raw =
        "HTTP/1.1 200 OK\r\n"
        "X-Empty:\r\n"
        "Content-Length: 0\r\n"
        "\r\n";

    auto response = parse_whole_response(raw);

    REQUIRE(response.has_value());
    REQUIRE(response->headers.size() == 2);
    REQUIRE(response->headers[0].first == "X-Empty");
    REQUIRE(response->headers[0].second.empty());
    REQUIRE(response->headers[1].first == "Content-Length");
}

TEST_CASE("Malformed response is rejected", "[http][parser][response]") {
    auto response = parse_whole_response("NOT-HTTP garbage\r\n\r\n");
    REQUIRE_FALSE(response.has_value());
}
