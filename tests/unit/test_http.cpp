// Hopstrip HTTP Layer Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/http/http.hpp"

using namespace hopstrip::http;

TEST_CASE("HTTP method conversion", "[http][method]") {
    REQUIRE(to_string(Method::GET) == "GET");
    REQUIRE(to_string(Method::POST) == "POST");
    REQUIRE(to_string(Method::HEAD) == "HEAD");
    REQUIRE(to_string(Method::DELETE) == "DELETE");

    REQUIRE(parse_method("GET") == Method::GET);
    REQUIRE(parse_method("PATCH") == Method::PATCH);
    REQUIRE(parse_method("BREW") == Method::UNKNOWN);
}

TEST_CASE("HTTP version conversion", "[http][version]") {
    REQUIRE(to_string(Version::HTTP_1_0) == "HTTP/1.0");
    REQUIRE(to_string(Version::HTTP_1_1) == "HTTP/1.1");
}

TEST_CASE("Reason phrases", "[http][status]") {
    REQUIRE(to_reason_phrase(StatusCode::OK) == "OK");
    REQUIRE(to_reason_phrase(StatusCode::BadGateway) == "Bad Gateway");
    REQUIRE(to_reason_phrase(StatusCode::GatewayTimeout) == "Gateway Timeout");
    REQUIRE(to_reason_phrase(StatusCode::PayloadTooLarge) == "Payload Too Large");
}

TEST_CASE("Header name comparison (case-insensitive)", "[http][headers]") {
    REQUIRE(header_name_equals("Content-Type", "content-type"));
    REQUIRE(header_name_equals("CONTENT-TYPE", "content-type"));
    REQUIRE_FALSE(header_name_equals("Content-Type", "Content-Length"));
    REQUIRE_FALSE(header_name_equals("Connection", "Connection2"));
}

TEST_CASE("Token helpers", "[http][headers]") {
    SECTION("is_token accepts RFC 7230 field names") {
        REQUIRE(is_token("X-Custom_Header.v2"));
        REQUIRE(is_token("keep-alive"));
        REQUIRE_FALSE(is_token(""));
        REQUIRE_FALSE(is_token("bad header"));
        REQUIRE_FALSE(is_token("colon:"));
    }

    SECTION("has_token scans comma-separated lists") {
        REQUIRE(has_token("keep-alive, Upgrade", "upgrade"));
        REQUIRE(has_token("close", "close"));
        REQUIRE(has_token(" Close ", "close"));
        REQUIRE_FALSE(has_token("closed", "close"));
        REQUIRE_FALSE(has_token("", "close"));
    }

    REQUIRE(to_lower_ascii("Transfer-ENCODING") == "transfer-encoding");
}

TEST_CASE("HeaderCollection preserves order, casing and repeats", "[http][headers]") {
    HeaderCollection headers;
    headers.add("Set-Cookie", "a=1");
    headers.add("Content-Type", "text/plain");
    headers.add("set-cookie", "b=2");

    REQUIRE(headers.size() == 3);
    REQUIRE(headers[0].first == "Set-Cookie");
    REQUIRE(headers[2].first == "set-cookie");
    REQUIRE(headers.count("SET-COOKIE") == 2);
    REQUIRE(headers.get("set-cookie") == "a=1");
    REQUIRE(headers.get("Missing", "fallback") == "fallback");
    REQUIRE(headers.contains("content-type"));
    REQUIRE(headers.find("X-Nope") == nullptr);
}

TEST_CASE("HeaderCollection remove and set", "[http][headers]") {
    HeaderCollection headers{{"Via", "1.1 a"}, {"Content-Type", "text/html"}, {"VIA", "1.1 b"}};

    SECTION("remove drops every casing") {
        REQUIRE(headers.remove("via") == 2);
        REQUIRE(headers.size() == 1);
        REQUIRE(headers[0].first == "Content-Type");
    }

    SECTION("remove_if keeps relative order of the rest") {
        headers.add("X-A", "1");
        size_t removed = headers.remove_if(
            [](std::string_view name) { return header_name_equals(name, "Content-Type"); });
        REQUIRE(removed == 1);
        REQUIRE(headers.size() == 3);
        REQUIRE(headers[0].second == "1.1 a");
        REQUIRE(headers[1].second == "1.1 b");
        REQUIRE(headers[2].first == "X-A");
    }

    SECTION("set replaces the first field and drops later duplicates") {
        headers.set("via", "1.1 proxy");
        REQUIRE(headers.count("Via") == 1);
        REQUIRE(headers[0].first == "Via");
        REQUIRE(headers[0].second == "1.1 proxy");
    }

    SECTION("set appends an absent field") {
        headers.set("X-New", "yes");
        REQUIRE(headers.size() == 4);
        REQUIRE(headers[3].first == "X-New");
    }
}

TEST_CASE("Request header helpers", "[http][request]") {
    Request request;
    request.headers.push_back({"Content-Type", "application/json"});
    request.headers.push_back({"Content-Length", "42"});
    request.headers.push_back({"Host", "example.com"});

    REQUIRE(request.has_header("content-type"));
    REQUIRE_FALSE(request.has_header("User-Agent"));
    REQUIRE(request.get_header("HOST") == "example.com");
    REQUIRE(request.get_header("Missing", "default") == "default");
    REQUIRE(request.content_length() == 42);
}

TEST_CASE("Request keep-alive detection", "[http][request]") {
    Request request;

    SECTION("HTTP/1.1 defaults to keep-alive") {
        request.version = Version::HTTP_1_1;
        REQUIRE(request.keep_alive());
    }

    SECTION("HTTP/1.1 with Connection: close") {
        request.version = Version::HTTP_1_1;
        request.headers.push_back({"Connection", "close"});
        REQUIRE_FALSE(request.keep_alive());
    }

    SECTION("HTTP/1.0 defaults to close") {
        request.version = Version::HTTP_1_0;
        REQUIRE_FALSE(request.keep_alive());
    }

    SECTION("HTTP/1.0 with Connection: keep-alive") {
        request.version = Version::HTTP_1_0;
        request.headers.push_back({"Connection", "Keep-Alive"});
        REQUIRE(request.keep_alive());
    }
}

TEST_CASE("Response helpers", "[http][response]") {
    Response response;
    response.status = StatusCode::NotFound;
    response.set_body("missing");
    response.set_content_type("text/plain");
    response.headers.add("Content-Length", "7");

    REQUIRE(response.status_code() == 404);
    REQUIRE(as_text(response.body) == "missing");
    REQUIRE(response.get_header("content-type") == "text/plain");
    REQUIRE(response.content_length() == 7);
    REQUIRE(response.keep_alive());

    response.headers.add("Connection", "close");
    REQUIRE_FALSE(response.keep_alive());
}
