// Hopstrip Proxy Unit Tests
// Client connection handling end to end: request framing, upstream exchange,
// response sanitizing and serialization

#include <sys/socket.h>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>

#include <cctype>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/server.hpp"
#include "../../src/core/socket.hpp"
#include "../../src/gateway/factory.hpp"
#include "../../src/http/http.hpp"
#include "mock_backend.hpp"

using namespace hopstrip;
using namespace hopstrip::core;
using namespace hopstrip::http;

// Test fixture with access to Server internals via friend declaration.
// The client connection is one end of a socketpair, the other end is
// registered with the server the way the accept loop would.
class ProxyTestFixture {
public:
    explicit ProxyTestFixture(uint16_t upstream_port, uint32_t max_request_size = 1048576)
        : config_(create_test_config(upstream_port, max_request_size)),
          server_(config_, gateway::build_pipeline(*config_),
                  gateway::build_upstream_client(*config_)) {
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
            throw std::runtime_error("Failed to create socketpair");
        }
        server_fd_ = fds[0];
        client_fd_ = fds[1];
        if (set_nonblocking(server_fd_)) {
            throw std::runtime_error("Failed to set non-blocking");
        }
        server_.handle_accept(server_fd_, "127.0.0.1", 40000);
    }

    ~ProxyTestFixture() { close(client_fd_); }

    // Send raw bytes from the client and let the server process them
    std::string exchange(const std::string& request) {
        send(client_fd_, request.data(), request.size(), MSG_NOSIGNAL);
        server_.handle_read(server_fd_);
        return drain_client();
    }

    // Everything the server has written to the client so far
    std::string drain_client() {
        std::string out;
        char buffer[4096];
        while (true) {
            ssize_t n = recv(client_fd_, buffer, sizeof(buffer), MSG_DONTWAIT);
            if (n <= 0) {
                break;
            }
            out.append(buffer, static_cast<size_t>(n));
        }
        return out;
    }

    bool server_connection_open() const { return server_.connections_.contains(server_fd_); }

    size_t pooled_upstream_connections() const { return server_.upstream_->pool().size(); }

    Server& server() { return server_; }

private:
    static std::shared_ptr<control::Config> create_test_config(uint16_t upstream_port,
                                                               uint32_t max_request_size) {
        auto cfg = std::make_shared<control::Config>();
        cfg->server.listen_address = "127.0.0.1";
        cfg->server.listen_port = 0;
        cfg->server.worker_threads = 1;
        cfg->server.max_request_size = max_request_size;
        cfg->upstream.host = "127.0.0.1";
        cfg->upstream.port = upstream_port;
        cfg->upstream.connect_timeout = 500;
        cfg->upstream.read_timeout = 2000;
        return cfg;
    }

    std::shared_ptr<control::Config> config_;
    Server server_;
    int server_fd_ = -1;
    int client_fd_ = -1;
};

namespace {

const std::string kGetRequest =
    "GET /api/items HTTP/1.1\r\n"
    "Host: localhost\r\n"
    "\r\n";

bool has_header_line(const std::string& wire, std::string_view name) {
    auto head_end = wire.find("\r\n\r\n");
    std::string head = wire.substr(0, head_end);
    std::string lower_head;
    for (char c : head) {
        lower_head += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    std::string needle = "\r\n";
    for (char c : name) {
        needle += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    needle += ":";
    return lower_head.find(needle) != std::string::npos;
}

std::string body_of(const std::string& wire) {
    auto head_end = wire.find("\r\n\r\n");
    return head_end == std::string::npos ? std::string{} : wire.substr(head_end + 4);
}

uint16_t unused_port() {
    int fd = create_listening_socket("127.0.0.1", 0);
    uint16_t port = local_port(fd);
    close_fd(fd);
    return port;
}

}  // namespace

TEST_CASE("Hop-by-hop headers never reach the client", "[proxy][sanitize]") {
    MockBackend backend({
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "Transfer-Encoding: chunked\r\n"
        "Connection: keep-alive\r\n"
        "Keep-Alive: timeout=72\r\n"
        "Upgrade: h2c\r\n"
        "Proxy-Connection: keep-alive\r\n"
        "X-Request-Id: 42\r\n"
        "\r\n"
        "7\r\n{\"a\":1}\r\n"
        "0\r\n\r\n",
    });
    ProxyTestFixture fixture(backend.port());

    std::string wire = fixture.exchange(kGetRequest);

    REQUIRE(wire.starts_with("HTTP/1.1 200 OK\r\n"));
    REQUIRE_FALSE(has_header_line(wire, "Connection"));
    REQUIRE_FALSE(has_header_line(wire, "Keep-Alive"));
    REQUIRE_FALSE(has_header_line(wire, "Transfer-Encoding"));
    REQUIRE_FALSE(has_header_line(wire, "Upgrade"));
    REQUIRE_FALSE(has_header_line(wire, "Proxy-Connection"));
    REQUIRE(wire.find("Content-Type: application/json\r\n") != std::string::npos);
    REQUIRE(wire.find("X-Request-Id: 42\r\n") != std::string::npos);
    REQUIRE(wire.find("Content-Length: 7\r\n") != std::string::npos);
    REQUIRE(body_of(wire) == "{\"a\":1}");

    // The request was forwarded byte for byte and the client stays connected
    REQUIRE(backend.requests() == std::vector<std::string>{kGetRequest});
    REQUIRE(fixture.server_connection_open());
}

TEST_CASE("Request headers are forwarded unchanged", "[proxy]") {
    MockBackend backend({"HTTP/1.1 204 No Content\r\nConnection: keep-alive\r\n\r\n"});
    ProxyTestFixture fixture(backend.port());

    const std::string request =
        "GET /ws HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Connection: keep-alive, Upgrade\r\n"
        "Upgrade: websocket\r\n"
        "Keep-Alive: timeout=5\r\n"
        "\r\n";
    std::string wire = fixture.exchange(request);

    REQUIRE(wire == "HTTP/1.1 204 No Content\r\n\r\n");
    REQUIRE(backend.requests() == std::vector<std::string>{request});
}

TEST_CASE("Pipelined requests are answered in order", "[proxy][pipelining]") {
    MockBackend backend({
        "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nfirst",
        "HTTP/1.1 200 OK\r\nContent-Length: 6\r\n\r\nsecond",
    });
    ProxyTestFixture fixture(backend.port());

    std::string wire = fixture.exchange(kGetRequest + kGetRequest);

    auto first = wire.find("first");
    auto second = wire.find("second");
    REQUIRE(first != std::string::npos);
    REQUIRE(second != std::string::npos);
    REQUIRE(first < second);
    REQUIRE(backend.requests().size() == 2);
}

TEST_CASE("Request split across reads is buffered", "[proxy]") {
    MockBackend backend({"HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok"});
    ProxyTestFixture fixture(backend.port());

    REQUIRE(fixture.exchange("GET /api/items HTTP/1.1\r\nHo").empty());
    REQUIRE(fixture.server_connection_open());

    std::string wire = fixture.exchange("st: localhost\r\n\r\n");
    REQUIRE(body_of(wire) == "ok");
}

TEST_CASE("Request trickling in over many reads is forwarded intact", "[proxy]") {
    MockBackend backend({"HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok"});
    ProxyTestFixture fixture(backend.port());

    std::string body(256 * 1024, 'b');
    for (size_t i = 0; i < body.size(); i += 97) {
        body[i] = static_cast<char>('a' + (i % 26));
    }
    const std::string head = "POST /upload HTTP/1.1\r\n"
                             "Host: localhost\r\n"
                             "Content-Length: " +
                             std::to_string(body.size()) + "\r\n\r\n";
    const std::string request = head + body;

    // The head a byte at a time, then the body in small pieces
    std::string wire;
    for (size_t i = 0; i < head.size(); ++i) {
        wire += fixture.exchange(head.substr(i, 1));
    }
    for (size_t offset = 0; offset < body.size(); offset += 1000) {
        REQUIRE(wire.empty());
        wire += fixture.exchange(body.substr(offset, 1000));
    }

    REQUIRE(body_of(wire) == "ok");
    REQUIRE(fixture.server_connection_open());
    auto requests = backend.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0] == request);
}

TEST_CASE("Idle sweep closes expired pooled upstream connections", "[proxy][pool]") {
    MockBackend backend({"HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok"});
    ProxyTestFixture fixture(backend.port());
    auto config = std::make_shared<control::Config>(fixture.server().config());
    config->upstream.pool_idle_timeout = 0;
    fixture.server().apply_config(config, gateway::build_pipeline(*config),
                                  gateway::build_upstream_client(*config));

    REQUIRE(body_of(fixture.exchange(kGetRequest)) == "ok");
    REQUIRE(fixture.pooled_upstream_connections() == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    // The client itself is still within read_timeout
    REQUIRE(fixture.server().close_idle_connections() == 0);
    REQUIRE(fixture.server_connection_open());
    REQUIRE(fixture.pooled_upstream_connections() == 0);

    REQUIRE_NOTHROW(fixture.server().log_upstream_stats());
}

TEST_CASE("HTTP/1.0 client is closed without a Connection header", "[proxy][keepalive]") {
    MockBackend backend({"HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: keep-alive\r\n\r\nok"});
    ProxyTestFixture fixture(backend.port());

    std::string wire = fixture.exchange("GET / HTTP/1.0\r\n\r\n");

    REQUIRE(wire ==
            "HTTP/1.1 200 OK\r\n"
            "Content-Length: 2\r\n"
            "\r\n"
            "ok");
    REQUIRE_FALSE(has_header_line(wire, "Connection"));
    REQUIRE_FALSE(fixture.server_connection_open());
}

TEST_CASE("Client asking to close gets no Connection header", "[proxy][keepalive]") {
    MockBackend backend({"HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok"});
    ProxyTestFixture fixture(backend.port());

    std::string wire =
        fixture.exchange("GET / HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");

    REQUIRE(body_of(wire) == "ok");
    REQUIRE_FALSE(has_header_line(wire, "Connection"));
    REQUIRE_FALSE(fixture.server_connection_open());
}

TEST_CASE("Upstream 101 closes the client connection", "[proxy]") {
    MockBackend backend({"HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\n"
                         "Connection: Upgrade\r\n\r\n"});
    ProxyTestFixture fixture(backend.port());

    std::string wire = fixture.exchange(kGetRequest);

    REQUIRE(wire.starts_with("HTTP/1.1 101 Switching Protocols\r\n"));
    REQUIRE_FALSE(has_header_line(wire, "Upgrade"));
    REQUIRE_FALSE(has_header_line(wire, "Connection"));
    REQUIRE_FALSE(fixture.server_connection_open());
}

TEST_CASE("Upstream failures produce sanitized error responses", "[proxy][errors]") {
    SECTION("Connection refused gives 502") {
        ProxyTestFixture fixture(unused_port());
        std::string wire = fixture.exchange(kGetRequest);

        REQUIRE(wire.starts_with("HTTP/1.1 502 Bad Gateway\r\n"));
        REQUIRE(body_of(wire) == "502 Bad Gateway\n");
        REQUIRE_FALSE(has_header_line(wire, "Connection"));
        REQUIRE(fixture.server_connection_open());
    }

    SECTION("Upstream timeout gives 504") {
        MockBackend backend({""});
        ProxyTestFixture fixture(backend.port());
        // Shorter read timeout through a reloaded snapshot
        auto config = std::make_shared<control::Config>(fixture.server().config());
        config->upstream.read_timeout = 200;
        fixture.server().apply_config(config, gateway::build_pipeline(*config),
                                      gateway::build_upstream_client(*config));

        std::string wire = fixture.exchange(kGetRequest);
        REQUIRE(wire.starts_with("HTTP/1.1 504 Gateway Timeout\r\n"));
    }
}

TEST_CASE("Malformed request gets 400 and is closed", "[proxy][errors]") {
    ProxyTestFixture fixture(unused_port());

    std::string wire = fixture.exchange("NOT A VALID REQUEST\r\n\r\n");

    REQUIRE(wire.starts_with("HTTP/1.1 400 Bad Request\r\n"));
    REQUIRE_FALSE(has_header_line(wire, "Connection"));
    REQUIRE_FALSE(fixture.server_connection_open());
}

TEST_CASE("Oversized request gets 413", "[proxy][errors]") {
    ProxyTestFixture fixture(unused_port(), 64);

    std::string wire = fixture.exchange("GET / HTTP/1.1\r\nHost: localhost\r\nX-Filler: " +
                                        std::string(128, 'a') + "\r\n\r\n");

    REQUIRE(wire.starts_with("HTTP/1.1 413 Payload Too Large\r\n"));
    REQUIRE_FALSE(has_header_line(wire, "Connection"));
    REQUIRE_FALSE(fixture.server_connection_open());
}

TEST_CASE("Drain closes connections without a pending request", "[proxy][shutdown]") {
    ProxyTestFixture fixture(unused_port());
    REQUIRE(fixture.server().connection_count() == 1);
    REQUIRE(fixture.server().close_quiescent_connections() == 1);
    REQUIRE(fixture.server().connection_count() == 0);
}

TEST_CASE("serialize_response framing", "[proxy][serialize]") {
    Response response;
    response.status = StatusCode::OK;
    response.reason_phrase = "OK";
    response.headers = {{"Content-Type", "text/plain"}, {"Content-Length", "999"}};
    response.set_body("hello");

    SECTION("Content-Length is recomputed from the body") {
        REQUIRE(serialize_response(response, false) ==
                "HTTP/1.1 200 OK\r\n"
                "Content-Type: text/plain\r\n"
                "Content-Length: 5\r\n"
                "\r\n"
                "hello");
    }

    SECTION("HEAD keeps the upstream length and sends no body") {
        response.body.clear();
        REQUIRE(serialize_response(response, true) ==
                "HTTP/1.1 200 OK\r\n"
                "Content-Type: text/plain\r\n"
                "Content-Length: 999\r\n"
                "\r\n");
    }

    SECTION("204 has no Content-Length") {
        response.status = StatusCode::NoContent;
        response.reason_phrase = "No Content";
        response.body.clear();
        REQUIRE(serialize_response(response, false) ==
                "HTTP/1.1 204 No Content\r\n"
                "Content-Type: text/plain\r\n"
                "\r\n");
    }

    SECTION("Missing reason phrase falls back to the standard one") {
        response.reason_phrase.clear();
        REQUIRE(serialize_response(response, false).starts_with("HTTP/1.1 200 OK\r\n"));
    }
}
