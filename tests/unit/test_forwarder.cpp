// Unit tests for the forwarding engine against a loopback upstream

#include <catch2/catch_test_macros.hpp>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/buffer.hpp"
#include "gateway/admission.hpp"
#include "gateway/errors.hpp"
#include "gateway/events.hpp"
#include "gateway/forwarder.hpp"
#include "gateway/route_table.hpp"
#include "gateway/upstream.hpp"
#include "http/http.hpp"
#include "http/parser.hpp"
#include "loopback_upstream.hpp"

using namespace httpgate;
using namespace httpgate::gateway;
using namespace std::chrono_literals;
using httpgate::testing::LoopbackUpstream;
using httpgate::testing::UpstreamReply;

namespace {

class RecordingSink final : public EventSink {
public:
    void on_request(const RequestEvent& event) override {
        std::lock_guard lock(mutex_);
        requests_.push_back(event);
    }
    void on_health(const HealthEvent& event) override {
        std::lock_guard lock(mutex_);
        health_.push_back(event);
    }

    std::vector<RequestEvent> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<RequestEvent> requests_;
    std::vector<HealthEvent> health_;
};

/// Client connection: the gateway writes to one end, the test reads the other
class ClientPair {
public:
    ClientPair() { REQUIRE(socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds_) == 0); }
    ~ClientPair() {
        ::close(fds_[0]);
        close_client();
    }

    int gateway_fd() const { return fds_[0]; }

    /// The client goes away entirely
    void close_client() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

    /// The client is done sending but still reads
    void shutdown_client_writes() { REQUIRE(::shutdown(fds_[1], SHUT_WR) == 0); }

    void write(std::string_view data) {
        REQUIRE(::write(fds_[1], data.data(), data.size()) == static_cast<ssize_t>(data.size()));
    }

    /// Everything the gateway has written so far
    std::string read_all() {
        std::string out;
        char chunk[4096];
        while (true) {
            pollfd pfd{fds_[1], POLLIN, 0};
            if (::poll(&pfd, 1, 100) <= 0) {
                return out;
            }
            ssize_t n = ::read(fds_[1], chunk, sizeof(chunk));
            if (n <= 0) {
                return out;
            }
            out.append(chunk, static_cast<size_t>(n));
        }
    }

private:
    int fds_[2] = {-1, -1};
};

struct EngineFixture {
    explicit EngineFixture(size_t max_in_flight = 0, size_t max_queue = 16)
        : admission(std::make_shared<AdmissionController>(max_in_flight, max_queue)) {}

    std::shared_ptr<UpstreamManager> upstreams = std::make_shared<UpstreamManager>();
    std::shared_ptr<RouteTable> routes = std::make_shared<RouteTable>();
    std::shared_ptr<AdmissionController> admission;
    std::shared_ptr<RecordingSink> events = std::make_shared<RecordingSink>();
    ForwardingEngine engine{routes, admission, events};

    std::shared_ptr<UpstreamTarget> target(uint16_t port) {
        CircuitBreakerConfig circuit;
        circuit.failure_threshold = 1;
        circuit.cooldown_ms = 60000;
        return upstreams->get_or_create("test", "127.0.0.1", port, 1, PoolConfig{}, circuit);
    }

    void route(std::string id, std::string prefix,
               std::vector<std::shared_ptr<UpstreamTarget>> targets, uint32_t max_retries = 1,
               std::chrono::milliseconds timeout = 5s) {
        RouteRule rule;
        rule.id = std::move(id);
        rule.path_prefix = std::move(prefix);
        rule.targets = std::move(targets);
        rule.policy.timeout = timeout;
        rule.policy.max_retries = max_retries;
        rules_.push_back(std::move(rule));
        routes->publish(std::make_shared<RouteSnapshot>(rules_));
    }

    /// Parse the head of raw the way the connection loop does, then forward
    ForwardResult forward(ClientPair& client, std::string_view raw, bool draining = false) {
        http::Parser parser(http::MessageKind::Request);
        core::IoBuffer input;
        auto space = input.prepare(raw.size());
        std::memcpy(space.data(), raw.data(), raw.size());
        input.commit(raw.size());

        size_t head_end = http::find_head_end(input.readable());
        REQUIRE(head_end > 0);
        auto [result, consumed] = parser.feed(input.readable().first(head_end));
        REQUIRE(result != http::ParseResult::Error);
        input.consume(consumed);

        ClientExchange exchange{
            .fd = client.gateway_fd(),
            .peer_address = "192.0.2.7",
            .head = parser.request(),
            .parser = parser,
            .input = input,
            .correlation_id = "req-1",
            .draining = draining,
        };
        return engine.forward(exchange);
    }

private:
    std::vector<RouteRule> rules_;
};

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("Forwarder relays a request and rewrites headers", "[forwarder]") {
    LoopbackUpstream upstream([](const std::string&) {
        return LoopbackUpstream::ok("hello", "Connection: keep-alive\r\nKeep-Alive: timeout=5\r\n");
    });
    EngineFixture fx;
    fx.route("api", "/api", {fx.target(upstream.port())});

    ClientPair client;
    auto result = fx.forward(client,
                             "GET /api/users?page=2 HTTP/1.1\r\n"
                             "Host: app.example.com\r\n"
                             "Connection: keep-alive, X-Drop\r\n"
                             "X-Drop: secret\r\n"
                             "X-Forwarded-For: 10.1.1.1\r\n"
                             "\r\n");

    REQUIRE_FALSE(result.error);
    REQUIRE(result.status == 200);
    REQUIRE(result.response_started);
    REQUIRE_FALSE(result.close_connection);
    REQUIRE(result.retries == 0);
    REQUIRE(result.route_id == "api");

    auto requests = upstream.requests();
    REQUIRE(requests.size() == 1);
    const auto& sent = requests.front();
    REQUIRE(sent.starts_with("GET /api/users?page=2 HTTP/1.1\r\n"));
    REQUIRE(contains(sent, "Host: app.example.com\r\n"));
    REQUIRE(contains(sent, "X-Forwarded-For: 10.1.1.1, 192.0.2.7\r\n"));
    REQUIRE(contains(sent, "X-Forwarded-Host: app.example.com\r\n"));
    REQUIRE(contains(sent, "X-Request-Id: req-1\r\n"));
    REQUIRE(contains(sent, "Connection: keep-alive\r\n"));
    REQUIRE_FALSE(contains(sent, "X-Drop"));

    auto response = client.read_all();
    REQUIRE(response.starts_with("HTTP/1.1 200 OK\r\n"));
    REQUIRE(contains(response, "Connection: keep-alive\r\n"));
    REQUIRE_FALSE(contains(response, "Keep-Alive:"));
    REQUIRE(response.ends_with("\r\n\r\nhello"));

    auto events = fx.events->requests();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].route == "api");
    REQUIRE(events[0].status == 200);
    REQUIRE(events[0].correlation_id == "req-1");
    REQUIRE(events[0].outcome() == "ok");
}

TEST_CASE("Forwarder relays request bodies", "[forwarder]") {
    LoopbackUpstream upstream([](const std::string&) { return LoopbackUpstream::ok("created"); });
    EngineFixture fx;
    fx.route("api", "/api", {fx.target(upstream.port())});

    SECTION("body already buffered") {
        ClientPair client;
        auto result = fx.forward(client,
                                 "POST /api/items HTTP/1.1\r\nHost: x\r\n"
                                 "Content-Length: 4\r\n\r\nabcd");
        REQUIRE(result.status == 200);
        auto requests = upstream.requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(contains(requests[0], "Content-Length: 4\r\n"));
        REQUIRE(requests[0].ends_with("\r\n\r\nabcd"));
    }

    SECTION("Expect: 100-continue is answered by the gateway") {
        ClientPair client;
        client.write("abcd");
        auto result = fx.forward(client,
                                 "POST /api/items HTTP/1.1\r\nHost: x\r\n"
                                 "Expect: 100-continue\r\nContent-Length: 4\r\n\r\n");
        REQUIRE(result.status == 200);

        auto response = client.read_all();
        REQUIRE(response.starts_with("HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 200 OK\r\n"));

        auto requests = upstream.requests();
        REQUIRE(requests.size() == 1);
        REQUIRE_FALSE(contains(requests[0], "Expect"));
        REQUIRE(requests[0].ends_with("abcd"));
    }
}

TEST_CASE("Forwarder reuses pooled upstream connections", "[forwarder]") {
    LoopbackUpstream upstream([](const std::string&) { return LoopbackUpstream::ok("pong"); });
    EngineFixture fx;
    auto target = fx.target(upstream.port());
    fx.route("api", "/", {target});

    for (int i = 0; i < 3; ++i) {
        ClientPair client;
        auto result = fx.forward(client, "GET /ping HTTP/1.1\r\nHost: x\r\n\r\n");
        REQUIRE(result.status == 200);
    }

    REQUIRE(upstream.request_count() == 3);
    REQUIRE(upstream.connection_count() == 1);
    REQUIRE(target->pool().idle_count() == 1);
    REQUIRE(target->pool().hits() == 2);
}

TEST_CASE("Forwarder retries the next target when connect fails", "[forwarder]") {
    LoopbackUpstream upstream([](const std::string&) { return LoopbackUpstream::ok("ok"); });
    EngineFixture fx;
    auto dead = fx.target(LoopbackUpstream::closed_port());
    auto live = fx.target(upstream.port());
    fx.route("api", "/api", {dead, live});

    ClientPair client;
    auto result = fx.forward(client, "GET /api/x HTTP/1.1\r\nHost: x\r\n\r\n");

    REQUIRE_FALSE(result.error);
    REQUIRE(result.status == 200);
    REQUIRE(result.retries == 1);
    REQUIRE(result.target == live->address());
    REQUIRE(dead->circuit().state() == CircuitState::OPEN);
    REQUIRE(live->circuit().state() == CircuitState::CLOSED);
}

TEST_CASE("Forwarder answers 502 when every attempt fails", "[forwarder]") {
    EngineFixture fx;
    fx.route("api", "/api", {fx.target(LoopbackUpstream::closed_port())}, 2);

    ClientPair client;
    auto result = fx.forward(client, "GET /api/x HTTP/1.1\r\nHost: x\r\n\r\n");

    REQUIRE(result.error == GatewayError::UpstreamUnreachable);
    REQUIRE(result.status == 502);
    REQUIRE_FALSE(result.response_started);
    REQUIRE(client.read_all().starts_with("HTTP/1.1 502 Bad Gateway\r\n"));
}

TEST_CASE("Forwarder skips targets with an open circuit", "[forwarder]") {
    LoopbackUpstream a([](const std::string&) { return LoopbackUpstream::ok("a"); });
    LoopbackUpstream b([](const std::string&) { return LoopbackUpstream::ok("b"); });
    EngineFixture fx;
    auto target_a = fx.target(a.port());
    auto target_b = fx.target(b.port());
    fx.route("api", "/api", {target_a, target_b});

    target_a->circuit().record_failure(Permit::Granted);
    REQUIRE(target_a->circuit().state() == CircuitState::OPEN);

    ClientPair client;
    auto result = fx.forward(client, "GET /api/users HTTP/1.1\r\nHost: x\r\n\r\n");

    REQUIRE(result.status == 200);
    REQUIRE(result.target == target_b->address());
    REQUIRE(a.request_count() == 0);
    REQUIRE(b.request_count() == 1);
    REQUIRE(client.read_all().ends_with("\r\n\r\nb"));
}

TEST_CASE("Forwarder does not retry once the response has started", "[forwarder]") {
    LoopbackUpstream broken([](const std::string&) {
        return UpstreamReply{"HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\npartial", true};
    });
    LoopbackUpstream healthy([](const std::string&) { return LoopbackUpstream::ok("full"); });
    EngineFixture fx;
    fx.route("api", "/", {fx.target(broken.port()), fx.target(healthy.port())});

    ClientPair client;
    auto result = fx.forward(client, "GET / HTTP/1.1\r\nHost: x\r\n\r\n");

    REQUIRE(result.error == GatewayError::PartialResponseFailure);
    REQUIRE(result.response_started);
    REQUIRE(result.close_connection);
    REQUIRE(healthy.request_count() == 0);

    auto response = client.read_all();
    REQUIRE(response.starts_with("HTTP/1.1 200 OK\r\n"));
    REQUIRE(response.ends_with("partial"));
}

TEST_CASE("Forwarder counts 5xx responses as target failures", "[forwarder]") {
    LoopbackUpstream upstream([](const std::string&) {
        return UpstreamReply{"HTTP/1.1 502 Bad Gateway\r\nContent-Length: 0\r\n\r\n", false};
    });
    EngineFixture fx;
    auto target = fx.target(upstream.port());
    fx.route("api", "/", {target});

    ClientPair client;
    auto result = fx.forward(client, "GET / HTTP/1.1\r\nHost: x\r\n\r\n");

    // The upstream's answer is relayed as is
    REQUIRE_FALSE(result.error);
    REQUIRE(result.status == 502);
    REQUIRE(upstream.request_count() == 1);
    REQUIRE(target->circuit().state() == CircuitState::OPEN);
    REQUIRE(client.read_all().starts_with("HTTP/1.1 502 Bad Gateway\r\n"));
}

TEST_CASE("Forwarder rejects unparsable upstream responses", "[forwarder]") {
    LoopbackUpstream garbage([](const std::string&) {
        return UpstreamReply{"SPEAKING NONSENSE\r\n\r\n", false};
    });
    LoopbackUpstream healthy([](const std::string&) { return LoopbackUpstream::ok("ok"); });
    EngineFixture fx;
    fx.route("api", "/", {fx.target(garbage.port()), fx.target(healthy.port())});

    ClientPair client;
    auto result = fx.forward(client, "GET / HTTP/1.1\r\nHost: x\r\n\r\n");

    REQUIRE(result.error == GatewayError::UpstreamProtocolError);
    REQUIRE(result.status == 502);
    REQUIRE(healthy.request_count() == 0);
}

TEST_CASE("Forwarder answers 404 when no route matches", "[forwarder]") {
    EngineFixture fx;
    fx.route("api", "/api", {fx.target(LoopbackUpstream::closed_port())});

    ClientPair client;
    auto result = fx.forward(client, "GET /other HTTP/1.1\r\nHost: x\r\n\r\n");

    REQUIRE(result.error == GatewayError::NoRoute);
    REQUIRE(result.status == 404);
    REQUIRE_FALSE(result.close_connection);
    REQUIRE(client.read_all().starts_with("HTTP/1.1 404 Not Found\r\n"));

    auto events = fx.events->requests();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].route.empty());
    REQUIRE(events[0].status == 404);
}

TEST_CASE("Forwarder sheds load past the admission ceiling", "[forwarder]") {
    LoopbackUpstream upstream([](const std::string&) { return LoopbackUpstream::ok("ok"); });
    EngineFixture fx(0, 0);
    fx.route("api", "/api", {fx.target(upstream.port())});
    fx.admission->configure_route("api", 1);

    std::error_code ec;
    auto held = fx.admission->acquire(AdmissionScope::route("api"), core::deadline_after(1s), ec);
    REQUIRE(held.has_value());

    ClientPair client;
    auto result = fx.forward(client, "GET /api/x HTTP/1.1\r\nHost: x\r\n\r\n");

    REQUIRE(result.error == GatewayError::Rejected);
    REQUIRE(result.status == 503);
    REQUIRE(upstream.request_count() == 0);

    auto response = client.read_all();
    REQUIRE(response.starts_with("HTTP/1.1 503 Service Unavailable\r\n"));
    REQUIRE(contains(response, "Retry-After: 1\r\n"));

    // Capacity comes back once the slot is released
    held->release();
    ClientPair second;
    REQUIRE(fx.forward(second, "GET /api/x HTTP/1.1\r\nHost: x\r\n\r\n").status == 200);
}

TEST_CASE("Forwarder closes the client connection while draining", "[forwarder]") {
    LoopbackUpstream upstream([](const std::string&) { return LoopbackUpstream::ok("bye"); });
    EngineFixture fx;
    fx.route("api", "/", {fx.target(upstream.port())});

    ClientPair client;
    auto result = fx.forward(client, "GET / HTTP/1.1\r\nHost: x\r\n\r\n", true);

    REQUIRE(result.status == 200);
    REQUIRE(result.close_connection);
    REQUIRE(contains(client.read_all(), "Connection: close\r\n"));
}

TEST_CASE("Forwarder abandons the upstream when the client hangs up", "[forwarder]") {
    EngineFixture fx;
    std::atomic<size_t> in_flight_during{0};
    LoopbackUpstream upstream([&fx, &in_flight_during](const std::string&) {
        in_flight_during.store(fx.admission->global_gate()->in_flight());
        std::this_thread::sleep_for(800ms);
        return LoopbackUpstream::ok("late");
    });
    auto target = fx.target(upstream.port());
    fx.route("api", "/api", {target});
    fx.admission->configure_route("api", 4);

    ClientPair client;
    std::thread hangup([&client] {
        std::this_thread::sleep_for(150ms);
        client.close_client();
    });

    auto started = std::chrono::steady_clock::now();
    auto result = fx.forward(client, "GET /api/slow HTTP/1.1\r\nHost: x\r\n\r\n");
    auto elapsed = std::chrono::steady_clock::now() - started;
    hangup.join();

    REQUIRE(result.error == GatewayError::ClientDisconnected);
    REQUIRE_FALSE(result.response_started);
    REQUIRE(result.close_connection);
    REQUIRE(elapsed < 600ms);
    REQUIRE(upstream.request_count() == 1);

    // Exactly one release per acquire, and the upstream connection is not pooled
    REQUIRE(in_flight_during.load() == 1);
    REQUIRE(fx.admission->global_gate()->in_flight() == 0);
    REQUIRE(fx.admission->route_gate("api")->in_flight() == 0);
    REQUIRE(target->pool().leased_count() == 0);
    REQUIRE(target->pool().idle_count() == 0);

    // Not the upstream's fault
    REQUIRE(target->circuit().state() == CircuitState::CLOSED);

    auto events = fx.events->requests();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].error == GatewayError::ClientDisconnected);
}

TEST_CASE("Forwarder answers 504 when the request deadline runs out", "[forwarder]") {
    LoopbackUpstream stalled([](const std::string&) {
        std::this_thread::sleep_for(800ms);
        return LoopbackUpstream::ok("too late");
    });
    EngineFixture fx;
    auto target = fx.target(stalled.port());
    fx.route("api", "/api", {target}, 1, 300ms);
    fx.admission->configure_route("api", 4);

    ClientPair client;
    auto started = std::chrono::steady_clock::now();
    auto result = fx.forward(client, "GET /api/stuck HTTP/1.1\r\nHost: x\r\n\r\n");
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.error == GatewayError::UpstreamTimeout);
    REQUIRE(result.status == 504);
    REQUIRE_FALSE(result.response_started);
    REQUIRE(elapsed >= 300ms);
    REQUIRE(elapsed < 700ms);

    // The deadline leaves no room for a retry
    REQUIRE(stalled.request_count() == 1);
    REQUIRE(client.read_all().starts_with("HTTP/1.1 504 Gateway Timeout\r\n"));

    REQUIRE(fx.admission->global_gate()->in_flight() == 0);
    REQUIRE(fx.admission->route_gate("api")->in_flight() == 0);
    REQUIRE(target->pool().leased_count() == 0);
    REQUIRE(target->pool().idle_count() == 0);
}

TEST_CASE("Forwarder answers a client that half-closed after its request", "[forwarder]") {
    LoopbackUpstream upstream([](const std::string&) {
        std::this_thread::sleep_for(100ms);
        return LoopbackUpstream::ok("still here");
    });
    EngineFixture fx;
    auto target = fx.target(upstream.port());
    fx.route("api", "/api", {target});

    SECTION("request without a body") {
        ClientPair client;
        client.shutdown_client_writes();
        auto result = fx.forward(client, "GET /api/x HTTP/1.1\r\nHost: x\r\n\r\n");

        REQUIRE_FALSE(result.error);
        REQUIRE(result.status == 200);
        REQUIRE(client.read_all().ends_with("\r\n\r\nstill here"));
    }

    SECTION("request with a complete body") {
        ClientPair client;
        client.shutdown_client_writes();
        auto result = fx.forward(client,
                                 "POST /api/items HTTP/1.1\r\nHost: x\r\n"
                                 "Content-Length: 4\r\n\r\nabcd");

        REQUIRE_FALSE(result.error);
        REQUIRE(result.status == 200);
        REQUIRE(upstream.requests().front().ends_with("\r\n\r\nabcd"));
        REQUIRE(client.read_all().ends_with("\r\n\r\nstill here"));
    }

    SECTION("body still queued on the socket") {
        ClientPair client;
        client.write("wxyz");
        client.shutdown_client_writes();
        auto result = fx.forward(client,
                                 "POST /api/items HTTP/1.1\r\nHost: x\r\n"
                                 "Content-Length: 4\r\n\r\n");

        REQUIRE_FALSE(result.error);
        REQUIRE(result.status == 200);
        REQUIRE(upstream.requests().front().ends_with("\r\n\r\nwxyz"));
        REQUIRE(client.read_all().ends_with("\r\n\r\nstill here"));
    }

    REQUIRE(target->circuit().state() == CircuitState::CLOSED);
}
