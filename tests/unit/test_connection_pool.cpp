/*
 * Copyright 2025 httpgate Contributors
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

// Unit tests for the upstream connection pool

#include <catch2/catch_test_macros.hpp>

#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "core/deadline.hpp"
#include "gateway/connection_pool.hpp"
#include "gateway/errors.hpp"

using namespace httpgate;
using namespace httpgate::gateway;
using namespace std::chrono_literals;

namespace {

/// Hands out one end of a socketpair per connect; keeps the other end as the "upstream"
class FakeConnector final : public Connector {
public:
    ~FakeConnector() override {
        for (int fd : peers_) {
            ::close(fd);
        }
    }

    int connect(const std::string&, uint16_t, core::Deadline, std::error_code& ec) override {
        attempts.fetch_add(1);
        if (refuse.load()) {
            ec = std::make_error_code(std::errc::connection_refused);
            return -1;
        }

        int fds[2];
        if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds) < 0) {
            ec = std::error_code(errno, std::system_category());
            return -1;
        }

        std::lock_guard lock(mutex_);
        peers_.push_back(fds[1]);
        return fds[0];
    }

    /// Close the upstream side of the most recent connection
    void close_last_peer() {
        std::lock_guard lock(mutex_);
        ::close(peers_.back());
        peers_.pop_back();
    }

    /// Upstream sends bytes nobody asked for on the most recent connection
    void write_last_peer(std::string_view data) {
        std::lock_guard lock(mutex_);
        REQUIRE(::write(peers_.back(), data.data(), data.size()) ==
                static_cast<ssize_t>(data.size()));
    }

    std::atomic<int> attempts{0};
    std::atomic<bool> refuse{false};

private:
    std::mutex mutex_;
    std::vector<int> peers_;
};

PoolConfig small_pool(size_t max_size = 2) {
    PoolConfig config;
    config.max_size = max_size;
    config.idle_timeout = 60s;
    config.connect_timeout = 1s;
    return config;
}

}  // namespace

TEST_CASE("ConnectionPool - new and reused connections", "[pool]") {
    auto connector = std::make_shared<FakeConnector>();
    ConnectionPool pool("upstream", 80, small_pool(), connector);

    std::error_code ec;
    auto lease = pool.acquire(core::deadline_after(1s), ec);
    REQUIRE(lease);
    REQUIRE_FALSE(ec);
    REQUIRE_FALSE(lease->reused());
    REQUIRE(pool.leased_count() == 1);
    REQUIRE(pool.total_count() == 1);

    int fd = lease->fd();
    lease->release(ReleaseOutcome::Reusable);
    REQUIRE(pool.idle_count() == 1);
    REQUIRE(pool.leased_count() == 0);

    auto again = pool.acquire(core::deadline_after(1s), ec);
    REQUIRE(again);
    REQUIRE(again->reused());
    REQUIRE(again->fd() == fd);
    REQUIRE(again->request_count() == 1);
    REQUIRE(pool.hits() == 1);
    REQUIRE(pool.misses() == 1);
    REQUIRE(connector->attempts.load() == 1);
}

TEST_CASE("ConnectionPool - failed and dropped leases are not reused", "[pool]") {
    auto connector = std::make_shared<FakeConnector>();
    ConnectionPool pool("upstream", 80, small_pool(), connector);
    std::error_code ec;

    SECTION("explicit failure") {
        auto lease = pool.acquire(core::deadline_after(1s), ec);
        REQUIRE(lease);
        lease->release(ReleaseOutcome::Failed);
    }

    SECTION("lease destroyed without release") {
        auto lease = pool.acquire(core::deadline_after(1s), ec);
        REQUIRE(lease);
    }

    REQUIRE(pool.idle_count() == 0);
    REQUIRE(pool.total_count() == 0);
}

TEST_CASE("ConnectionPool - release is idempotent", "[pool]") {
    auto connector = std::make_shared<FakeConnector>();
    ConnectionPool pool("upstream", 80, small_pool(), connector);
    std::error_code ec;

    auto lease = pool.acquire(core::deadline_after(1s), ec);
    REQUIRE(lease);
    lease->release(ReleaseOutcome::Reusable);
    lease->release(ReleaseOutcome::Failed);

    REQUIRE(pool.idle_count() == 1);
    REQUIRE(pool.total_count() == 1);
}

TEST_CASE("ConnectionPool - liveness probe on reuse", "[pool]") {
    auto connector = std::make_shared<FakeConnector>();
    ConnectionPool pool("upstream", 80, small_pool(), connector);
    std::error_code ec;

    auto lease = pool.acquire(core::deadline_after(1s), ec);
    REQUIRE(lease);
    lease->release(ReleaseOutcome::Reusable);

    SECTION("upstream closed the idle connection") {
        connector->close_last_peer();
    }

    SECTION("upstream sent unsolicited bytes") {
        connector->write_last_peer("HTTP/1.1 408 Request Timeout\r\n\r\n");
    }

    auto next = pool.acquire(core::deadline_after(1s), ec);
    REQUIRE(next);
    REQUIRE_FALSE(next->reused());
    REQUIRE(pool.health_fails() == 1);
    REQUIRE(connector->attempts.load() == 2);
}

TEST_CASE("ConnectionPool - exhausted at the cap", "[pool]") {
    auto connector = std::make_shared<FakeConnector>();
    ConnectionPool pool("upstream", 80, small_pool(2), connector);
    std::error_code ec;

    auto a = pool.acquire(core::deadline_after(1s), ec);
    auto b = pool.acquire(core::deadline_after(1s), ec);
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(pool.total_count() == 2);

    auto start = core::Clock::now();
    auto c = pool.acquire(core::deadline_after(50ms), ec);
    REQUIRE_FALSE(c);
    REQUIRE(ec == GatewayError::PoolExhausted);
    REQUIRE(core::Clock::now() - start >= 50ms);
    REQUIRE(pool.exhausted() == 1);
    REQUIRE(pool.peak_total() == 2);
}

TEST_CASE("ConnectionPool - waiter gets a released connection", "[pool]") {
    auto connector = std::make_shared<FakeConnector>();
    ConnectionPool pool("upstream", 80, small_pool(1), connector);
    std::error_code ec;

    auto held = pool.acquire(core::deadline_after(1s), ec);
    REQUIRE(held);
    int fd = held->fd();

    std::thread releaser([&held] {
        std::this_thread::sleep_for(30ms);
        held->release(ReleaseOutcome::Reusable);
    });

    std::error_code wait_ec;
    auto waited = pool.acquire(core::deadline_after(2s), wait_ec);
    releaser.join();

    REQUIRE(waited);
    REQUIRE_FALSE(wait_ec);
    REQUIRE(waited->fd() == fd);
    REQUIRE(pool.total_count() == 1);
}

TEST_CASE("ConnectionPool - cancelled waiter", "[pool]") {
    auto connector = std::make_shared<FakeConnector>();
    ConnectionPool pool("upstream", 80, small_pool(1), connector);
    std::error_code ec;

    auto held = pool.acquire(core::deadline_after(1s), ec);
    REQUIRE(held);

    core::CancelToken cancel;
    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(30ms);
        cancel.cancel();
    });

    auto start = core::Clock::now();
    auto waited = pool.acquire(core::deadline_after(5s), ec, &cancel);
    canceller.join();

    REQUIRE_FALSE(waited);
    REQUIRE(ec == GatewayError::ClientDisconnected);
    REQUIRE(core::Clock::now() - start < 2s);
}

TEST_CASE("ConnectionPool - connect failure frees the slot", "[pool]") {
    auto connector = std::make_shared<FakeConnector>();
    ConnectionPool pool("upstream", 80, small_pool(1), connector);
    std::error_code ec;

    connector->refuse = true;
    auto lease = pool.acquire(core::deadline_after(1s), ec);
    REQUIRE_FALSE(lease);
    REQUIRE(ec == GatewayError::UpstreamUnreachable);
    REQUIRE(pool.total_count() == 0);

    connector->refuse = false;
    ec.clear();
    lease = pool.acquire(core::deadline_after(1s), ec);
    REQUIRE(lease);
}

TEST_CASE("ConnectionPool - recycling limits", "[pool]") {
    auto connector = std::make_shared<FakeConnector>();
    std::error_code ec;

    SECTION("max requests per connection") {
        auto config = small_pool();
        config.max_requests_per_connection = 2;
        ConnectionPool pool("upstream", 80, config, connector);

        auto first = pool.acquire(core::deadline_after(1s), ec);
        first->release(ReleaseOutcome::Reusable);
        auto second = pool.acquire(core::deadline_after(1s), ec);
        REQUIRE(second->reused());
        second->release(ReleaseOutcome::Reusable);

        REQUIRE(pool.idle_count() == 0);
        REQUIRE(pool.evictions() == 1);
    }

    SECTION("idle timeout") {
        auto config = small_pool();
        config.idle_timeout = 20ms;
        ConnectionPool pool("upstream", 80, config, connector);

        auto first = pool.acquire(core::deadline_after(1s), ec);
        first->release(ReleaseOutcome::Reusable);
        std::this_thread::sleep_for(40ms);

        auto next = pool.acquire(core::deadline_after(1s), ec);
        REQUIRE(next);
        REQUIRE_FALSE(next->reused());
        REQUIRE(pool.evictions() == 1);
    }

    SECTION("shrinking max_size drains on release") {
        ConnectionPool pool("upstream", 80, small_pool(2), connector);
        auto a = pool.acquire(core::deadline_after(1s), ec);
        auto b = pool.acquire(core::deadline_after(1s), ec);

        pool.reconfigure(small_pool(1));
        a->release(ReleaseOutcome::Reusable);
        REQUIRE(pool.idle_count() == 0);
        b->release(ReleaseOutcome::Reusable);
        REQUIRE(pool.idle_count() == 1);
        REQUIRE(pool.total_count() == 1);
    }
}

TEST_CASE("ConnectionPool - concurrent leases respect the cap", "[pool]") {
    auto connector = std::make_shared<FakeConnector>();
    ConnectionPool pool("upstream", 80, small_pool(3), connector);

    std::atomic<int> in_use{0};
    std::atomic<int> max_seen{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                std::error_code ec;
                auto lease = pool.acquire(core::deadline_after(5s), ec);
                if (!lease) {
                    failures.fetch_add(1);
                    continue;
                }
                int now = in_use.fetch_add(1) + 1;
                int seen = max_seen.load();
                while (now > seen && !max_seen.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(1ms);
                in_use.fetch_sub(1);
                lease->release(ReleaseOutcome::Reusable);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(max_seen.load() <= 3);
    REQUIRE(pool.peak_total() <= 3);
    REQUIRE(pool.leased_count() == 0);
}
