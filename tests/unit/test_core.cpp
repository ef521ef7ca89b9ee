// httpgate Core Unit Tests

#include "../../src/core/core.hpp"
#include "../../src/core/deadline.hpp"
#include "../../src/core/worker_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace httpgate::core;
using namespace std::chrono_literals;

TEST_CASE("CPU count detection", "[core][cpu]") {
    uint32_t count = get_cpu_count();
    REQUIRE(count > 0);
    REQUIRE(count <= 1024);

    REQUIRE(default_worker_count() >= 4);
    REQUIRE(default_worker_count() >= count);
}

TEST_CASE("Thread naming", "[core][thread]") {
    auto ec = set_current_thread_name("httpgate-test-with-a-long-name");
#ifdef __linux__
    REQUIRE_FALSE(ec);
#else
    (void)ec;
#endif
}

TEST_CASE("Deadline helpers", "[core][deadline]") {
    SECTION("expired deadline gives zero poll timeout") {
        auto past = Clock::now() - 10ms;
        REQUIRE(expired(past));
        REQUIRE(poll_timeout_ms(past) == 0);
    }

    SECTION("future deadline rounds up") {
        auto future = deadline_after(250ms);
        REQUIRE_FALSE(expired(future));
        int timeout = poll_timeout_ms(future);
        REQUIRE(timeout > 0);
        REQUIRE(timeout <= 251);
    }
}

TEST_CASE("CancelToken", "[core][deadline]") {
    SECTION("explicit cancel latches") {
        CancelToken token;
        REQUIRE_FALSE(token.is_cancelled());
        token.cancel();
        REQUIRE(token.is_cancelled());
    }

    SECTION("probe reports cancellation") {
        std::atomic<bool> gone{false};
        CancelToken token([&gone] { return gone.load(); });
        REQUIRE_FALSE(token.is_cancelled());

        gone = true;
        REQUIRE(token.is_cancelled());

        // Latched even if the probe changes its mind
        gone = false;
        REQUIRE(token.is_cancelled());
    }
}

TEST_CASE("WorkerPool runs submitted tasks", "[core][worker_pool]") {
    WorkerPool pool(4, 100);
    REQUIRE(pool.thread_count() == 4);

    std::atomic<int> counter{0};
    for (int i = 0; i < 50; ++i) {
        REQUIRE(pool.submit([&counter] { counter.fetch_add(1); }));
    }

    pool.shutdown();
    REQUIRE(counter.load() == 50);
}

TEST_CASE("WorkerPool refuses work beyond capacity", "[core][worker_pool]") {
    WorkerPool pool(1, 2);

    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::atomic<int> started{0};

    auto blocker = [&] {
        started.fetch_add(1);
        std::unique_lock lock(mutex);
        cv.wait(lock, [&] { return release; });
    };

    REQUIRE(pool.submit(blocker));
    while (started.load() == 0) {
        std::this_thread::sleep_for(1ms);
    }

    // One running, one queued: the pool is full
    REQUIRE(pool.submit(blocker));
    REQUIRE_FALSE(pool.submit(blocker));
    REQUIRE(pool.running() == 1);
    REQUIRE(pool.queued() == 1);

    {
        std::lock_guard lock(mutex);
        release = true;
    }
    cv.notify_all();
    pool.shutdown();

    REQUIRE(started.load() == 2);
    REQUIRE_FALSE(pool.submit([] {}));
}
