// httpgate Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <thread>

#include "../../src/core/logging.hpp"

using namespace httpgate::logging;

TEST_CASE("Correlation ID generation", "[logging][correlation_id]") {
    SECTION("generates valid format") {
        std::string correlation_id = generate_correlation_id();

        size_t hash_count = std::count(correlation_id.begin(), correlation_id.end(), '#');
        REQUIRE(hash_count == 1);
        REQUIRE(is_valid_correlation_id(correlation_id));
    }

    SECTION("same base with incrementing counter within a thread") {
        std::string id1 = generate_correlation_id();
        std::string id2 = generate_correlation_id();

        REQUIRE(id1 != id2);

        size_t hash_pos1 = id1.find('#');
        size_t hash_pos2 = id2.find('#');
        REQUIRE(id1.substr(0, hash_pos1) == id2.substr(0, hash_pos2));

        auto counter1 = std::stoull(id1.substr(hash_pos1 + 1));
        auto counter2 = std::stoull(id2.substr(hash_pos2 + 1));
        REQUIRE(counter2 == counter1 + 1);
    }

    SECTION("different threads get different bases") {
        std::string main_id = generate_correlation_id();
        std::string thread_id;
        std::thread t([&thread_id] { thread_id = generate_correlation_id(); });
        t.join();

        REQUIRE(is_valid_correlation_id(thread_id));
        REQUIRE(main_id.substr(0, 36) != thread_id.substr(0, 36));
    }

    SECTION("uuid part is version 4") {
        std::string correlation_id = generate_correlation_id();
        std::string uuid_part = correlation_id.substr(0, correlation_id.find('#'));

        REQUIRE(uuid_part.length() == 36);
        REQUIRE(uuid_part[14] == '4');
        char variant = uuid_part[19];
        REQUIRE((variant == '8' || variant == '9' || variant == 'a' || variant == 'b'));
    }
}

TEST_CASE("Correlation ID validation", "[logging][validation]") {
    SECTION("accepts valid ids") {
        REQUIRE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000#999999"));
        REQUIRE(is_valid_correlation_id("abcdef12-3456-4789-abcd-ef0123456789#42"));
    }

    SECTION("rejects malformed ids") {
        REQUIRE_FALSE(is_valid_correlation_id(""));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000#"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000#12a"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-a716-44665544000#0"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400e29b41d4a716446655440000#0"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-31d4-a716-446655440000#0"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-c716-446655440000#0"));
        REQUIRE_FALSE(is_valid_correlation_id("550g8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000#42#56"));
    }

    SECTION("generated ids are unique and valid") {
        std::set<std::string> seen;
        for (int i = 0; i < 100; ++i) {
            auto id = generate_correlation_id();
            REQUIRE(is_valid_correlation_id(id));
            seen.insert(id);
        }
        REQUIRE(seen.size() == 100);
    }
}

TEST_CASE("Process logger", "[logging][logger]") {
    // Initialized by the test fixture
    auto* logger = get_logger();
    REQUIRE(logger != nullptr);

    set_log_level("warning");
    REQUIRE(logger->get_log_level() == quill::LogLevel::Warning);
    set_log_level("debug");
    REQUIRE(logger->get_log_level() == quill::LogLevel::Debug);

    LOG_REQUEST(logger, "GET", "example.com", "/", "r1", "api/10.0.0.1:80", 200, 0, 1500,
                "success", generate_correlation_id());
    LOG_UPSTREAM(logger, "retry", "api/10.0.0.1:80", "connect refused", "test");
}
