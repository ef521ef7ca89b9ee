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

// httpgate Route Table - Header
// (host, path prefix) -> ordered upstream targets, published as immutable snapshots

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "upstream.hpp"

namespace httpgate::gateway {

/// Per-route forwarding policy
struct RoutePolicy {
    std::chrono::milliseconds timeout{30000};       // Whole-request deadline
    std::chrono::milliseconds attempt_timeout{0};   // Per-attempt bound (0 = none)
    uint32_t max_retries = 2;                       // Extra attempts after the first
    uint32_t max_concurrency = 0;                   // 0 = unlimited
    size_t retry_buffer_bytes = 65536;              // Request body kept for replay
};

/// Route rule. Immutable once published.
struct RouteRule {
    std::string id;
    std::string host_pattern;  // "", "*", exact host or "*.suffix" (lowercase)
    std::string path_prefix;   // Normalized ("/" or "/seg[/seg...]")
    std::vector<std::shared_ptr<UpstreamTarget>> targets;
    RoutePolicy policy;
};

/// Outcome of resolving one request
struct Resolution {
    std::shared_ptr<const RouteRule> rule;
    std::vector<std::shared_ptr<UpstreamTarget>> candidates;  // Ordered, never empty
    bool degraded = false;  // Every candidate was unhealthy; trying anyway
};

/// "/api", "/api/" and "/api/*" all normalize to "/api"; "", "*" and "/*" to "/"
[[nodiscard]] std::string normalize_path_prefix(std::string_view prefix);

/// Segment-aware prefix match: "/api" matches "/api", "/api/", "/api/x" but not "/apix"
[[nodiscard]] bool path_matches(std::string_view prefix, std::string_view path) noexcept;

/// Host match length, or std::nullopt if the pattern does not match.
/// host must already be normalized (lowercase, no port).
[[nodiscard]] std::optional<size_t> host_match_length(std::string_view pattern,
                                                      std::string_view host) noexcept;

/// Filter a rule's targets into request candidates (weight, then health)
[[nodiscard]] Resolution select_candidates(std::shared_ptr<const RouteRule> rule,
                                           core::Clock::time_point now = core::Clock::now());

/// Immutable rule set, ordered by specificity
class RouteSnapshot {
public:
    RouteSnapshot() = default;

    /// Rules are ordered by (path prefix length desc, host specificity desc,
    /// registration order), so the first match is the most specific one.
    explicit RouteSnapshot(std::vector<RouteRule> rules);

    /// Most specific rule matching host and path (nullptr if none)
    [[nodiscard]] std::shared_ptr<const RouteRule> match(std::string_view host,
                                                         std::string_view path) const;

    [[nodiscard]] const std::vector<std::shared_ptr<const RouteRule>>& rules() const noexcept {
        return rules_;
    }

    [[nodiscard]] size_t size() const noexcept { return rules_.size(); }

private:
    std::vector<std::shared_ptr<const RouteRule>> rules_;
};

/// Dynamic route source consulted when no static rule matches
class RouteSource {
public:
    virtual ~RouteSource() = default;

    [[nodiscard]] virtual std::shared_ptr<const RouteRule> lookup(std::string_view host,
                                                                  std::string_view path) = 0;
};

/// Route table with RCU snapshot swap.
///
/// Readers take a snapshot reference for one resolution; publish() swaps in
/// a complete new snapshot, so lookups never see a partial update.
class RouteTable {
public:
    RouteTable();

    RouteTable(const RouteTable&) = delete;
    RouteTable& operator=(const RouteTable&) = delete;

    /// Swap in a new snapshot
    void publish(std::shared_ptr<const RouteSnapshot> snapshot);

    /// Current snapshot (never null)
    [[nodiscard]] std::shared_ptr<const RouteSnapshot> snapshot() const;

    /// Install the fallback consulted when no static rule matches
    void set_fallback(std::shared_ptr<RouteSource> fallback);

    /// Resolve a request. host may carry a port and any case.
    /// Returns std::nullopt with ec = GatewayError::NoRoute when nothing matches.
    [[nodiscard]] std::optional<Resolution> resolve(std::string_view host, std::string_view path,
                                                    std::error_code& ec) const;

    /// Number of snapshots published so far
    [[nodiscard]] uint64_t version() const noexcept {
        return version_.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<const RouteSnapshot> snapshot_;
    std::shared_ptr<RouteSource> fallback_;
    std::atomic<uint64_t> version_{0};
};

}  // namespace httpgate::gateway
