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

// httpgate Route Table - Implementation

#include "route_table.hpp"

#include <algorithm>

#include "../http/http.hpp"
#include "errors.hpp"

namespace httpgate::gateway {

std::string normalize_path_prefix(std::string_view prefix) {
    if (prefix.ends_with('*')) {
        prefix.remove_suffix(1);
    }
    while (prefix.size() > 1 && prefix.ends_with('/')) {
        prefix.remove_suffix(1);
    }
    if (prefix.empty() || prefix == "/") {
        return "/";
    }
    std::string result;
    if (prefix.front() != '/') {
        result.push_back('/');
    }
    result.append(prefix);
    return result;
}

bool path_matches(std::string_view prefix, std::string_view path) noexcept {
    if (prefix == "/") {
        return true;
    }
    if (!path.starts_with(prefix)) {
        return false;
    }
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

std::optional<size_t> host_match_length(std::string_view pattern, std::string_view host) noexcept {
    if (pattern.empty() || pattern == "*") {
        return 0;
    }
    if (pattern.starts_with("*.")) {
        auto suffix = pattern.substr(1);  // ".example.com"
        if (host.size() > suffix.size() && host.ends_with(suffix)) {
            return suffix.size();
        }
        return std::nullopt;
    }
    if (pattern == host) {
        return pattern.size();
    }
    return std::nullopt;
}

namespace {

/// Static specificity of a host pattern (the length it matches with)
[[nodiscard]] size_t host_specificity(std::string_view pattern) noexcept {
    if (pattern.empty() || pattern == "*") {
        return 0;
    }
    if (pattern.starts_with("*.")) {
        return pattern.size() - 1;
    }
    return pattern.size();
}

}  // namespace

Resolution select_candidates(std::shared_ptr<const RouteRule> rule, core::Clock::time_point now) {
    Resolution resolution;

    // Weight 0 means "only if nothing else is configured"
    std::vector<std::shared_ptr<UpstreamTarget>> weighted;
    weighted.reserve(rule->targets.size());
    for (const auto& target : rule->targets) {
        if (target->weight() > 0) {
            weighted.push_back(target);
        }
    }
    if (weighted.empty()) {
        weighted = rule->targets;
    }

    for (const auto& target : weighted) {
        if (target->is_routable(now)) {
            resolution.candidates.push_back(target);
        }
    }

    if (resolution.candidates.empty()) {
        resolution.candidates = std::move(weighted);
        resolution.degraded = true;
    }

    resolution.rule = std::move(rule);
    return resolution;
}

// RouteSnapshot

RouteSnapshot::RouteSnapshot(std::vector<RouteRule> rules) {
    for (auto& rule : rules) {
        rule.path_prefix = normalize_path_prefix(rule.path_prefix);
        rule.host_pattern = http::normalize_host(rule.host_pattern);
    }

    std::stable_sort(rules.begin(), rules.end(), [](const RouteRule& a, const RouteRule& b) {
        if (a.path_prefix.size() != b.path_prefix.size()) {
            return a.path_prefix.size() > b.path_prefix.size();
        }
        return host_specificity(a.host_pattern) > host_specificity(b.host_pattern);
    });

    rules_.reserve(rules.size());
    for (auto& rule : rules) {
        rules_.push_back(std::make_shared<const RouteRule>(std::move(rule)));
    }
}

std::shared_ptr<const RouteRule> RouteSnapshot::match(std::string_view host,
                                                      std::string_view path) const {
    if (path.empty()) {
        path = "/";
    }
    for (const auto& rule : rules_) {
        if (path_matches(rule->path_prefix, path) && host_match_length(rule->host_pattern, host)) {
            return rule;
        }
    }
    return nullptr;
}

// RouteTable

RouteTable::RouteTable() : snapshot_(std::make_shared<const RouteSnapshot>()) {}

void RouteTable::publish(std::shared_ptr<const RouteSnapshot> snapshot) {
    if (!snapshot) {
        snapshot = std::make_shared<const RouteSnapshot>();
    }
    std::atomic_store(&snapshot_, std::move(snapshot));
    version_.fetch_add(1, std::memory_order_acq_rel);
}

std::shared_ptr<const RouteSnapshot> RouteTable::snapshot() const {
    return std::atomic_load(&snapshot_);
}

void RouteTable::set_fallback(std::shared_ptr<RouteSource> fallback) {
    std::atomic_store(&fallback_, std::move(fallback));
}

std::optional<Resolution> RouteTable::resolve(std::string_view host, std::string_view path,
                                              std::error_code& ec) const {
    auto normalized_host = http::normalize_host(host);

    auto current = snapshot();
    auto rule = current->match(normalized_host, path);

    if (!rule) {
        if (auto fallback = std::atomic_load(&fallback_)) {
            rule = fallback->lookup(normalized_host, path);
        }
    }

    if (!rule || rule->targets.empty()) {
        ec = GatewayError::NoRoute;
        return std::nullopt;
    }

    return select_candidates(std::move(rule));
}

}  // namespace httpgate::gateway
