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

// httpgate Devbox Routing - Implementation

#include "devbox.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>

#include "../core/logging.hpp"
#include "../http/http.hpp"

namespace httpgate::gateway {

// DevboxRegistry

bool DevboxRegistry::register_devbox(std::string unique_id, std::string namespace_name) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.insert_or_assign(std::move(unique_id),
                                                    DevboxInfo{std::move(namespace_name)});
    return inserted;
}

bool DevboxRegistry::unregister_devbox(std::string_view unique_id) {
    std::unique_lock lock(mutex_);
    return entries_.erase(std::string(unique_id)) > 0;
}

void DevboxRegistry::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

void DevboxRegistry::replace_all(core::fast_map<std::string, DevboxInfo> entries) {
    std::unique_lock lock(mutex_);
    entries_.swap(entries);
}

std::optional<DevboxInfo> DevboxRegistry::get(std::string_view unique_id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(std::string(unique_id));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t DevboxRegistry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

bool DevboxRegistry::empty() const {
    std::shared_lock lock(mutex_);
    return entries_.empty();
}

// Host parsing

namespace {

[[nodiscard]] bool is_id_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

}  // namespace

std::optional<DevboxHost> parse_devbox_host(std::string_view host) {
    std::string normalized = http::normalize_host(host);

    auto dot = normalized.find('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    std::string_view label = std::string_view(normalized).substr(0, dot);

    auto dash = label.rfind('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }

    std::string_view id = label.substr(0, dash);
    std::string_view port_str = label.substr(dash + 1);

    if (id.empty() || id.front() == '-' || id.back() == '-' ||
        !std::all_of(id.begin(), id.end(), is_id_char)) {
        return std::nullopt;
    }

    if (port_str.empty() || !std::all_of(port_str.begin(), port_str.end(),
                                         [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || port == 0 || port > 65535) {
        return std::nullopt;
    }

    return DevboxHost{std::string(id), static_cast<uint16_t>(port)};
}

// DevboxResolver

DevboxResolver::DevboxResolver(std::shared_ptr<DevboxRegistry> registry,
                               std::shared_ptr<UpstreamManager> upstreams,
                               DevboxSettings settings)
    : registry_(std::move(registry)),
      upstreams_(std::move(upstreams)),
      settings_(std::move(settings)) {}

// Devbox routing is host-only; the path is not consulted
std::shared_ptr<const RouteRule> DevboxResolver::lookup(std::string_view host,
                                                        std::string_view /*path*/) {
    DevboxSettings settings = this->settings();
    if (!settings.enabled) {
        return nullptr;
    }

    std::string suffix = "." + settings.domain_suffix;
    if (host.size() <= suffix.size() || !host.ends_with(suffix)) {
        return nullptr;
    }

    auto parsed = parse_devbox_host(host);
    if (!parsed) {
        if (auto* logger = logging::get_logger()) {
            LOG_DEBUG(logger, "[DEVBOX] unparsable host: {}", host);
        }
        return nullptr;
    }

    // Registry is checked on every request so unregistration takes effect at once
    auto info = registry_->get(parsed->unique_id);
    if (!info) {
        if (auto* logger = logging::get_logger()) {
            LOG_DEBUG(logger, "[DEVBOX] unknown devbox: {}", parsed->unique_id);
        }
        return nullptr;
    }

    std::string target_host =
        fmt::format("{}.{}.svc.{}", parsed->unique_id, info->namespace_name,
                    settings.cluster_domain);
    std::string cache_key = fmt::format("{}:{}", target_host, parsed->port);

    // Creation stays under the lock so an evicted target is never handed out again
    std::lock_guard lock(mutex_);
    if (auto it = cache_.find(cache_key); it != cache_.end()) {
        lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
        return it->second.rule;
    }

    auto target = upstreams_->get_or_create(kDevboxGroup, target_host, parsed->port, 1,
                                            settings_.pool, settings_.circuit);

    auto rule = std::make_shared<RouteRule>();
    rule->id = std::string(kDevboxRouteId);
    rule->host_pattern = std::string(host);
    rule->path_prefix = "/";
    rule->targets.push_back(std::move(target));
    rule->policy = settings_.policy;

    if (auto* logger = logging::get_logger()) {
        LOG_DEBUG(logger, "[DEVBOX] resolved {} -> {}", host, cache_key);
    }

    lru_.push_front(cache_key);
    cache_.try_emplace(std::move(cache_key), CachedRule{parsed->unique_id, rule, lru_.begin()});
    evict_over_cap();
    return rule;
}

void DevboxResolver::evict_over_cap() {
    size_t cap = std::max<size_t>(settings_.max_targets, 1);
    while (cache_.size() > cap && !lru_.empty()) {
        auto it = cache_.find(lru_.back());
        if (it != cache_.end()) {
            // Requests already holding the rule keep the target alive
            upstreams_->remove(it->second.rule->targets.front()->key());
            if (auto* logger = logging::get_logger()) {
                LOG_DEBUG(logger, "[DEVBOX] evicted {}", it->first);
            }
            cache_.erase(it);
        }
        lru_.pop_back();
    }
}

void DevboxResolver::configure(DevboxSettings settings) {
    std::lock_guard lock(mutex_);
    settings_ = std::move(settings);
    cache_.clear();
    lru_.clear();
}

void DevboxResolver::prune_unregistered() {
    std::string cluster_suffix = ".svc." + settings().cluster_domain;

    // Target hosts are "<uniqueID>.<namespace>.svc.<cluster_domain>"
    core::fast_set<std::string> keep;
    for (const auto& target : upstreams_->targets()) {
        if (target->group() != kDevboxGroup) {
            continue;
        }
        std::string_view host = target->host();
        if (!host.ends_with(cluster_suffix)) {
            continue;
        }
        host.remove_suffix(cluster_suffix.size());

        auto dot = host.find('.');
        if (dot == std::string_view::npos) {
            continue;
        }
        auto info = registry_->get(host.substr(0, dot));
        if (info && info->namespace_name == host.substr(dot + 1)) {
            keep.insert(target->key());
        }
    }

    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> doomed;
        for (const auto& [key, cached] : cache_) {
            if (!keep.contains(cached.rule->targets.front()->key())) {
                doomed.push_back(key);
            }
        }
        for (const auto& key : doomed) {
            auto it = cache_.find(key);
            lru_.erase(it->second.lru_pos);
            cache_.erase(it);
        }
    }

    upstreams_->prune(kDevboxGroup, keep);
}

DevboxSettings DevboxResolver::settings() const {
    std::lock_guard lock(mutex_);
    return settings_;
}

size_t DevboxResolver::cached_rules() const {
    std::lock_guard lock(mutex_);
    return cache_.size();
}

}  // namespace httpgate::gateway
