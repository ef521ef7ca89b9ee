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

// httpgate Configuration - Implementation

#include "config.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "../core/containers.hpp"

namespace httpgate::control {

namespace {

[[nodiscard]] bool is_known_log_level(std::string_view level) {
    return level == "debug" || level == "info" || level == "warning" || level == "error";
}

[[nodiscard]] std::string to_lower(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Devbox unique IDs: lowercase alphanumerics and '-', no leading/trailing '-'
[[nodiscard]] bool is_valid_devbox_id(std::string_view id) {
    if (id.empty() || id.front() == '-' || id.back() == '-') {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
}

void validate_pool(const PoolConfigSchema& pool, const std::string& context,
                   ValidationResult& result) {
    if (pool.max_size == 0) {
        result.add_error(context + ": pool max_size must be > 0");
    }
    if (pool.connect_timeout_ms == 0) {
        result.add_error(context + ": pool connect_timeout_ms must be > 0");
    }
}

void validate_circuit(const CircuitBreakerConfigSchema& cb, const std::string& context,
                      ValidationResult& result) {
    if (cb.failure_threshold == 0) {
        result.add_error(context + ": circuit_breaker failure_threshold must be > 0");
    }
    if (cb.window_ms == 0) {
        result.add_error(context + ": circuit_breaker window_ms must be > 0");
    }
    if (cb.backoff_multiplier < 1.0) {
        result.add_error(context + ": circuit_breaker backoff_multiplier must be >= 1.0");
    }
    if (cb.max_cooldown_ms < cb.cooldown_ms) {
        result.add_error(context + ": circuit_breaker max_cooldown_ms must be >= cooldown_ms");
    }
}

/// The listener binds IPv4 only, so the address must be a dotted quad
[[nodiscard]] bool is_ipv4_literal(const std::string& address) {
    in_addr parsed{};
    return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

/// Parse "host:port" or ":port". Bracketed IPv6 hosts are rejected.
[[nodiscard]] bool parse_listen_addr(std::string_view value, std::string& host, uint16_t& port) {
    auto colon = value.rfind(':');
    if (colon == std::string_view::npos) {
        return false;
    }

    std::string_view host_part = value.substr(0, colon);
    std::string_view port_part = value.substr(colon + 1);

    if (!host_part.empty() && !is_ipv4_literal(std::string(host_part))) {
        return false;
    }

    unsigned int parsed = 0;
    auto [ptr, ec] = std::from_chars(port_part.data(), port_part.data() + port_part.size(), parsed);
    if (ec != std::errc{} || ptr != port_part.data() + port_part.size() || parsed > 65535) {
        return false;
    }

    host = host_part.empty() ? std::string("0.0.0.0") : std::string(host_part);
    port = static_cast<uint16_t>(parsed);
    return true;
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_json(buffer.str());
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);
        return j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }
}

ValidationResult ConfigLoader::apply_env_overrides(Config& config, const EnvLookup& lookup) {
    ValidationResult result;
    if (!lookup) {
        return result;
    }

    if (const char* listen = lookup("LISTEN_ADDR"); listen != nullptr && *listen != '\0') {
        std::string host;
        uint16_t port = 0;
        if (parse_listen_addr(listen, host, port)) {
            config.server.listen_address = std::move(host);
            config.server.listen_port = port;
        } else {
            result.add_error(std::string("Invalid LISTEN_ADDR '") + listen +
                             "' (expected ipv4:port)");
        }
    }

    if (const char* suffix = lookup("DOMAIN_SUFFIX"); suffix != nullptr && *suffix != '\0') {
        std::string value = to_lower(suffix);
        while (!value.empty() && value.front() == '.') {
            value.erase(0, 1);
        }
        if (value.empty()) {
            result.add_error(std::string("Invalid DOMAIN_SUFFIX '") + suffix + "'");
        } else {
            config.devbox.domain_suffix = std::move(value);
        }
    }

    if (const char* level = lookup("LOG_LEVEL"); level != nullptr && *level != '\0') {
        std::string value = to_lower(level);
        if (value == "warn") {
            value = "warning";
        }
        if (is_known_log_level(value)) {
            config.logging.level = std::move(value);
        } else {
            result.add_error(std::string("Unknown LOG_LEVEL '") + level + "'");
        }
    }

    return result;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_port == 0) {
        result.add_warning("Server listen_port is 0 (ephemeral port will be used)");
    }

    if (!is_ipv4_literal(config.server.listen_address)) {
        result.add_error("Server listen_address '" + config.server.listen_address +
                         "' must be an IPv4 address");
    }

    if (config.server.max_header_size == 0) {
        result.add_error("Server max_header_size must be > 0");
    }

    if (config.server.max_connections == 0) {
        result.add_error("Server max_connections must be > 0");
    }

    if (config.server.idle_timeout == 0 || config.server.read_timeout == 0) {
        result.add_error("Server idle_timeout and read_timeout must be > 0");
    }

    // Upstreams
    core::fast_set<std::string> upstream_names;
    for (const auto& upstream : config.upstreams) {
        if (upstream.name.empty()) {
            result.add_error("Upstream name cannot be empty");
        } else if (!upstream_names.insert(upstream.name).second) {
            result.add_error("Duplicate upstream name '" + upstream.name + "'");
        }

        if (upstream.backends.empty()) {
            result.add_error("Upstream '" + upstream.name + "' has no backends");
        }

        for (const auto& backend : upstream.backends) {
            if (backend.host.empty()) {
                result.add_error("Backend host cannot be empty in upstream '" + upstream.name +
                                 "'");
            }

            if (backend.port == 0) {
                result.add_error("Backend port must be > 0 in upstream '" + upstream.name + "'");
            }

            if (backend.weight == 0) {
                result.add_warning("Backend weight is 0 in upstream '" + upstream.name +
                                   "' (only used when no other backend is available)");
            }
        }

        validate_pool(upstream.pool, "Upstream '" + upstream.name + "'", result);
        validate_circuit(upstream.circuit_breaker, "Upstream '" + upstream.name + "'", result);
    }

    // Routes
    if (config.routes.empty() && !config.devbox.enabled) {
        result.add_warning("No routes configured and devbox routing disabled");
    }

    core::fast_set<std::string> route_ids;
    for (size_t i = 0; i < config.routes.size(); ++i) {
        const auto& route = config.routes[i];
        std::string label = route.id.empty() ? "route_" + std::to_string(i) : route.id;

        if (!route_ids.insert(label).second) {
            result.add_error("Duplicate route id '" + label + "'");
        }

        if (label == kReservedDevboxRouteId) {
            result.add_error("Route id '" + label + "' is reserved for devbox routing");
        }

        if (route.path.empty() || route.path.front() != '/') {
            result.add_error("Route '" + label + "' path must start with '/'");
        }

        if (route.upstream.empty()) {
            result.add_error("Route '" + label + "' has no upstream");
        } else if (!upstream_names.contains(route.upstream)) {
            result.add_error("Route '" + label + "' references non-existent upstream '" +
                             route.upstream + "'");
        }

        if (route.timeout_ms == 0) {
            result.add_error("Route '" + label + "' timeout_ms must be > 0");
        }

        if (route.attempt_timeout_ms > route.timeout_ms) {
            result.add_warning("Route '" + label +
                               "' attempt_timeout_ms exceeds timeout_ms (request deadline wins)");
        }
    }

    // Admission
    if (config.admission.max_in_flight > 0 && config.admission.max_queue == 0) {
        result.add_warning("Admission max_queue is 0 (requests over the ceiling are shed)");
    }

    // Devbox
    if (config.devbox.enabled) {
        if (config.devbox.domain_suffix.empty()) {
            result.add_error("Devbox domain_suffix cannot be empty");
        }
        if (config.devbox.cluster_domain.empty()) {
            result.add_error("Devbox cluster_domain cannot be empty");
        }
        if (config.devbox.timeout_ms == 0) {
            result.add_error("Devbox timeout_ms must be > 0");
        }
        if (config.devbox.max_targets == 0) {
            result.add_error("Devbox max_targets must be > 0");
        }
        validate_pool(config.devbox.pool, "Devbox", result);
        validate_circuit(config.devbox.circuit_breaker, "Devbox", result);
    }

    core::fast_set<std::string> devbox_ids;
    for (const auto& reg : config.devbox.registrations) {
        if (!is_valid_devbox_id(reg.id)) {
            result.add_error("Invalid devbox id '" + reg.id + "'");
        } else if (!devbox_ids.insert(reg.id).second) {
            result.add_error("Duplicate devbox id '" + reg.id + "'");
        }
        if (reg.namespace_name.empty()) {
            result.add_error("Devbox '" + reg.id + "' has no namespace");
        }
    }

    // Logging
    if (!is_known_log_level(config.logging.level)) {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    if (config.logging.output.empty()) {
        result.add_error("Logging output cannot be empty");
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    nlohmann::json j = config;
    return j.dump(2);  // 2-space indentation
}

// ConfigManager implementation

ConfigManager::ConfigManager(EnvLookup lookup) : env_lookup_(std::move(lookup)) {}

EnvLookup ConfigManager::default_env_lookup() {
    return [](const char* name) -> const char* { return std::getenv(name); };
}

std::optional<Config> ConfigManager::read_and_validate() {
    std::optional<Config> maybe_config;
    if (config_path_.empty()) {
        maybe_config = Config{};
    } else {
        maybe_config = ConfigLoader::load_from_file(config_path_);
    }

    if (!maybe_config.has_value()) {
        last_validation_ = ValidationResult{};
        last_validation_.add_error("Failed to read configuration");
        return std::nullopt;
    }

    last_validation_ = ConfigLoader::apply_env_overrides(*maybe_config, env_lookup_);
    auto validation = ConfigLoader::validate(*maybe_config);
    for (auto& err : validation.errors) {
        last_validation_.add_error(std::move(err));
    }
    for (auto& warn : validation.warnings) {
        last_validation_.add_warning(std::move(warn));
    }

    if (last_validation_.has_errors()) {
        return std::nullopt;
    }
    return maybe_config;
}

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;

    auto maybe_config = read_and_validate();
    if (!maybe_config.has_value()) {
        return false;
    }

    std::atomic_store(&current_config_,
                      std::shared_ptr<const Config>(
                          std::make_shared<const Config>(std::move(*maybe_config))));
    return true;
}

bool ConfigManager::reload() {
    auto maybe_config = read_and_validate();
    if (!maybe_config.has_value()) {
        return false;
    }

    // RCU: old snapshot stays valid until all readers release it
    auto new_config = std::make_shared<const Config>(std::move(*maybe_config));
    std::atomic_store(&current_config_, std::shared_ptr<const Config>(std::move(new_config)));

    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    return std::atomic_load(&current_config_);
}

}  // namespace httpgate::control
