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

// httpgate Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace httpgate::control {

/// Listener and connection handling
struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8080;
    uint32_t backlog = 512;

    uint32_t worker_threads = 0;  // 0 = 4 x CPU count

    // Timeouts (milliseconds)
    uint32_t idle_timeout = 60000;      // Keep-alive wait for the next request
    uint32_t read_timeout = 30000;      // Reading a request head once it started
    uint32_t shutdown_timeout = 30000;  // Graceful drain grace period

    // Limits
    uint32_t max_connections = 10000;  // Accepted and queued client connections
    uint32_t max_header_size = 16384;
};

/// Backend server (one upstream target)
struct BackendConfig {
    std::string host;
    uint16_t port = 80;
    uint32_t weight = 1;  // 0 = never selected while others are available
};

/// Per-target connection pool
struct PoolConfigSchema {
    uint32_t max_size = 64;
    uint32_t idle_timeout_ms = 60000;
    uint32_t connect_timeout_ms = 3000;
    uint32_t max_requests_per_connection = 0;  // 0 = unlimited
};

/// Per-target circuit breaker
struct CircuitBreakerConfigSchema {
    uint32_t failure_threshold = 5;    // Consecutive failures to open circuit
    uint32_t window_ms = 10000;        // Failures older than this are forgotten
    uint32_t cooldown_ms = 30000;      // OPEN -> HALF_OPEN delay
    double backoff_multiplier = 2.0;   // Cool-down growth on failed probes (1.0 = fixed)
    uint32_t max_cooldown_ms = 300000;
};

/// Upstream group configuration
struct UpstreamConfig {
    std::string name;
    std::vector<BackendConfig> backends;
    PoolConfigSchema pool;
    CircuitBreakerConfigSchema circuit_breaker;
};

/// Route configuration: (host, path prefix) -> upstream group
struct RouteConfig {
    std::string id;              // Defaults to "route_<index>"
    std::string host;            // "", "*", exact host or "*.suffix"
    std::string path = "/";      // Path prefix ("/api", "/api/" and "/api/*" are equivalent)
    std::string upstream;        // Upstream name

    uint32_t timeout_ms = 30000;         // Whole-request deadline
    uint32_t attempt_timeout_ms = 0;     // Per-attempt bound inside the deadline (0 = none)
    uint32_t max_retries = 2;            // Extra attempts after the first
    uint32_t max_concurrency = 0;        // In-flight ceiling for this route (0 = unlimited)
    uint32_t retry_buffer_bytes = 65536; // Request body kept for replay on retry
};

/// Gateway-wide admission control
struct AdmissionConfig {
    uint32_t max_in_flight = 0;  // 0 = unlimited
    uint32_t max_queue = 1024;   // Requests allowed to wait for a slot, per scope
};

/// Route id of all devbox traffic; static routes may not use it
inline constexpr std::string_view kReservedDevboxRouteId = "devbox";

/// Static devbox registration (uniqueID -> namespace)
struct DevboxRegistration {
    std::string id;
    std::string namespace_name;
};

/// Devbox host routing: <uniqueID>-<port>.<domain_suffix>
struct DevboxConfig {
    bool enabled = true;
    std::string domain_suffix = "devbox.example.com";
    std::string cluster_domain = "cluster.local";

    uint32_t timeout_ms = 60000;
    uint32_t attempt_timeout_ms = 0;
    uint32_t max_retries = 1;
    uint32_t max_concurrency = 0;
    uint32_t retry_buffer_bytes = 65536;
    uint32_t max_targets = 1024;  // Cached devbox targets; least recently used are dropped

    PoolConfigSchema pool;
    CircuitBreakerConfigSchema circuit_breaker;

    std::vector<DevboxRegistration> registrations;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";     // debug, info, warning, error
    std::string format = "text";    // json, text (json applies to file output)
    std::string output = "stdout";  // "stdout" or a log directory (httpgate.log)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full httpgate configuration
struct Config {
    ServerConfig server;
    std::vector<UpstreamConfig> upstreams;
    std::vector<RouteConfig> routes;
    AdmissionConfig admission;
    DevboxConfig devbox;
    LogConfig logging;

    std::string version = "1.0";
};

// from_json fills defaults for missing fields; to_json writes everything

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", uint16_t(8080));
    s.backlog = j.value("backlog", 512u);
    s.worker_threads = j.value("worker_threads", 0u);
    s.idle_timeout = j.value("idle_timeout", 60000u);
    s.read_timeout = j.value("read_timeout", 30000u);
    s.shutdown_timeout = j.value("shutdown_timeout", 30000u);
    s.max_connections = j.value("max_connections", 10000u);
    s.max_header_size = j.value("max_header_size", 16384u);
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"backlog", s.backlog},
                       {"worker_threads", s.worker_threads},
                       {"idle_timeout", s.idle_timeout},
                       {"read_timeout", s.read_timeout},
                       {"shutdown_timeout", s.shutdown_timeout},
                       {"max_connections", s.max_connections},
                       {"max_header_size", s.max_header_size}};
}

inline void from_json(const nlohmann::json& j, BackendConfig& b) {
    j.at("host").get_to(b.host);  // host is required
    b.port = j.value("port", uint16_t(80));
    b.weight = j.value("weight", 1u);
}

inline void to_json(nlohmann::json& j, const BackendConfig& b) {
    j = nlohmann::json{{"host", b.host}, {"port", b.port}, {"weight", b.weight}};
}

inline void from_json(const nlohmann::json& j, PoolConfigSchema& p) {
    p.max_size = j.value("max_size", 64u);
    p.idle_timeout_ms = j.value("idle_timeout_ms", 60000u);
    p.connect_timeout_ms = j.value("connect_timeout_ms", 3000u);
    p.max_requests_per_connection = j.value("max_requests_per_connection", 0u);
}

inline void to_json(nlohmann::json& j, const PoolConfigSchema& p) {
    j = nlohmann::json{{"max_size", p.max_size},
                       {"idle_timeout_ms", p.idle_timeout_ms},
                       {"connect_timeout_ms", p.connect_timeout_ms},
                       {"max_requests_per_connection", p.max_requests_per_connection}};
}

inline void from_json(const nlohmann::json& j, CircuitBreakerConfigSchema& c) {
    c.failure_threshold = j.value("failure_threshold", 5u);
    c.window_ms = j.value("window_ms", 10000u);
    c.cooldown_ms = j.value("cooldown_ms", 30000u);
    c.backoff_multiplier = j.value("backoff_multiplier", 2.0);
    c.max_cooldown_ms = j.value("max_cooldown_ms", 300000u);
}

inline void to_json(nlohmann::json& j, const CircuitBreakerConfigSchema& c) {
    j = nlohmann::json{{"failure_threshold", c.failure_threshold},
                       {"window_ms", c.window_ms},
                       {"cooldown_ms", c.cooldown_ms},
                       {"backoff_multiplier", c.backoff_multiplier},
                       {"max_cooldown_ms", c.max_cooldown_ms}};
}

inline void from_json(const nlohmann::json& j, UpstreamConfig& u) {
    j.at("name").get_to(u.name);          // name is required
    j.at("backends").get_to(u.backends);  // backends is required
    u.pool = j.value("pool", PoolConfigSchema{});
    u.circuit_breaker = j.value("circuit_breaker", CircuitBreakerConfigSchema{});
}

inline void to_json(nlohmann::json& j, const UpstreamConfig& u) {
    j = nlohmann::json{{"name", u.name},
                       {"backends", u.backends},
                       {"pool", u.pool},
                       {"circuit_breaker", u.circuit_breaker}};
}

inline void from_json(const nlohmann::json& j, RouteConfig& r) {
    r.id = j.value("id", std::string());
    r.host = j.value("host", std::string());
    r.path = j.value("path", std::string("/"));
    j.at("upstream").get_to(r.upstream);  // upstream is required
    r.timeout_ms = j.value("timeout_ms", 30000u);
    r.attempt_timeout_ms = j.value("attempt_timeout_ms", 0u);
    r.max_retries = j.value("max_retries", 2u);
    r.max_concurrency = j.value("max_concurrency", 0u);
    r.retry_buffer_bytes = j.value("retry_buffer_bytes", 65536u);
}

inline void to_json(nlohmann::json& j, const RouteConfig& r) {
    j = nlohmann::json{{"id", r.id},
                       {"host", r.host},
                       {"path", r.path},
                       {"upstream", r.upstream},
                       {"timeout_ms", r.timeout_ms},
                       {"attempt_timeout_ms", r.attempt_timeout_ms},
                       {"max_retries", r.max_retries},
                       {"max_concurrency", r.max_concurrency},
                       {"retry_buffer_bytes", r.retry_buffer_bytes}};
}

inline void from_json(const nlohmann::json& j, AdmissionConfig& a) {
    a.max_in_flight = j.value("max_in_flight", 0u);
    a.max_queue = j.value("max_queue", 1024u);
}

inline void to_json(nlohmann::json& j, const AdmissionConfig& a) {
    j = nlohmann::json{{"max_in_flight", a.max_in_flight}, {"max_queue", a.max_queue}};
}

inline void from_json(const nlohmann::json& j, DevboxRegistration& r) {
    j.at("id").get_to(r.id);                     // id is required
    j.at("namespace").get_to(r.namespace_name);  // namespace is required
}

inline void to_json(nlohmann::json& j, const DevboxRegistration& r) {
    j = nlohmann::json{{"id", r.id}, {"namespace", r.namespace_name}};
}

inline void from_json(const nlohmann::json& j, DevboxConfig& d) {
    d.enabled = j.value("enabled", true);
    d.domain_suffix = j.value("domain_suffix", std::string("devbox.example.com"));
    d.cluster_domain = j.value("cluster_domain", std::string("cluster.local"));
    d.timeout_ms = j.value("timeout_ms", 60000u);
    d.attempt_timeout_ms = j.value("attempt_timeout_ms", 0u);
    d.max_retries = j.value("max_retries", 1u);
    d.max_concurrency = j.value("max_concurrency", 0u);
    d.retry_buffer_bytes = j.value("retry_buffer_bytes", 65536u);
    d.max_targets = j.value("max_targets", 1024u);
    d.pool = j.value("pool", PoolConfigSchema{});
    d.circuit_breaker = j.value("circuit_breaker", CircuitBreakerConfigSchema{});
    if (j.contains("registrations")) {
        j.at("registrations").get_to(d.registrations);
    }
}

inline void to_json(nlohmann::json& j, const DevboxConfig& d) {
    j = nlohmann::json{{"enabled", d.enabled},
                       {"domain_suffix", d.domain_suffix},
                       {"cluster_domain", d.cluster_domain},
                       {"timeout_ms", d.timeout_ms},
                       {"attempt_timeout_ms", d.attempt_timeout_ms},
                       {"max_retries", d.max_retries},
                       {"max_concurrency", d.max_concurrency},
                       {"retry_buffer_bytes", d.retry_buffer_bytes},
                       {"max_targets", d.max_targets},
                       {"pool", d.pool},
                       {"circuit_breaker", d.circuit_breaker},
                       {"registrations", d.registrations}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("stdout"));
    l.rotation = j.value("rotation", LogConfig::RotationConfig{});
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    c.server = j.value("server", ServerConfig{});
    if (j.contains("upstreams")) {
        j.at("upstreams").get_to(c.upstreams);
    }
    if (j.contains("routes")) {
        j.at("routes").get_to(c.routes);
    }
    c.admission = j.value("admission", AdmissionConfig{});
    c.devbox = j.value("devbox", DevboxConfig{});
    c.logging = j.value("logging", LogConfig{});
    c.version = j.value("version", std::string("1.0"));
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{{"server", c.server},
                       {"upstreams", c.upstreams},
                       {"routes", c.routes},
                       {"admission", c.admission},
                       {"devbox", c.devbox},
                       {"logging", c.logging},
                       {"version", c.version}};
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string msg) {
        valid = false;
        errors.push_back(std::move(msg));
    }

    void add_warning(std::string msg) { warnings.push_back(std::move(msg)); }

    [[nodiscard]] bool has_errors() const noexcept { return !errors.empty(); }
};

/// Environment lookup (getenv-compatible), injectable for tests
using EnvLookup = std::function<const char*(const char*)>;

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file (no validation)
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Parse configuration from JSON string (no validation).
    /// Parse errors are reported on stderr and yield std::nullopt.
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Apply LISTEN_ADDR, DOMAIN_SUFFIX and LOG_LEVEL overrides.
    /// Malformed values are reported as errors and leave the field unchanged.
    [[nodiscard]] static ValidationResult apply_env_overrides(Config& config,
                                                              const EnvLookup& lookup);

    /// Validate configuration (semantic checks)
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Serialize configuration to pretty-printed JSON
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Configuration manager with RCU hot-reload.
///
/// Readers call get() and keep the shared_ptr for as long as they use the
/// snapshot; reload() swaps in a new one without disturbing them.
class ConfigManager {
public:
    explicit ConfigManager(EnvLookup lookup = default_env_lookup());
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration from file (empty path = built-in defaults)
    [[nodiscard]] bool load(std::string_view path);

    /// Reload configuration (hot-reload with RCU)
    [[nodiscard]] bool reload();

    /// Get current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    [[nodiscard]] bool is_loaded() const noexcept { return get() != nullptr; }

    /// Get last validation result
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

    [[nodiscard]] static EnvLookup default_env_lookup();

private:
    [[nodiscard]] std::optional<Config> read_and_validate();

    EnvLookup env_lookup_;
    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace httpgate::control
