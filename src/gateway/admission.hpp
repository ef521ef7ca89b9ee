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

// httpgate Admission Control - Header
// Bounds in-flight requests gateway-wide and per route

#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../core/containers.hpp"
#include "../core/deadline.hpp"

namespace httpgate::gateway {

class AdmissionGate;

/// One unit of concurrency capacity. Move-only; released exactly once,
/// by release() or the destructor, whichever comes first.
class AdmissionSlot {
public:
    AdmissionSlot() = default;
    ~AdmissionSlot() { release(); }

    AdmissionSlot(const AdmissionSlot&) = delete;
    AdmissionSlot& operator=(const AdmissionSlot&) = delete;
    AdmissionSlot(AdmissionSlot&& other) noexcept;
    AdmissionSlot& operator=(AdmissionSlot&& other) noexcept;

    /// Give the capacity back (no-op if already released)
    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return gate_ != nullptr; }

private:
    friend class AdmissionGate;
    explicit AdmissionSlot(std::shared_ptr<AdmissionGate> gate) : gate_(std::move(gate)) {}

    std::shared_ptr<AdmissionGate> gate_;
};

/// Concurrency ceiling with a bounded wait queue
class AdmissionGate : public std::enable_shared_from_this<AdmissionGate> {
public:
    /// limit 0 = unlimited
    AdmissionGate(size_t limit, size_t max_queue);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    /// Take a slot, waiting for capacity until deadline.
    /// Errors: Rejected (deadline, full queue), ClientDisconnected (cancelled).
    [[nodiscard]] std::optional<AdmissionSlot> acquire(core::Deadline deadline,
                                                       std::error_code& ec,
                                                       const core::CancelToken* cancel = nullptr);

    /// Change limits; waiters are re-evaluated
    void set_limits(size_t limit, size_t max_queue);

    [[nodiscard]] size_t in_flight() const;
    [[nodiscard]] size_t waiting() const;
    [[nodiscard]] size_t limit() const;
    [[nodiscard]] uint64_t rejected() const;

private:
    friend class AdmissionSlot;
    void release_one() noexcept;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    size_t limit_;
    size_t max_queue_;
    size_t in_flight_ = 0;
    size_t waiting_ = 0;
    uint64_t rejected_ = 0;
};

/// What an admission request counts against
struct AdmissionScope {
    std::string route_id;  // Empty = gateway-wide

    [[nodiscard]] static AdmissionScope global() { return {}; }
    [[nodiscard]] static AdmissionScope route(std::string id) { return {std::move(id)}; }
    [[nodiscard]] bool is_global() const noexcept { return route_id.empty(); }
};

/// Registry of admission gates: one global, one per route
class AdmissionController {
public:
    AdmissionController(size_t max_in_flight, size_t max_queue);

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    /// Update the gateway-wide ceiling
    void set_global_limit(size_t max_in_flight, size_t max_queue);

    /// Register or update a route gate; an existing gate keeps its in-flight count
    void configure_route(const std::string& route_id, size_t max_concurrency);

    /// Forget gates of routes not in keep (slots already handed out stay valid)
    void retain_routes(const core::fast_set<std::string>& keep);

    /// Acquire a slot in scope. A route without a registered gate is unlimited.
    [[nodiscard]] std::optional<AdmissionSlot> acquire(const AdmissionScope& scope,
                                                       core::Deadline deadline,
                                                       std::error_code& ec,
                                                       const core::CancelToken* cancel = nullptr);

    [[nodiscard]] std::shared_ptr<AdmissionGate> global_gate() const { return global_; }
    [[nodiscard]] std::shared_ptr<AdmissionGate> route_gate(std::string_view route_id) const;

private:
    std::shared_ptr<AdmissionGate> global_;

    mutable std::mutex mutex_;
    core::fast_map<std::string, std::shared_ptr<AdmissionGate>> routes_;
    size_t route_queue_;
};

}  // namespace httpgate::gateway
