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

// httpgate Admission Control - Implementation

#include "admission.hpp"

#include <algorithm>

#include "errors.hpp"

namespace httpgate::gateway {

// AdmissionSlot

AdmissionSlot::AdmissionSlot(AdmissionSlot&& other) noexcept : gate_(std::move(other.gate_)) {}

AdmissionSlot& AdmissionSlot::operator=(AdmissionSlot&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = std::move(other.gate_);
    }
    return *this;
}

void AdmissionSlot::release() noexcept {
    if (gate_) {
        auto gate = std::move(gate_);
        gate_.reset();
        gate->release_one();
    }
}

// AdmissionGate

AdmissionGate::AdmissionGate(size_t limit, size_t max_queue)
    : limit_(limit), max_queue_(max_queue) {}

std::optional<AdmissionSlot> AdmissionGate::acquire(core::Deadline deadline, std::error_code& ec,
                                                    const core::CancelToken* cancel) {
    std::unique_lock lock(mutex_);

    auto has_capacity = [this] { return limit_ == 0 || in_flight_ < limit_; };

    if (!has_capacity()) {
        // Shed load instead of queueing when waiting cannot help
        if (core::expired(deadline) || waiting_ >= max_queue_) {
            ++rejected_;
            ec = GatewayError::Rejected;
            return std::nullopt;
        }

        ++waiting_;
        while (!has_capacity()) {
            if (cancel != nullptr && cancel->is_cancelled()) {
                --waiting_;
                ec = GatewayError::ClientDisconnected;
                return std::nullopt;
            }

            auto now = core::Clock::now();
            if (now >= deadline) {
                --waiting_;
                ++rejected_;
                ec = GatewayError::Rejected;
                return std::nullopt;
            }

            released_.wait_until(lock, std::min(deadline, now + core::kCancelCheckInterval));
        }
        --waiting_;
    }

    ++in_flight_;
    return AdmissionSlot(shared_from_this());
}

void AdmissionGate::release_one() noexcept {
    {
        std::lock_guard lock(mutex_);
        if (in_flight_ > 0) {
            --in_flight_;
        }
    }
    released_.notify_one();
}

void AdmissionGate::set_limits(size_t limit, size_t max_queue) {
    {
        std::lock_guard lock(mutex_);
        limit_ = limit;
        max_queue_ = max_queue;
    }
    released_.notify_all();
}

size_t AdmissionGate::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

size_t AdmissionGate::waiting() const {
    std::lock_guard lock(mutex_);
    return waiting_;
}

size_t AdmissionGate::limit() const {
    std::lock_guard lock(mutex_);
    return limit_;
}

uint64_t AdmissionGate::rejected() const {
    std::lock_guard lock(mutex_);
    return rejected_;
}

// AdmissionController

AdmissionController::AdmissionController(size_t max_in_flight, size_t max_queue)
    : global_(std::make_shared<AdmissionGate>(max_in_flight, max_queue)), route_queue_(max_queue) {}

void AdmissionController::set_global_limit(size_t max_in_flight, size_t max_queue) {
    global_->set_limits(max_in_flight, max_queue);
    std::lock_guard lock(mutex_);
    route_queue_ = max_queue;
}

void AdmissionController::configure_route(const std::string& route_id, size_t max_concurrency) {
    std::lock_guard lock(mutex_);
    if (auto it = routes_.find(route_id); it != routes_.end()) {
        it->second->set_limits(max_concurrency, route_queue_);
        return;
    }
    routes_.emplace(route_id, std::make_shared<AdmissionGate>(max_concurrency, route_queue_));
}

void AdmissionController::retain_routes(const core::fast_set<std::string>& keep) {
    std::lock_guard lock(mutex_);
    std::vector<std::string> doomed;
    for (const auto& [id, gate] : routes_) {
        if (!keep.contains(id)) {
            doomed.push_back(id);
        }
    }
    for (const auto& id : doomed) {
        routes_.erase(id);
    }
}

std::shared_ptr<AdmissionGate> AdmissionController::route_gate(std::string_view route_id) const {
    std::lock_guard lock(mutex_);
    auto it = routes_.find(std::string(route_id));
    return it != routes_.end() ? it->second : nullptr;
}

std::optional<AdmissionSlot> AdmissionController::acquire(const AdmissionScope& scope,
                                                          core::Deadline deadline,
                                                          std::error_code& ec,
                                                          const core::CancelToken* cancel) {
    std::shared_ptr<AdmissionGate> gate;
    if (scope.is_global()) {
        gate = global_;
    } else {
        gate = route_gate(scope.route_id);
        if (!gate) {
            // Unregistered route: unlimited
            return AdmissionSlot();
        }
    }
    return gate->acquire(deadline, ec, cancel);
}

}  // namespace httpgate::gateway
