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

// httpgate Deadlines - Header
// Per-request deadlines and cooperative cancellation

#pragma once

#include <atomic>
#include <chrono>
#include <functional>

namespace httpgate::core {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

/// Granularity at which blocking waits re-check their cancellation token
inline constexpr std::chrono::milliseconds kCancelCheckInterval{20};

[[nodiscard]] inline Deadline deadline_after(std::chrono::milliseconds timeout) {
    return Clock::now() + timeout;
}

[[nodiscard]] inline bool expired(Deadline deadline) noexcept {
    return Clock::now() >= deadline;
}

/// Milliseconds left until deadline, rounded up, clamped for poll(2).
/// Returns 0 once the deadline has passed.
[[nodiscard]] int poll_timeout_ms(Deadline deadline) noexcept;

/// Cancellation flag shared by every suspension point of one request.
///
/// The optional probe lets a token discover cancellation on its own
/// (e.g. by checking whether the client socket hung up); once the probe
/// reports true the token latches cancelled.
class CancelToken {
public:
    CancelToken() = default;
    explicit CancelToken(std::function<bool()> probe) : probe_(std::move(probe)) {}

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const;

private:
    mutable std::atomic<bool> cancelled_{false};
    std::function<bool()> probe_;
};

} // namespace httpgate::core
