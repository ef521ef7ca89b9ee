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

// httpgate Deadlines - Implementation

#include "deadline.hpp"

#include <climits>

namespace httpgate::core {

int poll_timeout_ms(Deadline deadline) noexcept {
    auto now = Clock::now();
    if (now >= deadline) {
        return 0;
    }

    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
    if (remaining > INT_MAX) {
        return INT_MAX;
    }
    return static_cast<int>(remaining);
}

bool CancelToken::is_cancelled() const {
    if (cancelled_.load(std::memory_order_acquire)) {
        return true;
    }
    if (probe_ && probe_()) {
        cancelled_.store(true, std::memory_order_release);
        return true;
    }
    return false;
}

} // namespace httpgate::core
