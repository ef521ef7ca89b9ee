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

// httpgate Core - Implementation

#include "core.hpp"

#ifdef __linux__
#include <pthread.h>
#endif

#include <algorithm>
#include <string>
#include <thread>

namespace httpgate::core {

uint32_t get_cpu_count() {
    return std::max(1u, std::thread::hardware_concurrency());
}

uint32_t default_worker_count() {
    constexpr uint32_t kThreadsPerCore = 4;
    constexpr uint32_t kMinWorkers = 4;
    return std::max(kMinWorkers, get_cpu_count() * kThreadsPerCore);
}

std::error_code set_current_thread_name(std::string_view name) {
#ifdef __linux__
    // Linux limits thread names to 16 bytes including the terminator
    std::string truncated{name.substr(0, 15)};
    int ret = pthread_setname_np(pthread_self(), truncated.c_str());
    if (ret != 0) {
        return std::error_code(ret, std::system_category());
    }
#else
    (void)name;
#endif
    return {};
}

} // namespace httpgate::core
