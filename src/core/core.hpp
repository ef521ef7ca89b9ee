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

// httpgate Core - Header
// Thread utilities for worker sizing and naming

#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace httpgate::core {

/// Get number of available CPU cores (at least 1)
[[nodiscard]] uint32_t get_cpu_count();

/// Default worker pool size when the configuration leaves it at 0.
/// Workers block on upstream I/O, so the pool is oversubscribed relative to cores.
[[nodiscard]] uint32_t default_worker_count();

/// Set the name of the calling thread (visible in top/gdb), truncated to 15 chars
[[nodiscard]] std::error_code set_current_thread_name(std::string_view name);

} // namespace httpgate::core
