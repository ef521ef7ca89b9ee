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

// httpgate Worker Pool - Header
// Fixed set of threads draining a bounded task queue

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace httpgate::core {

/// Fixed-size thread pool with a bounded backlog.
///
/// `capacity` bounds queued plus running tasks; submit() refuses work beyond
/// it instead of blocking, so the caller (the accept loop) never stalls.
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(uint32_t threads, size_t capacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Returns false if the pool is full or shutting down.
    [[nodiscard]] bool submit(Task task);

    /// Stop taking work, run what is queued, join all threads (idempotent)
    void shutdown();

    [[nodiscard]] uint32_t thread_count() const noexcept { return thread_count_; }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t queued() const;
    [[nodiscard]] size_t running() const;

private:
    void worker_loop(uint32_t index);

    const uint32_t thread_count_;
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    size_t running_ = 0;
    bool stopping_ = false;

    std::vector<std::thread> threads_;
};

} // namespace httpgate::core
