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

// httpgate Worker Pool - Implementation

#include "worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include "core.hpp"
#include "logging.hpp"

namespace httpgate::core {

WorkerPool::WorkerPool(uint32_t threads, size_t capacity)
    : thread_count_(std::max(1u, threads)), capacity_(std::max<size_t>(1, capacity)) {
    threads_.reserve(thread_count_);
    for (uint32_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this, i] { worker_loop(i); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ || queue_.size() + running_ >= capacity_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ && threads_.empty()) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

size_t WorkerPool::queued() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

size_t WorkerPool::running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

void WorkerPool::worker_loop(uint32_t index) {
    (void)set_current_thread_name("httpgate-w" + std::to_string(index));

    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // Stopping and nothing left
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            if (auto* logger = logging::get_logger()) {
                LOG_ERROR(logger, "Worker {} task failed: {}", index, e.what());
            }
        }

        std::lock_guard lock(mutex_);
        --running_;
    }
}

} // namespace httpgate::core
