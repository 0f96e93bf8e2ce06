/**
 * SPDX-FileCopyrightText: Copyright (c) 2022, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include "minitask/utils/macros.hpp"

#include <tl/expected.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace minitask::internal::executor {

class Task;

enum class Status
{
    success,
    /// The queue has been closed by Executor::shutdown().
    closed,
    /// Every registered task has completed and the queue does not keep the executor alive.
    drained
};

/**
 * @brief Multi-producer ready queue shared by an Executor and all of its Tasks.
 *
 * Besides the FIFO of tasks eligible to be polled, the TaskQueue owns the registry of incomplete tasks. The registry
 * decides when Executor::run() may return: once it is empty and the queue is not configured to keep the executor
 * alive, pop() reports Status::drained.
 */
class TaskQueue final
{
  public:
    explicit TaskQueue(bool keep_alive);
    ~TaskQueue() = default;

    DELETE_COPYABILITY(TaskQueue);
    DELETE_MOVEABILITY(TaskQueue);

    /**
     * @brief Enqueue a task that is ready to be polled; callable from any thread.
     * @return Status::closed if the queue has been closed, the task is not enqueued
     */
    auto push(std::shared_ptr<Task> task) -> Status;

    /**
     * @brief Blocks until a task is available, the queue is closed or the queue is drained.
     */
    auto pop() -> tl::expected<std::shared_ptr<Task>, Status>;

    /**
     * @brief Adds a freshly spawned task to the registry of incomplete tasks.
     * @return Status::closed if the queue has been closed, the task is not registered
     */
    auto register_task(std::shared_ptr<Task> task) -> Status;

    /**
     * @brief Removes a completed task from the registry; wakes the consumer if this was the last one.
     */
    void complete_task(const std::shared_ptr<Task>& task);

    /**
     * @brief Closes the queue; subsequent pushes and registrations are rejected. Idempotent.
     */
    void close() noexcept;

    /**
     * @brief Empties the ready queue and the registry, returning every task that never completed.
     */
    auto drain() -> std::vector<std::shared_ptr<Task>>;

    /**
     * @return The number of registered tasks that have not completed.
     */
    auto size() const -> std::size_t;

    /**
     * @return The number of tasks waiting in the ready queue.
     */
    auto queue_size() const -> std::size_t;

  private:
    const bool m_keep_alive;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::shared_ptr<Task>> m_queue;
    std::unordered_set<std::shared_ptr<Task>> m_tasks;
    bool m_closed{false};
};

}  // namespace minitask::internal::executor
