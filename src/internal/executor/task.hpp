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

#include "minitask/core/future.hpp"
#include "minitask/core/poll.hpp"
#include "minitask/core/waker.hpp"
#include "minitask/utils/macros.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace minitask::internal::executor {

class TaskQueue;

/**
 * @brief Executor owned wrapper around one top-level future.
 *
 * A Task is shared between the executor's registry, the ready queue while it is scheduled, and every Waker created
 * for it. Waking a Task pushes it onto the ready queue; an atomic scheduling state guarantees that a Task is queued
 * at most once at a time and that a wake arriving while the Task is being polled results in exactly one re-poll
 * after the current poll finishes. The wrapped future is additionally guarded by a mutex so that it is never polled
 * by two threads at once.
 */
class Task final : public IWakeable, public std::enable_shared_from_this<Task>
{
  public:
    enum class State : std::uint8_t
    {
        /// Pending and not in the ready queue; waiting for a wake.
        idle,
        /// In the ready queue.
        scheduled,
        /// Being polled by the executor.
        running,
        /// Woken while running; will be re-queued once the current poll returns.
        notified,
        /// Resolved, failed or released; wakes are ignored.
        complete
    };

    Task(std::uint64_t id, std::unique_ptr<Future<void>> future, std::shared_ptr<TaskQueue> queue);
    ~Task() final = default;

    DELETE_COPYABILITY(Task);
    DELETE_MOVEABILITY(Task);

    /**
     * @brief Wake protocol entry point; equivalent to schedule().
     */
    void wake_by_ref() final;

    /**
     * @brief Moves an idle Task onto the ready queue; absorbed if already scheduled, running or complete.
     */
    void schedule();

    /**
     * @brief Polls the wrapped future exactly once with a Waker bound to this Task.
     *
     * Must only be called by the executor with a Task it has just popped from the ready queue. Exceptions thrown by
     * the future are logged and complete the Task.
     *
     * @return PollStatus::ready if the Task completed
     */
    auto run() -> PollStatus;

    /**
     * @brief Drops the wrapped future without completing it; used when an executor is torn down.
     */
    void release();

    auto id() const noexcept -> std::uint64_t
    {
        return m_id;
    }

    auto state() const noexcept -> State
    {
        return m_state.load(std::memory_order::acquire);
    }

  private:
    void enqueue();
    void complete();

    const std::uint64_t m_id;
    std::shared_ptr<TaskQueue> m_queue;

    std::mutex m_future_mutex;
    std::unique_ptr<Future<void>> m_future;

    std::atomic<State> m_state{State::idle};
};

}  // namespace minitask::internal::executor
