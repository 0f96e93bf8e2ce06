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

#include "minitask/core/concepts/future.hpp"
#include "minitask/core/future.hpp"
#include "minitask/executor/join_handle.hpp"
#include "minitask/utils/macros.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace minitask {

namespace internal::executor {
class TaskQueue;
}  // namespace internal::executor

/**
 * Wake driven, single threaded executor.
 *
 * Spawned futures are wrapped in tasks and placed on a FIFO ready queue. run() pops one task at a time and polls it
 * exactly once with a Waker bound to that task. A task whose future returns pending is not re-queued by the
 * executor; it returns to the ready queue only when its Waker is woken, from any thread. Completed tasks are
 * discarded immediately and never polled again.
 *
 * run() returns once every spawned task has completed, unless Options::keep_alive is set, in which case it returns
 * only after shutdown() has been called.
 */
class Executor final
{
  public:
    struct Options
    {
        /// Description used to identify the executor thread in log messages.
        std::string description;
        /// When true, run() keeps waiting for new work after all tasks have completed until shutdown() is called.
        bool keep_alive{false};
    };

    Executor();
    explicit Executor(Options opts);

    DELETE_COPYABILITY(Executor);
    DELETE_MOVEABILITY(Executor);

    /**
     * @brief Shuts down the executor and releases the futures of any tasks that never completed.
     */
    ~Executor();

    /**
     * @brief Wraps a future in a new task and enqueues it; never blocks beyond the cost of a queue push. Callable from
     * any thread, including from within a task running on this executor.
     * @throw std::runtime_error If the executor has been shut down.
     * @return A handle to the output of the future; it may be discarded.
     */
    template <concepts::future FutureT>
    auto spawn(FutureT future) -> JoinHandle<typename FutureT::output_type>
    {
        auto [task, handle] = detail::make_spawned(std::move(future));
        spawn_task(std::move(task));
        return std::move(handle);
    }

    /**
     * @brief Drives spawned tasks on the calling thread until all of them have completed or shutdown() is called.
     * @throw std::logic_error If called from within a task, or while another thread is running this executor.
     */
    void run();

    /**
     * @brief Closes the ready queue. A blocked run() returns once the tasks already queued have been polled. Tasks
     * waiting on a wake are abandoned. Idempotent; callable from any thread.
     */
    void shutdown() noexcept;

    /**
     * @return The number of spawned tasks that have not completed.
     */
    auto size() const -> std::size_t;

    /**
     * @return True if every spawned task has completed.
     */
    auto empty() const -> bool
    {
        return size() == 0;
    }

    /**
     * @return The number of tasks currently waiting in the ready queue.
     */
    auto queue_size() const -> std::size_t;

    const std::string& description() const;

    /**
     * @return The executor whose run() is executing on the calling thread, otherwise nullptr.
     */
    static auto from_current_thread() noexcept -> Executor*;

  private:
    void spawn_task(std::unique_ptr<Future<void>> future);

    Options m_opts;
    std::shared_ptr<internal::executor::TaskQueue> m_queue;
    std::atomic<std::uint64_t> m_next_task_id{0};
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_shutdown_requested{false};

    static thread_local Executor* m_thread_local_executor;
};

}  // namespace minitask
