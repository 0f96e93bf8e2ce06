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

#include <cstddef>
#include <deque>
#include <memory>
#include <utility>

namespace minitask {

/**
 * Simplified busy-polling executor.
 *
 * Tasks are held in an ordered list. Each pass pops the front task, polls it with Waker::noop() and pushes it to the
 * back if it is still pending. Progress relies on futures observing external state change (e.g. time passing) on a
 * later pass rather than on notifications, so every outstanding task is polled once per pass whether or not it can
 * make progress.
 *
 * Not thread safe: spawn and run must be called from the same thread. Tasks spawned during a pass are first polled
 * on the next pass.
 */
class RoundRobinExecutor final
{
  public:
    RoundRobinExecutor()  = default;
    ~RoundRobinExecutor() = default;

    DELETE_COPYABILITY(RoundRobinExecutor);
    DELETE_MOVEABILITY(RoundRobinExecutor);

    template <concepts::future FutureT>
    auto spawn(FutureT future) -> JoinHandle<typename FutureT::output_type>
    {
        auto [task, handle] = detail::make_spawned(std::move(future));
        m_tasks.emplace_back(std::move(task));
        return std::move(handle);
    }

    /**
     * @brief Polls every task that was outstanding at the start of the pass exactly once, in FIFO order.
     * @return The number of tasks still outstanding after the pass.
     */
    auto run_once() -> std::size_t;

    /**
     * @brief Repeats passes until every task has completed.
     */
    void run();

    auto size() const noexcept -> std::size_t
    {
        return m_tasks.size();
    }

    auto empty() const noexcept -> bool
    {
        return m_tasks.empty();
    }

  private:
    std::deque<std::unique_ptr<Future<void>>> m_tasks;
};

}  // namespace minitask
