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

#include "minitask/executor/round_robin.hpp"

#include "minitask/core/context.hpp"
#include "minitask/core/thread.hpp"
#include "minitask/core/waker.hpp"

#include <glog/logging.h>

#include <exception>

namespace minitask {

auto RoundRobinExecutor::run_once() -> std::size_t
{
    const auto waker = Waker::noop();
    auto remaining   = m_tasks.size();

    while (remaining-- > 0)
    {
        auto task = std::move(m_tasks.front());
        m_tasks.pop_front();

        Context cx{waker};

        try
        {
            if (task->poll(cx).is_pending())
            {
                m_tasks.emplace_back(std::move(task));
            }
        } catch (const std::exception& e)
        {
            LOG(ERROR) << this_thread::get_id() << ": round robin task aborted: " << e.what();
        } catch (...)
        {
            LOG(ERROR) << this_thread::get_id() << ": round robin task aborted: unknown exception";
        }
    }

    return m_tasks.size();
}

void RoundRobinExecutor::run()
{
    while (run_once() > 0) {}
}

}  // namespace minitask
