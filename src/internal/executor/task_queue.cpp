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

#include "internal/executor/task_queue.hpp"

#include "internal/executor/task.hpp"

#include <glog/logging.h>

#include <utility>

namespace minitask::internal::executor {

TaskQueue::TaskQueue(bool keep_alive) : m_keep_alive(keep_alive) {}

auto TaskQueue::push(std::shared_ptr<Task> task) -> Status
{
    CHECK(task);

    {
        std::scoped_lock lock{m_mutex};
        if (m_closed)
        {
            return Status::closed;
        }
        m_queue.emplace_back(std::move(task));
    }

    m_cv.notify_one();
    return Status::success;
}

auto TaskQueue::pop() -> tl::expected<std::shared_ptr<Task>, Status>
{
    std::unique_lock lock{m_mutex};

    m_cv.wait(lock, [this] { return !m_queue.empty() || m_closed || (!m_keep_alive && m_tasks.empty()); });

    if (!m_queue.empty())
    {
        auto task = std::move(m_queue.front());
        m_queue.pop_front();
        return task;
    }

    if (m_closed)
    {
        return tl::make_unexpected(Status::closed);
    }

    return tl::make_unexpected(Status::drained);
}

auto TaskQueue::register_task(std::shared_ptr<Task> task) -> Status
{
    CHECK(task);

    std::scoped_lock lock{m_mutex};
    if (m_closed)
    {
        return Status::closed;
    }
    m_tasks.insert(std::move(task));
    return Status::success;
}

void TaskQueue::complete_task(const std::shared_ptr<Task>& task)
{
    bool drained = false;

    {
        std::scoped_lock lock{m_mutex};
        m_tasks.erase(task);
        drained = m_tasks.empty();
    }

    if (drained)
    {
        m_cv.notify_all();
    }
}

void TaskQueue::close() noexcept
{
    {
        std::scoped_lock lock{m_mutex};
        m_closed = true;
    }
    m_cv.notify_all();
}

auto TaskQueue::drain() -> std::vector<std::shared_ptr<Task>>
{
    std::deque<std::shared_ptr<Task>> queued;
    std::unordered_set<std::shared_ptr<Task>> registered;

    {
        std::scoped_lock lock{m_mutex};
        queued.swap(m_queue);
        registered.swap(m_tasks);
    }

    // queued entries are always registered as well; the registry alone is the set of incomplete tasks
    queued.clear();

    return {registered.begin(), registered.end()};
}

auto TaskQueue::size() const -> std::size_t
{
    std::scoped_lock lock{m_mutex};
    return m_tasks.size();
}

auto TaskQueue::queue_size() const -> std::size_t
{
    std::scoped_lock lock{m_mutex};
    return m_queue.size();
}

}  // namespace minitask::internal::executor
