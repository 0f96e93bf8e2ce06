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

#include "minitask/executor/executor.hpp"

#include "internal/executor/task.hpp"
#include "internal/executor/task_queue.hpp"

#include "minitask/core/thread.hpp"

#include <glog/logging.h>

#include <sstream>
#include <stdexcept>
#include <utility>

namespace minitask {

thread_local Executor* Executor::m_thread_local_executor{nullptr};

Executor::Executor() : Executor(Options{}) {}

Executor::Executor(Options opts) : m_opts(std::move(opts))
{
    if (m_opts.description.empty())
    {
        std::stringstream ss;
        ss << "executor_" << this;
        m_opts.description = ss.str();
    }

    m_queue = std::make_shared<internal::executor::TaskQueue>(m_opts.keep_alive);
}

Executor::~Executor()
{
    shutdown();

    auto abandoned = m_queue->drain();
    if (!abandoned.empty())
    {
        LOG(WARNING) << m_opts.description << ": destroyed with " << abandoned.size() << " incomplete task(s)";
    }

    for (auto& task : abandoned)
    {
        task->release();
    }
}

void Executor::spawn_task(std::unique_ptr<Future<void>> future)
{
    if (m_shutdown_requested.load(std::memory_order::acquire))
    {
        throw std::runtime_error("minitask::Executor is shutting down, unable to spawn new tasks.");
    }

    auto id   = m_next_task_id.fetch_add(1, std::memory_order::relaxed);
    auto task = std::make_shared<internal::executor::Task>(id, std::move(future), m_queue);

    if (m_queue->register_task(task) != internal::executor::Status::success)
    {
        throw std::runtime_error("minitask::Executor is shutting down, unable to spawn new tasks.");
    }

    DVLOG(10) << this_thread::get_id() << ": spawned task " << id << " on " << m_opts.description;
    task->schedule();
}

void Executor::run()
{
    if (m_thread_local_executor != nullptr)
    {
        throw std::logic_error("minitask::Executor::run called from within a running executor");
    }

    if (m_running.exchange(true, std::memory_order::acq_rel))
    {
        throw std::logic_error("minitask::Executor::run called while " + m_opts.description + " is already running");
    }

    struct RunScope
    {
        RunScope(Executor* self) : m_self(self)
        {
            m_thread_local_executor = self;
        }
        ~RunScope()
        {
            m_thread_local_executor = nullptr;
            m_self->m_running.store(false, std::memory_order::release);
        }
        Executor* m_self;
    } scope{this};

    DVLOG(10) << this_thread::get_id() << ": running";

    while (true)
    {
        auto task = m_queue->pop();
        if (!task)
        {
            DVLOG(10) << this_thread::get_id() << ": ready queue "
                      << (task.error() == internal::executor::Status::closed ? "closed" : "drained");
            break;
        }

        auto status = (*task)->run();
        DVLOG(20) << this_thread::get_id() << ": task " << (*task)->id() << " polled; "
                  << (status == PollStatus::ready ? "complete" : "pending");
    }
}

void Executor::shutdown() noexcept
{
    // Only allow shutdown to occur once.
    if (!m_shutdown_requested.exchange(true, std::memory_order::acq_rel))
    {
        DVLOG(10) << this_thread::get_id() << ": shutting down " << m_opts.description;
        m_queue->close();
    }
}

auto Executor::size() const -> std::size_t
{
    return m_queue->size();
}

auto Executor::queue_size() const -> std::size_t
{
    return m_queue->queue_size();
}

const std::string& Executor::description() const
{
    return m_opts.description;
}

auto Executor::from_current_thread() noexcept -> Executor*
{
    return m_thread_local_executor;
}

}  // namespace minitask
