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

#include "internal/executor/task.hpp"

#include "internal/executor/task_queue.hpp"

#include "minitask/core/context.hpp"
#include "minitask/core/thread.hpp"

#include <glog/logging.h>

#include <exception>
#include <string>
#include <utility>

namespace minitask::internal::executor {

namespace {

std::string describe(std::exception_ptr ptr)
{
    try
    {
        std::rethrow_exception(std::move(ptr));
    } catch (const std::exception& e)
    {
        return e.what();
    } catch (...)
    {
        return "unknown exception";
    }
}

}  // namespace

Task::Task(std::uint64_t id, std::unique_ptr<Future<void>> future, std::shared_ptr<TaskQueue> queue) :
  m_id(id),
  m_queue(std::move(queue)),
  m_future(std::move(future))
{
    CHECK(m_queue);
    CHECK(m_future);
}

void Task::wake_by_ref()
{
    schedule();
}

void Task::schedule()
{
    auto state = m_state.load(std::memory_order::acquire);

    while (true)
    {
        switch (state)
        {
        case State::idle:
            if (m_state.compare_exchange_weak(
                    state, State::scheduled, std::memory_order::acq_rel, std::memory_order::acquire))
            {
                enqueue();
                return;
            }
            break;

        case State::running:
            if (m_state.compare_exchange_weak(
                    state, State::notified, std::memory_order::acq_rel, std::memory_order::acquire))
            {
                DVLOG(10) << this_thread::get_id() << ": task " << m_id << " woken while running";
                return;
            }
            break;

        case State::scheduled:
        case State::notified:
        case State::complete:
            return;
        }
    }
}

auto Task::run() -> PollStatus
{
    auto previous = m_state.exchange(State::running, std::memory_order::acq_rel);
    if (previous == State::complete)
    {
        m_state.store(State::complete, std::memory_order::release);
        return PollStatus::ready;
    }
    DCHECK(previous == State::scheduled) << "task " << m_id << " popped in an unexpected state";

    auto status = PollStatus::ready;

    {
        std::scoped_lock lock{m_future_mutex};

        if (m_future)
        {
            Waker waker{shared_from_this()};
            Context cx{waker};

            try
            {
                status = m_future->poll(cx).status();
            } catch (...)
            {
                LOG(ERROR) << this_thread::get_id() << ": task " << m_id
                           << " aborted: " << describe(std::current_exception());
                status = PollStatus::ready;
            }

            if (status == PollStatus::ready)
            {
                // release the future on the executor thread; it may hold wakers referencing this task
                m_future.reset();
            }
        }
    }

    if (status == PollStatus::ready)
    {
        complete();
        return PollStatus::ready;
    }

    auto expected = State::running;
    if (!m_state.compare_exchange_strong(expected, State::idle, std::memory_order::acq_rel, std::memory_order::acquire))
    {
        // woken during the poll
        DCHECK(expected == State::notified);
        m_state.store(State::scheduled, std::memory_order::release);
        enqueue();
    }

    return PollStatus::pending;
}

void Task::release()
{
    m_state.store(State::complete, std::memory_order::release);

    std::unique_ptr<Future<void>> future;
    {
        std::scoped_lock lock{m_future_mutex};
        future = std::move(m_future);
    }

    // destroyed outside of the lock; dropping a future may join timing threads that are waking this task
    future.reset();
}

void Task::enqueue()
{
    auto status = m_queue->push(shared_from_this());
    if (status != Status::success)
    {
        DVLOG(10) << this_thread::get_id() << ": task " << m_id << " not scheduled; ready queue is closed";
    }
}

void Task::complete()
{
    m_state.store(State::complete, std::memory_order::release);
    m_queue->complete_task(shared_from_this());
}

}  // namespace minitask::internal::executor
