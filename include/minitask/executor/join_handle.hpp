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
#include "minitask/core/waker.hpp"

#include <tl/expected.hpp>

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace minitask {

template <typename T>
using TaskResult = tl::expected<T, std::exception_ptr>;

namespace detail {

/**
 * @brief State shared between a spawned task and the JoinHandle returned to the caller of spawn.
 */
template <typename T>
class JoinState final
{
  public:
    void complete(TaskResult<T>&& result)
    {
        Waker waiter;
        {
            std::scoped_lock lock{m_mutex};
            m_result = std::move(result);
            std::swap(waiter, m_waiter);
        }
        waiter.wake();
    }

    auto poll(Context& cx) -> Poll<TaskResult<T>>
    {
        std::scoped_lock lock{m_mutex};

        if (m_consumed)
        {
            throw std::logic_error("minitask::JoinHandle polled after completion");
        }

        if (!m_result)
        {
            if (!m_waiter.will_wake(cx.waker()))
            {
                m_waiter = cx.waker();
            }
            return Poll<TaskResult<T>>::pending();
        }

        m_consumed = true;
        return Poll<TaskResult<T>>::ready(std::move(*m_result));
    }

    auto is_ready() const -> bool
    {
        std::scoped_lock lock{m_mutex};
        return m_result.has_value() && !m_consumed;
    }

    auto result() -> TaskResult<T>&
    {
        std::scoped_lock lock{m_mutex};

        if (!m_result || m_consumed)
        {
            throw std::logic_error("minitask::JoinHandle result requested before the task completed");
        }
        return *m_result;
    }

  private:
    mutable std::mutex m_mutex;
    std::optional<TaskResult<T>> m_result;
    Waker m_waiter;
    bool m_consumed{false};
};

/**
 * @brief Top-level future driven by an executor task; forwards the output (or failure) of the user's future to the
 * JoinState. Failures are rethrown so the executor reports the task as aborted.
 */
template <concepts::future FutureT>
class Spawned final : public Future<void>
{
    using output_t = typename FutureT::output_type;

  public:
    Spawned(FutureT future, std::shared_ptr<JoinState<output_t>> state) :
      m_future(std::move(future)),
      m_state(std::move(state))
    {}

    [[nodiscard]] auto poll(Context& cx) -> Poll<void> final
    {
        try
        {
            auto poll = m_future.poll(cx);
            if (poll.is_pending())
            {
                return Poll<void>::pending();
            }

            if constexpr (std::is_void_v<output_t>)
            {
                poll.take();
                m_state->complete(TaskResult<void>{});
            }
            else
            {
                m_state->complete(TaskResult<output_t>{poll.take()});
            }
        } catch (...)
        {
            m_state->complete(tl::make_unexpected(std::current_exception()));
            throw;
        }

        return Poll<void>::ready();
    }

  private:
    FutureT m_future;
    std::shared_ptr<JoinState<output_t>> m_state;
};

}  // namespace detail

/**
 * @brief Handle to the output of a spawned future.
 *
 * A JoinHandle is itself a future that resolves with TaskResult<T>: the value produced by the spawned future, or the
 * exception that aborted it. After the executor has finished, the result can also be inspected with is_ready() and
 * result(). Dropping a JoinHandle does not affect the task.
 */
template <typename T>
class JoinHandle final : public Future<TaskResult<T>>
{
  public:
    explicit JoinHandle(std::shared_ptr<detail::JoinState<T>> state) : m_state(std::move(state)) {}

    [[nodiscard]] auto poll(Context& cx) -> Poll<TaskResult<T>> final
    {
        return m_state->poll(cx);
    }

    auto is_ready() const -> bool
    {
        return m_state->is_ready();
    }

    /**
     * @throw std::logic_error if the task has not completed or the result was already consumed by polling
     */
    auto result() -> TaskResult<T>&
    {
        return m_state->result();
    }

  private:
    std::shared_ptr<detail::JoinState<T>> m_state;
};

namespace detail {

template <concepts::future FutureT>
auto make_spawned(FutureT future)
    -> std::pair<std::unique_ptr<Future<void>>, JoinHandle<typename FutureT::output_type>>
{
    using output_t = typename FutureT::output_type;

    auto state = std::make_shared<JoinState<output_t>>();
    std::unique_ptr<Future<void>> spawned = std::make_unique<Spawned<FutureT>>(std::move(future), state);

    return {std::move(spawned), JoinHandle<output_t>{std::move(state)}};
}

}  // namespace detail

}  // namespace minitask
