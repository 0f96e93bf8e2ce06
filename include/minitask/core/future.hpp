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

#include "minitask/core/context.hpp"
#include "minitask/core/poll.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace minitask {

/**
 * @brief A suspendable computation producing a value of type T.
 *
 * poll() advances the computation as far as it can. If it returns pending, the implementation (or an inner future it
 * delegates to) must have arranged for cx.waker() to be woken once polling again could make progress; otherwise the
 * owning task is never scheduled again.
 *
 * Futures are not thread safe; the runtime never polls the same future from two threads at once. Polling a future
 * after it has returned ready is a programmer error.
 */
template <typename T>
class Future
{
  public:
    using output_type = T;

    virtual ~Future() = default;

    [[nodiscard]] virtual auto poll(Context& cx) -> Poll<T> = 0;
};

/**
 * @brief Adapts a callable with the signature `Poll<T>(Context&)` into a Future<T>
 */
template <typename FunctionT>
class PollFn final : public Future<typename std::invoke_result_t<FunctionT&, Context&>::value_type>
{
  public:
    using output_type = typename std::invoke_result_t<FunctionT&, Context&>::value_type;

    explicit PollFn(FunctionT function) : m_function(std::move(function)) {}

    [[nodiscard]] auto poll(Context& cx) -> Poll<output_type> final
    {
        return m_function(cx);
    }

  private:
    FunctionT m_function;
};

template <typename FunctionT>
auto poll_fn(FunctionT&& function) -> PollFn<std::decay_t<FunctionT>>
{
    return PollFn<std::decay_t<FunctionT>>{std::forward<FunctionT>(function)};
}

/**
 * @brief Returns pending exactly once, waking itself before doing so, then resolves.
 *
 * Awaiting yield_now() inside a long running computation gives other ready tasks a chance to run.
 */
class YieldNow final : public Future<void>
{
  public:
    [[nodiscard]] auto poll(Context& cx) -> Poll<void> final
    {
        if (m_resolved)
        {
            throw std::logic_error("minitask::YieldNow polled after completion");
        }

        if (!m_yielded)
        {
            m_yielded = true;
            cx.waker().wake();
            return Poll<void>::pending();
        }

        m_resolved = true;
        return Poll<void>::ready();
    }

  private:
    bool m_yielded{false};
    bool m_resolved{false};
};

inline auto yield_now() -> YieldNow
{
    return YieldNow{};
}

}  // namespace minitask
