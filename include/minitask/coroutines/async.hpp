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
#include "minitask/core/context.hpp"
#include "minitask/core/future.hpp"
#include "minitask/core/poll.hpp"

#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace minitask {

template <typename ReturnT = void>
class Async;

namespace detail {

/**
 * @brief A co_await expression suspended on a pending future; re-polled by Async::poll before the coroutine resumes.
 */
struct PendingAwaiter
{
    virtual ~PendingAwaiter() = default;

    virtual auto repoll(Context& cx) -> PollStatus = 0;
};

template <concepts::future FutureT>
class FutureAwaiter;

struct AsyncPromiseBase
{
    AsyncPromiseBase() noexcept = default;
    ~AsyncPromiseBase()         = default;

    static auto initial_suspend() noexcept -> std::suspend_always
    {
        return {};
    }

    static auto final_suspend() noexcept -> std::suspend_always
    {
        return {};
    }

    auto unhandled_exception() noexcept -> void
    {
        m_exception_ptr = std::current_exception();
    }

    template <typename FutureT>
        requires concepts::future<std::remove_cvref_t<FutureT>>
    auto await_transform(FutureT&& future) -> FutureAwaiter<std::remove_cvref_t<FutureT>>
    {
        return FutureAwaiter<std::remove_cvref_t<FutureT>>{future, *this};
    }

    auto context() const -> Context&
    {
        if (m_context == nullptr)
        {
            throw std::logic_error("minitask::Async awaited a future outside of poll");
        }
        return *m_context;
    }

    Context* m_context{nullptr};
    PendingAwaiter* m_pending{nullptr};

  protected:
    void rethrow_if_failed() const
    {
        if (m_exception_ptr)
        {
            std::rethrow_exception(m_exception_ptr);
        }
    }

    std::exception_ptr m_exception_ptr{};
};

template <concepts::future FutureT>
class FutureAwaiter final : public PendingAwaiter
{
    using output_t = typename FutureT::output_type;

  public:
    FutureAwaiter(FutureT& future, AsyncPromiseBase& promise) noexcept : m_future(future), m_promise(promise) {}

    auto await_ready() -> bool
    {
        return repoll(m_promise.context()) == PollStatus::ready;
    }

    void await_suspend(std::coroutine_handle<> /*unused*/) noexcept
    {
        m_promise.m_pending = this;
    }

    auto await_resume() -> output_t
    {
        if (m_exception_ptr)
        {
            std::rethrow_exception(m_exception_ptr);
        }

        if constexpr (std::is_void_v<output_t>)
        {
            m_result.take();
        }
        else
        {
            return m_result.take();
        }
    }

    // failures are captured here and rethrown from await_resume so they surface at the co_await expression
    auto repoll(Context& cx) -> PollStatus final
    {
        try
        {
            m_result = m_future.poll(cx);
        } catch (...)
        {
            m_exception_ptr = std::current_exception();
            return PollStatus::ready;
        }
        return m_result.status();
    }

  private:
    FutureT& m_future;
    AsyncPromiseBase& m_promise;
    Poll<output_t> m_result;
    std::exception_ptr m_exception_ptr{};
};

template <typename ReturnT>
struct AsyncPromise final : public AsyncPromiseBase
{
    using coroutine_type = std::coroutine_handle<AsyncPromise<ReturnT>>;

    auto get_return_object() noexcept -> Async<ReturnT>;

    auto return_value(ReturnT value) -> void
    {
        m_return_value = std::move(value);
    }

    auto take_result() -> ReturnT
    {
        rethrow_if_failed();
        return std::move(*m_return_value);
    }

  private:
    std::optional<ReturnT> m_return_value;
};

template <>
struct AsyncPromise<void> final : public AsyncPromiseBase
{
    using coroutine_type = std::coroutine_handle<AsyncPromise<void>>;

    auto get_return_object() noexcept -> Async<void>;

    auto return_void() noexcept -> void {}

    auto take_result() -> void
    {
        rethrow_if_failed();
    }
};

}  // namespace detail

/**
 * @brief Coroutine that is itself a Future<ReturnT>.
 *
 * The body runs lazily, on the first poll. Within the body, `co_await f` polls any future f with the context of the
 * current poll; if f is pending the coroutine suspends and Async::poll returns pending. f has registered the waker of
 * the current poll, so the owning task is woken when f can make progress; the next Async::poll re-polls f and only
 * resumes the body once f is ready. Exceptions thrown by f are rethrown at the co_await expression; exceptions
 * escaping the body are rethrown from poll.
 */
template <typename ReturnT>
class [[nodiscard]] Async final : public Future<ReturnT>
{
  public:
    using promise_type   = detail::AsyncPromise<ReturnT>;
    using coroutine_type = std::coroutine_handle<promise_type>;

    Async() noexcept = default;

    explicit Async(coroutine_type handle) noexcept : m_coroutine(handle) {}
    Async(const Async&) = delete;
    Async(Async&& other) noexcept : m_coroutine(std::exchange(other.m_coroutine, nullptr)) {}

    ~Async() final
    {
        if (m_coroutine != nullptr)
        {
            m_coroutine.destroy();
        }
    }

    auto operator=(const Async&) -> Async& = delete;

    auto operator=(Async&& other) noexcept -> Async&
    {
        if (std::addressof(other) != this)
        {
            if (m_coroutine != nullptr)
            {
                m_coroutine.destroy();
            }

            m_coroutine = std::exchange(other.m_coroutine, nullptr);
        }

        return *this;
    }

    /**
     * @return True if the coroutine has run to completion or holds no coroutine.
     */
    auto is_ready() const noexcept -> bool
    {
        return m_coroutine == nullptr || m_coroutine.done();
    }

    [[nodiscard]] auto poll(Context& cx) -> Poll<ReturnT> final
    {
        if (is_ready())
        {
            throw std::logic_error("minitask::Async polled after completion");
        }

        auto& promise = m_coroutine.promise();

        if (promise.m_pending != nullptr)
        {
            if (promise.m_pending->repoll(cx) == PollStatus::pending)
            {
                return Poll<ReturnT>::pending();
            }
            promise.m_pending = nullptr;
        }

        promise.m_context = &cx;
        m_coroutine.resume();
        promise.m_context = nullptr;

        if (!m_coroutine.done())
        {
            return Poll<ReturnT>::pending();
        }

        if constexpr (std::is_void_v<ReturnT>)
        {
            promise.take_result();
            return Poll<void>::ready();
        }
        else
        {
            return Poll<ReturnT>::ready(promise.take_result());
        }
    }

  private:
    coroutine_type m_coroutine{nullptr};
};

namespace detail {
template <typename ReturnT>
inline auto AsyncPromise<ReturnT>::get_return_object() noexcept -> Async<ReturnT>
{
    return Async<ReturnT>{coroutine_type::from_promise(*this)};
}

inline auto AsyncPromise<void>::get_return_object() noexcept -> Async<>
{
    return Async<>{coroutine_type::from_promise(*this)};
}

}  // namespace detail

}  // namespace minitask
