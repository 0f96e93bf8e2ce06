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

#include <optional>
#include <stdexcept>
#include <utility>

namespace minitask {

enum class PollStatus
{
    /// The future produced its output.
    ready,
    /// The future cannot make progress; it has arranged for its waker to be woken.
    pending
};

/**
 * @brief Outcome of a single call to Future<T>::poll
 */
template <typename T>
class Poll
{
  public:
    using value_type = T;

    static auto ready(T value) -> Poll
    {
        return Poll{std::move(value)};
    }

    static auto pending() noexcept -> Poll
    {
        return Poll{};
    }

    Poll() = default;

    auto status() const noexcept -> PollStatus
    {
        return m_value.has_value() ? PollStatus::ready : PollStatus::pending;
    }

    auto is_ready() const noexcept -> bool
    {
        return m_value.has_value();
    }

    auto is_pending() const noexcept -> bool
    {
        return !m_value.has_value();
    }

    auto value() & -> T&
    {
        check_ready();
        return *m_value;
    }

    auto value() const& -> const T&
    {
        check_ready();
        return *m_value;
    }

    /**
     * @brief Moves the output out of a ready poll; the Poll is left pending.
     */
    auto take() -> T
    {
        check_ready();
        T value = std::move(*m_value);
        m_value.reset();
        return value;
    }

  private:
    explicit Poll(T&& value) : m_value(std::move(value)) {}

    void check_ready() const
    {
        if (!m_value.has_value())
        {
            throw std::logic_error("minitask::Poll: value requested from a pending poll");
        }
    }

    std::optional<T> m_value;
};

template <>
class Poll<void>
{
  public:
    using value_type = void;

    static auto ready() noexcept -> Poll
    {
        return Poll{true};
    }

    static auto pending() noexcept -> Poll
    {
        return Poll{false};
    }

    Poll() = default;

    auto status() const noexcept -> PollStatus
    {
        return m_ready ? PollStatus::ready : PollStatus::pending;
    }

    auto is_ready() const noexcept -> bool
    {
        return m_ready;
    }

    auto is_pending() const noexcept -> bool
    {
        return !m_ready;
    }

    void take()
    {
        if (!m_ready)
        {
            throw std::logic_error("minitask::Poll: value requested from a pending poll");
        }
        m_ready = false;
    }

  private:
    explicit Poll(bool ready) noexcept : m_ready(ready) {}

    bool m_ready{false};
};

}  // namespace minitask
