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

#include <memory>
#include <utility>

namespace minitask {

/**
 * @brief Target of a Waker. Implementations must tolerate wake_by_ref being called any number of times,
 * concurrently, from any thread.
 */
struct IWakeable
{
    virtual ~IWakeable() = default;

    virtual void wake_by_ref() = 0;
};

/**
 * @brief Cloneable, thread-safe handle used by a pending future to request that it be polled again.
 *
 * Copying a Waker is the clone operation; all copies share the same target. The default constructed Waker and
 * Waker::noop() do nothing when woken and are only meaningful to executors that re-poll unconditionally.
 */
class Waker
{
  public:
    Waker() = default;
    explicit Waker(std::shared_ptr<IWakeable> target) noexcept : m_target(std::move(target)) {}

    /**
     * @brief A waker whose wake() is a no-op; all noop wakers wake the same (empty) target.
     */
    static auto noop() noexcept -> Waker
    {
        return Waker{};
    }

    /**
     * @brief Signals the target that progress may be possible. Never blocks beyond the cost of an enqueue.
     */
    void wake() const
    {
        if (m_target)
        {
            m_target->wake_by_ref();
        }
    }

    /**
     * @return true if this waker and other wake the same target
     */
    auto will_wake(const Waker& other) const noexcept -> bool
    {
        return m_target == other.m_target;
    }

    auto is_noop() const noexcept -> bool
    {
        return m_target == nullptr;
    }

  private:
    std::shared_ptr<IWakeable> m_target;
};

}  // namespace minitask
