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
#include "minitask/core/waker.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

namespace minitask {

namespace detail {

class BlockingWakeable final : public IWakeable
{
  public:
    void wake_by_ref() final
    {
        {
            std::scoped_lock lock{m_mutex};
            m_notified = true;
        }
        m_cv.notify_one();
    }

    void wait()
    {
        std::unique_lock lock{m_mutex};
        m_cv.wait(lock, [this] { return m_notified; });
        m_notified = false;
    }

  private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_notified{false};
};

}  // namespace detail

/**
 * @brief Drives a single future to completion on the calling thread, sleeping between polls until it is woken.
 */
template <typename FutureT>
    requires concepts::future<std::remove_cvref_t<FutureT>>
auto block_on(FutureT&& future) -> typename std::remove_cvref_t<FutureT>::output_type
{
    auto wakeable = std::make_shared<detail::BlockingWakeable>();
    Waker waker{wakeable};

    while (true)
    {
        Context cx{waker};
        auto poll = future.poll(cx);
        if (poll.is_ready())
        {
            return poll.take();
        }
        wakeable->wait();
    }
}

}  // namespace minitask
