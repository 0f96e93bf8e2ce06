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

#include "minitask/core/future.hpp"
#include "minitask/core/waker.hpp"
#include "minitask/utils/macros.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace minitask::time {

using clock_type = std::chrono::steady_clock;

/**
 * @brief Future that resolves once a deadline has passed.
 *
 * The first poll before the deadline stores the context's waker and spawns a single timing thread which waits until
 * the deadline and then wakes whichever waker is stored at that moment. Subsequent polls replace the stored waker if
 * the task driving this Delay has changed. A deadline that has already passed resolves on the first poll without
 * spawning a thread.
 *
 * Destroying a Delay stops and joins its timing thread. A moved-from Delay is resolved; polling it throws.
 */
class Delay final : public Future<void>
{
  public:
    enum class State
    {
        unarmed,
        armed,
        resolved
    };

    explicit Delay(clock_type::time_point deadline);
    ~Delay() final;

    Delay(Delay&& other) noexcept;
    Delay& operator=(Delay&& other) noexcept;

    DELETE_COPYABILITY(Delay);

    [[nodiscard]] auto poll(Context& cx) -> Poll<void> final;

    auto deadline() const noexcept -> clock_type::time_point
    {
        return m_deadline;
    }

    auto state() const noexcept -> State
    {
        return m_state;
    }

    /**
     * @return total number of timing threads spawned by all Delay instances in this process
     */
    static auto threads_spawned() noexcept -> std::size_t;

    /**
     * @return number of timing threads currently alive
     */
    static auto threads_running() noexcept -> std::size_t;

    /**
     * @return true if the calling thread is a Delay timing thread
     */
    static auto is_timer_thread() noexcept -> bool;

  private:
    struct WakerSlot
    {
        std::mutex mutex;
        std::condition_variable_any cv;
        Waker waker;
    };

    void arm(const Waker& waker);
    void detach_if_timer_thread() noexcept;

    static void timer_thread(std::stop_token stop_token,
                             clock_type::time_point deadline,
                             std::shared_ptr<WakerSlot> slot);

    clock_type::time_point m_deadline;
    State m_state{State::unarmed};
    std::shared_ptr<WakerSlot> m_slot;
    std::jthread m_thread;
};

inline auto sleep_until(clock_type::time_point deadline) -> Delay
{
    return Delay{deadline};
}

template <typename RepT, typename PeriodT>
auto sleep_for(std::chrono::duration<RepT, PeriodT> duration) -> Delay
{
    return Delay{clock_type::now() + std::chrono::duration_cast<clock_type::duration>(duration)};
}

}  // namespace minitask::time
