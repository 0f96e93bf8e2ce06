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

#include "minitask/time/delay.hpp"

#include "minitask/core/thread.hpp"

#include <glog/logging.h>

#include <atomic>
#include <exception>
#include <stdexcept>
#include <utility>

namespace minitask::time {

namespace {

std::atomic<std::size_t> s_threads_spawned{0};
std::atomic<std::size_t> s_threads_running{0};
thread_local bool s_is_timer_thread{false};

}  // namespace

Delay::Delay(clock_type::time_point deadline) : m_deadline(deadline) {}

Delay::Delay(Delay&& other) noexcept :
  m_deadline(other.m_deadline),
  m_state(std::exchange(other.m_state, State::resolved)),
  m_slot(std::move(other.m_slot)),
  m_thread(std::move(other.m_thread))
{}

Delay& Delay::operator=(Delay&& other) noexcept
{
    if (this != &other)
    {
        detach_if_timer_thread();

        m_deadline = other.m_deadline;
        m_state    = std::exchange(other.m_state, State::resolved);
        m_slot     = std::move(other.m_slot);
        m_thread   = std::move(other.m_thread);
    }
    return *this;
}

Delay::~Delay()
{
    detach_if_timer_thread();
}

void Delay::detach_if_timer_thread() noexcept
{
    // the last reference to a task may be released from a timing thread; never join ourselves
    if (m_thread.joinable() && m_thread.get_id() == std::this_thread::get_id())
    {
        m_thread.detach();
    }
}

auto Delay::poll(Context& cx) -> Poll<void>
{
    switch (m_state)
    {
    case State::resolved:
        throw std::logic_error("minitask::time::Delay polled after completion");

    case State::unarmed:
        if (clock_type::now() >= m_deadline)
        {
            m_state = State::resolved;
            return Poll<void>::ready();
        }
        arm(cx.waker());
        return Poll<void>::pending();

    case State::armed:
        {
            std::scoped_lock lock{m_slot->mutex};
            if (!m_slot->waker.will_wake(cx.waker()))
            {
                DVLOG(10) << this_thread::get_id() << ": delay " << this << " replacing stored waker";
                m_slot->waker = cx.waker();
            }
        }

        if (clock_type::now() >= m_deadline)
        {
            m_state = State::resolved;
            return Poll<void>::ready();
        }
        return Poll<void>::pending();
    }

    throw std::logic_error("minitask::time::Delay in an unknown state");
}

void Delay::arm(const Waker& waker)
{
    m_slot        = std::make_shared<WakerSlot>();
    m_slot->waker = waker;
    m_state       = State::armed;

    s_threads_spawned.fetch_add(1, std::memory_order::relaxed);
    s_threads_running.fetch_add(1, std::memory_order::release);

    DVLOG(10) << this_thread::get_id() << ": delay " << this << " armed; spawning timing thread";

    m_thread = std::jthread([deadline = m_deadline, slot = m_slot](std::stop_token st) {
        timer_thread(std::move(st), deadline, std::move(slot));
    });
}

void Delay::timer_thread(std::stop_token stop_token, clock_type::time_point deadline, std::shared_ptr<WakerSlot> slot)
{
    s_is_timer_thread = true;

    Waker waker;
    {
        std::unique_lock lock{slot->mutex};

        // wait on the absolute deadline so late scheduling of this thread does not extend the delay
        slot->cv.wait_until(lock, stop_token, deadline, [] { return false; });

        if (stop_token.stop_requested())
        {
            DVLOG(10) << this_thread::get_id() << ": delay dropped before its deadline";
            s_threads_running.fetch_sub(1, std::memory_order::release);
            return;
        }

        // always invoke the most recently stored waker, never a copy taken at spawn time
        waker = slot->waker;
    }

    try
    {
        waker.wake();
    } catch (const std::exception& e)
    {
        LOG(ERROR) << this_thread::get_id() << ": failed to wake task on delay expiration: " << e.what();
    }

    s_threads_running.fetch_sub(1, std::memory_order::release);
}

auto Delay::threads_spawned() noexcept -> std::size_t
{
    return s_threads_spawned.load(std::memory_order::acquire);
}

auto Delay::threads_running() noexcept -> std::size_t
{
    return s_threads_running.load(std::memory_order::acquire);
}

auto Delay::is_timer_thread() noexcept -> bool
{
    return s_is_timer_thread;
}

}  // namespace minitask::time
