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

#include "minitask/core/context.hpp"
#include "minitask/core/future.hpp"
#include "minitask/coroutines/async.hpp"
#include "minitask/executor/executor.hpp"
#include "minitask/time/delay.hpp"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace minitask;
using namespace std::chrono_literals;

class TestExecutor : public ::testing::Test
{};

namespace {

auto sleep_then_done(time::clock_type::duration duration) -> Async<std::string>
{
    co_await time::sleep_for(duration);
    co_return "done";
}

auto sleep_then_throw(time::clock_type::duration duration) -> Async<int>
{
    co_await time::sleep_for(duration);
    throw std::runtime_error("task failed");
}

auto sleep_then_value(time::clock_type::duration duration, int value) -> Async<int>
{
    co_await time::sleep_for(duration);
    co_return value;
}

auto yielding(std::string name, std::vector<std::string>& log) -> Async<>
{
    for (int i = 0; i < 3; i++)
    {
        log.push_back(name + std::to_string(i));
        co_await yield_now();
    }
}

auto spawn_child_and_join() -> Async<int>
{
    auto* executor = Executor::from_current_thread();
    if (executor == nullptr)
    {
        throw std::logic_error("not running on an executor");
    }

    auto result = co_await executor->spawn(sleep_then_value(1ms, 21));
    co_return result.value() * 2;
}

auto nested_run() -> Async<>
{
    Executor::from_current_thread()->run();
    co_return;
}

template <typename PredicateT>
auto wait_until(PredicateT predicate, std::chrono::milliseconds timeout) -> bool
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate())
    {
        if (std::chrono::steady_clock::now() > deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

}  // namespace

TEST_F(TestExecutor, SleepThenDone)
{
    Executor executor;
    auto handle = executor.spawn(sleep_then_done(10ms));

    auto start = std::chrono::steady_clock::now();
    executor.run();
    auto elapsed = std::chrono::steady_clock::now() - start;

    VLOG(1) << "run() returned after " << std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count()
            << "us";

    EXPECT_GE(elapsed, 10ms);
    EXPECT_LT(elapsed, 100ms);

    ASSERT_TRUE(handle.is_ready());
    ASSERT_TRUE(handle.result().has_value());
    EXPECT_EQ(handle.result().value(), "done");
    EXPECT_TRUE(executor.empty());
}

TEST_F(TestExecutor, EmptyRunReturns)
{
    Executor executor;
    executor.run();
    EXPECT_TRUE(executor.empty());
}

TEST_F(TestExecutor, PastDeadlineSpawnsNoThread)
{
    auto spawned = time::Delay::threads_spawned();

    Executor executor;
    auto handle = executor.spawn(time::sleep_until(time::clock_type::now() - 1s));
    executor.run();

    EXPECT_TRUE(handle.is_ready());
    EXPECT_EQ(time::Delay::threads_spawned(), spawned);
}

TEST_F(TestExecutor, Liveness)
{
    const std::vector<std::chrono::milliseconds> offsets{-50ms, -1ms, 0ms, 1ms, 5ms, 20ms};

    Executor executor;
    std::vector<JoinHandle<void>> handles;
    for (auto offset : offsets)
    {
        handles.push_back(executor.spawn(time::sleep_until(time::clock_type::now() + offset)));
    }

    auto start = std::chrono::steady_clock::now();
    executor.run();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 20ms + 1s);

    for (auto& handle : handles)
    {
        EXPECT_TRUE(handle.is_ready());
    }
}

TEST_F(TestExecutor, ThousandTimers)
{
    constexpr std::size_t count = 1000;

    auto spawned = time::Delay::threads_spawned();
    auto running = time::Delay::threads_running();

    Executor executor;
    std::vector<JoinHandle<void>> handles;
    handles.reserve(count);
    for (std::size_t i = 0; i < count; i++)
    {
        handles.push_back(executor.spawn(time::sleep_for(1ms)));
    }
    EXPECT_EQ(executor.size(), count);

    executor.run();

    EXPECT_TRUE(executor.empty());
    EXPECT_EQ(executor.queue_size(), 0U);
    EXPECT_LE(time::Delay::threads_spawned() - spawned, count);
    EXPECT_EQ(time::Delay::threads_running(), running);
    EXPECT_TRUE(std::all_of(handles.begin(), handles.end(), [](const auto& h) { return h.is_ready(); }));
}

TEST_F(TestExecutor, CompletedTaskIsNeverPolledAgain)
{
    int polls             = 0;
    int polls_after_ready = 0;
    bool resolved         = false;
    std::optional<Waker> stale;

    Executor executor;
    executor.spawn(poll_fn([&](Context& cx) -> Poll<void> {
        if (resolved)
        {
            ++polls_after_ready;
            return Poll<void>::ready();
        }

        if (++polls < 3)
        {
            // woken while running; the executor re-queues the task once this poll returns
            cx.waker().wake();
            cx.waker().wake();
            return Poll<void>::pending();
        }

        stale    = cx.waker();
        resolved = true;
        return Poll<void>::ready();
    }));

    executor.run();

    ASSERT_TRUE(stale.has_value());
    stale->wake();
    stale->wake();

    EXPECT_EQ(executor.queue_size(), 0U);
    executor.run();

    EXPECT_EQ(polls, 3);
    EXPECT_EQ(polls_after_ready, 0);
}

TEST_F(TestExecutor, NoConcurrentPollsUnderConcurrentWakes)
{
    constexpr int wake_threads = 4;
    constexpr int total_polls  = 50;

    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::atomic<std::size_t> max_queued{0};
    std::atomic<bool> done{false};
    int polls = 0;

    std::mutex waker_mutex;
    std::optional<Waker> shared_waker;

    Executor executor;
    auto handle = executor.spawn(poll_fn([&](Context& cx) -> Poll<void> {
        auto current = ++in_flight;
        max_in_flight.store(std::max(max_in_flight.load(), current));

        // while running, the task must not also be sitting in the ready queue
        auto queued = Executor::from_current_thread()->queue_size();
        max_queued.store(std::max(max_queued.load(), queued));

        std::this_thread::sleep_for(100us);

        {
            std::scoped_lock lock{waker_mutex};
            shared_waker = cx.waker();
        }

        --in_flight;
        return (++polls >= total_polls) ? Poll<void>::ready() : Poll<void>::pending();
    }));

    std::vector<std::thread> wakers;
    for (int i = 0; i < wake_threads; i++)
    {
        wakers.emplace_back([&] {
            while (!done.load())
            {
                std::optional<Waker> waker;
                {
                    std::scoped_lock lock{waker_mutex};
                    waker = shared_waker;
                }
                if (waker)
                {
                    waker->wake();
                }
                std::this_thread::yield();
            }
        });
    }

    executor.run();
    done = true;

    for (auto& thread : wakers)
    {
        thread.join();
    }

    EXPECT_TRUE(handle.is_ready());
    EXPECT_EQ(polls, total_polls);
    EXPECT_EQ(max_in_flight.load(), 1);
    EXPECT_EQ(max_queued.load(), 0U);
}

TEST_F(TestExecutor, FailedTaskIsIsolated)
{
    Executor executor;
    auto failing = executor.spawn(sleep_then_throw(1ms));
    auto sibling = executor.spawn(sleep_then_value(5ms, 42));

    executor.run();

    ASSERT_TRUE(failing.is_ready());
    ASSERT_FALSE(failing.result().has_value());
    EXPECT_THROW(std::rethrow_exception(failing.result().error()), std::runtime_error);

    ASSERT_TRUE(sibling.is_ready());
    EXPECT_EQ(sibling.result().value(), 42);
    EXPECT_TRUE(executor.empty());
}

TEST_F(TestExecutor, SpawnFromTask)
{
    Executor executor;
    auto handle = executor.spawn(spawn_child_and_join());
    executor.run();

    ASSERT_TRUE(handle.is_ready());
    EXPECT_EQ(handle.result().value(), 42);
}

TEST_F(TestExecutor, YieldInterleavesTasksInFifoOrder)
{
    std::vector<std::string> log;

    Executor executor;
    executor.spawn(yielding("a", log));
    executor.spawn(yielding("b", log));
    executor.run();

    EXPECT_EQ(log, (std::vector<std::string>{"a0", "b0", "a1", "b1", "a2", "b2"}));
}

TEST_F(TestExecutor, RunFromWithinTaskFails)
{
    Executor executor;
    auto handle = executor.spawn(nested_run());
    executor.run();

    ASSERT_TRUE(handle.is_ready());
    ASSERT_FALSE(handle.result().has_value());
    EXPECT_THROW(std::rethrow_exception(handle.result().error()), std::logic_error);
}

TEST_F(TestExecutor, KeepAliveUntilShutdown)
{
    Executor executor({.description = "keep_alive", .keep_alive = true});

    std::thread runner([&executor] { executor.run(); });

    auto first = executor.spawn(sleep_then_value(1ms, 1));
    ASSERT_TRUE(wait_until([&] { return first.is_ready(); }, 5000ms));

    // still accepting work after the executor went idle
    auto second = executor.spawn(sleep_then_value(1ms, 2));
    ASSERT_TRUE(wait_until([&] { return second.is_ready(); }, 5000ms));

    executor.shutdown();
    runner.join();

    EXPECT_EQ(first.result().value(), 1);
    EXPECT_EQ(second.result().value(), 2);
    EXPECT_THROW(executor.spawn(yield_now()), std::runtime_error);
}

TEST_F(TestExecutor, DestructionReleasesPendingTasks)
{
    auto running = time::Delay::threads_running();

    {
        Executor executor({.description = "abandoned", .keep_alive = true});
        std::thread runner([&executor] { executor.run(); });

        executor.spawn(time::sleep_for(10s));
        ASSERT_TRUE(wait_until([&] { return time::Delay::threads_running() == running + 1; }, 5000ms));

        executor.shutdown();
        runner.join();
        EXPECT_EQ(executor.size(), 1U);
    }

    EXPECT_EQ(time::Delay::threads_running(), running);
}
