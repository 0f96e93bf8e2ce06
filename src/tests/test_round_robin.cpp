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
#include "minitask/executor/round_robin.hpp"
#include "minitask/time/delay.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <vector>

using namespace minitask;
using namespace std::chrono_literals;

class TestRoundRobin : public ::testing::Test
{};

namespace {

auto sleep_twice() -> Async<int>
{
    co_await time::sleep_for(1ms);
    co_await time::sleep_for(1ms);
    co_return 2;
}

}  // namespace

TEST_F(TestRoundRobin, EveryTaskPolledOncePerPass)
{
    constexpr int count = 5;

    bool tick = false;
    std::vector<int> order;

    RoundRobinExecutor executor;
    for (int i = 0; i < count; i++)
    {
        executor.spawn(poll_fn([&, i](Context& cx) -> Poll<void> {
            EXPECT_TRUE(cx.waker().is_noop());
            order.push_back(i);
            return tick ? Poll<void>::ready() : Poll<void>::pending();
        }));
    }

    EXPECT_EQ(executor.run_once(), 5U);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));

    EXPECT_EQ(executor.run_once(), 5U);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4, 0, 1, 2, 3, 4}));

    tick = true;
    EXPECT_EQ(executor.run_once(), 0U);
    EXPECT_EQ(order.size(), 15U);
    EXPECT_TRUE(executor.empty());
}

TEST_F(TestRoundRobin, BusyPollsTimersToCompletion)
{
    RoundRobinExecutor executor;
    auto first  = executor.spawn(time::sleep_for(2ms));
    auto second = executor.spawn(sleep_twice());

    executor.run();

    EXPECT_TRUE(first.is_ready());
    ASSERT_TRUE(second.is_ready());
    EXPECT_EQ(second.result().value(), 2);
}

TEST_F(TestRoundRobin, FailedTaskIsDropped)
{
    int sibling_polls = 0;

    RoundRobinExecutor executor;
    auto failing = executor.spawn(poll_fn([](Context& /*cx*/) -> Poll<int> { throw std::runtime_error("boom"); }));
    auto sibling = executor.spawn(poll_fn([&sibling_polls](Context& /*cx*/) -> Poll<int> {
        return (++sibling_polls < 3) ? Poll<int>::pending() : Poll<int>::ready(sibling_polls);
    }));

    EXPECT_EQ(executor.run_once(), 1U);
    executor.run();

    ASSERT_TRUE(failing.is_ready());
    EXPECT_FALSE(failing.result().has_value());
    EXPECT_EQ(sibling.result().value(), 3);
}
