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

#include "minitask/core/thread.hpp"

#include "minitask/executor/executor.hpp"
#include "minitask/time/delay.hpp"

#include <concepts>
#include <functional>
#include <iomanip>
#include <sstream>
#include <thread>

namespace minitask::this_thread {

namespace {

std::string to_hex(std::integral auto i)
{
    std::stringstream ss;
    ss << std::setfill('0') << std::setw(sizeof(i) * 2) << std::hex << i;
    return ss.str();
}

const std::string& native_id()
{
    static thread_local std::string id = to_hex(std::hash<std::thread::id>()(std::this_thread::get_id()));
    return id;
}

}  // namespace

std::string get_id()
{
    // an executor may be run on any thread, so the executor lookup is not cached
    const auto* const executor = Executor::from_current_thread();
    if (executor != nullptr)
    {
        return executor->description();
    }

    if (time::Delay::is_timer_thread())
    {
        return "timer/" + native_id();
    }

    return "sys/" + native_id();
}

}  // namespace minitask::this_thread
