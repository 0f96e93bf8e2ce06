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

// IWYU pragma: begin_exports
#include "minitask/core/context.hpp"
#include "minitask/core/future.hpp"
#include "minitask/core/poll.hpp"
#include "minitask/core/thread.hpp"
#include "minitask/core/waker.hpp"
#include "minitask/coroutines/async.hpp"
#include "minitask/executor/block_on.hpp"
#include "minitask/executor/executor.hpp"
#include "minitask/executor/join_handle.hpp"
#include "minitask/executor/round_robin.hpp"
#include "minitask/time/delay.hpp"
// IWYU pragma: end_exports
