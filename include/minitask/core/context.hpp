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

#include "minitask/core/waker.hpp"
#include "minitask/utils/macros.hpp"

namespace minitask {

/**
 * @brief State handed to Future<T>::poll for the duration of a single call.
 *
 * A future that returns pending must clone waker() and arrange for it to be woken once polling again could make
 * progress. The Context itself must not be retained beyond the poll call.
 */
class Context
{
  public:
    explicit Context(const Waker& waker) noexcept : m_waker(waker) {}

    DELETE_COPYABILITY(Context);
    DELETE_MOVEABILITY(Context);

    auto waker() const noexcept -> const Waker&
    {
        return m_waker;
    }

    auto current_wake_handle() const -> Waker
    {
        return m_waker;
    }

  private:
    const Waker& m_waker;
};

}  // namespace minitask
