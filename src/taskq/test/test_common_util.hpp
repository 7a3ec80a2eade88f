/* Flow-TaskQ: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#pragma once

#include <taskq/util/util_fwd.hpp>
#include <type_traits>

namespace taskq::test
{

/// How long wait_for() waits by default.  Generous, so slow CI machines do not cause spurious failures.
constexpr util::Fine_duration S_DEFAULT_WAIT_TIMEOUT = boost::chrono::seconds(10);

/**
 * Polls the given predicate, sleeping briefly between attempts, until it returns `true` or the timeout elapses.
 * Asynchronous outcomes (work done on tasks' strands) are checked with this.
 *
 * @param pred The predicate.
 * @param timeout How long to keep trying.
 *
 * @return `true` if `pred()` returned `true` in time; else `false`.
 */
bool wait_for(const Function<bool ()>& pred, util::Fine_duration timeout = S_DEFAULT_WAIT_TIMEOUT);

/**
 * Casts an enumeration to its primitive type.
 *
 * @tparam Enum The enumeration type.
 * @param e The enumeration value.
 *
 * @return The primitive type form of the enumeration value.
 */
template <class Enum>
constexpr std::underlying_type_t<Enum> to_underlying(Enum e) noexcept
{
  return static_cast<std::underlying_type_t<Enum>>(e);
}

} // namespace taskq::test
