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

/// @file
#pragma once

#include "taskq/common.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>

/**
 * Flow-TaskQ module containing miscellaneous general-use facilities that don't fit into any other Flow-TaskQ module.
 * As of this writing it is only a set of short-hand aliases onto Flow facilities used throughout the project.
 */
namespace taskq::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;

/// Short-hand for a non-recursive mutex.
using Mutex_non_recursive = flow::util::Mutex_non_recursive;
/// Short-hand for a recursive mutex.
using Mutex_recursive = flow::util::Mutex_recursive;
/// Short-hand for the scoped lock of a mutex; e.g., `Lock_guard<Mutex_recursive>`.
template<typename Mutex>
using Lock_guard = flow::util::Lock_guard<Mutex>;

} // namespace taskq::util
