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

#include "taskq/task/task_fwd.hpp"

/**
 * Flow-TaskQ module providing a ready-made *host scheduler* for task::Cancellable_task objects: Task_queue.
 * See namespace ::taskq doc header for an overview of Flow-TaskQ modules.
 *
 * A task::Cancellable_task never runs itself; a host scheduler admits it, watches its readiness, and starts it.
 * The boundary between the two is documented in the task::Cancellable_task doc header.  Task_queue is one
 * implementation of the scheduler side; it is by no means the only possible one.
 */
namespace taskq::sched
{

// Types.

// Find doc headers near the bodies of these compound types.

class Task_queue;

// Free functions.

/**
 * Prints string representation of the given Task_queue to the given `ostream`.
 *
 * @relatesalso Task_queue
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Task_queue& val);

} // namespace taskq::sched
