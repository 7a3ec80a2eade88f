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

#include "taskq/util/util_fwd.hpp"
#include <memory>
#include <ostream>

/**
 * Flow-TaskQ module providing the cancellable, observable, dependency-aware unit of asynchronous work:
 * Cancellable_task.  See namespace ::taskq doc header for an overview of Flow-TaskQ modules.  A synopsis follows:
 *
 * A Cancellable_task moves through the states of #State in strictly increasing order.  Before it may execute it
 * must (1) be admitted by a host scheduler (such as sched::Task_queue); (2) have all its dependencies (other
 * tasks) finished; and (3) have all its Condition objects report satisfaction.  Observer objects attached to it
 * are informed when it starts, is canceled, and finishes.  Block_task, Block_observer and Block_condition are
 * closure-based conveniences so that simple uses need not subclass anything.
 */
namespace taskq::task
{

// Types.

// Find doc headers near the bodies of these compound types.

class Cancellable_task;
class Block_task;
class Condition;
class Observer;
class Block_condition;
class Block_observer;

/**
 * The lifecycle state of a Cancellable_task.  The values form a total order, in the order listed; and a given
 * task's state only ever increases (never revisits a value; never goes back).  Whether a task is canceled is a
 * separate, orthogonal piece of information; see Cancellable_task::is_cancelled().
 */
enum class State
{
  /// Just constructed; not yet admitted by a host scheduler.
  S_INITIALIZED,

  /// Admitted by a host scheduler (Cancellable_task::mark_enqueued()); dependencies and/or conditions outstanding.
  S_PENDING,

  /// Dependencies finished; Condition objects asked to evaluate; not all have reported yet.
  S_EVALUATING_CONDITIONS,

  /// All readiness gates passed (or failed, in which case the task was canceled); may be started.
  S_READY,

  /// Started, not canceled at the time; Cancellable_task::run() body was invoked.
  S_EXECUTING,

  /// Terminal.
  S_FINISHED
}; // enum class State

/// Short-hand for ref-counted pointer to Cancellable_task.  Tasks are meant to be owned via this.
using Cancellable_task_ptr = std::shared_ptr<Cancellable_task>;

/// Short-hand for ref-counted pointer to Condition.
using Condition_ptr = std::shared_ptr<Condition>;

/// Short-hand for ref-counted pointer to Observer.
using Observer_ptr = std::shared_ptr<Observer>;

// Free functions.

/**
 * Prints string representation of the given State to the given `ostream`; e.g., `"evaluatingConditions"`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, State val);

/**
 * Prints string representation of the given Cancellable_task to the given `ostream`.
 *
 * @relatesalso Cancellable_task
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Cancellable_task& val);

} // namespace taskq::task
