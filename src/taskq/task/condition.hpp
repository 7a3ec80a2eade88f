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

namespace taskq::task
{

/**
 * Interface for a pluggable asynchronous predicate that must hold before a Cancellable_task may execute.
 * Attach via Cancellable_task::add_condition().
 *
 * Once the task's dependencies are all finished, the task calls evaluate() on each of its conditions, in the order
 * they were added, without waiting for any of them.  Each condition must eventually invoke the given `on_done_func`
 * exactly once, from any thread, with `true` if satisfied.  If any condition reports `false`, the task is canceled;
 * either way the task becomes ready once all have reported.
 *
 * There is no timeout: a condition that never reports keeps its task waiting indefinitely.
 *
 * ### Thread safety ###
 * evaluate() is invoked at most once per `*this` per task, with no internal lock of that task held; so it is safe
 * to call any Cancellable_task API from within it.  The same `*this` may be attached to several tasks, in which case
 * evaluate() may be invoked concurrently for different tasks.
 */
class Condition
{
public:
  // Types.

  /// Signature of the report callback: `void F(bool satisfied)`.
  using On_done_func = Function<void (bool satisfied)>;

  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Condition();

  // Methods.

  /**
   * Begins evaluating the condition with respect to the given task; reports the result asynchronously (or
   * synchronously from within this call, if the answer is immediately known).
   *
   * @param task
   *        The task being gated.  Do not save a reference beyond the invocation of `on_done_func`.
   * @param on_done_func
   *        Must be invoked exactly once, eventually, with the result.
   */
  virtual void evaluate(Cancellable_task& task, On_done_func&& on_done_func) = 0;
}; // class Condition

} // namespace taskq::task
