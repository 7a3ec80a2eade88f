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
 * Interface for a pluggable collaborator notified of Cancellable_task lifecycle events.  Attach via
 * Cancellable_task::add_observer(), which makes the task an owner of the observer.  An observer that wants to talk
 * back to its task must do so only through the reference passed to these methods (or via a non-owning pointer);
 * holding a `Cancellable_task_ptr` from inside an observer creates a reference cycle.
 *
 * Where each method is invoked from:
 *   - on_attach(): synchronously from within add_observer(), in the calling thread.
 *   - on_start(): from the task's strand, just before Cancellable_task::run().
 *   - on_cancel(): from the task's strand, some time after the first Cancellable_task::cancel().
 *   - on_finish(): from the task's strand, some time after the first effective Cancellable_task::finish().
 *     This fires even if the task was canceled.
 *
 * Observers of a given task are notified in the order they were attached.  No task-internal lock is held during
 * any of these calls.
 */
class Observer
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Observer();

  // Methods.

  /**
   * `*this` has just been attached to the given task.
   * @param task
   *        The task.
   */
  virtual void on_attach(Cancellable_task& task) = 0;

  /**
   * The given task is about to execute its body.
   * @param task
   *        The task.
   */
  virtual void on_start(Cancellable_task& task) = 0;

  /**
   * The given task was canceled.
   * @param task
   *        The task.
   */
  virtual void on_cancel(Cancellable_task& task) = 0;

  /**
   * The given task finished.
   * @param task
   *        The task.
   */
  virtual void on_finish(Cancellable_task& task) = 0;
}; // class Observer

} // namespace taskq::task
