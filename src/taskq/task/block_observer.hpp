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

#include "taskq/task/observer.hpp"

namespace taskq::task
{

/**
 * An Observer assembled from up to four closures, one per notification.  Any of them may be left empty, in which
 * case that notification is simply ignored.  See Observer for when and where each one is invoked.
 */
class Block_observer : public Observer
{
public:
  // Types.

  /// Signature of each of the closures.
  using Handler_func = Function<void (Cancellable_task& task)>;

  // Constructors/destructor.

  /**
   * Constructs the observer.
   *
   * @param on_attach_func
   *        See Observer::on_attach().  May be empty.
   * @param on_start_func
   *        See Observer::on_start().  May be empty.
   * @param on_cancel_func
   *        See Observer::on_cancel().  May be empty.
   * @param on_finish_func
   *        See Observer::on_finish().  May be empty.
   */
  explicit Block_observer(Handler_func&& on_attach_func = Handler_func(),
                          Handler_func&& on_start_func = Handler_func(),
                          Handler_func&& on_cancel_func = Handler_func(),
                          Handler_func&& on_finish_func = Handler_func());

  // Methods.

  /**
   * Invokes the corresponding ctor closure, if any.
   * @param task
   *        The task.
   */
  void on_attach(Cancellable_task& task) override;

  /**
   * Invokes the corresponding ctor closure, if any.
   * @param task
   *        The task.
   */
  void on_start(Cancellable_task& task) override;

  /**
   * Invokes the corresponding ctor closure, if any.
   * @param task
   *        The task.
   */
  void on_cancel(Cancellable_task& task) override;

  /**
   * Invokes the corresponding ctor closure, if any.
   * @param task
   *        The task.
   */
  void on_finish(Cancellable_task& task) override;

private:
  // Data.

  /// See ctor.
  const Handler_func m_on_attach_func;
  /// See ctor.
  const Handler_func m_on_start_func;
  /// See ctor.
  const Handler_func m_on_cancel_func;
  /// See ctor.
  const Handler_func m_on_finish_func;
}; // class Block_observer

} // namespace taskq::task
