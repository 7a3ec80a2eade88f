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

#include "taskq/task/cancellable_task.hpp"

namespace taskq::task
{

/**
 * A Cancellable_task whose body is a closure supplied at construction, so that simple uses need not subclass
 * Cancellable_task.  The body is invoked from strand S in place of Cancellable_task::run() and must, eventually
 * (possibly from another thread), call finish() on the task it is given.  An empty body finishes immediately.
 *
 * Optionally a cancel closure can be supplied; it is invoked from strand S in place of
 * Cancellable_task::on_cancelled(), which is a good place to abort whatever asynchronous work the body kicked off.
 */
class Block_task : public Cancellable_task
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to `*this` type.
  using Ptr = std::shared_ptr<Block_task>;

  /// Signature of the body: `void F(Block_task& task)`.
  using Body_func = Function<void (Block_task& task)>;

  /// Signature of the cancel handler: `void F(Block_task& task)`.
  using On_cancel_func = Function<void (Block_task& task)>;

  // Constructors/destructor.

  /**
   * Constructs the task.  See Cancellable_task ctor.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param loop
   *        See Cancellable_task ctor.
   * @param nickname
   *        See Cancellable_task ctor.
   * @param body_func
   *        The body.  May be empty, in which case the task finishes as soon as it starts.
   * @param on_cancel_func
   *        Invoked upon effective cancel(), from strand S.  May be empty.
   */
  explicit Block_task(flow::log::Logger* logger_ptr, flow::async::Concurrent_task_loop* loop,
                      util::String_view nickname = util::String_view(),
                      Body_func&& body_func = Body_func(), On_cancel_func&& on_cancel_func = On_cancel_func());

protected:
  // Methods.

  /// Invokes the body; or finish() if there is none.
  void run() override;

  /// Invokes the cancel closure, if any.
  void on_cancelled() override;

private:
  // Data.

  /// See ctor.
  Body_func m_body_func;

  /// See ctor.
  On_cancel_func m_on_cancel_func;
}; // class Block_task

} // namespace taskq::task
