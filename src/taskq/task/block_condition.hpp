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

#include "taskq/task/condition.hpp"

namespace taskq::task
{

/**
 * A Condition whose evaluate() forwards to a closure supplied at construction.  The closure takes on the full
 * Condition::evaluate() contract: it must invoke the given `on_done_func` exactly once, eventually.
 */
class Block_condition : public Condition
{
public:
  // Types.

  /// Signature of the evaluation closure; same as that of Condition::evaluate().
  using Evaluate_func = Function<void (Cancellable_task& task, On_done_func&& on_done_func)>;

  // Constructors/destructor.

  /**
   * Constructs the condition.
   *
   * @param evaluate_func
   *        Non-empty closure.
   */
  explicit Block_condition(Evaluate_func&& evaluate_func);

  // Methods.

  /**
   * Forwards to the ctor closure.
   *
   * @param task
   *        See Condition::evaluate().
   * @param on_done_func
   *        See Condition::evaluate().
   */
  void evaluate(Cancellable_task& task, On_done_func&& on_done_func) override;

private:
  // Data.

  /// See ctor.
  const Evaluate_func m_evaluate_func;
}; // class Block_condition

} // namespace taskq::task
