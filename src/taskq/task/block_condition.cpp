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
#include "taskq/task/block_condition.hpp"

namespace taskq::task
{

Block_condition::Block_condition(Evaluate_func&& evaluate_func) :
  m_evaluate_func(std::move(evaluate_func))
{
  assert(m_evaluate_func && "Evaluation closure must not be empty.  Broke contract.");
}

void Block_condition::evaluate(Cancellable_task& task, On_done_func&& on_done_func)
{
  m_evaluate_func(task, std::move(on_done_func));
}

} // namespace taskq::task
