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
#include "taskq/task/block_observer.hpp"

namespace taskq::task
{

Block_observer::Block_observer(Handler_func&& on_attach_func, Handler_func&& on_start_func,
                               Handler_func&& on_cancel_func, Handler_func&& on_finish_func) :
  m_on_attach_func(std::move(on_attach_func)),
  m_on_start_func(std::move(on_start_func)),
  m_on_cancel_func(std::move(on_cancel_func)),
  m_on_finish_func(std::move(on_finish_func))
{
  // That's it.
}

void Block_observer::on_attach(Cancellable_task& task)
{
  if (m_on_attach_func)
  {
    m_on_attach_func(task);
  }
}

void Block_observer::on_start(Cancellable_task& task)
{
  if (m_on_start_func)
  {
    m_on_start_func(task);
  }
}

void Block_observer::on_cancel(Cancellable_task& task)
{
  if (m_on_cancel_func)
  {
    m_on_cancel_func(task);
  }
}

void Block_observer::on_finish(Cancellable_task& task)
{
  if (m_on_finish_func)
  {
    m_on_finish_func(task);
  }
}

} // namespace taskq::task
