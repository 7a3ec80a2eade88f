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
#include "taskq/task/block_task.hpp"

namespace taskq::task
{

Block_task::Block_task(flow::log::Logger* logger_ptr, flow::async::Concurrent_task_loop* loop,
                       util::String_view nickname, Body_func&& body_func, On_cancel_func&& on_cancel_func) :
  Cancellable_task(logger_ptr, loop, nickname),
  m_body_func(std::move(body_func)),
  m_on_cancel_func(std::move(on_cancel_func))
{
  // That's it.
}

void Block_task::run()
{
  if (!m_body_func)
  {
    FLOW_LOG_TRACE("Task [" << *this << "]: No body; finishing right away.");
    finish();
    return;
  }
  // else
  m_body_func(*this);
}

void Block_task::on_cancelled()
{
  if (m_on_cancel_func)
  {
    m_on_cancel_func(*this);
  }
}

} // namespace taskq::task
