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

#include "test_util.hpp"
#include <algorithm>

namespace taskq::test
{

Test_loop::Test_loop(flow::log::Logger* logger_ptr, size_t n_threads) :
  flow::async::Cross_thread_task_loop(logger_ptr, "test_loop", n_threads)
{
  start();
}

void Event_log::push(const std::string& event)
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  m_events.push_back(event);
}

std::vector<std::string> Event_log::events() const
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  return m_events;
}

size_t Event_log::count(const std::string& event) const
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  return std::count(m_events.begin(), m_events.end(), event);
}

task::Observer_ptr make_recording_observer(Event_log* log, const std::string& name)
{
  using task::Block_observer;
  using task::Cancellable_task;

  return std::make_shared<Block_observer>
           ([log, name](Cancellable_task&) { log->push(name + ":attach"); },
            [log, name](Cancellable_task&) { log->push(name + ":start"); },
            [log, name](Cancellable_task&) { log->push(name + ":cancel"); },
            [log, name](Cancellable_task&) { log->push(name + ":finish"); });
}

Manual_conditions::Manual_conditions(size_t n) :
  m_on_done_funcs(n)
{
  using task::Block_condition;
  using task::Cancellable_task;
  using task::Condition;

  for (size_t idx = 0; idx != n; ++idx)
  {
    m_conditions.push_back(std::make_shared<Block_condition>
                             ([this, idx](Cancellable_task&, Condition::On_done_func&& on_done_func)
    {
      util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
      m_on_done_funcs[idx] = std::move(on_done_func);
    }));
  }
}

const std::vector<task::Condition_ptr>& Manual_conditions::conditions() const
{
  return m_conditions;
}

size_t Manual_conditions::n_evaluating() const
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  return std::count_if(m_on_done_funcs.begin(), m_on_done_funcs.end(),
                       [](const task::Condition::On_done_func& func) -> bool { return bool(func); });
}

void Manual_conditions::report(size_t idx, bool satisfied)
{
  task::Condition::On_done_func func;
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
    func = m_on_done_funcs[idx];
  }
  func(satisfied); // Not under m_mutex: a condition may be re-entered.
}

} // namespace taskq::test
