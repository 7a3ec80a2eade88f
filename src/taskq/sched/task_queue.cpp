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
#include "taskq/sched/task_queue.hpp"
#include <flow/error/error.hpp>
#include <boost/thread/locks.hpp>
#include <algorithm>

namespace taskq::sched
{

Task_queue::Task_queue(flow::log::Logger* logger_ptr, util::String_view nickname, size_t max_concurrent_tasks) :
  flow::log::Log_context(logger_ptr, Log_component::S_SCHED),
  m_nickname(nickname),
  m_max_concurrent_tasks(max_concurrent_tasks),
  m_host_link(new Host_link{ {}, this }),
  m_shutting_down(false),
  m_worker(get_logger(), flow::util::ostream_op_string("tq-", m_nickname))
{
  m_worker.start();
  FLOW_LOG_INFO("Task_queue [" << *this << "]: Started; max concurrent tasks = [" << m_max_concurrent_tasks << "] "
                "(0 = unlimited).");
}

Task_queue::~Task_queue()
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  // We are in thread U.  By contract not thread Q, nor running a task's body or notifications.

  shut_down();
  {
    Lock_guard<Mutex_non_recursive> lock(m_host_link->m_mutex);
    m_host_link->m_queue = nullptr;
  }
  // No more admissions; no more host signals will reach us.  Now stop thread Q, dropping any pending passes.

  FLOW_LOG_INFO("Task_queue [" << *this << "]: Shutting down.  Worker thread will be joined.");
  m_worker.stop();
  // Thread Q is (synchronously!) no more.  So we can touch its data from here.

  size_t n_unfinished;
  {
    Lock_guard<Mutex_non_recursive> lock(m_tracked_mutex);
    n_unfinished = m_tracked.size();
    m_tracked.clear();
  }
  if (n_unfinished != 0)
  {
    FLOW_LOG_INFO("Task_queue [" << *this << "]: Releasing [" << n_unfinished << "] tasks still tracked; they will "
                  "not be started by this queue.");
  }
  m_waiting.clear();
  m_started.clear();
  m_tracked_empty_cond.notify_all(); // Contract forbids concurrent wait_all(), but be nice about it anyway.
} // Task_queue::~Task_queue()

bool Task_queue::add_task(const task::Cancellable_task_ptr& task, Error_code* err_code)
{
  using task::State;
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Task_queue::add_task, task, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!task)
  {
    FLOW_LOG_WARNING("Task_queue [" << *this << "]: Asked to admit null task.  Refusing.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  // else

  {
    Lock_guard<Mutex_non_recursive> lock(m_tracked_mutex);

    if (m_shutting_down)
    {
      FLOW_LOG_WARNING("Task_queue [" << *this << "]: Asked to admit task [" << *task << "], but we are shutting "
                       "down.  Refusing.");
      *err_code = error::Code::S_QUEUE_SHUT_DOWN;
      return false;
    }
    // else

    const auto state = task->state();
    if ((state != State::S_INITIALIZED) || (m_tracked.count(task) != 0))
    {
      FLOW_LOG_WARNING("Task_queue [" << *this << "]: Asked to admit task [" << *task << "], but it is in state "
                       "[" << state << "], meaning it was already admitted by us or another scheduler.  Refusing.");
      *err_code = error::Code::S_TASK_ALREADY_ENQUEUED;
      return false;
    }
    // else

    m_tracked.insert(task);
  } // Lock_guard lock(m_tracked_mutex)

  err_code->clear();

  FLOW_LOG_INFO("Task_queue [" << *this << "]: Admitting task [" << *task << "].");

  task->set_host_signal_func(make_host_signal_func());

  /* Post the insertion before mark_enqueued(): any dispatch pass the latter triggers (via host signal) will
   * then find the task in m_waiting. */
  m_worker.post([this, task]()
  {
    // We are in thread Q.
    m_waiting.push_back(task);
    dispatch();
  });

  task->mark_enqueued();
  return true;
} // Task_queue::add_task()

bool Task_queue::add_tasks(const std::vector<task::Cancellable_task_ptr>& tasks, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Task_queue::add_tasks, tasks, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  for (const auto& task : tasks)
  {
    if (!add_task(task, err_code))
    {
      return false;
    }
  }
  return true;
}

void Task_queue::cancel_all()
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;
  using std::vector;

  vector<task::Cancellable_task_ptr> tasks;
  {
    Lock_guard<Mutex_non_recursive> lock(m_tracked_mutex);
    tasks.assign(m_tracked.begin(), m_tracked.end());
  }

  FLOW_LOG_INFO("Task_queue [" << *this << "]: Canceling all [" << tasks.size() << "] tracked tasks.");
  // Outside the lock: cancel() synchronously calls our host signal among other things.
  for (const auto& task : tasks)
  {
    task->cancel();
  }
}

void Task_queue::shut_down()
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  Lock_guard<Mutex_non_recursive> lock(m_tracked_mutex);
  if (!m_shutting_down)
  {
    FLOW_LOG_INFO("Task_queue [" << *this << "]: No longer admitting tasks; [" << m_tracked.size() << "] tracked "
                  "tasks shall proceed.");
    m_shutting_down = true;
  }
}

void Task_queue::wait_all()
{
  using util::Mutex_non_recursive;

  assert((!m_worker.in_thread()) && "wait_all() from thread Q would block forever.  Broke contract.");

  FLOW_LOG_TRACE("Task_queue [" << *this << "]: Waiting for all tracked tasks to finish.");

  boost::unique_lock<Mutex_non_recursive> lock(m_tracked_mutex);
  m_tracked_empty_cond.wait(lock, [this]() -> bool { return m_tracked.empty(); });

  FLOW_LOG_TRACE("Task_queue [" << *this << "]: Done waiting; no tracked tasks remain.");
}

size_t Task_queue::size() const
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  Lock_guard<Mutex_non_recursive> lock(m_tracked_mutex);
  return m_tracked.size();
}

const std::string& Task_queue::nickname() const
{
  return m_nickname;
}

task::Cancellable_task::Host_signal_func Task_queue::make_host_signal_func() const
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  // We are in unspecified thread when this is invoked: whichever thread changed the task's readiness.
  return [link = m_host_link]()
  {
    Lock_guard<Mutex_non_recursive> lock(link->m_mutex);
    if (link->m_queue)
    {
      link->m_queue->schedule_dispatch(); // Non-blocking.
    }
  };
}

void Task_queue::schedule_dispatch()
{
  m_worker.post([this]()
  {
    dispatch();
  });
}

void Task_queue::dispatch()
{
  using std::count_if;

  // We are in thread Q.

  // Release the finished ones first: it frees up slots under the cap.
  for (auto it = m_started.begin(); it != m_started.end(); )
  {
    if (it->m_task->is_finished())
    {
      release(it->m_task);
      it = m_started.erase(it);
    }
    else
    {
      ++it;
    }
  }

  // Decided when each was started: a task canceled mid-body keeps its slot until it finishes.
  size_t n_executing = count_if(m_started.begin(), m_started.end(),
                                [](const Started& started) -> bool { return started.m_counted; });

  for (auto it = m_waiting.begin(); it != m_waiting.end(); )
  {
    const auto& task = *it;

    // Someone may have finish()ed it without our starting it.  Legal.
    if (task->is_finished())
    {
      FLOW_LOG_TRACE("Task_queue [" << *this << "]: Task [" << *task << "] finished without being started by us.");
      release(task);
      it = m_waiting.erase(it);
      continue;
    }
    // else

    if (!task->is_ready())
    {
      ++it;
      continue;
    }
    // else

    const bool cancelled = task->is_cancelled();
    if ((!cancelled) && (m_max_concurrent_tasks != 0) && (n_executing >= m_max_concurrent_tasks))
    {
      FLOW_LOG_TRACE("Task_queue [" << *this << "]: Task [" << *task << "] is ready, but the cap "
                     "[" << m_max_concurrent_tasks << "] is reached; it shall wait.");
      ++it;
      continue; // A later canceled task may still bypass the cap.
    }
    // else

    FLOW_LOG_TRACE("Task_queue [" << *this << "]: Starting task [" << *task << "] (canceled = [" << cancelled << "]).");
    if (!cancelled)
    {
      ++n_executing;
    }
    m_started.push_back(Started{ task, !cancelled });
    it = m_waiting.erase(it);
    m_started.back().m_task->start(); // Non-blocking: posts onto the task's strand.
  } // for (it : m_waiting)
} // Task_queue::dispatch()

void Task_queue::release(const task::Cancellable_task_ptr& task)
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  // We are in thread Q.

  FLOW_LOG_TRACE("Task_queue [" << *this << "]: Releasing finished task [" << *task << "].");

  bool now_empty;
  {
    Lock_guard<Mutex_non_recursive> lock(m_tracked_mutex);
    m_tracked.erase(task);
    now_empty = m_tracked.empty();
  }

  if (now_empty)
  {
    FLOW_LOG_TRACE("Task_queue [" << *this << "]: No tracked tasks remain; waking any waiters.");
    m_tracked_empty_cond.notify_all();
  }
}

std::ostream& operator<<(std::ostream& os, const Task_queue& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace taskq::sched
