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
#include "taskq/task/cancellable_task.hpp"
#include <flow/util/util.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>

namespace taskq::task
{

namespace
{

/// Source of generated nicknames.
std::atomic<unsigned int> s_n_unnamed_tasks(0);

} // namespace (anon)

// Implementations.

Condition::~Condition() = default;

Observer::~Observer() = default;

Cancellable_task::Condition_results::Condition_results(size_t n_conditions) :
  m_satisfied(n_conditions, false),
  m_reported(n_conditions, false),
  m_n_outstanding(n_conditions)
{
  // That's it.
}

Cancellable_task::Cancellable_task(flow::log::Logger* logger_ptr, flow::async::Concurrent_task_loop* loop,
                                   util::String_view nickname) :
  flow::log::Log_context(logger_ptr, Log_component::S_TASK),
  m_nickname(nickname.empty()
               ? flow::util::ostream_op_string("task", ++s_n_unnamed_tasks)
               : std::string(nickname)),
  m_state(State::S_INITIALIZED),
  m_cancelled(false),
  m_n_unfinished_deps(0),
  m_strand(*loop->task_engine())
{
  FLOW_LOG_TRACE("Task [" << *this << "]: Created.");
}

Cancellable_task::~Cancellable_task()
{
  FLOW_LOG_TRACE("Task [" << *this << "]: Destroying.");
}

void Cancellable_task::add_observer(Observer_ptr observer)
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  assert(observer && "Observer must not be null.  Broke contract.");

  {
    Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
    assert((state() < State::S_EXECUTING) && "Observers may be added only before execution.  Broke contract.");
    m_observers.push_back(observer);
    FLOW_LOG_TRACE("Task [" << *this << "]: Attached observer [" << observer.get() << "]; "
                   "[" << m_observers.size() << "] observers total.");
  }

  observer->on_attach(*this);
}

void Cancellable_task::add_condition(Condition_ptr condition)
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  assert(condition && "Condition must not be null.  Broke contract.");

  Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
  assert((state() < State::S_EVALUATING_CONDITIONS)
         && "Conditions may be added only before they are evaluated.  Broke contract.");
  m_conditions.push_back(std::move(condition));
  FLOW_LOG_TRACE("Task [" << *this << "]: Added condition; [" << m_conditions.size() << "] conditions total.");
}

void Cancellable_task::add_dependency(Ptr other)
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  assert(other && (other.get() != this) && "Dependency must be a non-null task other than this one.  Broke contract.");

  auto self = weak_from_this();
  assert((!self.expired()) && "A task must be owned by a shared_ptr before taking dependencies.  Broke contract.");

  {
    Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
    m_dependencies.push_back(other);
    ++m_n_unfinished_deps;
  }

  if (other->register_dependent(std::move(self)))
  {
    FLOW_LOG_TRACE("Task [" << *this << "]: Now depends on [" << *other << "].");
    return;
  }
  // else

  FLOW_LOG_TRACE("Task [" << *this << "]: Now depends on [" << *other << "], which is already finished.");
  --m_n_unfinished_deps;
  /* A concurrent check_readiness() may have seen our transient increment and backed off.  Our dependencies are
   * exactly as finished as before; so re-check. */
  check_readiness();
  signal_host();
} // Cancellable_task::add_dependency()

void Cancellable_task::add_dependencies(const std::vector<Ptr>& others)
{
  for (const auto& other : others)
  {
    add_dependency(other);
  }
}

bool Cancellable_task::register_dependent(std::weak_ptr<Cancellable_task> dependent)
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
  if (state() == State::S_FINISHED)
  {
    return false;
  }
  // else: finish() will swap out m_dependents under this same lock; so `dependent` is sure to hear about it.
  m_dependents.emplace_back(std::move(dependent));
  return true;
}

void Cancellable_task::on_dependency_finished()
{
  const auto n_left = --m_n_unfinished_deps;
  assert((n_left >= 0) && "Dependency bookkeeping went negative?  Bug?");

  FLOW_LOG_TRACE("Task [" << *this << "]: A dependency finished; [" << n_left << "] remain unfinished.");
  if (n_left == 0)
  {
    check_readiness();
    signal_host();
  }
}

void Cancellable_task::mark_enqueued()
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  {
    Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
    if (state() != State::S_INITIALIZED)
    {
      FLOW_LOG_TRACE("Task [" << *this << "]: Enqueue signal ignored in state [" << state() << "].");
      return;
    }
    // else
    set_state(State::S_PENDING);
  }

  /* Dependencies may well have finished before this point (and their signals been ignored, since we were not
   * pending); so this check is not optional. */
  check_readiness();
  signal_host();
} // Cancellable_task::mark_enqueued()

void Cancellable_task::check_readiness()
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  std::vector<Condition_ptr> conditions;
  {
    Lock_guard<Mutex_recursive> op_lock(m_op_mutex);

    if ((state() != State::S_PENDING) || is_cancelled() || (!dependencies_finished()))
    {
      return;
    }
    // else

    if (m_conditions.empty())
    {
      FLOW_LOG_TRACE("Task [" << *this << "]: Dependencies satisfied; no conditions to evaluate.");
      set_state(State::S_READY);
      return;
    }
    // else

    /* Leaving S_PENDING under the lock is what makes this happen at most once: any racing trigger will see
     * the new state and bail above. */
    set_state(State::S_EVALUATING_CONDITIONS);
    conditions = m_conditions;
  } // Lock_guard op_lock(m_op_mutex)

  evaluate_conditions(conditions);
} // Cancellable_task::check_readiness()

void Cancellable_task::evaluate_conditions(const std::vector<Condition_ptr>& conditions)
{
  using std::make_shared;

  const auto self = weak_from_this();
  assert((!self.expired()) && "A task must be owned by a shared_ptr before conditions are evaluated.  "
                              "Broke contract.");

  FLOW_LOG_TRACE("Task [" << *this << "]: Evaluating [" << conditions.size() << "] conditions.");

  const auto results = make_shared<Condition_results>(conditions.size());
  for (size_t idx = 0; idx != conditions.size(); ++idx)
  {
    conditions[idx]->evaluate(*this, [self, results, idx](bool satisfied)
    {
      // We are in unspecified thread.  The task may be gone by now, in which case there is nothing left to gate.
      const auto task = self.lock();
      if (!task)
      {
        return;
      }
      // else

      boost::asio::post(task->m_strand, [task, results, idx, satisfied]()
      {
        task->on_condition_result(results.get(), idx, satisfied);
      });
    }); // evaluate()
  } // for (idx)
} // Cancellable_task::evaluate_conditions()

void Cancellable_task::on_condition_result(Condition_results* results, size_t idx, bool satisfied)
{
  // We are in strand S.

  if (results->m_reported[idx])
  {
    FLOW_LOG_WARNING("Task [" << *this << "]: Condition [" << idx << "] reported [" << satisfied << "] "
                     "after already having reported [" << results->m_satisfied[idx] << "].  "
                     "A condition must report exactly once; ignoring the repeat.");
    return;
  }
  // else

  results->m_reported[idx] = true;
  results->m_satisfied[idx] = satisfied;
  --results->m_n_outstanding;

  FLOW_LOG_TRACE("Task [" << *this << "]: Condition [" << idx << "] reported satisfied = [" << satisfied << "]; "
                 "[" << results->m_n_outstanding << "] reports outstanding.");

  if (results->m_n_outstanding == 0)
  {
    on_conditions_evaluated(*results);
  }
}

void Cancellable_task::on_conditions_evaluated(const Condition_results& results)
{
  using util::Lock_guard;
  using util::Mutex_recursive;
  using std::all_of;

  // We are in strand S.

  bool cancelled_now = false;
  {
    Lock_guard<Mutex_recursive> op_lock(m_op_mutex);

    if (state() >= State::S_READY)
    {
      return;
    }
    // else

    const bool all_satisfied = all_of(results.m_satisfied.begin(), results.m_satisfied.end(),
                                      [](bool satisfied) { return satisfied; });
    if (!all_satisfied)
    {
      FLOW_LOG_INFO("Task [" << *this << "]: At least one condition is not satisfied; canceling.");
      cancelled_now = mark_cancelled(); // Recursive lock.
    }

    set_state(State::S_READY);
  } // Lock_guard op_lock(m_op_mutex)

  if (cancelled_now)
  {
    post_cancel_notifications();
  }
  signal_host();
} // Cancellable_task::on_conditions_evaluated()

void Cancellable_task::start()
{
  if (m_strand.running_in_this_thread())
  {
    start_impl();
    return;
  }
  // else

  FLOW_LOG_TRACE("Task [" << *this << "]: Start requested from outside our strand; posting onto it.");
  boost::asio::post(m_strand, [self = shared_from_this()]()
  {
    self->start_impl();
  });
}

void Cancellable_task::start_impl()
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  // We are in strand S.

  std::vector<Observer_ptr> observers;
  bool cancelled;
  {
    Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
    cancelled = is_cancelled();
    if (!cancelled)
    {
      set_state(State::S_EXECUTING);
      observers = m_observers; // Cannot change from now on.
    }
  }

  if (cancelled)
  {
    FLOW_LOG_TRACE("Task [" << *this << "]: Started while canceled; finishing without running the body.");
    finish();
    return;
  }
  // else

  FLOW_LOG_TRACE("Task [" << *this << "]: Executing; notifying [" << observers.size() << "] observers first.");
  for (const auto& observer : observers)
  {
    observer->on_start(*this);
  }

  run();
} // Cancellable_task::start_impl()

void Cancellable_task::cancel()
{
  if (!mark_cancelled())
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Task [" << *this << "]: Canceled in state [" << state() << "].");
  post_cancel_notifications();
  signal_host(); // is_ready() has just become true.
}

bool Cancellable_task::mark_cancelled()
{
  using util::Lock_guard;
  using util::Mutex_recursive;
  using util::Mutex_non_recursive;

  Lock_guard<Mutex_recursive> op_lock(m_op_mutex);

  Lock_guard<Mutex_non_recursive> state_lock(m_state_mutex);
  if (m_cancelled)
  {
    return false;
  }
  // else
  m_cancelled = true;
  return true;
}

void Cancellable_task::finish()
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  std::vector<std::weak_ptr<Cancellable_task>> dependents;
  {
    Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
    if (state() == State::S_FINISHED)
    {
      return;
    }
    // else
    set_state(State::S_FINISHED);
    dependents.swap(m_dependents);
  }

  /* A dependent may hold the only other ref to us; informing it may release that.  Our own handlers on S can
   * complete concurrently too.  So stay alive until we return. */
  const auto self = shared_from_this();

  FLOW_LOG_INFO("Task [" << *this << "]: Finished (canceled = [" << is_cancelled() << "]); "
                "informing [" << dependents.size() << "] dependents.");

  post_finish_notifications();

  for (const auto& dependent_weak : dependents)
  {
    if (const auto dependent = dependent_weak.lock())
    {
      dependent->on_dependency_finished();
    }
  }

  signal_host();
} // Cancellable_task::finish()

void Cancellable_task::post_cancel_notifications()
{
  boost::asio::post(m_strand, [this, self = shared_from_this()]()
  {
    // We are in strand S.
    FLOW_LOG_TRACE("Task [" << *this << "]: Delivering cancel notifications.");
    on_cancelled();
    for (const auto& observer : observers())
    {
      observer->on_cancel(*this);
    }
  });
}

void Cancellable_task::post_finish_notifications()
{
  boost::asio::post(m_strand, [this, self = shared_from_this()]()
  {
    // We are in strand S.
    FLOW_LOG_TRACE("Task [" << *this << "]: Delivering finish notifications.");
    on_finished();
    for (const auto& observer : observers())
    {
      observer->on_finish(*this);
    }
  });
}

void Cancellable_task::signal_host()
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  Host_signal_func func;
  {
    Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
    func = m_host_signal_func;
  }
  if (func)
  {
    func();
  }
}

void Cancellable_task::set_host_signal_func(Host_signal_func&& func)
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
  m_host_signal_func = std::move(func);
}

void Cancellable_task::set_state(State new_state)
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  State old_state;
  {
    Lock_guard<Mutex_non_recursive> state_lock(m_state_mutex);
    old_state = m_state;
    assert((old_state < new_state) && "Task state may only move strictly forward.  Broke contract.");
    m_state = new_state;
  }

  FLOW_LOG_TRACE("Task [" << *this << "]: State [" << old_state << "] => [" << new_state << "].");
}

bool Cancellable_task::is_ready() const
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  const bool deps_finished = dependencies_finished();

  Lock_guard<Mutex_non_recursive> state_lock(m_state_mutex);
  if (m_cancelled)
  {
    return true; // So the scheduler can flush us quickly.
  }
  // else
  return deps_finished && (m_state >= State::S_READY);
}

State Cancellable_task::state() const
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  Lock_guard<Mutex_non_recursive> state_lock(m_state_mutex);
  return m_state;
}

bool Cancellable_task::is_cancelled() const
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  Lock_guard<Mutex_non_recursive> state_lock(m_state_mutex);
  return m_cancelled;
}

bool Cancellable_task::is_executing() const
{
  return state() == State::S_EXECUTING;
}

bool Cancellable_task::is_finished() const
{
  return state() == State::S_FINISHED;
}

bool Cancellable_task::dependencies_finished() const
{
  return m_n_unfinished_deps == 0;
}

std::vector<Observer_ptr> Cancellable_task::observers() const
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
  return m_observers;
}

std::vector<Condition_ptr> Cancellable_task::conditions() const
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
  return m_conditions;
}

std::vector<Cancellable_task::Ptr> Cancellable_task::dependencies() const
{
  using util::Lock_guard;
  using util::Mutex_recursive;

  Lock_guard<Mutex_recursive> op_lock(m_op_mutex);
  return m_dependencies;
}

const std::string& Cancellable_task::nickname() const
{
  return m_nickname;
}

void Cancellable_task::run()
{
  // Subclasses override.
}

void Cancellable_task::on_cancelled()
{
  // Subclasses override.
}

void Cancellable_task::on_finished()
{
  // Subclasses override.
}

std::ostream& operator<<(std::ostream& os, State val)
{
  switch (val)
  {
  case State::S_INITIALIZED:
    return os << "initialized";
  case State::S_PENDING:
    return os << "pending";
  case State::S_EVALUATING_CONDITIONS:
    return os << "evaluatingConditions";
  case State::S_READY:
    return os << "ready";
  case State::S_EXECUTING:
    return os << "executing";
  case State::S_FINISHED:
    return os << "finished";
  }
  assert(false);
  return os;
}

std::ostream& operator<<(std::ostream& os, const Cancellable_task& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace taskq::task
