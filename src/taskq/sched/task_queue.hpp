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

#include "taskq/sched/sched_fwd.hpp"
#include "taskq/sched/error.hpp"
#include "taskq/task/cancellable_task.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/unordered_set.hpp>
#include <boost/noncopyable.hpp>
#include <list>

namespace taskq::sched
{

/**
 * A host scheduler that admits task::Cancellable_task objects, starts each one once it is ready, and keeps it
 * alive until it finishes; optionally with a cap on the number of task bodies executing at the same time.
 *
 * ### Dispatch ###
 * All bookkeeping happens in a single internal thread, Q.  Whenever anything may have changed (a task was admitted;
 * a task signaled us via its host signal; a task was released), Q runs a *dispatch pass*:
 *   -# Every tracked task that is_finished() is released (our `shared_ptr` to it is dropped, in thread Q).
 *   -# Then, in order of admission, each waiting task that is_ready() is started via task::Cancellable_task::start(),
 *      as long as fewer than `max_concurrent_tasks` started tasks that count against the cap are unfinished.  A task
 *      counts against the cap if it was not canceled when we started it, until it finishes; canceling it afterwards
 *      does not free its slot, as its body may well still be running.  A task canceled before we start it does not
 *      count and is started regardless of the cap, since it will finish without running its body.
 *
 * So task order of admission is respected only as far as readiness allows: a later task whose dependencies finish
 * first may well start first.  Use task::Cancellable_task::add_dependency() to impose order.
 *
 * ### Error reporting ###
 * add_task() and add_tasks() follow the Flow convention: on error `*err_code` is set, or, if `err_code` is null,
 * `flow::error::Runtime_error` is thrown.
 *
 * ### Thread safety ###
 * All public methods are safe to call concurrently with each other.  The destructor must not be called
 * concurrently with anything else; and not from within a task's notification callbacks or body.
 */
class Task_queue :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the queue and starts thread Q.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        Human-readable name used in logging.
   * @param max_concurrent_tasks
   *        At most this many tasks shall be executing (started while not canceled, not finished) at a time.
   *        0 means no limit.
   */
  explicit Task_queue(flow::log::Logger* logger_ptr, util::String_view nickname, size_t max_concurrent_tasks = 0);

  /**
   * Stops admitting tasks, stops thread Q, and releases whatever tasks are still tracked.  Those will never be
   * started by `*this`.  Call wait_all() first if that is not desired.
   */
  ~Task_queue();

  // Methods.

  /**
   * Admits the given task: registers our host signal with it, moves it to task::State::S_PENDING via
   * task::Cancellable_task::mark_enqueued(), and schedules a dispatch pass.  The task shall be started once
   * it is ready and tracked until it finishes.
   *
   * @param task
   *        Task to admit.  Must not have been admitted by any host scheduler before.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (`task` is null),
   *        error::Code::S_TASK_ALREADY_ENQUEUED (`task` was already admitted),
   *        error::Code::S_QUEUE_SHUT_DOWN (shut_down() was called, or `*this` is being destroyed).
   * @return `true` if admitted; `false` on error.
   */
  bool add_task(const task::Cancellable_task_ptr& task, Error_code* err_code = 0);

  /**
   * Invokes add_task() on each given task in order, stopping at the first failure.
   *
   * @param tasks
   *        Tasks to admit.
   * @param err_code
   *        See add_task().
   * @return `true` if all were admitted; `false` on error (the failing and subsequent tasks were not admitted).
   */
  bool add_tasks(const std::vector<task::Cancellable_task_ptr>& tasks, Error_code* err_code = 0);

  /// Invokes task::Cancellable_task::cancel() on every task currently tracked.
  void cancel_all();

  /**
   * Stops admitting tasks: subsequent add_task() calls fail with error::Code::S_QUEUE_SHUT_DOWN.  Tasks already
   * tracked proceed as usual, so wait_all() still works.  Idempotent.  The dtor calls it too.
   */
  void shut_down();

  /**
   * Blocks until every task admitted so far (and any admitted meanwhile) has finished and been released.
   * Must not be called from thread Q or from within a tracked task's body or notifications.
   */
  void wait_all();

  /**
   * Returns the number of tasks admitted and not yet released (finished tasks are released shortly after
   * finishing).
   *
   * @return See above.
   */
  size_t size() const;

  /**
   * Returns nickname as passed to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// A started task, not yet released.
  struct Started
  {
    /// The task.
    task::Cancellable_task_ptr m_task;

    /// Whether it counts against the cap: it was not canceled when started.  Fixed from then on.
    bool m_counted;
  };

  /**
   * The piece of `*this` that task host signals point to.  Tasks may outlive `*this`, and they may be in the
   * middle of signaling when the dtor runs; so the signal goes through this, and the dtor nulls out
   * #m_queue.
   */
  struct Host_link
  {
    /// Protects #m_queue.
    util::Mutex_non_recursive m_mutex;

    /// The queue; null once its dtor has begun.
    Task_queue* m_queue;
  };

  // Methods.

  /**
   * Returns a host signal function pointing to #m_host_link, for task::Cancellable_task::set_host_signal_func().
   * @return See above.
   */
  task::Cancellable_task::Host_signal_func make_host_signal_func() const;

  /// Posts dispatch() onto thread Q.
  void schedule_dispatch();

  /// The dispatch pass; see class doc header.  Runs in thread Q.
  void dispatch();

  /**
   * Untracks the given finished task; our last references to it are dropped as the caller discards `task` too.
   * Runs in thread Q.
   *
   * @param task
   *        The task.
   */
  void release(const task::Cancellable_task_ptr& task);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See ctor.
  const size_t m_max_concurrent_tasks;

  /// Target of the host signals given out to tasks.  See Host_link.
  const std::shared_ptr<Host_link> m_host_link;

  /// Protects #m_tracked and #m_shutting_down.
  mutable util::Mutex_non_recursive m_tracked_mutex;

  /// Notified whenever #m_tracked becomes empty.
  boost::condition_variable m_tracked_empty_cond;

  /// Every task admitted and not yet released.  Protected by #m_tracked_mutex.
  boost::unordered_set<task::Cancellable_task_ptr> m_tracked;

  /// Set to `true` by shut_down().  Protected by #m_tracked_mutex.
  bool m_shutting_down;

  /// Tracked tasks not yet started, in order of admission.  Accessed only from thread Q.
  std::list<task::Cancellable_task_ptr> m_waiting;

  /// Tracked tasks started and not yet released.  Accessed only from thread Q.
  std::list<Started> m_started;

  /// Thread Q.  Must be last, so it is stopped before the above are destroyed.
  flow::async::Single_thread_task_loop m_worker;
}; // class Task_queue

// Free functions: in *_fwd.hpp.

} // namespace taskq::sched
