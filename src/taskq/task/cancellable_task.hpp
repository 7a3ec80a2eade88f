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

#include "taskq/task/task_fwd.hpp"
#include "taskq/task/condition.hpp"
#include "taskq/task/observer.hpp"
#include <flow/async/concurrent_task_loop.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <string>
#include <vector>

namespace taskq::task
{

/**
 * An asynchronous unit of work with an explicit, strictly-forward lifecycle (see #State), pre-execution
 * readiness gates (other tasks as dependencies; Condition objects), cooperative cancellation, and Observer
 * notification hooks.  Subclass it and override run() (plus optionally on_cancelled() and on_finished()); or
 * use Block_task to supply the body as a closure.
 *
 * ### Lifecycle ###
 * A `*this` does not run itself.  A *host scheduler* (such as sched::Task_queue; or any other code honoring the
 * boundary described below) drives it:
 *   -# Constructed: State::S_INITIALIZED.  Add dependencies, conditions, observers now.
 *   -# Scheduler admits it: mark_enqueued().  State::S_PENDING.
 *   -# Once every dependency has reached State::S_FINISHED, and assuming `*this` is not canceled, conditions are
 *      evaluated.  If there are none: State::S_READY immediately.  Otherwise: State::S_EVALUATING_CONDITIONS;
 *      every Condition::evaluate() is invoked; once all have reported, if any reported `false` `*this` cancels
 *      itself; either way it then enters State::S_READY.
 *   -# Scheduler sees is_ready() and calls start().  Unless canceled by then: State::S_EXECUTING, each
 *      Observer::on_start(), then run().  The body, eventually, calls finish().  If canceled by then, start()
 *      instead goes directly to finish() without invoking run().
 *   -# finish(): State::S_FINISHED.  Terminal.
 *
 * cancel() may be called at any point.  It does not itself change state(); it does make is_ready() return `true`
 * immediately, so that the scheduler can flush `*this` (via start() => finish()) quickly.  It does not interrupt a
 * run() already in progress: the body should check is_cancelled() if it wants to stop early.  Canceling a task that
 * has already finished is recorded and notified like any other first cancel(); it merely has no effect on execution.
 *
 * ### Host scheduler boundary ###
 * The scheduler:
 *   - calls mark_enqueued() once, upon admission;
 *   - registers, via set_host_signal_func(), a function `*this` shall invoke whenever is_ready() or is_finished()
 *     may have changed (this is the only way `*this` talks to it);
 *   - calls start() once is_ready() (at most once);
 *   - keeps `*this` alive (holds a #Ptr) at least until is_finished().
 *
 * Dependency bookkeeping (add_dependency()) is built into `*this`: when a task finishes, it directly informs those
 * tasks depending on it, which then re-check their readiness.  The scheduler need not do anything about it beyond
 * reacting to the host signal.
 *
 * ### Threads and locking ###
 * `*this` owns no thread.  The user supplies a `flow::async::Concurrent_task_loop` (typically a
 * `flow::async::Cross_thread_task_loop` with a handful of threads, shared by any number of tasks), and `*this` creates
 * its own strand, S, on that loop's `Task_engine`.  Strand S is used to: aggregate Condition results; execute start()
 * (if start() was called from outside S, it posts itself onto S and returns immediately); and deliver
 * on_cancelled()/on_finished() and the Observer::on_cancel() and Observer::on_finish() notifications.  So all
 * lifecycle notifications of a given task are serialized with respect to each other, none of them blocks the thread
 * that triggered them, and different tasks proceed in parallel on the loop's threads.  A run() that blocks occupies
 * one of the loop's threads for that long; size the loop accordingly.
 *
 * Internally two mutexes are used, and the distinction between them is essential:
 *   - #m_state_mutex (non-recursive) guards only #m_state and #m_cancelled, for the shortest possible time.  It is
 *     never held while calling out of `*this`: a callee may well query state() from another thread synchronously,
 *     and we'd deadlock.
 *   - #m_op_mutex (recursive) makes each of the read-then-maybe-write operations (start(), cancel(), finish(),
 *     mark_enqueued(), the internal readiness check, applying condition results, mutating the lists) atomic with
 *     respect to each other.  It too is never held while calling out of `*this`: observers, conditions,
 *     dependents and the host signal are all invoked after it is released.
 *
 * ### Lifetime ###
 * A `*this` must be owned by a `shared_ptr` (#Ptr) before any of add_dependency(), mark_enqueued(), start(),
 * cancel() or finish() is used.  Each handler posted onto S holds a #Ptr to `*this`, so a pending notification is
 * never lost when the last outside reference goes away, and the destructor has nothing to wait for: the last #Ptr may
 * be released from any thread, including from S itself (e.g., a task's own run(), or another task's).  Callbacks
 * handed to Condition objects and dependency links keep only weak references to `*this`.  The loop must outlive
 * every task created on it.
 *
 * ### Known limitation ###
 * There is no timeout on condition evaluation.  A Condition that never reports keeps `*this` in
 * State::S_EVALUATING_CONDITIONS forever.  Compose a timeout externally if needed (e.g., a condition that itself
 * reports `false` after some time).
 *
 * ### Thread safety ###
 * All public methods are safe to call concurrently with each other on the same `*this`.
 */
class Cancellable_task :
  public flow::log::Log_context,
  public std::enable_shared_from_this<Cancellable_task>,
  private boost::noncopyable // And non-movable.
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to `*this` type.
  using Ptr = Cancellable_task_ptr;

  /// Function a host scheduler registers to learn that is_ready() and/or is_finished() may have changed.
  using Host_signal_func = Function<void ()>;

  // Constructors/destructor.

  /**
   * Constructs the task in State::S_INITIALIZED, not canceled, with its strand S on `loop`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param loop
   *        Started (or to be started) loop whose threads shall execute `*this`.  Must outlive `*this`.
   * @param nickname
   *        Human-readable name used in logging.  If empty, a unique name is generated.
   */
  explicit Cancellable_task(flow::log::Logger* logger_ptr, flow::async::Concurrent_task_loop* loop,
                            util::String_view nickname = util::String_view());

  /// Destroys `*this`.  Nothing is pending on S at this point, as every such handler holds a #Ptr.
  virtual ~Cancellable_task();

  // Methods.

  /**
   * Attaches the given observer, to be notified of subsequent lifecycle events in order of attachment; then
   * invokes its Observer::on_attach() synchronously.
   *
   * Must be called before State::S_EXECUTING, or behavior is undefined (assertion may trip).
   *
   * @param observer
   *        Non-null observer.  `*this` co-owns it from now on.
   */
  void add_observer(Observer_ptr observer);

  /**
   * Adds the given readiness condition.
   *
   * Must be called before State::S_EVALUATING_CONDITIONS, or behavior is undefined (assertion may trip).
   *
   * @param condition
   *        Non-null condition.  `*this` co-owns it from now on.
   */
  void add_condition(Condition_ptr condition);

  /**
   * Makes `*this` depend on `other`: `*this` shall not begin evaluating conditions (nor be is_ready(), unless
   * canceled) until `other` is finished.  If `other` is already finished, this is effectively a no-op.
   *
   * @param other
   *        Non-null task other than `*this`.  `*this` co-owns it from now on.  Creating a dependency cycle means
   *        none of the tasks in the cycle will ever become ready.
   */
  void add_dependency(Ptr other);

  /**
   * Equivalent to add_dependency() on each element, in order.
   *
   * @param others
   *        See add_dependency().
   */
  void add_dependencies(const std::vector<Ptr>& others);

  /**
   * To be invoked by the host scheduler upon admission: moves State::S_INITIALIZED to State::S_PENDING, then checks
   * readiness (which may move it further).  If not in State::S_INITIALIZED, no-op.
   */
  void mark_enqueued();

  /**
   * To be invoked by the host scheduler once is_ready(): runs the body, or finishes immediately if canceled.
   * If called from strand S, executes synchronously; otherwise posts the work onto S and returns immediately.
   *
   * Must be called at most once; else behavior is undefined (assertion may trip).
   */
  void start();

  /**
   * Requests cancellation.  Only the first call has an effect, in any state:
   * is_cancelled() becomes `true`; the host signal fires; and, from strand S, on_cancelled() followed by every
   * Observer::on_cancel() is invoked.  A body already in run() is not interrupted.
   */
  void cancel();

  /**
   * Moves `*this` to State::S_FINISHED; informs dependent tasks and the host scheduler; and, from strand S,
   * invokes on_finished() followed by every Observer::on_finish().  If already State::S_FINISHED, no-op.
   *
   * run() implementations must call this, from any thread, once their work is complete.
   */
  void finish();

  /**
   * Whether the host scheduler may start() `*this` now: `true` if canceled; otherwise `true` if and only if all
   * dependencies are finished and state() is at least State::S_READY.
   *
   * @return See above.
   */
  bool is_ready() const;

  /**
   * Current lifecycle state.
   * @return See above.
   */
  State state() const;

  /**
   * Whether cancel() has taken effect (possibly because a Condition failed).
   * @return See above.
   */
  bool is_cancelled() const;

  /**
   * `state() == State::S_EXECUTING`.
   * @return See above.
   */
  bool is_executing() const;

  /**
   * `state() == State::S_FINISHED`.
   * @return See above.
   */
  bool is_finished() const;

  /**
   * Whether every dependency added via add_dependency() has reached State::S_FINISHED (vacuously `true` if none).
   * @return See above.
   */
  bool dependencies_finished() const;

  /**
   * Copy of the attached observers, in attachment order.
   * @return See above.
   */
  std::vector<Observer_ptr> observers() const;

  /**
   * Copy of the added conditions, in order of addition.
   * @return See above.
   */
  std::vector<Condition_ptr> conditions() const;

  /**
   * Copy of the added dependencies, in order of addition.
   * @return See above.
   */
  std::vector<Ptr> dependencies() const;

  /**
   * Nickname as passed to (or generated by) ctor.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Registers the host signal; see class doc header.  Replaces any previously registered one.  The function is
   * invoked with no `*this`-internal lock held, from various threads, possibly concurrently.
   *
   * @param func
   *        The function; or an empty one to unregister.
   */
  void set_host_signal_func(Host_signal_func&& func);

protected:
  // Methods.

  /**
   * The body, invoked from strand S after Observer::on_start().  The default does nothing: the task then remains
   * State::S_EXECUTING until somebody calls finish().  Overrides must (eventually) call finish().
   */
  virtual void run();

  /// Hook invoked from strand S, before any Observer::on_cancel(), upon effective cancel().  Default no-op.
  virtual void on_cancelled();

  /// Hook invoked from strand S, before any Observer::on_finish(), upon effective finish().  Default no-op.
  virtual void on_finished();

private:
  // Types.

  /// Aggregation state of one round of condition evaluation.  Accessed only from strand S once evaluation began.
  struct Condition_results
  {
    /**
     * Prepares for `n_conditions` reports.
     * @param n_conditions
     *        Number of conditions being evaluated.
     */
    explicit Condition_results(size_t n_conditions);

    /// Result of condition at index `i`, in order of add_condition().  Meaningful only if `m_reported[i]`.
    std::vector<bool> m_satisfied;

    /// Whether condition at index `i` has reported.
    std::vector<bool> m_reported;

    /// How many conditions have not reported yet.
    size_t m_n_outstanding;
  }; // struct Condition_results

  // Methods.

  /**
   * Sets #m_state, asserting it strictly increases.  Locks #m_state_mutex only for the assignment itself.
   * @param new_state
   *        New state.
   */
  void set_state(State new_state);

  /**
   * If not yet canceled, sets #m_cancelled.  Locks #m_op_mutex (recursively).
   * @return `true` if and only if this call set it; so notifications are due.
   */
  bool mark_cancelled();

  /// Body of start(), in strand S.
  void start_impl();

  /**
   * The readiness re-check invoked whenever something it depends on changes: if State::S_PENDING, not canceled,
   * and dependencies_finished(), begins condition evaluation (or goes straight to State::S_READY).
   * Otherwise no-op, which suppresses duplicate triggers.
   */
  void check_readiness();

  /**
   * Invokes every Condition::evaluate(), with no lock held.  Results are funneled onto strand S.
   * @param conditions
   *        Snapshot of #m_conditions taken as we entered State::S_EVALUATING_CONDITIONS.
   */
  void evaluate_conditions(const std::vector<Condition_ptr>& conditions);

  /**
   * Strand S: records one condition's report; once all are in, applies them.
   *
   * @param results
   *        Aggregation state for this round.
   * @param idx
   *        Index of the reporting condition.
   * @param satisfied
   *        Its report.
   */
  void on_condition_result(Condition_results* results, size_t idx, bool satisfied);

  /**
   * Strand S: all conditions reported.  Cancels if any failed; moves to State::S_READY.
   * @param results
   *        The complete results.
   */
  void on_conditions_evaluated(const Condition_results& results);

  /**
   * Invoked on a dependency of some other task: arranges for `dependent` to be informed once `*this` finishes.
   *
   * @param dependent
   *        The task that depends on `*this`.
   * @return `false` if `*this` is already finished (so `dependent` will not be informed); `true` otherwise.
   */
  bool register_dependent(std::weak_ptr<Cancellable_task> dependent);

  /// Invoked by a dependency of `*this` once it finishes.
  void on_dependency_finished();

  /// Invokes the host signal, if any is registered.  Must be called with no lock held.
  void signal_host();

  /// Posts on_cancelled() and the Observer::on_cancel() notifications onto strand S.
  void post_cancel_notifications();

  /// Posts on_finished() and the Observer::on_finish() notifications onto strand S.
  void post_finish_notifications();

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Guards #m_state and #m_cancelled and nothing else.  See class doc header.
  mutable util::Mutex_non_recursive m_state_mutex;

  /// See state().  Protected by #m_state_mutex.
  State m_state;

  /// See is_cancelled().  Protected by #m_state_mutex.
  bool m_cancelled;

  /// Makes composite operations atomic.  Recursive, since e.g. applying condition results may cancel.
  mutable util::Mutex_recursive m_op_mutex;

  /// See observers().  Protected by #m_op_mutex.
  std::vector<Observer_ptr> m_observers;

  /// See conditions().  Protected by #m_op_mutex.
  std::vector<Condition_ptr> m_conditions;

  /// See dependencies().  Protected by #m_op_mutex.
  std::vector<Ptr> m_dependencies;

  /**
   * Tasks that called add_dependency() on `*this`, to be informed once `*this` finishes; cleared at that point.
   * Protected by #m_op_mutex.
   */
  std::vector<std::weak_ptr<Cancellable_task>> m_dependents;

  /**
   * Number of entries in #m_dependencies not yet known to be finished.  Incremented before registering with
   * the dependency, so it never dips below its true value.
   */
  std::atomic<int> m_n_unfinished_deps;

  /// See set_host_signal_func().  Protected by #m_op_mutex (we invoke a copy, unlocked).
  Host_signal_func m_host_signal_func;

  /// Strand S, on the loop given to ctor.  See class doc header.
  flow::util::Strand m_strand;
}; // class Cancellable_task

} // namespace taskq::task
