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

#include <flow/util/util.hpp>

#include "taskq/detail/common.hpp"

/* The APIs and header-inlined stuff (templates, constexprs, `if constexpr`, weak_from_this()) require C++17 or newer;
 * and that applies to the linking user's `#include`ing .cpp file(s) too.  Enforce it here. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any taskq/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Flow-TaskQ project: a small library in modern C++17 providing an asynchronous,
 * dependency-aware, cancellable unit of work (a *task*) with an explicit lifecycle, plus a reference scheduler
 * that runs such tasks.
 *
 * From the user's perspective, one should view this namespace as the "root," meaning it consists of two parts:
 *   - Symbols directly in Flow-TaskQ: the absolute most basic, commonly used symbols (such as the alias
 *     taskq::Error_code).
 *     - In particular this includes `enum class` taskq::Log_component which defines the set of possible
 *       `flow::log::Component` values logged from within all modules of Flow-TaskQ.
 *   - Sub-namespaces, each of which represents a Flow-TaskQ *module*.
 *
 * Flow-TaskQ modules overview
 * ---------------------------
 *   - *taskq::task*: The point of the project.  task::Cancellable_task is a unit of asynchronous work that moves
 *     through a strictly forward state sequence (task::State), can be gated by other tasks (dependencies) and by
 *     pluggable asynchronous predicates (task::Condition), and reports its lifecycle to pluggable
 *     task::Observer objects.  Cancellation is cooperative.
 *   - *taskq::sched*: A *host scheduler*.  task::Cancellable_task does not run itself: something must admit it,
 *     watch its readiness, and start it.  sched::Task_queue is a ready-made such thing; but any other scheduler
 *     honoring the same boundary (see task::Cancellable_task doc header) works equally well.
 *   - *taskq::util*: Miscellaneous aliases.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Flow-TaskQ requires Flow and Boost.  `flow::log` is the assumed logging system; `flow::Error_code` and related
 * conventions are used for error reporting; `flow::async` loops provide the threads (tasks run on strands of a
 * user-supplied `flow::async::Concurrent_task_loop`; sched::Task_queue has a `Single_thread_task_loop` of its own);
 * and `boost::thread` mutex types (via `flow::util` aliases) provide the locking.
 *
 * ### Error reporting ###
 * The standards and mechanics w/r/t error reporting are entirely inherited from Flow.  Therefore, see the
 * `namespace flow` doc header's "Error reporting" section.  Broken contracts (e.g., trying to move a task's state
 * backwards) are not errors but bugs; they trip assertions.
 *
 * ### Logging ###
 * We use the Flow log module, in `flow::log` namespace, for logging.  The user must supply a `flow::log::Logger`
 * into various APIs in order to enable logging.  (Worst-case, passing `Logger == null` will make it log nowhere.)
 */
namespace taskq
{

// Types.  They're outside of `namespace ::taskq::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef TASKQ_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by Flow-TaskQ internal
 * logging.  Flow-TaskQ user specifies it, albeit very rarely, when configuring their program's logging
 * such as via `flow::log::Config::init_component_to_union_idx_mapping()` and
 * `flow::log::Config::init_component_names()`.
 *
 * The actual members are generated from the source file `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /**
   * CAUTION -- see taskq::Log_component doc header for directions to find actual members of this
   * `enum class`.  This entry is a placeholder for Doxygen purposes only.
   */
  S_END_SENTINEL
};

// Constants.

/**
 * The map that maps each enumerated value in taskq::Log_component to its string representation as used in log
 * output and verbosity config.  If the component `enum` member is called `S_SOME_NAME`, then its string counterpart
 * in this map is `"SOME_NAME"` (optionally prepended with a prefix as supplied to
 * `flow::log::Config::init_component_names()`).
 *
 * @see taskq::Log_component first.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_TASKQ_LOG_COMPONENT_NAME_MAP;

#endif // TASKQ_DOXYGEN_ONLY

} // namespace taskq
