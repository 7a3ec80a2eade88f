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
#include "taskq/sched/task_queue.hpp"
#include "taskq/task/block_task.hpp"
#include "taskq/test/test_logger.hpp"
#include "taskq/test/test_common_util.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <boost/thread/thread.hpp>
#include <atomic>

namespace taskq::sched::test
{

namespace
{

using task::Block_task;
using task::Cancellable_task;
using task::Cancellable_task_ptr;
using taskq::test::Test_logger;
using taskq::test::Test_loop;
using taskq::test::Event_log;
using taskq::test::Manual_conditions;
using taskq::test::make_recording_observer;
using taskq::test::wait_for;
using std::make_shared;
using std::string;
using std::vector;

/// Block_task whose body records its invocation and then finishes.
Block_task::Ptr make_finishing_task(Test_logger* logger, Test_loop* loop, const string& name, Event_log* log)
{
  return make_shared<Block_task>(logger, loop, name, [log, name](Block_task& self)
  {
    log->push(name);
    self.finish();
  });
}

} // namespace (anon)

TEST(Task_queue_test, Runs_ready_tasks)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  Task_queue queue(&logger, "q");
  EXPECT_EQ(queue.nickname(), "q");

  vector<Cancellable_task_ptr> tasks;
  for (const auto& name : { "a", "b", "c" })
  {
    tasks.push_back(make_finishing_task(&logger, &loop, name, &log));
  }
  queue.add_tasks(tasks);
  queue.wait_all();

  EXPECT_EQ(queue.size(), 0u);
  for (const auto& name : { "a", "b", "c" })
  {
    EXPECT_EQ(log.count(name), 1u);
  }
  for (const auto& task : tasks)
  {
    EXPECT_TRUE(task->is_finished());
  }
}

TEST(Task_queue_test, Dependency_chain_runs_in_order)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  Task_queue queue(&logger, "q");

  const auto a = make_finishing_task(&logger, &loop, "a", &log);
  const auto b = make_finishing_task(&logger, &loop, "b", &log);
  const auto c = make_finishing_task(&logger, &loop, "c", &log);
  b->add_dependency(a);
  c->add_dependency(b);

  // Admit in reverse, so admission order cannot be what orders them.
  Error_code err_code;
  EXPECT_TRUE(queue.add_tasks({ c, b, a }, &err_code));
  EXPECT_FALSE(err_code);
  queue.wait_all();

  const vector<string> expected{ "a", "b", "c" };
  EXPECT_EQ(log.events(), expected);
}

TEST(Task_queue_test, Canceled_dependency_does_not_block_dependent)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  Task_queue queue(&logger, "q");

  const auto a = make_finishing_task(&logger, &loop, "a", &log);
  const auto b = make_finishing_task(&logger, &loop, "b", &log);
  b->add_dependency(a);
  a->cancel();

  queue.add_task(b);
  queue.add_task(a);
  queue.wait_all();

  EXPECT_TRUE(a->is_cancelled());
  EXPECT_FALSE(b->is_cancelled());
  const vector<string> expected{ "b" };
  EXPECT_EQ(log.events(), expected);
}

TEST(Task_queue_test, Concurrency_cap_is_honored)
{
  Test_logger logger;
  Test_loop loop(&logger);
  constexpr size_t N_TASKS = 6;

  for (const size_t cap : { size_t(1), size_t(2) })
  {
    Task_queue queue(&logger, "q", cap);
    std::atomic<size_t> n_executing(0);
    std::atomic<size_t> max_executing(0);

    vector<Cancellable_task_ptr> tasks;
    for (size_t idx = 0; idx != N_TASKS; ++idx)
    {
      tasks.push_back(make_shared<Block_task>(&logger, &loop, "", [&](Block_task& self)
      {
        const size_t now = ++n_executing;
        size_t prev_max = max_executing;
        while ((now > prev_max) && (!max_executing.compare_exchange_weak(prev_max, now)))
        {
          // Try again.
        }
        boost::this_thread::sleep_for(boost::chrono::milliseconds(20));
        --n_executing;
        self.finish();
      }));
    }
    queue.add_tasks(tasks);
    queue.wait_all();

    EXPECT_LE(max_executing.load(), cap);
    EXPECT_GE(max_executing.load(), 1u);
    for (const auto& task : tasks)
    {
      EXPECT_TRUE(task->is_finished());
    }
  }
}

TEST(Task_queue_test, Canceled_task_bypasses_cap)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  Task_queue queue(&logger, "q", 1);

  // Occupies the only slot until told to finish.
  const auto blocker = make_shared<Block_task>(&logger, &loop, "blocker", [&](Block_task&)
  {
    log.push("blocker");
  });
  queue.add_task(blocker);
  ASSERT_TRUE(wait_for([&]() { return log.count("blocker") == 1; }));

  const auto canceled = make_finishing_task(&logger, &loop, "canceled", &log);
  canceled->add_observer(make_recording_observer(&log, "canceled"));
  canceled->cancel();
  queue.add_task(canceled);

  // Gets flushed though the cap is reached.
  ASSERT_TRUE(wait_for([&]() { return canceled->is_finished() && (queue.size() == 1); }));
  EXPECT_EQ(log.count("canceled"), 0u);
  EXPECT_TRUE(blocker->is_executing());

  blocker->finish();
  queue.wait_all();
  EXPECT_EQ(queue.size(), 0u);
}

TEST(Task_queue_test, Cancel_during_body_keeps_slot)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  Task_queue queue(&logger, "q", 1);

  // Its body returns without finishing: it stays executing, holding the only slot, until finished by hand.
  const auto a = make_shared<Block_task>(&logger, &loop, "a", [&](Block_task&) { log.push("a"); });
  const auto b = make_finishing_task(&logger, &loop, "b", &log);
  queue.add_task(a);
  ASSERT_TRUE(wait_for([&]() { return log.count("a") == 1; }));
  queue.add_task(b);
  ASSERT_TRUE(wait_for([&]() { return b->is_ready(); }));

  // Canceling does not stop a body in progress; so `a` still occupies the slot.
  a->cancel();
  boost::this_thread::sleep_for(boost::chrono::milliseconds(100));
  EXPECT_EQ(log.count("b"), 0u);
  EXPECT_TRUE(a->is_executing());
  EXPECT_EQ(b->state(), task::State::S_READY);

  a->finish();
  queue.wait_all();
  const vector<string> expected{ "a", "b" };
  EXPECT_EQ(log.events(), expected);
}

TEST(Task_queue_test, Many_tasks_share_a_small_loop)
{
  Test_logger logger(flow::log::Sev::S_WARNING); // Thousands of INFO lines otherwise.
  constexpr size_t N_TASKS = 1000;
  constexpr size_t CHAIN_LENGTH = 10;
  std::atomic<size_t> n_run(0);
  std::atomic<size_t> n_out_of_order(0);
  Test_loop loop(&logger, 2);
  Task_queue queue(&logger, "q");

  // Chains of CHAIN_LENGTH tasks, each depending on the one before; all on 2 threads.
  vector<Cancellable_task_ptr> tasks;
  for (size_t idx = 0; idx != N_TASKS; ++idx)
  {
    tasks.push_back(make_shared<Block_task>(&logger, &loop, "", [&](Block_task& self)
    {
      if (!self.dependencies_finished())
      {
        ++n_out_of_order;
      }
      ++n_run;
      self.finish();
    }));
    if ((idx % CHAIN_LENGTH) != 0)
    {
      tasks.back()->add_dependency(tasks[idx - 1]);
    }
  }
  queue.add_tasks(tasks);
  queue.wait_all();

  EXPECT_EQ(n_run.load(), N_TASKS);
  EXPECT_EQ(n_out_of_order.load(), 0u);
  for (const auto& task : tasks)
  {
    EXPECT_TRUE(task->is_finished());
  }
}

TEST(Task_queue_test, Conditions_gate_dispatch)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  Manual_conditions conds(2);
  Task_queue queue(&logger, "q");

  const auto task = make_finishing_task(&logger, &loop, "t", &log);
  for (const auto& cond : conds.conditions())
  {
    task->add_condition(cond);
  }
  queue.add_task(task);
  EXPECT_EQ(queue.size(), 1u);
  EXPECT_EQ(task->state(), task::State::S_EVALUATING_CONDITIONS);

  conds.report(1, true);
  boost::this_thread::sleep_for(boost::chrono::milliseconds(50));
  EXPECT_EQ(log.count("t"), 0u);

  conds.report(0, true);
  queue.wait_all();
  EXPECT_EQ(log.count("t"), 1u);
  EXPECT_FALSE(task->is_cancelled());
}

TEST(Task_queue_test, Cancel_all)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  Task_queue queue(&logger, "q");

  // Neither can ever run on its own: the dependency is never admitted.
  const auto never = make_finishing_task(&logger, &loop, "never", &log);
  const auto a = make_finishing_task(&logger, &loop, "a", &log);
  const auto b = make_finishing_task(&logger, &loop, "b", &log);
  a->add_dependency(never);
  b->add_dependency(never);
  queue.add_tasks({ a, b });
  EXPECT_EQ(queue.size(), 2u);

  queue.cancel_all();
  queue.wait_all();

  EXPECT_TRUE(a->is_cancelled());
  EXPECT_TRUE(b->is_cancelled());
  EXPECT_TRUE(a->is_finished());
  EXPECT_TRUE(b->is_finished());
  EXPECT_TRUE(log.events().empty());
  EXPECT_FALSE(never->is_cancelled());
}

TEST(Task_queue_test, Task_finished_without_start_is_released)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  Task_queue queue(&logger, "q");

  const auto never = make_finishing_task(&logger, &loop, "never", &log);
  const auto task = make_finishing_task(&logger, &loop, "t", &log);
  task->add_dependency(never);
  queue.add_task(task);

  task->finish(); // Legal, if unusual.
  queue.wait_all();
  EXPECT_EQ(log.count("t"), 0u);
}

TEST(Task_queue_test, Admission_errors)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  Task_queue queue(&logger, "q");
  Error_code err_code;

  EXPECT_FALSE(queue.add_task(Cancellable_task_ptr(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  const auto task = make_shared<Block_task>(&logger, &loop, "t", [](Block_task&) {}); // Never finishes on its own.
  EXPECT_TRUE(queue.add_task(task, &err_code));
  EXPECT_FALSE(err_code);

  EXPECT_FALSE(queue.add_task(task, &err_code));
  EXPECT_EQ(err_code, error::Code::S_TASK_ALREADY_ENQUEUED);

  // Admitted elsewhere (here: by hand) also counts.
  const auto other = make_finishing_task(&logger, &loop, "other", &log);
  other->mark_enqueued();
  EXPECT_FALSE(queue.add_task(other, &err_code));
  EXPECT_EQ(err_code, error::Code::S_TASK_ALREADY_ENQUEUED);

  const auto late = make_finishing_task(&logger, &loop, "late", &log);
  queue.shut_down();
  queue.shut_down();
  EXPECT_FALSE(queue.add_task(late, &err_code));
  EXPECT_EQ(err_code, error::Code::S_QUEUE_SHUT_DOWN);
  EXPECT_EQ(late->state(), task::State::S_INITIALIZED);

  // Already-tracked tasks proceed.
  ASSERT_TRUE(wait_for([&]() { return task->is_executing(); }));
  task->finish();
  queue.wait_all();
}

TEST(Task_queue_test, Admission_errors_throw_without_error_code)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  Task_queue queue(&logger, "q");

  EXPECT_THROW(queue.add_task(Cancellable_task_ptr()), flow::error::Runtime_error);

  const auto task = make_finishing_task(&logger, &loop, "t", &log);
  EXPECT_NO_THROW(queue.add_tasks({ task }));
  try
  {
    queue.add_task(task);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_TASK_ALREADY_ENQUEUED);
  }

  queue.wait_all();
  queue.shut_down();
  EXPECT_THROW(queue.add_task(make_finishing_task(&logger, &loop, "late", &log)), flow::error::Runtime_error);
}

TEST(Task_queue_test, Add_tasks_stops_at_first_error)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  Task_queue queue(&logger, "q");
  Error_code err_code;

  const auto a = make_finishing_task(&logger, &loop, "a", &log);
  const auto c = make_finishing_task(&logger, &loop, "c", &log);
  EXPECT_FALSE(queue.add_tasks({ a, Cancellable_task_ptr(), c }, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);
  EXPECT_EQ(c->state(), task::State::S_INITIALIZED);

  queue.wait_all();
  EXPECT_EQ(log.count("a"), 1u);
}

TEST(Task_queue_test, Destruction_releases_unfinished_tasks)
{
  Test_logger logger;
  Event_log log;
  Test_loop loop(&logger);
  const auto never = make_finishing_task(&logger, &loop, "never", &log);
  const auto task = make_finishing_task(&logger, &loop, "t", &log);
  task->add_dependency(never);

  {
    Task_queue queue(&logger, "q");
    queue.add_task(task);
    EXPECT_EQ(queue.size(), 1u);
  } // Queue gone; `task` must not notice.

  never->finish(); // Would signal the (gone) queue via `task`.
  EXPECT_TRUE(task->is_ready());
  EXPECT_EQ(log.count("t"), 0u);
}

} // namespace taskq::sched::test
