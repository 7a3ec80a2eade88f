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

#include "taskq/test/test_config.hpp"
#include <gtest/gtest.h>

/* Runs all the unit tests.  Beyond the usual GoogleTest options it understands:
 *   --minimum-log-severity=<sev>: e.g., trace; the severity threshold of Test_logger (default: info). */
int main(int argc, char** argv)
{
  using taskq::test::Test_config;

  ::testing::InitGoogleTest(&argc, argv);
  // ^-- Removes the GoogleTest options it recognized; ours remain.

  if (!Test_config::get_singleton().parse_command_line(argc, argv))
  {
    return 1;
  }

  // Tasks and queues run threads; the default "fast" style forks with those around, which is unsafe.
  GTEST_FLAG_SET(death_test_style, "threadsafe");

  return RUN_ALL_TESTS();
}
