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

#pragma once

#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <string>

namespace taskq::test
{

/**
 * Configuration of the test programs, shared process-wide.  Set up once by `main()` (see
 * parse_command_line()) and read by test helpers such as Test_logger.
 */
class Test_config :
  private boost::noncopyable
{
public:
  // Constants.

  /// Command-line option prefix for #m_sev; e.g., `--minimum-log-severity=trace`.
  static const std::string S_MIN_LOG_SEVERITY_PREFIX;

  // Methods.

  /**
   * Returns the one instance.
   *
   * @return See above.
   */
  static Test_config& get_singleton();

  /**
   * Applies any recognized options among the given command-line arguments; leaves others alone (so that, e.g.,
   * GoogleTest can handle them).
   *
   * @param argc
   *        As passed to `main()`.
   * @param argv
   *        As passed to `main()`.
   * @return `false` if a recognized option had an invalid value; `true` otherwise.
   */
  bool parse_command_line(int argc, char const * const * argv);

  // Data.

  /// Lowest severity that test loggers shall let through.
  flow::log::Sev m_sev;

private:
  // Constructors.

  /// Sets defaults.
  Test_config();
}; // class Test_config

} // namespace taskq::test
