/* resname: Resource naming
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

#include <flow/log/log.hpp>

namespace resname::test
{

/**
 * Process-wide settings for test programs.  The one instance is obtained via get_singleton(); a test `main()`
 * may modify it before any Test_logger is constructed.
 */
class Test_config
{
public:
  // Methods.

  /**
   * Returns the one instance.
   * @return See above.
   */
  static Test_config& get_singleton()
  {
    static Test_config s_config;
    return s_config;
  }

  // Data.

  /// Default minimum severity passed through by Test_logger.  Raise it to S_TRACE to see per-name logging.
  flow::log::Sev m_sev = flow::log::Sev::S_INFO;

private:
  // Constructors/destructor.

  /// Use get_singleton().
  Test_config() = default;
}; // class Test_config

} // namespace resname::test
