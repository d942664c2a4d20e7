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

#include <resname/naming/naming_convention_factory.hpp>
#include <resname/naming/error.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We try to use a compiled thing or two; and a template (header-only) thing or two;
 * not so much for correctness testing but to see it build successfully and run without barfing. */
int main(int argc, char const * const * argv)
{
  using resname::naming::Naming_convention_factory;
  using resname::naming::Naming_config;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Error_code;
  using flow::Flow_log_component;

  using std::string;
  using std::exception;

  const string LOG_FILE = "resname_link_test.log";
  const int BAD_EXIT = 1;

  /* Set up logging within this function.  We could easily just use `cout` and `cerr` instead, but this
   * Flow stuff will give us time stamps and such for free, so why not?  Normally, one derives from
   * Log_context to do this very trivially, but we just have the one function, main(), so far so: */
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  // This is separate: the resname/Flow logging will go into this file.
  const string log_file((argc >= 2) ? string(argv[1]) : LOG_FILE);
  FLOW_LOG_INFO("Opening log file [" << log_file << "] for resname/Flow logs only.");
  Config log_config = std_log_config;
  log_config.init_component_to_union_idx_mapping<resname::Log_component>(2000, 999);
  log_config.init_component_names<resname::Log_component>(resname::S_RESNAME_LOG_COMPONENT_NAME_MAP,
                                                          false, "resname-");
  log_config.configure_default_verbosity(Sev::S_DATA, true); // High-verbosity.  Use S_INFO in production.
  /* First arg: could use &std_logger to log-about-logging to console; but it's a bit heavy for such a console-dependent
   * little program.  Just send it to /dev/null metaphorically speaking. */
  Async_file_logger log_logger(nullptr, &log_config, log_file, false /* No rotation; we're no serious business. */);

  try
  {
    Naming_config config;
    config.m_prefix = "jclouds";
    const Naming_convention_factory factory(&log_logger, config);
    const auto convention = factory.create();

    const string GROUP = "mycluster";
    const auto shared_name = convention->shared_name_for_group(GROUP);
    const auto unique_name = convention->unique_name_for_group(GROUP);
    FLOW_LOG_INFO("Group [" << GROUP << "]: shared name [" << shared_name << "]; unique name [" << unique_name << "].");

    const auto contains = convention->contains_group(GROUP);
    if ((!contains(shared_name)) || (!contains(unique_name)) || (convention->extract_group(unique_name) != GROUP))
    {
      FLOW_LOG_WARNING("Names did not decode back to group [" << GROUP << "]; unexpected!");
      return BAD_EXIT;
    }
    // else

    Error_code err_code;
    convention->shared_name_for_group("not a group", &err_code);
    FLOW_LOG_INFO("Bad group rejected as expected: [" << err_code << "] [" << err_code.message() << "].");

    FLOW_LOG_INFO("Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
