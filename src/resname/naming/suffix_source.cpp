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
#include "resname/naming/suffix_source.hpp"
#include "resname/naming/naming_config.hpp"
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/random_device.hpp>
#include <cassert>

namespace resname::naming
{

namespace
{

/**
 * Returns this thread's random engine, seeding it on first use.
 * @return See above.
 */
boost::random::mt19937& this_thread_random_engine()
{
  using boost::random::mt19937;
  using boost::random::random_device;

  /* random_device reads the OS entropy source; it is only touched once per thread.  The engine itself is not
   * reentrant, hence one per thread rather than one per process behind a mutex. */
  thread_local mt19937 s_engine(random_device{}());
  return s_engine;
}

} // namespace (anon)

// Implementations.

Suffix_source::~Suffix_source() = default;

Random_suffix_source::Random_suffix_source(size_t length, util::String_view alphabet) :
  m_length(length),
  m_alphabet(alphabet),
  m_char_idx_distribution(0, m_alphabet.empty() ? 0 : (m_alphabet.size() - 1))
{
  assert((m_length != 0) && (!m_alphabet.empty()));
}

Random_suffix_source::Random_suffix_source(const Naming_config& config) :
  Random_suffix_source(config.m_suffix_length, config.m_suffix_alphabet)
{
  // Delegated.
}

std::string Random_suffix_source::next_suffix() // Virtual.
{
  auto& engine = this_thread_random_engine();

  std::string suffix;
  suffix.reserve(m_length);
  for (size_t idx = 0; idx != m_length; ++idx)
  {
    suffix += m_alphabet[m_char_idx_distribution(engine)];
  }
  return suffix;
}

} // namespace resname::naming
