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

#include "resname/naming/suffix_source.hpp"
#include <boost/make_shared.hpp>
#include <atomic>
#include <string>
#include <vector>

namespace resname::test
{

/**
 * Suffix_source returning a fixed sequence of tokens, cycling back to the first after the last.  Lets a test
 * predict unique names exactly.  next_suffix() may be called concurrently.
 */
class Test_suffix_source :
  public naming::Suffix_source
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to `*this`.
  using Ptr = boost::shared_ptr<Test_suffix_source>;

  // Constructors/destructor.

  /**
   * Constructor.
   *
   * @param suffixes The sequence; must be non-empty.  Tokens need not be valid suffixes.
   */
  explicit Test_suffix_source(std::vector<std::string> suffixes) :
    m_suffixes(std::move(suffixes)),
    m_n_calls(0)
  {
    // That's it.
  }

  // Methods.

  /**
   * Convenience: creates a source via `make_shared`.
   *
   * @param suffixes See ctor.
   * @return See above.
   */
  static Ptr create(std::vector<std::string> suffixes)
  {
    return boost::make_shared<Test_suffix_source>(std::move(suffixes));
  }

  /**
   * Returns the next token in the sequence.
   *
   * @return See above.
   */
  std::string next_suffix() override
  {
    return m_suffixes[m_n_calls++ % m_suffixes.size()];
  }

  /**
   * Returns how many times next_suffix() was called.
   *
   * @return See above.
   */
  size_t n_calls() const
  {
    return m_n_calls;
  }

private:
  // Data.

  /// The sequence.
  const std::vector<std::string> m_suffixes;

  /// Calls to next_suffix() so far.
  std::atomic<size_t> m_n_calls;
}; // class Test_suffix_source

} // namespace resname::test
