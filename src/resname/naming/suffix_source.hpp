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

#include "resname/naming/naming_fwd.hpp"
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/shared_ptr.hpp>
#include <string>

namespace resname::naming
{

/**
 * Abstract source of suffixes for unique names (see Group_naming_convention::unique_name_for_group()).  Each
 * next_suffix() call yields a fresh token; the only requirement a Group_naming_convention places on it is that it
 * be a valid suffix under that convention's Name_codec (else the unique-name operation fails with
 * error::Code::S_SUFFIX_INVALID).
 *
 * Nothing guarantees that two tokens differ; the point is only to make a collision among sibling names unlikely
 * enough that the resource-creation code can guess a unique name in one or two tries.
 *
 * The default implementation is Random_suffix_source.  Tests substitute a deterministic sequence.
 *
 * ### Thread safety ###
 * A Suffix_source shared by several conventions (as with Naming_convention_factory) may be invoked concurrently
 * from different threads.  An implementation must be safe for whatever concurrency its user intends.
 */
class Suffix_source
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to `*this`; one source is typically shared by all conventions of a factory.
  using Ptr = boost::shared_ptr<Suffix_source>;

  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Suffix_source();

  // Methods.

  /**
   * Returns the next suffix token.
   * @return See above.
   */
  virtual std::string next_suffix() = 0;
}; // class Suffix_source

/**
 * Suffix_source that draws each suffix character uniformly and independently from a fixed alphabet.  With the
 * default 3 characters of lower-case hex there are 4096 possible suffixes: for the handful of unique resources
 * typically created per group the chance of a sibling collision is low, without making names unwieldy.
 *
 * ### Thread safety ###
 * next_suffix() may be called concurrently on the same object without any locking.  Each thread owns its own
 * random engine (seeded independently from `boost::random::random_device` on first use in that thread), so no two
 * threads share or correlate a sequence, and no thread waits on another.
 */
class Random_suffix_source :
  public Suffix_source
{
public:
  // Constructors/destructor.

  /**
   * Constructs the source.
   *
   * @param length
   *        Number of characters in each suffix.  Must be positive.
   * @param alphabet
   *        Characters from which to draw.  Must be non-empty.
   */
  explicit Random_suffix_source(size_t length, util::String_view alphabet);

  /**
   * Constructs the source from `config.m_suffix_length` and `config.m_suffix_alphabet`.
   *
   * @param config
   *        Configuration, presumably passing validate_naming_config().
   */
  explicit Random_suffix_source(const Naming_config& config);

  // Methods.

  /**
   * Implements Suffix_source API.
   * @return See above.
   */
  std::string next_suffix() override;

private:
  // Data.

  /// Number of characters in each suffix.
  const size_t m_length;

  /// The alphabet.
  const std::string m_alphabet;

  /// Uniform over indices into #m_alphabet.  It has no state beyond its range, so sharing it among threads is fine.
  const boost::random::uniform_int_distribution<size_t> m_char_idx_distribution;
}; // class Random_suffix_source

} // namespace resname::naming
