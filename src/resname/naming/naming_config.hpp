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
#include <string>

namespace resname::naming
{

// Types.

/**
 * The complete set of options determining the shape of names produced by a Naming_convention_factory and the
 * Group_naming_convention objects it creates.  Default-constructed, it holds the default convention:
 * prefix `resname`, delimiter `-`, 3-character lower-case hex suffix; hence names like `resname-mycluster` (shared)
 * and `resname-mycluster-f3e` (unique).
 *
 * This is a plain bag of public data members; set what you need after default-construction.  Validity is not
 * enforced here but by validate_naming_config() (which Naming_convention_factory invokes on construction).
 *
 * ### Choosing the delimiter ###
 * With the default `-`, the delimiter is also legal inside a group; e.g., group `my-cluster` is perfectly valid
 * and encodes to `resname-my-cluster`.  Decoding stays well defined (the suffix, if any, is always the segment
 * after the *last* delimiter), but a *shared* name whose group's last hyphen-segment happens to look like a
 * suffix (`resname-web-abc`) cannot be told apart from a *unique* name of a shorter group (`web` + suffix `abc`).
 * See Group_naming_convention::extract_group().  If your groups routinely end in such segments, pick a delimiter
 * outside the group character set (e.g., `_`), at the cost of that character needing to be acceptable to every
 * targeted provider.
 */
struct Naming_config
{
  // Constants.

  /// Default for #m_prefix.
  static const std::string S_DEFAULT_PREFIX;

  /// Default for #m_delimiter.
  static const char S_DEFAULT_DELIMITER;

  /// Default for #m_suffix_length.  With #S_DEFAULT_SUFFIX_ALPHABET it yields 16^3 = 4096 possible suffixes.
  static const size_t S_DEFAULT_SUFFIX_LENGTH;

  /// Default for #m_suffix_alphabet: lower-case hex digits.
  static const std::string S_DEFAULT_SUFFIX_ALPHABET;

  // Constructors/destructor.

  /// Loads the defaults (the `S_DEFAULT_*` constants) into all members.
  Naming_config();

  // Data.

  /**
   * Literal token, marking a resource as created by (and safe to delete by) this system, prepended with a trailing
   * #m_delimiter to every encoded name.  May be empty, in which case names are not prefixed at all.
   * Ignored by Naming_convention_factory::create_without_prefix().
   */
  std::string m_prefix;

  /// Segment separator between prefix, group, and suffix.
  char m_delimiter;

  /// Exact number of characters in the suffix of a unique name.
  size_t m_suffix_length;

  /// Characters from which each suffix character is drawn, uniformly.
  std::string m_suffix_alphabet;
}; // struct Naming_config

} // namespace resname::naming
