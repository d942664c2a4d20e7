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
#include <optional>
#include <string>

namespace resname::naming
{

/**
 * The formatting/parsing rules of the group naming convention: builds *shared* and *unique* names from a group
 * (plus, for unique names, a suffix) and parses them back.  A Name_codec is a small copyable value, fixed at
 * construction to one prefix, one delimiter, and one suffix shape (length and alphabet).  It has no other state,
 * does no logging, and is safe to use concurrently.
 *
 * ### The convention ###
 * Let P be the prefix, D the delimiter, G the group, and S the suffix.  Then:
 *   - shared name: `P D G` (e.g., `jclouds-mycluster`); or just `G` if P is empty.
 *   - unique name: `P D G D S` (e.g., `jclouds-mycluster-f3e`); or just `G D S` if P is empty.
 *
 * A group G is *valid* if and only if it is non-empty and consists only of characters [A-Za-z0-9-].  Only a valid
 * group can be encoded; only a valid group is ever decoded.  A suffix S is *valid* if and only if it has exactly
 * suffix_length() characters, each from suffix_alphabet().
 *
 * ### Decoding ###
 * decode_shared() requires the name to begin with `P D` (if P is not empty) and the remainder to be a valid group.
 * decode_unique() requires the segment after the *last* D to be a valid suffix, and applies decode_shared() to
 * everything before that D.  Hence a group containing D (possible when D is `-`) decodes correctly from a unique
 * name: `jclouds-my-cluster-f3e` yields `my-cluster`.  extract() tries decode_unique() first, then
 * decode_shared().  Decoding never fails loudly: any string may be passed in, and a non-matching one yields
 * `std::nullopt`.
 *
 * This order in extract() means a *shared* name of a group whose own last D-segment looks like a valid suffix is
 * interpreted as a unique name: `jclouds-web-abc` extracts to `web`, though decode_shared() alone returns
 * `web-abc`.  The convention cannot distinguish these two readings; unique-first is the reading that keeps every
 * unique name decodable.
 *
 * Typically one does not use this directly but through Group_naming_convention.
 */
class Name_codec
{
public:
  // Constants.

  /// The one character allowed in a group besides [A-Za-z0-9].
  static const char S_GROUP_EXTRA_CHAR;

  // Constructors/destructor.

  /**
   * Constructs the codec.  The arguments must be valid, as by validate_naming_config(), or behavior is undefined
   * (assertion may trip).
   *
   * @param prefix
   *        Prefix; may be empty.
   * @param delimiter
   *        Delimiter.
   * @param suffix_length
   *        Exact suffix length.
   * @param suffix_alphabet
   *        Characters allowed in a suffix.
   */
  explicit Name_codec(util::String_view prefix, char delimiter,
                      size_t suffix_length, util::String_view suffix_alphabet);

  /**
   * Constructs the codec from the values in the given config (including `config.m_prefix`).  Same requirements as
   * the other ctor.
   *
   * @param config
   *        Configuration.
   */
  explicit Name_codec(const Naming_config& config);

  // Methods.

  /**
   * Returns a codec identical to `*this` but with an empty prefix().
   * @return See above.
   */
  Name_codec without_prefix() const;

  /**
   * The prefix; may be empty.
   * @return See above.
   */
  const std::string& prefix() const;

  /**
   * The delimiter.
   * @return See above.
   */
  char delimiter() const;

  /**
   * The exact number of characters in a valid suffix.
   * @return See above.
   */
  size_t suffix_length() const;

  /**
   * The characters allowed in a valid suffix.
   * @return See above.
   */
  const std::string& suffix_alphabet() const;

  /**
   * Returns `true` if and only if `suffix` has exactly suffix_length() characters, each in suffix_alphabet().
   *
   * @param suffix
   *        Candidate suffix.
   * @return See above.
   */
  bool valid_suffix(util::String_view suffix) const;

  /**
   * Encodes `group` into a shared name.
   *
   * @param group
   *        Group to encode.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_GROUP_EMPTY, error::Code::S_GROUP_ILLEGAL_CHARACTER.
   * @return The name; or empty string if error emitted via `*err_code`.
   */
  std::string encode_shared(util::String_view group, Error_code* err_code = 0) const;

  /**
   * Encodes `group` plus the given `suffix` into a unique name.
   *
   * @param group
   *        Group to encode.
   * @param suffix
   *        Suffix to append; typically from a Suffix_source.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_GROUP_EMPTY, error::Code::S_GROUP_ILLEGAL_CHARACTER (checked first);
   *        error::Code::S_SUFFIX_INVALID (`!valid_suffix(suffix)`).
   * @return The name; or empty string if error emitted via `*err_code`.
   */
  std::string encode_unique(util::String_view group, util::String_view suffix, Error_code* err_code = 0) const;

  /**
   * Returns the group encoded in the given shared name; or `std::nullopt` if `name` is not a shared name under
   * this convention.
   *
   * @param name
   *        Any string.
   * @return See above.
   */
  std::optional<std::string> decode_shared(util::String_view name) const;

  /**
   * Returns the group encoded in the given unique name; or `std::nullopt` if `name` is not a unique name under
   * this convention.
   *
   * @param name
   *        Any string.
   * @return See above.
   */
  std::optional<std::string> decode_unique(util::String_view name) const;

  /**
   * Returns `decode_unique(name)` if that is not `nullopt`; else `decode_shared(name)`.
   *
   * @param name
   *        Any string.
   * @return See above.
   */
  std::optional<std::string> extract(util::String_view name) const;

  /**
   * Returns `true` if and only if `group` is non-empty and consists only of [A-Za-z0-9] and #S_GROUP_EXTRA_CHAR.
   *
   * ### Performance ###
   * It is linear-time, with at most one scan through `group`.
   *
   * @param group
   *        Candidate group.
   * @return See above.
   */
  static bool valid_group(util::String_view group);

  /**
   * Returns `true` if and only if `ch` is in [A-Za-z0-9].  Unlike `std::isalnum()` this is locale-independent.
   *
   * @param ch
   *        Character.
   * @return See above.
   */
  static bool alnum_char(char ch);

private:
  // Methods.

  /**
   * Checks `group` for encodability; on failure sets `*err_code` to the reason, else clears it.
   *
   * @param group
   *        Candidate group.
   * @param err_code
   *        Not null.
   */
  static void check_group(util::String_view group, Error_code* err_code);

  /**
   * If prefix() is empty returns `name`; else if `name` begins with prefix() followed by delimiter() returns
   * the rest of `name` (possibly empty); else `nullopt`.
   *
   * @param name
   *        Any string.
   * @return See above.
   */
  std::optional<util::String_view> strip_prefix(util::String_view name) const;

  /**
   * Appends the shared name of an already-validated `group` to `*name`.
   *
   * @param group
   *        Valid group.
   * @param name
   *        Target.
   */
  void append_shared(util::String_view group, std::string* name) const;

  // Data.

  /// See prefix().  Not `const` so as to support copy assignment.
  std::string m_prefix;

  /// See delimiter().
  char m_delimiter;

  /// See suffix_length().
  size_t m_suffix_length;

  /// See suffix_alphabet().
  std::string m_suffix_alphabet;
}; // class Name_codec

} // namespace resname::naming
