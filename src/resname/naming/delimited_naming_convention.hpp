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

#include "resname/naming/group_naming_convention.hpp"
#include "resname/naming/name_codec.hpp"
#include "resname/naming/suffix_source.hpp"
#include <flow/log/log.hpp>

namespace resname::naming
{

/**
 * The default (and only) implementation of Group_naming_convention: names are delimiter-separated segments
 * formatted and parsed by a Name_codec, with unique-name suffixes drawn from a Suffix_source.  See Name_codec doc
 * header for the exact shape of names and how names containing the delimiter within the group are decoded.
 *
 * Typically obtained from Naming_convention_factory::create() or Naming_convention_factory::create_without_prefix()
 * rather than constructed directly.
 *
 * Logging: every rejected encode is logged at WARNING level; everything else at TRACE level at most.
 */
class Delimited_naming_convention :
  public Group_naming_convention,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the convention.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  May be null.
   * @param codec
   *        Formatting/parsing rules; copied.
   * @param suffix_source
   *        Source of unique-name suffixes.  Must not be null.  Its tokens should be valid suffixes per `codec`.
   */
  explicit Delimited_naming_convention(flow::log::Logger* logger_ptr, const Name_codec& codec,
                                       Suffix_source::Ptr suffix_source);

  // Methods.

  /**
   * Implements Group_naming_convention API.
   * @param group
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  std::string shared_name_for_group(util::String_view group, Error_code* err_code = 0) const override;

  /**
   * Implements Group_naming_convention API.  Invokes Suffix_source::next_suffix() exactly once, even if `group` is
   * invalid.
   *
   * @param group
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  std::string unique_name_for_group(util::String_view group, Error_code* err_code = 0) const override;

  /**
   * Implements Group_naming_convention API.
   * @param encoded
   *        See above.
   * @return See above.
   */
  std::optional<std::string> group_in_shared_name_or_none(util::String_view encoded) const override;

  /**
   * Implements Group_naming_convention API.
   * @param encoded
   *        See above.
   * @return See above.
   */
  std::optional<std::string> group_in_unique_name_or_none(util::String_view encoded) const override;

  /**
   * Implements Group_naming_convention API.
   * @param encoded
   *        See above.
   * @return See above.
   */
  std::optional<std::string> extract_group(util::String_view encoded) const override;

  /**
   * Implements Group_naming_convention API.  The predicate does not log.
   * @param group
   *        See above.
   * @return See above.
   */
  Name_predicate contains_group(util::String_view group) const override;

  /**
   * Implements Group_naming_convention API.  The predicate does not log.
   * @return See above.
   */
  Name_predicate contains_any_group() const override;

  /**
   * Implements Group_naming_convention API.
   * @param os
   *        See above.
   */
  void print(std::ostream& os) const override;

  /**
   * The formatting/parsing rules in use.
   * @return See above.
   */
  const Name_codec& codec() const;

private:
  // Methods.

  /**
   * Logs the result of a decode operation and returns it.
   *
   * @param op_name
   *        Name of the operation for logging.
   * @param encoded
   *        The input.
   * @param group
   *        The result.
   * @return `group`.
   */
  std::optional<std::string> log_decoded(util::String_view op_name, util::String_view encoded,
                                         std::optional<std::string>&& group) const;

  // Data.

  /// See codec().
  const Name_codec m_codec;

  /// Source of suffixes for unique_name_for_group().  Not null.
  const Suffix_source::Ptr m_suffix_source;
}; // class Delimited_naming_convention

} // namespace resname::naming
