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
#include <boost/move/unique_ptr.hpp>
#include <optional>
#include <string>

namespace resname::naming
{

/**
 * Interface for the convention by which resource-provisioning code names the resources it creates on behalf of a
 * *group* (a logical set of related resources, such as the nodes of a cluster).  It distinguishes two kinds of
 * names:
 *   - A *shared* name: for a resource created once per group and used by all its members (e.g., a security group or
 *     a key pair).  It is a deterministic function of the group.
 *   - A *unique* name: for a resource created redundantly, once per member (e.g., a compute instance).  Sibling
 *     resources must not collide, so each call appends a short random suffix.
 *
 * Every encoded name can be decoded back into its group purely from its shape; nothing is remembered between calls.
 * A decode operation accepts any string at all (typically, a name listed from a provider, possibly of a resource
 * created by hand) and returns `std::nullopt` if it does not follow this convention.  The encode operations, by
 * contrast, reject a malformed group with an error.
 *
 * There is one implementation, Delimited_naming_convention; obtain it from Naming_convention_factory.  Callers
 * should depend only on this interface.
 *
 * ### Unique names are only probably unique ###
 * unique_name_for_group() does not (cannot) check whether a name is already taken at the provider.  If resource
 * creation fails due to a conflict, it is the caller's job to ask for another unique name and retry.
 *
 * ### Thread safety ###
 * All methods are `const` and may be called concurrently on the same object.
 */
class Group_naming_convention
{
public:
  // Types.

  /// Short-hand for owning pointer to `*this`, as returned by Naming_convention_factory.
  using Ptr = boost::movelib::unique_ptr<Group_naming_convention>;

  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Group_naming_convention();

  // Methods.

  /**
   * Returns the name of the resource shared by all members of the given group.  E.g., with prefix `jclouds` and
   * delimiter `-`, group `mycluster` yields `jclouds-mycluster`.
   *
   * @param group
   *        Group; non-empty, containing only [A-Za-z0-9-].
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_GROUP_EMPTY, error::Code::S_GROUP_ILLEGAL_CHARACTER.
   * @return The name; or empty string if error emitted via `*err_code`.
   */
  virtual std::string shared_name_for_group(util::String_view group, Error_code* err_code = 0) const = 0;

  /**
   * Returns a name, probably not taken by a sibling, for one of possibly many resources of the given group;
   * a different one (very likely) on each call.  E.g., with prefix `jclouds` and delimiter `-`, group `mycluster`
   * yields something like `jclouds-mycluster-f3e`.
   *
   * @param group
   *        Group; non-empty, containing only [A-Za-z0-9-].
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_GROUP_EMPTY, error::Code::S_GROUP_ILLEGAL_CHARACTER, error::Code::S_SUFFIX_INVALID
   *        (a custom Suffix_source produced a token unfit for this convention).
   * @return The name; or empty string if error emitted via `*err_code`.
   */
  virtual std::string unique_name_for_group(util::String_view group, Error_code* err_code = 0) const = 0;

  /**
   * Returns the group encoded in the given name, if it is a name returned by shared_name_for_group() (under the
   * same configuration); else `std::nullopt`.
   *
   * @param encoded
   *        Any string.
   * @return See above.
   */
  virtual std::optional<std::string> group_in_shared_name_or_none(util::String_view encoded) const = 0;

  /**
   * Returns the group encoded in the given name, if it is a name returned by unique_name_for_group() (under the
   * same configuration); else `std::nullopt`.
   *
   * @param encoded
   *        Any string.
   * @return See above.
   */
  virtual std::optional<std::string> group_in_unique_name_or_none(util::String_view encoded) const = 0;

  /**
   * Returns the group encoded in the given name, whether it be a unique or a shared name; else `std::nullopt`.
   * It tries group_in_unique_name_or_none() first and then group_in_shared_name_or_none().
   *
   * So for a unique name the result always equals group_in_unique_name_or_none(); and for a shared name it equals
   * group_in_shared_name_or_none() unless the group's own last delimiter-separated segment is itself
   * suffix-shaped.  E.g., with the default configuration, shared name `resname-web-abc` (group `web-abc`) yields
   * group `web`, as it is also the unique name of `web` with suffix `abc`.  To avoid this, avoid such groups or use
   * a delimiter that cannot appear in a group.
   *
   * @param encoded
   *        Any string.
   * @return See above.
   */
  virtual std::optional<std::string> extract_group(util::String_view encoded) const = 0;

  /**
   * Returns a predicate that, given a name, returns `true` if and only if `extract_group(name) == group`.  The
   * predicate is self-contained: it remains usable after `*this` is destroyed.
   *
   * @param group
   *        Group to match; it is copied.
   * @return See above.
   */
  virtual Name_predicate contains_group(util::String_view group) const = 0;

  /**
   * Returns a predicate that, given a name, returns `true` if and only if `extract_group(name)` is not
   * `std::nullopt`; i.e., whether the name follows this convention at all.  Same lifetime properties as with
   * contains_group().
   *
   * @return See above.
   */
  virtual Name_predicate contains_any_group() const = 0;

  /**
   * Prints a brief description of `*this` (identifying the configuration) to the given stream.  Used by
   * `operator<<(ostream&, const Group_naming_convention&)`.
   *
   * @param os
   *        Stream to which to write.
   */
  virtual void print(std::ostream& os) const = 0;
}; // class Group_naming_convention

} // namespace resname::naming
