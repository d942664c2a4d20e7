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
#include "resname/naming/naming_config.hpp"
#include "resname/naming/suffix_source.hpp"
#include <flow/log/log.hpp>

namespace resname::naming
{

/**
 * Source of configured Group_naming_convention objects.  It is constructed once from a Naming_config (and,
 * optionally, a custom Suffix_source), and then hands out conventions in one of two flavors:
 *   - create(): names carry the configured prefix (e.g., `resname-mycluster`).  Use this for resources that live in
 *     a namespace shared with resources not created by this system; the prefix then marks which resources are ours
 *     (and thus safe to delete automatically).
 *   - create_without_prefix(): names carry no prefix (e.g., `mycluster`).  Use this for resources that are already
 *     unambiguously scoped and do not need the extra segment.
 *
 * Both flavors share the configured delimiter and suffix shape, as well as the one Suffix_source.
 *
 * ### Thread safety ###
 * create() and create_without_prefix() may be called concurrently.  The conventions they return may be used (and
 * outlive `*this`) freely.
 */
class Naming_convention_factory :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the factory.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently, both by `*this` and by the conventions it creates.  May be null.
   * @param config
   *        Configuration; copied.  It must pass validate_naming_config(); else this throws.
   * @param suffix_source
   *        Source of suffixes for all created conventions.  If null, a Random_suffix_source is created from
   *        `config`.  If not null, its tokens should be valid suffixes per `config`; otherwise unique-name
   *        operations will fail with error::Code::S_SUFFIX_INVALID.
   *
   * @throws flow::error::Runtime_error
   *         Carrying the error code from validate_naming_config().
   */
  explicit Naming_convention_factory(flow::log::Logger* logger_ptr, const Naming_config& config = Naming_config(),
                                     Suffix_source::Ptr suffix_source = Suffix_source::Ptr());

  // Methods.

  /**
   * Returns a new convention using the configured prefix.
   * @return See above.  Not null.
   */
  Group_naming_convention::Ptr create() const;

  /**
   * Returns a new convention identical to what create() would return, except names carry no prefix.
   * @return See above.  Not null.
   */
  Group_naming_convention::Ptr create_without_prefix() const;

  /**
   * The configuration.
   * @return See above.
   */
  const Naming_config& config() const;

private:
  // Methods.

  /**
   * Returns new Delimited_naming_convention using the given codec and #m_suffix_source.
   *
   * @param codec
   *        Codec.
   * @return See above.
   */
  Group_naming_convention::Ptr create_impl(const Name_codec& codec) const;

  // Data.

  /// See config().
  const Naming_config m_config;

  /// Suffix source shared by all created conventions.  Not null after ctor body.
  Suffix_source::Ptr m_suffix_source;
}; // class Naming_convention_factory

} // namespace resname::naming
