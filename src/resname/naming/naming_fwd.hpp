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

#include "resname/util/util_fwd.hpp"
#include <ostream>

/**
 * resname module containing the group naming convention: the rules for encoding a logical group into a *shared*
 * resource name (one per group) or a *unique* resource name (one of many per group, disambiguated by a random
 * suffix), and for recovering the group from any such name.
 *
 * The user-facing entry point is Naming_convention_factory: construct it from a Naming_config (plus, optionally,
 * a custom Suffix_source), then obtain Group_naming_convention instances via `create()` or
 * `create_without_prefix()`.  Name_codec holds the actual formatting/parsing rules.  Errors are reported via
 * naming::error::Code.
 */
namespace resname::naming
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Naming_config;
class Name_codec;
class Suffix_source;
class Random_suffix_source;
class Group_naming_convention;
class Delimited_naming_convention;
class Naming_convention_factory;

/**
 * Short-hand for the predicate type returned by Group_naming_convention::contains_group() and
 * Group_naming_convention::contains_any_group(): takes a (possibly encoded) resource name; returns `true` if it
 * matches.
 */
using Name_predicate = Function<bool (util::String_view)>;

// Free functions.

/**
 * Checks the given configuration for validity; emits the first problem found.  The checks are, in order:
 *   - `m_delimiter` is a printable, non-space, non-alphanumeric ASCII character
 *     (error::Code::S_CONFIG_DELIMITER_INVALID);
 *   - `m_prefix` is empty or consists only of [A-Za-z0-9-] (error::Code::S_CONFIG_PREFIX_INVALID);
 *   - `m_suffix_length` is positive (error::Code::S_CONFIG_SUFFIX_LENGTH_INVALID);
 *   - `m_suffix_alphabet` is non-empty, alphanumeric, without repeats (error::Code::S_CONFIG_SUFFIX_ALPHABET_INVALID).
 *
 * @relatesalso Naming_config
 *
 * @param config
 *        Configuration to check.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: see above.
 */
void validate_naming_config(const Naming_config& config, Error_code* err_code = 0);

/**
 * Prints string representation of the given Naming_config to the given `ostream`.
 *
 * @relatesalso Naming_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Naming_config& val);

/**
 * Prints string representation of the given Name_codec (prefix, delimiter, suffix shape) to the given `ostream`.
 *
 * @relatesalso Name_codec
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Name_codec& val);

/**
 * Prints string representation of the given Group_naming_convention to the given `ostream`.
 * Forwards to the virtual Group_naming_convention::print().
 *
 * @relatesalso Group_naming_convention
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Group_naming_convention& val);

/**
 * Prints string representation of the given Naming_convention_factory to the given `ostream`.
 *
 * @relatesalso Naming_convention_factory
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Naming_convention_factory& val);

} // namespace resname::naming
