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

#include "resname/common.hpp"

/**
 * Namespace containing the resname::naming module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.
 *
 * Only the *encoding* direction and configuration can fail.  Decoding arbitrary strings is not an error
 * condition in this module (an unparseable name simply yields no group), hence no codes exist for it.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace resname::naming::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by resname::naming functions/methods.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp's Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to
 * error.cpp's Category::code_symbol().  This string must be identical to the symbol, minus the `S_`;
 * e.g., Code::S_GROUP_EMPTY => `"GROUP_EMPTY"`.  This enables the consistent and human-friendly
 * serialization `<<` and deserialization `>>` of a Code w/r/t standard streams.
 *
 * If you add a value to this `enum`, add it to the end, but ahead of Code::S_END_SENTINEL.
 * If you deprecate a value, do not delete it from this `enum`; mark it as deprecated here instead.
 */
enum class Code
{
  /// Cannot encode group into a name: group is empty.
  S_GROUP_EMPTY = S_CODE_LOWEST_INT_VALUE,

  /// Cannot encode group into a name: group contains a character outside [A-Za-z0-9-].
  S_GROUP_ILLEGAL_CHARACTER,

  /**
   * Cannot encode group into a unique name: the suffix source produced a token of the wrong length or with a
   * character outside the configured suffix alphabet.
   */
  S_SUFFIX_INVALID,

  /// Naming configuration invalid: prefix contains a character outside [A-Za-z0-9-].
  S_CONFIG_PREFIX_INVALID,

  /// Naming configuration invalid: delimiter must be a printable, non-space, non-alphanumeric ASCII character.
  S_CONFIG_DELIMITER_INVALID,

  /// Naming configuration invalid: suffix length must be positive.
  S_CONFIG_SUFFIX_LENGTH_INVALID,

  /// Naming configuration invalid: suffix alphabet must be non-empty, alphanumeric, and free of repeated characters.
  S_CONFIG_SUFFIX_ALPHABET_INVALID,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.  Or, slightly more in English,
 * it glues the (completely general) #Error_code to the (`resname::naming`-specific) error code set
 * resname::naming::error::Code, so that one can implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a naming::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "GROUP_EMPTY" (or "group_empty" or "Group_empty" or...) for Code::S_GROUP_EMPTY.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a naming::error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator; e.g., Code::S_GROUP_EMPTY => `"GROUP_EMPTY"`.  To print an #Error_code storing a Code,
 * continue to do the standard thing instead: output the #Error_code itself plus its `.message()`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace resname::naming::error

namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system authorizes implicit conversion from `enum` `Code` to
 * `Error_code`.  The non-specialized version sets `value` to `false`, so that random arbitary `enum`s can't just
 * be used as `Error_code`s.  This is the offical way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::resname::naming::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
