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
#include "resname/naming/error.hpp"
#include "resname/util/util_fwd.hpp"
#include <cassert>

namespace resname::naming::error
{

// Types.

/**
 * The boost.system category for errors returned by the resname::naming module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * Note that this class's declaration is not available outside this translation unit (.cpp
 * file), and its logic is accessed indirectly through standard boost.system machinery
 * (`Error_code::category().name()` and `Error_code::message()`).
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category` (which,
   * for example, shows up in the `ostream` representation of any Category-belonging #Error_code).
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, a #Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_GROUP_EMPTY => `"GROUP_EMPTY"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  // Glues together Category::name()/message() with the Code enum.
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "resname/naming";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_GROUP_EMPTY:
    return "Cannot encode group into a name: group is empty.";
  case Code::S_GROUP_ILLEGAL_CHARACTER:
    return "Cannot encode group into a name: group contains a character outside [A-Za-z0-9-].";
  case Code::S_SUFFIX_INVALID:
    return "Cannot encode group into a unique name: the suffix source produced a token of the wrong length or with "
           "a character outside the configured suffix alphabet.";
  case Code::S_CONFIG_PREFIX_INVALID:
    return "Naming configuration invalid: prefix contains a character outside [A-Za-z0-9-].";
  case Code::S_CONFIG_DELIMITER_INVALID:
    return "Naming configuration invalid: delimiter must be a printable, non-space, non-alphanumeric ASCII "
           "character.";
  case Code::S_CONFIG_SUFFIX_LENGTH_INVALID:
    return "Naming configuration invalid: suffix length must be positive.";
  case Code::S_CONFIG_SUFFIX_ALPHABET_INVALID:
    return "Naming configuration invalid: suffix alphabet must be non-empty, alphanumeric, and free of repeated "
           "characters.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_GROUP_EMPTY:
    return "GROUP_EMPTY";
  case Code::S_GROUP_ILLEGAL_CHARACTER:
    return "GROUP_ILLEGAL_CHARACTER";
  case Code::S_SUFFIX_INVALID:
    return "SUFFIX_INVALID";
  case Code::S_CONFIG_PREFIX_INVALID:
    return "CONFIG_PREFIX_INVALID";
  case Code::S_CONFIG_DELIMITER_INVALID:
    return "CONFIG_DELIMITER_INVALID";
  case Code::S_CONFIG_SUFFIX_LENGTH_INVALID:
    return "CONFIG_SUFFIX_LENGTH_INVALID";
  case Code::S_CONFIG_SUFFIX_ALPHABET_INVALID:
    return "CONFIG_SUFFIX_ALPHABET_INVALID";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace resname::naming::error
