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
#include "resname/naming/naming_config.hpp"
#include "resname/naming/name_codec.hpp"
#include "resname/naming/error.hpp"
#include <flow/error/error.hpp>
#include <boost/dynamic_bitset.hpp>

namespace resname::naming
{

// Initializers.

const std::string Naming_config::S_DEFAULT_PREFIX = "resname";
const char Naming_config::S_DEFAULT_DELIMITER = '-';
const size_t Naming_config::S_DEFAULT_SUFFIX_LENGTH = 3;
const std::string Naming_config::S_DEFAULT_SUFFIX_ALPHABET = "0123456789abcdef";

// Implementations.

Naming_config::Naming_config() :
  m_prefix(S_DEFAULT_PREFIX),
  m_delimiter(S_DEFAULT_DELIMITER),
  m_suffix_length(S_DEFAULT_SUFFIX_LENGTH),
  m_suffix_alphabet(S_DEFAULT_SUFFIX_ALPHABET)
{
  // That's it.
}

void validate_naming_config(const Naming_config& config, Error_code* err_code)
{
  using flow::util::in_closed_range;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { validate_naming_config(config, actual_err_code); },
         err_code, "naming::validate_naming_config()"))
  {
    return;
  }
  // else

  // Printable ASCII minus space ('!'..'~'), minus alphanumerics.
  const char delim = config.m_delimiter;
  if ((!in_closed_range('!', delim, '~')) || Name_codec::alnum_char(delim))
  {
    *err_code = error::Code::S_CONFIG_DELIMITER_INVALID;
    return;
  }
  // else

  /* Same character set as a group; but empty is fine (no prefix).  Note the prefix may well contain the delimiter
   * (with the default '-' at least): decoding matches the prefix literally, so that's harmless. */
  if ((!config.m_prefix.empty()) && (!Name_codec::valid_group(config.m_prefix)))
  {
    *err_code = error::Code::S_CONFIG_PREFIX_INVALID;
    return;
  }
  // else

  if (config.m_suffix_length == 0)
  {
    *err_code = error::Code::S_CONFIG_SUFFIX_LENGTH_INVALID;
    return;
  }
  // else

  /* Alphanumerics only: then a suffix can never contain the delimiter, which decoding relies on.  A repeated
   * character would silently skew the distribution of suffixes; reject that too. */
  if (config.m_suffix_alphabet.empty())
  {
    *err_code = error::Code::S_CONFIG_SUFFIX_ALPHABET_INVALID;
    return;
  }
  // else
  boost::dynamic_bitset<> seen(256);
  for (const auto ch : config.m_suffix_alphabet)
  {
    const auto idx = static_cast<unsigned char>(ch);
    if ((!Name_codec::alnum_char(ch)) || seen.test(idx))
    {
      *err_code = error::Code::S_CONFIG_SUFFIX_ALPHABET_INVALID;
      return;
    }
    // else
    seen.set(idx);
  }

  err_code->clear();
} // validate_naming_config()

std::ostream& operator<<(std::ostream& os, const Naming_config& val)
{
  return os << "prefix[" << val.m_prefix << "] delimiter[" << val.m_delimiter << "] "
               "suffix[" << val.m_suffix_length << " x " << val.m_suffix_alphabet << ']';
}

} // namespace resname::naming
