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
#include "resname/naming/name_codec.hpp"
#include "resname/naming/naming_config.hpp"
#include "resname/naming/error.hpp"
#include <flow/error/error.hpp>
#include <cassert>

namespace resname::naming
{

// Initializers.

const char Name_codec::S_GROUP_EXTRA_CHAR = '-';

// Implementations.

Name_codec::Name_codec(util::String_view prefix, char delimiter,
                       size_t suffix_length, util::String_view suffix_alphabet) :
  m_prefix(prefix),
  m_delimiter(delimiter),
  m_suffix_length(suffix_length),
  m_suffix_alphabet(suffix_alphabet)
{
  assert((m_suffix_length != 0) && (!m_suffix_alphabet.empty()) && (!alnum_char(m_delimiter)));
}

Name_codec::Name_codec(const Naming_config& config) :
  Name_codec(config.m_prefix, config.m_delimiter, config.m_suffix_length, config.m_suffix_alphabet)
{
  // Delegated.
}

Name_codec Name_codec::without_prefix() const
{
  return Name_codec("", m_delimiter, m_suffix_length, m_suffix_alphabet);
}

const std::string& Name_codec::prefix() const
{
  return m_prefix;
}

char Name_codec::delimiter() const
{
  return m_delimiter;
}

size_t Name_codec::suffix_length() const
{
  return m_suffix_length;
}

const std::string& Name_codec::suffix_alphabet() const
{
  return m_suffix_alphabet;
}

bool Name_codec::alnum_char(char ch) // Static.
{
  using flow::util::in_closed_range;

  // Spelled out instead of isalnum(): the latter depends on the C locale.
  return in_closed_range('a', ch, 'z') || in_closed_range('A', ch, 'Z') || in_closed_range('0', ch, '9');
}

bool Name_codec::valid_group(util::String_view group) // Static.
{
  if (group.empty())
  {
    return false;
  }
  // else

  for (const auto ch : group)
  {
    if ((ch != S_GROUP_EXTRA_CHAR) && (!alnum_char(ch)))
    {
      return false;
    }
  }

  return true;
} // Name_codec::valid_group()

bool Name_codec::valid_suffix(util::String_view suffix) const
{
  if (suffix.size() != m_suffix_length)
  {
    return false;
  }
  // else

  for (const auto ch : suffix)
  {
    if (m_suffix_alphabet.find(ch) == std::string::npos)
    {
      return false;
    }
  }

  return true;
} // Name_codec::valid_suffix()

void Name_codec::check_group(util::String_view group, Error_code* err_code) // Static.
{
  assert(err_code);

  if (group.empty())
  {
    *err_code = error::Code::S_GROUP_EMPTY;
    return;
  }
  // else
  if (!valid_group(group))
  {
    *err_code = error::Code::S_GROUP_ILLEGAL_CHARACTER;
    return;
  }
  // else
  err_code->clear();
}

void Name_codec::append_shared(util::String_view group, std::string* name) const
{
  if (!m_prefix.empty())
  {
    *name += m_prefix;
    *name += m_delimiter;
  }
  name->append(group.data(), group.size());
}

std::string Name_codec::encode_shared(util::String_view group, Error_code* err_code) const
{
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(string, encode_shared, group, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  string name;
  check_group(group, err_code);
  if (!*err_code)
  {
    name.reserve(m_prefix.size() + 1 + group.size());
    append_shared(group, &name);
  }
  return name;
} // Name_codec::encode_shared()

std::string Name_codec::encode_unique(util::String_view group, util::String_view suffix, Error_code* err_code) const
{
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(string, encode_unique, group, suffix, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  string name;
  check_group(group, err_code);
  if (*err_code)
  {
    return name;
  }
  // else
  if (!valid_suffix(suffix))
  {
    *err_code = error::Code::S_SUFFIX_INVALID;
    return name;
  }
  // else

  name.reserve(m_prefix.size() + 1 + group.size() + 1 + suffix.size());
  append_shared(group, &name);
  name += m_delimiter;
  name.append(suffix.data(), suffix.size());
  return name;
} // Name_codec::encode_unique()

std::optional<util::String_view> Name_codec::strip_prefix(util::String_view name) const
{
  if (m_prefix.empty())
  {
    return name;
  }
  // else

  const auto head_size = m_prefix.size() + 1;
  if ((name.size() < head_size)
      || (name.compare(0, m_prefix.size(), m_prefix) != 0)
      || (name[m_prefix.size()] != m_delimiter))
  {
    return std::nullopt;
  }
  // else
  return name.substr(head_size);
}

std::optional<std::string> Name_codec::decode_shared(util::String_view name) const
{
  const auto rest = strip_prefix(name);
  if ((!rest) || (!valid_group(*rest)))
  {
    return std::nullopt;
  }
  // else
  return std::string(rest->data(), rest->size());
}

std::optional<std::string> Name_codec::decode_unique(util::String_view name) const
{
  /* The suffix is whatever follows the *last* delimiter.  Suffix characters are alphanumeric, so they never include
   * the delimiter; whereas the group may (if the delimiter is '-'). */
  const auto pos = name.rfind(m_delimiter);
  if ((pos == util::String_view::npos) || (!valid_suffix(name.substr(pos + 1))))
  {
    return std::nullopt;
  }
  // else
  return decode_shared(name.substr(0, pos));
}

std::optional<std::string> Name_codec::extract(util::String_view name) const
{
  auto group = decode_unique(name);
  if (!group)
  {
    group = decode_shared(name);
  }
  return group;
}

std::ostream& operator<<(std::ostream& os, const Name_codec& val)
{
  return os << "codec[prefix[" << val.prefix() << "] delimiter[" << val.delimiter() << "] "
               "suffix[" << val.suffix_length() << " x " << val.suffix_alphabet() << "]]";
}

} // namespace resname::naming
