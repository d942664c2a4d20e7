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
#include "resname/naming/delimited_naming_convention.hpp"
#include <flow/error/error.hpp>
#include <cassert>

namespace resname::naming
{

// Implementations.

Delimited_naming_convention::Delimited_naming_convention(flow::log::Logger* logger_ptr, const Name_codec& codec,
                                                         Suffix_source::Ptr suffix_source) :
  flow::log::Log_context(logger_ptr, Log_component::S_NAMING),
  m_codec(codec),
  m_suffix_source(std::move(suffix_source))
{
  assert(m_suffix_source && "Broke contract.");
}

std::string Delimited_naming_convention::shared_name_for_group(util::String_view group, Error_code* err_code) const
{
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(string, Delimited_naming_convention::shared_name_for_group, group, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  auto name = m_codec.encode_shared(group, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Naming convention [" << *this << "]: Shared name for group [" << group << "] "
                     "rejected: [" << *err_code << "] [" << err_code->message() << "].");
    return name;
  }
  // else

  FLOW_LOG_TRACE("Naming convention [" << *this << "]: Group [" << group << "] => shared name [" << name << "].");
  return name;
}

std::string Delimited_naming_convention::unique_name_for_group(util::String_view group, Error_code* err_code) const
{
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(string, Delimited_naming_convention::unique_name_for_group, group, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto suffix = m_suffix_source->next_suffix();
  auto name = m_codec.encode_unique(group, suffix, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Naming convention [" << *this << "]: Unique name for group [" << group << "] "
                     "(suffix [" << suffix << "]) rejected: [" << *err_code << "] [" << err_code->message() << "].");
    return name;
  }
  // else

  FLOW_LOG_TRACE("Naming convention [" << *this << "]: Group [" << group << "] => unique name [" << name << "].");
  return name;
}

std::optional<std::string>
  Delimited_naming_convention::group_in_shared_name_or_none(util::String_view encoded) const
{
  return log_decoded("shared", encoded, m_codec.decode_shared(encoded));
}

std::optional<std::string>
  Delimited_naming_convention::group_in_unique_name_or_none(util::String_view encoded) const
{
  return log_decoded("unique", encoded, m_codec.decode_unique(encoded));
}

std::optional<std::string> Delimited_naming_convention::extract_group(util::String_view encoded) const
{
  return log_decoded("any", encoded, m_codec.extract(encoded));
}

std::optional<std::string>
  Delimited_naming_convention::log_decoded(util::String_view op_name, util::String_view encoded,
                                           std::optional<std::string>&& group) const
{
  if (group)
  {
    FLOW_LOG_TRACE("Naming convention [" << *this << "]: Name [" << encoded << "] decoded (as [" << op_name << "]) "
                   "=> group [" << *group << "].");
  }
  else
  {
    FLOW_LOG_TRACE("Naming convention [" << *this << "]: Name [" << encoded << "] does not decode "
                   "(as [" << op_name << "]).");
  }
  return std::move(group);
}

Name_predicate Delimited_naming_convention::contains_group(util::String_view group) const
{
  // Capture a copy of the codec (not `this`): the predicate may outlive us.
  return [codec = m_codec, group = std::string(group.data(), group.size())](util::String_view name) -> bool
  {
    const auto extracted = codec.extract(name);
    return extracted && (*extracted == group);
  };
}

Name_predicate Delimited_naming_convention::contains_any_group() const
{
  return [codec = m_codec](util::String_view name) -> bool
  {
    return bool(codec.extract(name));
  };
}

void Delimited_naming_convention::print(std::ostream& os) const // Virtual.
{
  os << "Delimited_naming_convention[prefix[" << m_codec.prefix() << "] delimiter[" << m_codec.delimiter() << "]]";
}

const Name_codec& Delimited_naming_convention::codec() const
{
  return m_codec;
}

} // namespace resname::naming
