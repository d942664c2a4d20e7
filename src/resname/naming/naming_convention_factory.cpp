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
#include "resname/naming/naming_convention_factory.hpp"
#include "resname/naming/delimited_naming_convention.hpp"
#include "resname/naming/name_codec.hpp"
#include <boost/make_shared.hpp>
#include <boost/move/make_unique.hpp>

namespace resname::naming
{

// Implementations.

Naming_convention_factory::Naming_convention_factory(flow::log::Logger* logger_ptr, const Naming_config& config,
                                                     Suffix_source::Ptr suffix_source) :
  flow::log::Log_context(logger_ptr, Log_component::S_NAMING),
  m_config(config),
  m_suffix_source(std::move(suffix_source))
{
  validate_naming_config(m_config); // Throws if invalid.

  const bool custom_source = bool(m_suffix_source);
  if (!custom_source)
  {
    m_suffix_source = boost::make_shared<Random_suffix_source>(m_config);
  }

  FLOW_LOG_INFO("Naming_convention_factory [" << *this << "]: Created; "
                "suffix source is [" << (custom_source ? "custom" : "random") << "].");
}

Group_naming_convention::Ptr Naming_convention_factory::create() const
{
  auto convention = create_impl(Name_codec(m_config));
  FLOW_LOG_INFO("Naming_convention_factory [" << *this << "]: Created convention [" << *convention << "].");
  return convention;
}

Group_naming_convention::Ptr Naming_convention_factory::create_without_prefix() const
{
  auto convention = create_impl(Name_codec(m_config).without_prefix());
  FLOW_LOG_INFO("Naming_convention_factory [" << *this << "]: Created convention [" << *convention << "] "
                "(prefix omitted).");
  return convention;
}

Group_naming_convention::Ptr Naming_convention_factory::create_impl(const Name_codec& codec) const
{
  return boost::movelib::make_unique<Delimited_naming_convention>(get_logger(), codec, m_suffix_source);
}

const Naming_config& Naming_convention_factory::config() const
{
  return m_config;
}

std::ostream& operator<<(std::ostream& os, const Naming_convention_factory& val)
{
  return os << '[' << val.config() << "]@" << &val;
}

} // namespace resname::naming
