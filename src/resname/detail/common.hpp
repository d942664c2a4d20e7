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

#include <flow/common.hpp>
#include <boost/unordered_map.hpp>
#include <string>

namespace resname
{

// Types.

#ifndef RESNAME_DOXYGEN_ONLY // Doxygen sees the documented placeholder in resname/common.hpp instead.

/* The actual `flow::log::Component` payload enum, generated by the usual Flow X-macro technique: each
 * FLOW_LOG_CFG_COMPONENT_DEFINE() line in the .macros.hpp becomes one `S_`-prefixed member.  The same .macros.hpp
 * is re-included in common.cpp to generate S_RESNAME_LOG_COMPONENT_NAME_MAP; the two must stay in sync, which they
 * do automatically. */
#  define FLOW_LOG_CFG_COMPONENT_DEFINE(ARG_name_root, ARG_enum_val) \
     S_##ARG_name_root = (ARG_enum_val),
enum class Log_component
{
#  include "resname/detail/macros/log_component_enum_declare.macros.hpp"
  /// CAUTION -- Must be last.  Not a real component.
  S_END_SENTINEL
};
#  undef FLOW_LOG_CFG_COMPONENT_DEFINE

// Constants.

/// See doc header in resname/common.hpp.
extern const boost::unordered_multimap<Log_component, std::string> S_RESNAME_LOG_COMPONENT_NAME_MAP;

#endif // RESNAME_DOXYGEN_ONLY

} // namespace resname
