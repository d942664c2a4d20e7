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

#include <flow/util/util.hpp>

#include "resname/detail/common.hpp"

/* We build in C++17 mode ourselves, and the APIs and header-inlined stuff (e.g., std::optional in public
 * signatures) require C++17 or newer in the linking user's `#include`ing .cpp file(s) too.  So fail the compile
 * early and legibly instead of deep inside some header. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any resname/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the resname project: a small library in modern C++17 that encodes a logical *group*
 * name into provider-safe *resource names* and decodes such names back into the group.
 *
 * Provisioning code (the thing that actually talks to a cloud API and creates security groups, key pairs,
 * networks, compute instances, ...) needs to tell the resources it created apart from those supplied by the user.
 * If it created a security group it should be able to delete it during cleanup without accidentally deleting a
 * manually made one of similar name.  resname supplies the convention that makes this possible: a fixed *prefix*
 * marks a resource as ours; the group follows; and resources created redundantly per group member additionally
 * receive a short random *suffix* so that siblings do not collide.  Decoding is purely structural: given any
 * string, including names of resources the user created by hand, the convention can say which group (if any)
 * is encoded in it.
 *
 * From the user's perspective, one should view this namespace as the "root," meaning it consists of two parts:
 *   - Symbols directly in resname: the absolute most basic, commonly used symbols (such as the alias
 *     resname::Error_code).  In particular this includes `enum class` resname::Log_component which defines the set
 *     of possible `flow::log::Component` values logged from within all modules of resname.
 *   - Sub-namespaces, each of which represents a resname *module*:
 *     - *resname::naming*: the naming convention proper: resname::naming::Group_naming_convention (the interface),
 *       its default implementation, the factory producing configured instances, the suffix sources supplying
 *       entropy for unique names, and the module's error codes.
 *     - *resname::util*: miscellaneous items used by the other modules.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * resname requires Flow and Boost, both internally and in some of its APIs.  `flow::log` is the assumed logging
 * system, and `flow::Error_code` and related conventions are used for error reporting.  boost.random supplies
 * randomness.  (For example: `snake_case` identifiers, `m_` members, `S_` constants, and the
 * `Error_code* err_code = 0` error-emission convention are all inherited from Flow.)
 *
 * ### Error reporting ###
 * The standards and mechanics w/r/t error reporting are entirely inherited from Flow.  Therefore, see the
 * `namespace flow` doc header's "Error reporting" section.  In short: an API that can fail takes a trailing
 * `Error_code* err_code`; if null, failure throws `flow::error::Runtime_error`; else `*err_code` is set.
 *
 * ### Logging ###
 * We use the Flow log module, in `flow::log` namespace, for logging.  The user must supply a `flow::log::Logger`
 * into various APIs in order to enable logging.  (Passing `Logger == null` will make it log nowhere.)
 */
namespace resname
{

// Types.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef RESNAME_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by resname internal
 * logging.  Internal code specifies members thereof when indicating the log component for each particular piece of
 * logging code.  The user specifies it, rarely, when configuring their program's logging such as via
 * `flow::log::Config::init_component_to_union_idx_mapping()` and `flow::log::Config::init_component_names()`.
 *
 * The individual `enum` values are generated via macro magic; find them in the source file
 * `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.  See above.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in resname::Log_component to its
 * string representation as used in log output and verbosity config.  If the component `enum` member is called
 * `S_SOME_NAME`, then its string counterpart in this map is `"SOME_NAME"` (optionally prepended with a prefix
 * as supplied to `flow::log::Config::init_component_names()`).
 *
 * @see resname::Log_component first.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_RESNAME_LOG_COMPONENT_NAME_MAP;

#endif // RESNAME_DOXYGEN_ONLY

} // namespace resname
