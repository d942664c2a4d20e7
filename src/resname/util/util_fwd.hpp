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
#include <flow/log/log.hpp>

/**
 * resname module containing miscellaneous general-use facilities used by ~all resname modules and/or that do not
 * fit into any other module.  As of this writing it is a handful of aliases onto Flow types, so that the other
 * modules need not spell out `flow::util::` everywhere.
 */
namespace resname::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

} // namespace resname::util
