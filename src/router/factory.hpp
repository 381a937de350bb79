/*
 * Copyright 2025 Waypoint Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Waypoint Router Factory - Header
// Builds a routing table from configuration

#pragma once

#include <string>

#include "../control/config.hpp"
#include "router.hpp"

namespace waypoint::router {

/// Router whose handlers are the configured handler identifiers.
/// Fallback handlers are named "not_found", "method_not_allowed" and "options".
/// Throws RouteError on the first route that cannot be registered.
[[nodiscard]] Router<std::string> build_router(const control::Config& config);

}  // namespace waypoint::router
