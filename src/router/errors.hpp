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

// Waypoint Route Errors - Header
// Registration failures; request-time misses are never reported through here

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace waypoint::router {

/// Why a route was rejected at registration time
enum class RouteErrorKind : uint8_t {
    EmptyPattern,
    MissingLeadingSlash,
    InvalidMethod,
    UnnamedWildcard,
    MultipleWildcardsInSegment,
    CatchAllNotAtEnd,
    MissingSlashBeforeCatchAll,
    WildcardConflict,
    DuplicateRoute,
};

/// Thrown by route registration; a half-built routing table must not be served
class RouteError : public std::runtime_error {
public:
    RouteError(RouteErrorKind kind, std::string pattern, const std::string& message);

    [[nodiscard]] RouteErrorKind kind() const noexcept { return kind_; }

    /// Pattern that was being registered
    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

private:
    RouteErrorKind kind_;
    std::string pattern_;
};

/// Short machine-readable name of an error kind
[[nodiscard]] std::string_view to_string(RouteErrorKind kind) noexcept;

}  // namespace waypoint::router
